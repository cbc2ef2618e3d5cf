#include "data/fields.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

namespace numcsv::data
{

namespace
{

// Decimal exponent of the leading significant digit of a literal that
// from_chars already matched, e.g. 123.4 -> 2, 0.05 -> -2, 1e-400 -> -400.
// Only called on out-of-range literals, which always have a nonzero digit.
long decimal_magnitude(std::string_view text)
{
    std::size_t i = 0;
    if (i < text.size() && text[i] == '-')
        ++i;

    bool found         = false;
    bool in_fraction   = false;
    long int_digits    = 0;
    long fraction_zero = 0;
    for (; i < text.size(); ++i)
    {
        const char c = text[i];
        if (c == '.')
        {
            in_fraction = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c)))
            break;
        if (!in_fraction)
        {
            if (found || c != '0')
            {
                found = true;
                ++int_digits;
            }
        }
        else if (!found)
        {
            if (c != '0')
                found = true;
            else
                ++fraction_zero;
        }
    }
    long magnitude = int_digits > 0 ? int_digits - 1 : -(fraction_zero + 1);

    if (i < text.size() && (text[i] == 'e' || text[i] == 'E'))
    {
        ++i;
        bool negative = false;
        if (i < text.size() && (text[i] == '+' || text[i] == '-'))
            negative = text[i++] == '-';
        long exp = 0;
        for (; i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])); ++i)
        {
            // Saturate: anything past this is out of range either way.
            if (exp < 100000)
                exp = exp * 10 + (text[i] - '0');
        }
        magnitude += negative ? -exp : exp;
    }
    return magnitude;
}

}   // namespace

std::vector<std::string> split_fields(std::string_view line, std::string_view delim)
{
    std::vector<std::string> fields;
    if (delim.empty())
    {
        fields.emplace_back(line);
        return fields;
    }

    std::size_t start = 0;
    while (true)
    {
        const std::size_t pos = line.find(delim, start);
        if (pos == std::string_view::npos)
        {
            fields.emplace_back(line.substr(start));
            break;
        }
        fields.emplace_back(line.substr(start, pos - start));
        start = pos + delim.size();
    }
    return fields;
}

bool drop_trailing_empty(std::vector<std::string>& fields)
{
    if (fields.empty() || !fields.back().empty())
        return false;
    fields.pop_back();
    return true;
}

std::string strip_quotes(std::string_view field)
{
    if (!field.empty() && field.back() == '"')
        field.remove_suffix(1);
    if (!field.empty() && field.front() == '"')
        field.remove_prefix(1);
    return std::string(field);
}

std::optional<double> parse_double(std::string_view text)
{
    // from_chars takes a leading '-' but not '+'.
    if (!text.empty() && text.front() == '+')
    {
        text.remove_prefix(1);
        if (!text.empty() && (text.front() == '+' || text.front() == '-'))
            return std::nullopt;
    }
    if (text.empty())
        return std::nullopt;
    // Reject NaN payload spellings such as "nan(123)".
    if (text.find('(') != std::string_view::npos)
        return std::nullopt;

    double      value = 0.0;
    const char* first = text.data();
    const char* last  = text.data() + text.size();

    auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::general);
    if (ptr != last)
        return std::nullopt;
    if (ec == std::errc::result_out_of_range)
    {
        // Too small for a double: round to a signed zero. Too large: reject.
        if (decimal_magnitude(text) < 0)
            return text.front() == '-' ? -0.0 : 0.0;
        return std::nullopt;
    }
    if (ec != std::errc())
        return std::nullopt;
    return value;
}

}   // namespace numcsv::data
