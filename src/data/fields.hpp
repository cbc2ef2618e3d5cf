#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace numcsv::data
{

/// Split `line` on every occurrence of `delim` (which may be several
/// characters long). Always returns at least one field: an empty line yields
/// a single empty field, and a line ending in `delim` yields an empty last
/// field. No quote handling is done.
[[nodiscard]] std::vector<std::string> split_fields(std::string_view line, std::string_view delim);

/// If the last field is empty, remove it and return true.
bool drop_trailing_empty(std::vector<std::string>& fields);

/// Remove at most one trailing and then at most one leading '"'.
/// This is not CSV unquoting: inner quotes are left alone.
[[nodiscard]] std::string strip_quotes(std::string_view field);

/// Parse the whole of `text` as a double in decimal or scientific notation,
/// with an optional sign. "inf", "infinity" and "nan" are accepted in any
/// case; NaN payloads like "nan(1)" are not. Surrounding whitespace,
/// trailing garbage, empty input and values too large for a double are
/// rejected. Values too small for a double become a signed zero.
/// Independent of the C locale.
[[nodiscard]] std::optional<double> parse_double(std::string_view text);

}   // namespace numcsv::data
