#include <numcsv/error.hpp>
#include <string>
#include <utility>

namespace numcsv
{

namespace
{

std::string compose(ErrorKind kind, std::size_t line, const std::string& detail)
{
    std::string msg(to_string(kind));
    if (line > 0)
        msg += " at line " + std::to_string(line);
    if (!detail.empty())
        msg += ": " + detail;
    return msg;
}

}   // namespace

std::string_view to_string(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::Input:
            return "input error";
        case ErrorKind::TrailingDelimiter:
            return "trailing delimiter";
        case ErrorKind::FieldCount:
            return "wrong number of fields";
        case ErrorKind::NumericParse:
            return "invalid number";
        case ErrorKind::Sequence:
            return "out of sequence";
    }
    return "unknown error";
}

ReadError::ReadError(ErrorKind kind, std::size_t line, const std::string& detail)
    : std::runtime_error(compose(kind, line, detail)), kind_(kind), line_(line)
{
}

ReadError ReadError::field_count(std::size_t line, std::size_t expected, std::size_t actual)
{
    ReadError err(ErrorKind::FieldCount,
                  line,
                  "expected " + std::to_string(expected) + ", got " + std::to_string(actual));
    err.expected_ = expected;
    err.actual_   = actual;
    return err;
}

ReadError ReadError::numeric_parse(std::size_t line, std::size_t column, std::string text)
{
    ReadError err(ErrorKind::NumericParse,
                  line,
                  "column " + std::to_string(column + 1) + " \"" + text + "\"");
    err.column_ = column;
    err.text_   = std::move(text);
    return err;
}

}   // namespace numcsv
