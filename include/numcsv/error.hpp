#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace numcsv
{

enum class ErrorKind
{
    Input,               // stream failed, or no heading line before end of input
    TrailingDelimiter,   // heading ends with a delimiter that is not allowed
    FieldCount,          // line has the wrong number of fields
    NumericParse,        // data field is not a floating-point literal
    Sequence             // operation called in the wrong reader state
};

std::string_view to_string(ErrorKind kind);

// Every failure of a read operation is reported as a ReadError. The kind is
// always set; the remaining details are filled in where they apply and are
// zero/empty otherwise.
class ReadError : public std::runtime_error
{
   public:
    ReadError(ErrorKind kind, std::size_t line, const std::string& detail);

    static ReadError field_count(std::size_t line, std::size_t expected, std::size_t actual);
    static ReadError numeric_parse(std::size_t line, std::size_t column, std::string text);

    ErrorKind kind() const noexcept { return kind_; }

    // 1-based line of the input where the failure happened, 0 if unknown.
    std::size_t line() const noexcept { return line_; }

    std::size_t expected() const noexcept { return expected_; }
    std::size_t actual() const noexcept { return actual_; }

    const std::string& text() const noexcept { return text_; }
    std::size_t        column() const noexcept { return column_; }

   private:
    ErrorKind   kind_;
    std::size_t line_     = 0;
    std::size_t expected_ = 0;
    std::size_t actual_   = 0;
    std::size_t column_   = 0;
    std::string text_;
};

}   // namespace numcsv
