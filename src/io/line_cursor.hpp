#pragma once

#include <cstddef>
#include <istream>
#include <string>

namespace numcsv::io
{

// Forward-only line iterator over a borrowed input stream.
// Lines are split on '\n'; a single trailing '\r' is dropped so CRLF input
// reads the same as LF input. A final line without a terminator is still
// returned. Not thread-safe.
class LineCursor
{
   public:
    explicit LineCursor(std::istream& in) : in_(in) {}

    LineCursor(const LineCursor&)            = delete;
    LineCursor& operator=(const LineCursor&) = delete;

    // Advance to the next line. Returns false at end of input.
    // Throws ReadError(ErrorKind::Input) if the stream reports a failure.
    bool next();

    const std::string& line() const { return line_; }

    // 1-based number of the current line, 0 before the first next().
    std::size_t line_number() const { return line_number_; }

   private:
    std::istream& in_;
    std::string   line_;
    std::size_t   line_number_ = 0;
};

}   // namespace numcsv::io
