#include "io/line_cursor.hpp"

#include <numcsv/error.hpp>
#include <string>

namespace numcsv::io
{

bool LineCursor::next()
{
    if (in_.bad())
        throw ReadError(ErrorKind::Input, line_number_, "stream is in a bad state");

    if (!std::getline(in_, line_))
    {
        if (in_.bad())
            throw ReadError(ErrorKind::Input, line_number_ + 1, "failed to read from stream");
        line_.clear();
        return false;
    }

    // Strip trailing \r (Windows line endings)
    if (!line_.empty() && line_.back() == '\r')
        line_.pop_back();

    ++line_number_;
    return true;
}

}   // namespace numcsv::io
