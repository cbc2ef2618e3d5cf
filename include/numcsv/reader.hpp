#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <numcsv/error.hpp>
#include <numcsv/matrix.hpp>
#include <optional>
#include <string>
#include <vector>

namespace numcsv
{

namespace io
{
class LineCursor;
}

using Heading = std::vector<std::string>;

struct ReaderOptions
{
    std::string field_delimiter = ",";

    // Empty means "same as field_delimiter".
    std::string heading_delimiter;

    // Only governs the heading line. Data rows always accept one trailing delimiter.
    bool allow_trailing_delimiter = false;

    // Lines starting with this prefix are skipped while looking for the
    // heading. Empty disables comments. Never applied to data rows.
    std::string comment_prefix;

    // 0 = infer from the first parsed line.
    std::size_t expected_field_count = 0;

    bool skip_heading = false;

    const std::string& effective_heading_delimiter() const
    {
        return heading_delimiter.empty() ? field_delimiter : heading_delimiter;
    }
};

// ─── Reader ──────────────────────────────────────────────────────────────────
// Tolerant reader for numeric delimiter-separated text.
//
//   std::ifstream in("data.csv");
//   numcsv::Reader reader(in, {.comment_prefix = "#"});
//   auto heading = reader.read_heading();
//   numcsv::Matrix m = reader.read_all();
//
// The stream is borrowed and must outlive the reader. Every failure is thrown
// as a ReadError; after one the reader is in State::Failed and any further
// call throws ErrorKind::Sequence. Not thread-safe.

class Reader
{
   public:
    enum class State
    {
        Fresh,
        HeadingRead,
        Reading,
        Exhausted,
        Failed
    };

    // Throws std::invalid_argument if options.field_delimiter is empty.
    explicit Reader(std::istream& in, ReaderOptions options = {});
    ~Reader();

    Reader(const Reader&)            = delete;
    Reader& operator=(const Reader&) = delete;

    // Read the heading row, skipping blank and comment lines before it.
    // Only valid once, as the first call, and only when skip_heading is off.
    Heading read_heading();

    // Read one data row. Returns std::nullopt once the input is exhausted,
    // and keeps returning it on later calls.
    std::optional<Record> read();

    // Read every remaining data row. No partial matrix is returned on error.
    Matrix read_all();

    const ReaderOptions& options() const { return options_; }
    State                state() const { return state_; }

    // Number of fields per line; 0 until fixed by options or inference.
    std::size_t field_count() const { return field_count_; }

    bool        trailing_delimiter_seen() const { return trailing_delimiter_seen_; }
    std::size_t line_number() const;
    std::size_t records_read() const { return records_read_; }

   private:
    [[noreturn]] void fail(const ReadError& err);
    void              require(bool ok, const char* what);

    const ReaderOptions             options_;
    std::unique_ptr<io::LineCursor> cursor_;
    State                           state_                   = State::Fresh;
    std::size_t                     field_count_             = 0;
    bool                            heading_consumed_        = false;
    bool                            trailing_delimiter_seen_ = false;
    std::size_t                     records_read_            = 0;
};

const char* to_string(Reader::State state);

}   // namespace numcsv
