#include "data/fields.hpp"
#include "io/line_cursor.hpp"

#include <istream>
#include <numcsv/logger.hpp>
#include <numcsv/reader.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace numcsv
{

namespace
{

constexpr const char* kLogCategory = "reader";

bool is_comment(const std::string& line, const std::string& prefix)
{
    return !prefix.empty() && line.compare(0, prefix.size(), prefix) == 0;
}

}   // namespace

const char* to_string(Reader::State state)
{
    switch (state)
    {
        case Reader::State::Fresh:
            return "fresh";
        case Reader::State::HeadingRead:
            return "heading-read";
        case Reader::State::Reading:
            return "reading";
        case Reader::State::Exhausted:
            return "exhausted";
        case Reader::State::Failed:
            return "failed";
    }
    return "unknown";
}

Reader::Reader(std::istream& in, ReaderOptions options)
    : options_(std::move(options)),
      cursor_(std::make_unique<io::LineCursor>(in)),
      field_count_(options_.expected_field_count)
{
    if (options_.field_delimiter.empty())
        throw std::invalid_argument("numcsv::Reader: field delimiter must not be empty");
}

Reader::~Reader() = default;

std::size_t Reader::line_number() const
{
    return cursor_->line_number();
}

void Reader::fail(const ReadError& err)
{
    state_ = State::Failed;
    NUMCSV_LOG_DEBUG(kLogCategory, "{}", err.what());
    throw err;
}

void Reader::require(bool ok, const char* what)
{
    if (ok)
        return;
    fail(ReadError(ErrorKind::Sequence,
                   cursor_->line_number(),
                   std::string(what) + " (reader is " + to_string(state_) + ")"));
}

Heading Reader::read_heading()
{
    require(state_ != State::Failed, "read_heading after an earlier error");
    require(!options_.skip_heading, "read_heading with skip_heading set");
    require(state_ == State::Fresh, "read_heading called twice or after read");

    bool found = false;
    try
    {
        while (cursor_->next())
        {
            const std::string& line = cursor_->line();
            if (line.empty() || is_comment(line, options_.comment_prefix))
            {
                NUMCSV_LOG_TRACE(kLogCategory, "skipping line {}", cursor_->line_number());
                continue;
            }
            found = true;
            break;
        }
    }
    catch (const ReadError& e)
    {
        fail(e);
    }

    if (!found)
        fail(ReadError(ErrorKind::Input, 0, "no heading line before end of input"));

    const std::size_t line_no = cursor_->line_number();
    Heading fields = data::split_fields(cursor_->line(), options_.effective_heading_delimiter());

    if (fields.back().empty())
    {
        if (!options_.allow_trailing_delimiter)
            fail(ReadError(ErrorKind::TrailingDelimiter, line_no, "heading ends with a delimiter"));
        fields.pop_back();
        trailing_delimiter_seen_ = true;
    }

    if (options_.expected_field_count != 0 && fields.size() != options_.expected_field_count)
        fail(ReadError::field_count(line_no, options_.expected_field_count, fields.size()));
    field_count_ = fields.size();

    for (auto& f : fields)
        f = data::strip_quotes(f);

    heading_consumed_ = true;
    state_            = State::HeadingRead;
    NUMCSV_LOG_DEBUG(kLogCategory,
                     "heading at line {} with {} fields{}",
                     line_no,
                     field_count_,
                     trailing_delimiter_seen_ ? " (trailing delimiter)" : "");
    return fields;
}

std::optional<Record> Reader::read()
{
    if (state_ == State::Exhausted)
        return std::nullopt;
    require(state_ != State::Failed, "read after an earlier error");
    require(state_ != State::Fresh || options_.skip_heading, "read before read_heading");

    bool has_line = false;
    try
    {
        has_line = cursor_->next();
    }
    catch (const ReadError& e)
    {
        fail(e);
    }

    if (!has_line)
    {
        state_ = State::Exhausted;
        NUMCSV_LOG_DEBUG(kLogCategory, "end of input after {} records", records_read_);
        return std::nullopt;
    }

    const std::size_t line_no = cursor_->line_number();
    std::vector<std::string> fields = data::split_fields(cursor_->line(), options_.field_delimiter);
    data::drop_trailing_empty(fields);

    if (!heading_consumed_)
    {
        heading_consumed_ = true;
        if (field_count_ == 0)
        {
            field_count_ = fields.size();
            NUMCSV_LOG_DEBUG(kLogCategory, "inferred {} fields from line {}", field_count_, line_no);
        }
    }

    if (fields.size() != field_count_)
        fail(ReadError::field_count(line_no, field_count_, fields.size()));

    Record record;
    record.reserve(field_count_);
    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        auto value = data::parse_double(fields[i]);
        if (!value)
            fail(ReadError::numeric_parse(line_no, i, fields[i]));
        record.push_back(*value);
    }

    state_ = State::Reading;
    ++records_read_;
    return record;
}

Matrix Reader::read_all()
{
    std::vector<Record> records;
    while (auto record = read())
        records.push_back(std::move(*record));
    return assemble_matrix(records, field_count_);
}

}   // namespace numcsv
