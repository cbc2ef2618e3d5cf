// Print the heading, shape and per-column mean of a numeric CSV file.
//
//   csv_summary data.csv
//   csv_summary --delim ';' --comment '#' --allow-trailing data.csv
//   csv_summary --no-heading --verbose --log read.log data.txt

#include <charconv>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numcsv/numcsv.hpp>
#include <stdexcept>
#include <string>
#include <system_error>

using namespace numcsv;

namespace
{

void usage()
{
    std::cerr << "usage: csv_summary [--delim D] [--heading-delim D] [--comment P]\n"
                 "                   [--fields N] [--no-heading] [--allow-trailing]\n"
                 "                   [--verbose] [--log FILE] <file>\n";
}

bool parse_count(const char* text, std::size_t& out)
{
    const char* end = text + std::strlen(text);
    auto [ptr, ec]  = std::from_chars(text, end, out);
    return ec == std::errc() && ptr == end && ptr != text;
}

}   // namespace

int main(int argc, char** argv)
{
    ReaderOptions opts;
    std::string   path;
    std::string   log_path;
    bool          verbose = false;

    for (int i = 1; i < argc; ++i)
    {
        const char* arg       = argv[i];
        auto        has_value = [&]() { return i + 1 < argc; };

        if (std::strcmp(arg, "--delim") == 0 && has_value())
            opts.field_delimiter = argv[++i];
        else if (std::strcmp(arg, "--heading-delim") == 0 && has_value())
            opts.heading_delimiter = argv[++i];
        else if (std::strcmp(arg, "--comment") == 0 && has_value())
            opts.comment_prefix = argv[++i];
        else if (std::strcmp(arg, "--fields") == 0 && has_value()
                 && parse_count(argv[i + 1], opts.expected_field_count))
            ++i;
        else if (std::strcmp(arg, "--no-heading") == 0)
            opts.skip_heading = true;
        else if (std::strcmp(arg, "--allow-trailing") == 0)
            opts.allow_trailing_delimiter = true;
        else if (std::strcmp(arg, "--verbose") == 0)
            verbose = true;
        else if (std::strcmp(arg, "--log") == 0 && has_value())
            log_path = argv[++i];
        else if (arg[0] != '-' && path.empty())
            path = arg;
        else
        {
            usage();
            return 2;
        }
    }
    if (path.empty())
    {
        usage();
        return 2;
    }

    Logger::instance().set_level(verbose ? LogLevel::Trace : LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());
    if (!log_path.empty())
        Logger::instance().add_sink(sinks::file_sink(log_path));

    std::ifstream in(path);
    if (!in.is_open())
    {
        NUMCSV_LOG_ERROR("csv_summary", "cannot open file: {}", path);
        return 1;
    }

    try
    {
        Reader  reader(in, opts);
        Heading heading;
        if (!opts.skip_heading)
            heading = reader.read_heading();
        Matrix m = reader.read_all();

        NUMCSV_LOG_INFO("csv_summary", "{}: {} rows x {} columns", path, m.rows(), m.cols());
        if (m.rows() == 0)
            NUMCSV_LOG_WARN("csv_summary", "{}: no data rows after line {}", path, reader.line_number());

        std::cout << std::setprecision(6);
        for (Eigen::Index c = 0; c < m.cols(); ++c)
        {
            const std::string name = heading.empty()
                                         ? "column " + std::to_string(c + 1)
                                         : heading[static_cast<std::size_t>(c)];
            std::cout << name << '\t';
            if (m.rows() > 0)
                std::cout << m.col(c).mean();
            else
                std::cout << "-";
            std::cout << '\n';
        }
    }
    catch (const ReadError& e)
    {
        NUMCSV_LOG_ERROR("csv_summary", "{}: {}", path, e.what());
        return 1;
    }
    catch (const std::invalid_argument& e)
    {
        NUMCSV_LOG_ERROR("csv_summary", "{}", e.what());
        return 2;
    }

    return 0;
}
