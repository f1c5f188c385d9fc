#include <joblog/io/report_writers.hpp>
#include <joblog/io/error.hpp>

#include <system_error>

namespace joblog::io {

// =============================================================================
// CsvReportWriter
// =============================================================================

CsvReportWriter::CsvReportWriter(std::ostream& output)
    : output_(output) {
    output_ << kHeader << kLineTerminator;
    check_stream("cannot write report header");
}

std::string CsvReportWriter::escape_field(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }

    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted.push_back('"');
    for (char c : field) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

void CsvReportWriter::write_row(const core::ReportRow& row) {
    output_ << escape_field(row.pid) << ','
            << escape_field(row.job) << ','
            << row.duration_seconds << ','
            << core::flag_name(row.flag) << kLineTerminator;
    check_stream("cannot write report row");
    ++rows_written_;
}

void CsvReportWriter::flush() {
    output_.flush();
    check_stream("cannot flush report");
}

void CsvReportWriter::check_stream(const char* what) const {
    if (!output_) {
        throw OutputError(what, "report after " + std::to_string(rows_written_) + " rows");
    }
}

// =============================================================================
// MemoryReportWriter
// =============================================================================

void MemoryReportWriter::write_row(const core::ReportRow& row) {
    rows_.push_back(row);
}

// =============================================================================
// Output files
// =============================================================================

std::ofstream open_output_file(const std::filesystem::path& path, std::ios::openmode mode) {
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw OutputError("cannot create directory " + parent.string() + " (" + ec.message() + ")",
                              path.string());
        }
    }

    std::ofstream file(path, mode | std::ios::out);
    if (!file) {
        throw OutputError("cannot open file for writing", path.string());
    }
    return file;
}

} // namespace joblog::io
