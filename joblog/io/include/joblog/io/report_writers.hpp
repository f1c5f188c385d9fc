#pragma once

/// @file report_writers.hpp
/// @brief Concrete ReportWriter implementations and report file handling.
/// @ingroup io_report

#include <joblog/core/report_writer.hpp>

#include <filesystem>
#include <fstream>
#include <ios>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace joblog::io {

/// @brief Report writer producing CSV on an output stream.
///
/// Writes the header `pid,job,duration_sec,flag` on construction, then one
/// line per row. Fields containing a comma, a double quote, CR or LF are
/// quoted and embedded quotes doubled (RFC 4180); lines end with CRLF.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_report
/// @see core::ReportWriter, MemoryReportWriter
class CsvReportWriter : public core::ReportWriter {
public:
    static constexpr std::string_view kHeader = "pid,job,duration_sec,flag";
    static constexpr std::string_view kLineTerminator = "\r\n";

    /// @brief Construct a CSV writer targeting @p output and write the header.
    /// @param output  Destination stream (must outlive this writer).
    /// @throws OutputError  If the header cannot be written.
    explicit CsvReportWriter(std::ostream& output);

    CsvReportWriter(const CsvReportWriter&) = delete;
    CsvReportWriter& operator=(const CsvReportWriter&) = delete;
    CsvReportWriter(CsvReportWriter&&) = delete;
    CsvReportWriter& operator=(CsvReportWriter&&) = delete;

    /// @brief Append one CSV line.
    /// @throws OutputError  If the stream is in a failed state afterwards.
    void write_row(const core::ReportRow& row) override;

    /// @brief Flush the underlying stream.
    /// @throws OutputError  If flushing fails.
    void flush();

    /// @brief Number of data rows written (header excluded).
    [[nodiscard]] std::size_t rows_written() const noexcept { return rows_written_; }

    /// @brief Quote @p field if it needs it.
    [[nodiscard]] static std::string escape_field(std::string_view field);

private:
    void check_stream(const char* what) const;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::size_t rows_written_{0};
};

/// @brief Report writer that buffers rows in memory.
///
/// @ingroup io_report
/// @see core::ReportRow
class MemoryReportWriter : public core::ReportWriter {
public:
    void write_row(const core::ReportRow& row) override;

    [[nodiscard]] const std::vector<core::ReportRow>& rows() const { return rows_; }

    void clear() { rows_.clear(); }

private:
    std::vector<core::ReportRow> rows_;
};

/// @brief Open a file for writing, creating missing parent directories.
///
/// @param path  Destination file.
/// @param mode  Open mode; truncates by default, pass `std::ios::app` to append.
/// @return The open stream.
///
/// @throws OutputError  If a directory cannot be created or the file opened.
/// @ingroup io_report
std::ofstream open_output_file(const std::filesystem::path& path,
                               std::ios::openmode mode = std::ios::out | std::ios::trunc);

} // namespace joblog::io
