#pragma once

#include <joblog/core/thresholds.hpp>

#include <cstdint>
#include <string>

namespace joblog::core {

/// @brief One line of the job report.
/// @ingroup core_report
struct ReportRow {
    std::string pid;              ///< Identifier correlating START and END.
    std::string job;              ///< Job description recorded at START.
    int64_t duration_seconds{0};  ///< Duration rounded to the nearest second.
    Flag flag{Flag::warning};     ///< Threshold crossed by the job.

    bool operator==(const ReportRow&) const = default;
};

/// @brief Abstract append-only destination for report rows.
/// @ingroup core_report
///
/// The correlator hands rows over one at a time, in the order END events
/// are encountered. Creating, flushing and closing the underlying file is
/// the writer's concern. Implementations signal I/O failures by throwing;
/// the correlator lets such exceptions propagate.
///
/// @see io::CsvReportWriter, io::MemoryReportWriter
class ReportWriter {
public:
    virtual ~ReportWriter() = default;

    /// @brief Append one row to the report.
    /// @param row  Row to append.
    virtual void write_row(const ReportRow& row) = 0;

protected:
    ReportWriter() = default;
    ReportWriter(const ReportWriter&) = default;
    ReportWriter& operator=(const ReportWriter&) = default;
    ReportWriter(ReportWriter&&) = default;
    ReportWriter& operator=(ReportWriter&&) = default;
};

} // namespace joblog::core
