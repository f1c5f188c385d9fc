#pragma once

#include <joblog/core/diagnostic_sink.hpp>
#include <joblog/core/line_parser.hpp>
#include <joblog/core/report_writer.hpp>
#include <joblog/core/thresholds.hpp>
#include <joblog/core/types.hpp>

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace joblog::core {

/// @brief A job whose START has been seen but whose END has not.
/// @ingroup core_correlation
struct OpenJob {
    std::string pid;
    std::string job;
    TimePoint start{};

    bool operator==(const OpenJob&) const = default;
};

/// @brief Outcome of one correlation run.
///
/// Besides the unterminated jobs, the summary carries counters describing
/// how every input line was handled.
///
/// @ingroup core_correlation
/// @see EventCorrelator::finish, correlate
struct CorrelationSummary {
    /// @brief Jobs still open at end of stream, in first-open order.
    std::vector<OpenJob> unterminated;

    uint64_t lines_read{0};        ///< Every line consumed, blank ones included.
    uint64_t blank_lines{0};       ///< Whitespace-only lines.
    uint64_t rejected_lines{0};    ///< Wrong field count, bad timestamp or unknown event.
    uint64_t starts{0};            ///< Valid START records.
    uint64_t duplicate_starts{0};  ///< STARTs that overwrote an open job.
    uint64_t completed{0};         ///< ENDs matched with an open START.
    uint64_t orphan_ends{0};       ///< ENDs with no open START.
    uint64_t warnings_flagged{0};  ///< Rows written with Flag::warning.
    uint64_t errors_flagged{0};    ///< Rows written with Flag::error.
};

/// @brief Streaming single-pass correlator of START/END job events.
/// @ingroup core_correlation
///
/// Each consumed line is validated; START records open a job keyed by pid,
/// END records close it, and the elapsed time is classified against the
/// thresholds. Flagged jobs are written to the report writer immediately,
/// in END order. Validation failures, duplicate STARTs and orphan ENDs are
/// reported as warning diagnostics and never interrupt the run.
///
/// Parsed times of day are anchored on a reference date fixed at
/// construction, so a run whose jobs cross midnight yields meaningless
/// durations.
///
/// The correlator holds references to the writer and the sink; both must
/// outlive it. Not copyable or movable.
///
/// @see correlate, Thresholds, ReportWriter, DiagnosticSink
class EventCorrelator {
public:
    /// @brief Create a correlator for a single run.
    /// @param thresholds      Warning/error thresholds.
    /// @param report          Destination of flagged rows.
    /// @param diagnostics     Destination of diagnostic messages.
    /// @param reference_date  Date combined with every parsed time of day.
    EventCorrelator(const Thresholds& thresholds,
                    ReportWriter& report,
                    DiagnosticSink& diagnostics,
                    Date reference_date = today());

    EventCorrelator(const EventCorrelator&) = delete;
    EventCorrelator& operator=(const EventCorrelator&) = delete;
    EventCorrelator(EventCorrelator&&) = delete;
    EventCorrelator& operator=(EventCorrelator&&) = delete;

    /// @brief Process the next input line.
    ///
    /// Line numbers used in diagnostics start at 1 and advance on every
    /// call, blank lines included.
    ///
    /// @param raw_line  Line content, with or without trailing `\r`.
    /// @throws InvalidStateError  If finish() was already called.
    void consume(std::string_view raw_line);

    /// @brief End the stream: report open jobs and return the summary.
    ///
    /// Emits one info diagnostic per job still open. Open jobs are never
    /// written to the report. The table is cleared afterwards.
    ///
    /// @throws InvalidStateError  If called more than once.
    CorrelationSummary finish();

    /// @brief Number of jobs currently open.
    [[nodiscard]] std::size_t open_jobs() const noexcept { return open_.size(); }

    /// @brief Number of lines consumed so far.
    [[nodiscard]] uint64_t line_number() const noexcept { return line_number_; }

    [[nodiscard]] Date reference_date() const noexcept { return reference_date_; }

private:
    struct Entry {
        std::string job;
        TimePoint start;
        uint64_t sequence;  // first-open order, kept across duplicate STARTs
    };

    void handle_start(LogRecord&& record, TimePoint time);
    void handle_end(LogRecord&& record, TimePoint time);

    Thresholds thresholds_;
    ReportWriter& report_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    DiagnosticSink& diagnostics_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    Date reference_date_;

    std::unordered_map<std::string, Entry> open_;
    uint64_t next_sequence_{0};
    uint64_t line_number_{0};
    CorrelationSummary summary_;
    bool finished_{false};
};

/// @brief Correlate every line of @p input in one call.
///
/// Reads lines until end of stream, feeding each to an EventCorrelator,
/// then returns the result of EventCorrelator::finish(). `\n`, `\r\n` and a
/// lone `\r` all end a line.
///
/// @param input           Source of log lines.
/// @param thresholds      Warning/error thresholds.
/// @param report          Destination of flagged rows.
/// @param diagnostics     Destination of diagnostic messages.
/// @param reference_date  Date combined with every parsed time of day.
/// @return The run summary.
///
/// @throws InputReadError  If @p input fails at the I/O level.
/// @ingroup core_correlation
CorrelationSummary correlate(std::istream& input,
                             const Thresholds& thresholds,
                             ReportWriter& report,
                             DiagnosticSink& diagnostics,
                             Date reference_date = today());

} // namespace joblog::core
