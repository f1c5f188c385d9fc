#include <joblog/core/correlator.hpp>
#include <joblog/core/error.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

namespace joblog::core {

namespace {

std::string line_prefix(uint64_t line_number) {
    return "Line " + std::to_string(line_number);
}

} // anonymous namespace

EventCorrelator::EventCorrelator(const Thresholds& thresholds,
                                 ReportWriter& report,
                                 DiagnosticSink& diagnostics,
                                 Date reference_date)
    : thresholds_(thresholds)
    , report_(report)
    , diagnostics_(diagnostics)
    , reference_date_(reference_date) {}

void EventCorrelator::consume(std::string_view raw_line) {
    if (finished_) {
        throw InvalidStateError("cannot consume lines after finish()");
    }

    ++line_number_;
    ++summary_.lines_read;

    auto parsed = parse_line(raw_line);

    std::visit(
        overloaded{
            [&](BlankLine) {
                ++summary_.blank_lines;
                diagnostics_.trace(line_prefix(line_number_) + ": empty, skipped");
            },
            [&](const MalformedLine& bad) {
                ++summary_.rejected_lines;
                diagnostics_.warning(line_prefix(line_number_) + " malformed (" +
                                     std::to_string(bad.field_count) + " fields): " +
                                     std::string(trim(raw_line)));
            },
            [&](const BadTimestamp& bad) {
                ++summary_.rejected_lines;
                diagnostics_.warning(line_prefix(line_number_) + " bad timestamp '" + bad.value +
                                     "'");
            },
            [&](const UnknownEvent& bad) {
                ++summary_.rejected_lines;
                diagnostics_.warning(line_prefix(line_number_) + " unknown event '" + bad.value +
                                     "'");
            },
            [&](LogRecord& record) {
                const TimePoint time = at_time_of_day(reference_date_, record.time_of_day);
                if (record.event == EventKind::start) {
                    handle_start(std::move(record), time);
                } else {
                    handle_end(std::move(record), time);
                }
            }},
        parsed);
}

void EventCorrelator::handle_start(LogRecord&& record, TimePoint time) {
    ++summary_.starts;

    auto iter = open_.find(record.pid);
    if (iter != open_.end()) {
        ++summary_.duplicate_starts;
        diagnostics_.warning(line_prefix(line_number_) + " duplicate START for pid " + record.pid +
                             "; overwriting previous start");
        iter->second.job = std::move(record.job);
        iter->second.start = time;
        return;
    }

    open_.emplace(std::move(record.pid), Entry{std::move(record.job), time, next_sequence_++});
}

void EventCorrelator::handle_end(LogRecord&& record, TimePoint time) {
    auto iter = open_.find(record.pid);
    if (iter == open_.end()) {
        ++summary_.orphan_ends;
        diagnostics_.warning(line_prefix(line_number_) + " END for pid " + record.pid +
                             " with no START");
        return;
    }

    Entry entry = std::move(iter->second);
    open_.erase(iter);
    ++summary_.completed;

    // Negative when END precedes START; classify() never flags those
    const Seconds duration = time - entry.start;
    diagnostics_.debug(line_prefix(line_number_) + " pid " + record.pid + " (" + entry.job +
                       ") ran " + std::to_string(duration.count()) + " s");

    const auto flag = thresholds_.classify(duration);
    if (!flag) {
        return;
    }

    report_.write_row(ReportRow{std::move(record.pid), std::move(entry.job), duration.count(), *flag});
    if (*flag == Flag::error) {
        ++summary_.errors_flagged;
    } else {
        ++summary_.warnings_flagged;
    }
}

CorrelationSummary EventCorrelator::finish() {
    if (finished_) {
        throw InvalidStateError("finish() already called");
    }
    finished_ = true;

    std::vector<std::pair<uint64_t, OpenJob>> remaining;
    remaining.reserve(open_.size());
    for (auto& [pid, entry] : open_) {
        remaining.emplace_back(entry.sequence, OpenJob{pid, std::move(entry.job), entry.start});
    }
    open_.clear();

    std::sort(remaining.begin(), remaining.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

    summary_.unterminated.reserve(remaining.size());
    for (auto& item : remaining) {
        OpenJob& job = item.second;
        diagnostics_.info("PID " + job.pid + " (" + job.job + ") still running, no END found (started " +
                          format_time_of_day(job.start) + ")");
        summary_.unterminated.push_back(std::move(job));
    }

    return std::move(summary_);
}

CorrelationSummary correlate(std::istream& input,
                             const Thresholds& thresholds,
                             ReportWriter& report,
                             DiagnosticSink& diagnostics,
                             Date reference_date) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    EventCorrelator correlator(thresholds, report, diagnostics, reference_date);

    std::string line;
    while (std::getline(input, line)) {
        // A lone CR ends a line too; CRLF counts as one terminator
        std::string_view rest(line);
        for (auto cr = rest.find('\r'); cr != std::string_view::npos; cr = rest.find('\r')) {
            correlator.consume(rest.substr(0, cr));
            rest.remove_prefix(cr + 1);
        }
        if (line.empty() || line.back() != '\r') {
            correlator.consume(rest);
        }
    }
    if (input.bad()) {
        throw InputReadError("failed to read input after line " +
                             std::to_string(correlator.line_number()));
    }

    return correlator.finish();
}

} // namespace joblog::core
