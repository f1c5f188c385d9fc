#pragma once

#include <joblog/core/types.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace joblog::core {

/// @brief Kind of a job event.
/// @ingroup core_parsing
enum class EventKind {
    start,
    end,
};

/// @brief A validated `TIMESTAMP,JOB,EVENT,PID` record.
/// @ingroup core_parsing
struct LogRecord {
    Seconds time_of_day{};  ///< Offset since midnight.
    std::string job;        ///< Free-text job description.
    EventKind event{EventKind::start};
    std::string pid;        ///< Opaque correlation identifier.
};

/// @brief The line held nothing but whitespace.
/// @ingroup core_parsing
struct BlankLine {};

/// @brief The line did not split into exactly four fields.
/// @ingroup core_parsing
struct MalformedLine {
    std::size_t field_count{0};
};

/// @brief The first field is not a valid `HH:MM:SS` time of day.
/// @ingroup core_parsing
struct BadTimestamp {
    std::string value;
};

/// @brief The third field is neither START nor END (after upper-casing).
/// @ingroup core_parsing
struct UnknownEvent {
    std::string value;  ///< Upper-cased event text.
};

/// @brief Outcome of parsing one raw line.
/// @ingroup core_parsing
using ParsedLine = std::variant<LogRecord, BlankLine, MalformedLine, BadTimestamp, UnknownEvent>;

/// @brief Strip leading and trailing ASCII whitespace.
/// @ingroup core_parsing
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

/// @brief Split @p line on commas into at most @p max_fields trimmed fields.
///
/// The first `max_fields - 1` commas are delimiters; the last field keeps
/// any remaining commas verbatim.
///
/// @param line        Text to split.
/// @param max_fields  Upper bound on the number of fields (at least 1).
/// @return Trimmed views into @p line.
/// @ingroup core_parsing
[[nodiscard]] std::vector<std::string_view> split_fields(std::string_view line, std::size_t max_fields);

/// @brief Parse and validate one raw log line.
///
/// Checks are applied in order and the first failure wins: blank line,
/// field count, timestamp, event name.
///
/// @param raw_line  Line content without its terminating newline.
/// @return A LogRecord on success, otherwise the rejection reason.
/// @ingroup core_parsing
[[nodiscard]] ParsedLine parse_line(std::string_view raw_line);

} // namespace joblog::core
