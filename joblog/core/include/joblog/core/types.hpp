#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace joblog::core {

/// @brief Whole-second duration used for job runtimes and times of day.
/// @ingroup core_types
using Seconds = std::chrono::seconds;

/// @brief Calendar date combined with parsed times of day.
///
/// The date carries no meaning of its own: it is captured once per run so
/// that START and END timestamps share it and can be subtracted.
///
/// @ingroup core_types
using Date = std::chrono::sys_days;

/// @brief Absolute instant at one-second resolution.
/// @ingroup core_types
using TimePoint = std::chrono::sys_seconds;

/// @brief Return today's date according to the system clock.
/// @return The current date (UTC calendar day).
/// @ingroup core_types
[[nodiscard]] Date today();

/// @brief Parse a 24-hour `HH:MM:SS` time of day.
///
/// Each component must be one or two decimal digits. Hours must be in
/// [0, 23], minutes and seconds in [0, 59]. No surrounding text is
/// accepted; callers trim whitespace beforehand.
///
/// @param text  Candidate time of day, e.g. `"09:04:00"` or `"9:4:0"`.
/// @return Offset since midnight, or std::nullopt if @p text is invalid.
/// @ingroup core_types
[[nodiscard]] std::optional<Seconds> parse_time_of_day(std::string_view text);

/// @brief Combine a date with an offset since midnight.
/// @param date         Reference date.
/// @param time_of_day  Offset since midnight.
/// @return The absolute instant.
/// @ingroup core_types
[[nodiscard]] constexpr TimePoint at_time_of_day(Date date, Seconds time_of_day) noexcept {
    return TimePoint{date} + time_of_day;
}

/// @brief Format the time-of-day part of @p time as zero-padded `HH:MM:SS`.
/// @ingroup core_types
[[nodiscard]] std::string format_time_of_day(TimePoint time);

} // namespace joblog::core
