#pragma once

#include <joblog/core/types.hpp>

#include <optional>
#include <string_view>

namespace joblog::core {

/// @brief Classification label attached to a job that crossed a threshold.
/// @ingroup core_types
enum class Flag {
    warning,
    error,
};

/// @brief Report spelling of a flag (`"WARNING"` or `"ERROR"`).
/// @ingroup core_types
[[nodiscard]] std::string_view flag_name(Flag flag) noexcept;

/// @brief Ordered warning/error duration thresholds, in seconds.
///
/// The thresholds are global to a run. A duration at or above the error
/// threshold is classified as Flag::error, a duration at or above the
/// warning threshold (but below error) as Flag::warning, and anything
/// shorter, including negative durations, is not flagged.
///
/// @see Flag, EventCorrelator
/// @ingroup core_types
class Thresholds {
public:
    static constexpr double kDefaultWarningSeconds = 300.0;
    static constexpr double kDefaultErrorSeconds = 600.0;

    /// @brief Construct the default thresholds (300 s / 600 s).
    Thresholds() = default;

    /// @brief Construct custom thresholds.
    /// @param warning_seconds  Warning threshold in seconds.
    /// @param error_seconds    Error threshold in seconds.
    /// @throws InvalidThresholdsError  Unless `0 <= warning < error`.
    Thresholds(double warning_seconds, double error_seconds);

    [[nodiscard]] double warning_seconds() const noexcept { return warning_seconds_; }
    [[nodiscard]] double error_seconds() const noexcept { return error_seconds_; }

    /// @brief Classify an unrounded duration.
    /// @param duration_seconds  Elapsed time between START and END.
    /// @return The flag, or std::nullopt when below the warning threshold.
    [[nodiscard]] std::optional<Flag> classify(double duration_seconds) const noexcept;

    /// @brief Classify a whole-second duration.
    [[nodiscard]] std::optional<Flag> classify(Seconds duration) const noexcept {
        return classify(static_cast<double>(duration.count()));
    }

private:
    double warning_seconds_{kDefaultWarningSeconds};
    double error_seconds_{kDefaultErrorSeconds};
};

} // namespace joblog::core
