#include <joblog/core/thresholds.hpp>
#include <joblog/core/error.hpp>

#include <string>

namespace joblog::core {

std::string_view flag_name(Flag flag) noexcept {
    switch (flag) {
        case Flag::warning: return "WARNING";
        case Flag::error:   return "ERROR";
    }
    return "UNKNOWN";
}

Thresholds::Thresholds(double warning_seconds, double error_seconds)
    : warning_seconds_(warning_seconds)
    , error_seconds_(error_seconds) {
    // Negated comparisons also reject NaN
    if (!(warning_seconds_ >= 0.0)) {
        throw InvalidThresholdsError(
            "warning threshold must be non-negative, got " + std::to_string(warning_seconds_));
    }
    if (!(warning_seconds_ < error_seconds_)) {
        throw InvalidThresholdsError(
            "warning threshold (" + std::to_string(warning_seconds_) +
            " s) must be lower than error threshold (" + std::to_string(error_seconds_) + " s)");
    }
}

std::optional<Flag> Thresholds::classify(double duration_seconds) const noexcept {
    if (duration_seconds >= error_seconds_) {
        return Flag::error;
    }
    if (duration_seconds >= warning_seconds_) {
        return Flag::warning;
    }
    return std::nullopt;
}

} // namespace joblog::core
