#include <joblog/core/diagnostic_sink.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace joblog::core {

std::string_view level_name(Level level) noexcept {
    switch (level) {
        case Level::trace:   return "TRACE";
        case Level::debug:   return "DEBUG";
        case Level::info:    return "INFO";
        case Level::warning: return "WARNING";
        case Level::error:   return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<Level> parse_level(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") {
        return Level::trace;
    }
    if (lowered == "debug") {
        return Level::debug;
    }
    if (lowered == "info") {
        return Level::info;
    }
    if (lowered == "warning" || lowered == "warn") {
        return Level::warning;
    }
    if (lowered == "error") {
        return Level::error;
    }
    return std::nullopt;
}

} // namespace joblog::core
