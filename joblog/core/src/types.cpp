#include <joblog/core/types.hpp>

#include <iomanip>
#include <sstream>

namespace joblog::core {

namespace {

// One or two decimal digits, at most `max`
std::optional<int> parse_component(std::string_view text, int max) {
    if (text.empty() || text.size() > 2) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    if (value > max) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

Date today() {
    return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
}

std::optional<Seconds> parse_time_of_day(std::string_view text) {
    const auto first = text.find(':');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    const auto second = text.find(':', first + 1);
    if (second == std::string_view::npos) {
        return std::nullopt;
    }

    auto hours = parse_component(text.substr(0, first), 23);
    auto minutes = parse_component(text.substr(first + 1, second - first - 1), 59);
    auto seconds = parse_component(text.substr(second + 1), 59);
    if (!hours || !minutes || !seconds) {
        return std::nullopt;
    }

    return std::chrono::hours{*hours} + std::chrono::minutes{*minutes} + Seconds{*seconds};
}

std::string format_time_of_day(TimePoint time) {
    const auto midnight = std::chrono::floor<std::chrono::days>(time);
    const std::chrono::hh_mm_ss hms{time - midnight};

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << hms.hours().count() << ':'
        << std::setw(2) << hms.minutes().count() << ':'
        << std::setw(2) << hms.seconds().count();
    return oss.str();
}

} // namespace joblog::core
