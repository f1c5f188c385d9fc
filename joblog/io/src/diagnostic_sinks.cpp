#include <joblog/io/diagnostic_sinks.hpp>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace joblog::io {

std::string format_local_time(std::chrono::system_clock::time_point time, const char* format) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, format);
    return oss.str();
}

// =============================================================================
// NullDiagnosticSink
// =============================================================================

void NullDiagnosticSink::emit(core::Level /*level*/, std::string_view /*message*/) {}

// =============================================================================
// MemoryDiagnosticSink
// =============================================================================

void MemoryDiagnosticSink::emit(core::Level level, std::string_view message) {
    records_.push_back(Diagnostic{level, std::string(message)});
}

std::size_t MemoryDiagnosticSink::count(core::Level level) const {
    return static_cast<std::size_t>(std::count_if(
        records_.begin(), records_.end(),
        [level](const Diagnostic& record) { return record.level == level; }));
}

bool MemoryDiagnosticSink::contains(core::Level level, std::string_view text) const {
    return std::any_of(records_.begin(), records_.end(), [&](const Diagnostic& record) {
        return record.level == level && record.message.find(text) != std::string::npos;
    });
}

// =============================================================================
// StreamDiagnosticSink
// =============================================================================

StreamDiagnosticSink::StreamDiagnosticSink(std::ostream& output,
                                           core::Level threshold,
                                           bool timestamps)
    : output_(output)
    , threshold_(threshold)
    , timestamps_(timestamps) {}

void StreamDiagnosticSink::emit(core::Level level, std::string_view message) {
    if (level < threshold_) {
        return;
    }
    if (timestamps_) {
        output_ << current_timestamp() << ' ';
    }
    output_ << '[' << core::level_name(level) << "] " << message << '\n';
    output_.flush();
}

std::string StreamDiagnosticSink::current_timestamp() {
    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << format_local_time(now, "%Y-%m-%d %H:%M:%S") << ','
        << std::setfill('0') << std::setw(3) << millis.count();
    return oss.str();
}

// =============================================================================
// TeeDiagnosticSink
// =============================================================================

void TeeDiagnosticSink::attach(core::DiagnosticSink& sink) {
    if (std::find(sinks_.begin(), sinks_.end(), &sink) == sinks_.end()) {
        sinks_.push_back(&sink);
    }
}

void TeeDiagnosticSink::emit(core::Level level, std::string_view message) {
    for (auto* sink : sinks_) {
        sink->emit(level, message);
    }
}

} // namespace joblog::io
