#pragma once

/// @file diagnostic_sinks.hpp
/// @brief Concrete DiagnosticSink implementations.
///
/// Provides a no-op sink, an in-memory buffer for tests and post-run
/// inspection, a formatted stream sink for the console and log files, and
/// a tee that forwards to several sinks.
///
/// @ingroup io_diagnostics

#include <joblog/core/diagnostic_sink.hpp>

#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace joblog::io {

/// @brief Format @p time in the local time zone with a strftime pattern.
///
/// The single place converting to local time; uses POSIX `localtime_r`.
///
/// @param time    Instant to format.
/// @param format  `std::put_time` pattern, e.g. `%Y-%m-%d`.
/// @return The formatted text.
std::string format_local_time(std::chrono::system_clock::time_point time, const char* format);

/// @brief Diagnostic sink that silently discards all messages.
/// @ingroup io_diagnostics
class NullDiagnosticSink : public core::DiagnosticSink {
public:
    void emit(core::Level level, std::string_view message) override;
};

/// @brief A single buffered diagnostic.
/// @ingroup io_diagnostics
struct Diagnostic {
    core::Level level;
    std::string message;
};

/// @brief Diagnostic sink that keeps every message in memory.
///
/// All levels are recorded, trace included.
///
/// @ingroup io_diagnostics
/// @see Diagnostic
class MemoryDiagnosticSink : public core::DiagnosticSink {
public:
    void emit(core::Level level, std::string_view message) override;

    /// @brief Access the recorded diagnostics, oldest first.
    [[nodiscard]] const std::vector<Diagnostic>& records() const { return records_; }

    /// @brief Number of recorded diagnostics at exactly @p level.
    [[nodiscard]] std::size_t count(core::Level level) const;

    /// @brief Whether any message at @p level contains @p text.
    [[nodiscard]] bool contains(core::Level level, std::string_view text) const;

    void clear() { records_.clear(); }

private:
    std::vector<Diagnostic> records_;
};

/// @brief Diagnostic sink writing one formatted line per message.
///
/// Lines look like `2024-05-01 09:00:00,123 [WARNING] message`, or
/// `[WARNING] message` when timestamps are disabled. Messages below the
/// threshold are dropped. The stream is flushed after each line so that
/// diagnostics survive an aborted run.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_diagnostics
class StreamDiagnosticSink : public core::DiagnosticSink {
public:
    /// @brief Construct a sink targeting @p output.
    /// @param output      Destination stream (must outlive this sink).
    /// @param threshold   Lowest level written.
    /// @param timestamps  If true, prefix each line with the local time.
    explicit StreamDiagnosticSink(std::ostream& output,
                                  core::Level threshold = core::Level::info,
                                  bool timestamps = true);

    StreamDiagnosticSink(const StreamDiagnosticSink&) = delete;
    StreamDiagnosticSink& operator=(const StreamDiagnosticSink&) = delete;
    StreamDiagnosticSink(StreamDiagnosticSink&&) = delete;
    StreamDiagnosticSink& operator=(StreamDiagnosticSink&&) = delete;

    void emit(core::Level level, std::string_view message) override;

    [[nodiscard]] core::Level threshold() const noexcept { return threshold_; }
    void set_threshold(core::Level threshold) noexcept { threshold_ = threshold; }

private:
    static std::string current_timestamp();

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    core::Level threshold_;
    bool timestamps_;
};

/// @brief Diagnostic sink forwarding every message to several sinks.
///
/// Holds non-owning pointers; attached sinks must outlive the tee.
///
/// @ingroup io_diagnostics
class TeeDiagnosticSink : public core::DiagnosticSink {
public:
    /// @brief Attach a sink. Attaching the same sink twice has no effect.
    void attach(core::DiagnosticSink& sink);

    [[nodiscard]] std::size_t size() const noexcept { return sinks_.size(); }

    void emit(core::Level level, std::string_view message) override;

private:
    std::vector<core::DiagnosticSink*> sinks_;
};

} // namespace joblog::io
