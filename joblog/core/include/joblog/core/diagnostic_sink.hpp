#pragma once

#include <optional>
#include <string_view>

namespace joblog::core {

/// @brief Severity of a diagnostic message, in increasing order.
/// @ingroup core_diagnostics
enum class Level {
    trace,
    debug,
    info,
    warning,
    error,
};

/// @brief Upper-case name of a level (e.g. `"WARNING"`).
/// @ingroup core_diagnostics
[[nodiscard]] std::string_view level_name(Level level) noexcept;

/// @brief Parse a level name, case-insensitively.
/// @param text  One of trace, debug, info, warning (or warn), error.
/// @return The level, or std::nullopt if @p text names no level.
/// @ingroup core_diagnostics
[[nodiscard]] std::optional<Level> parse_level(std::string_view text);

/// @brief Abstract side channel receiving leveled diagnostic messages.
/// @ingroup core_diagnostics
///
/// The correlator only emits diagnostics; it never reads them back.
/// Implementations decide where messages go (console, log file, memory
/// buffer) and which levels are kept.
///
/// A sink is created once per run by the caller and passed by reference
/// to every component that reports diagnostics.
///
/// @see io::StreamDiagnosticSink, io::MemoryDiagnosticSink
class DiagnosticSink {
public:
    /// @brief Virtual destructor for safe polymorphic deletion.
    virtual ~DiagnosticSink() = default;

    /// @brief Deliver one message.
    /// @param level    Severity of the message.
    /// @param message  Free-text content, without trailing newline.
    virtual void emit(Level level, std::string_view message) = 0;

    void trace(std::string_view message) { emit(Level::trace, message); }
    void debug(std::string_view message) { emit(Level::debug, message); }
    void info(std::string_view message) { emit(Level::info, message); }
    void warning(std::string_view message) { emit(Level::warning, message); }
    void error(std::string_view message) { emit(Level::error, message); }

protected:
    /// @brief Default constructor (protected -- instantiate subclasses only).
    DiagnosticSink() = default;
    DiagnosticSink(const DiagnosticSink&) = default;
    DiagnosticSink& operator=(const DiagnosticSink&) = default;
    DiagnosticSink(DiagnosticSink&&) = default;
    DiagnosticSink& operator=(DiagnosticSink&&) = default;
};

} // namespace joblog::core
