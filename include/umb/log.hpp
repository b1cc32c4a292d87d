#pragma once

/// @file include/umb/log.hpp
/// @brief Leveled, component-tagged logging on top of {fmt}.
///
/// # Module: Log
///
/// ## Responsibility
/// One process-wide threshold and one sink. Lines default to stderr as
///   `[2026-10-18T09:15:02.114Z] [WARN] [memory] cache write degraded: ...`
///
/// ## Usage
/// ```cpp
/// umb::log::warn("cache", "backend {}:{} unreachable", host, port);
/// ```
///
/// ## Guarantees
/// - Sink invocation is serialized; safe from any thread
/// - Formatting is skipped entirely below the threshold

#include <fmt/core.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

namespace umb::log {

enum class Level : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

/// Receives every line at or above the threshold.
using Sink = std::function<void(Level level,
                                std::string_view component,
                                std::string_view message)>;

void  set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;
[[nodiscard]] bool  enabled(Level level) noexcept;

[[nodiscard]] std::string_view     to_string(Level level) noexcept;
[[nodiscard]] std::optional<Level> level_from_string(std::string_view name) noexcept;

/// Replace the sink (tests capture warnings this way).
void set_sink(Sink sink);

/// Restore the default stderr sink.
void reset_sink();

/// Emit a preformatted message.
void write(Level level, std::string_view component, std::string_view message);

// ─── Formatting front-ends ────────────────────────────────────────────────────

template <typename... Args>
void trace(std::string_view component, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Trace)) {
        write(Level::Trace, component, fmt::format(f, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void debug(std::string_view component, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Debug)) {
        write(Level::Debug, component, fmt::format(f, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(std::string_view component, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Info)) {
        write(Level::Info, component, fmt::format(f, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void warn(std::string_view component, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Warn)) {
        write(Level::Warn, component, fmt::format(f, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void error(std::string_view component, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Error)) {
        write(Level::Error, component, fmt::format(f, std::forward<Args>(args)...));
    }
}

} // namespace umb::log
