/// @file src/core/log.cpp
/// @brief Logger state and the default stderr sink.

#include "umb/log.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace umb::log {

namespace {

std::atomic<Level> g_level{Level::Info};

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

Sink& sink_slot() {
    static Sink s;
    return s;
}

/// UTC ISO-8601 with milliseconds, e.g. 2026-10-18T09:15:02.114Z
std::string utc_stamp() {
    const auto tp = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        tp.time_since_epoch()).count() % 1000;
    const std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(secs), ms);
}

void stderr_sink(Level level, std::string_view component, std::string_view message) {
    fmt::print(stderr, "[{}] [{}] [{}] {}\n",
               utc_stamp(), to_string(level), component, message);
}

} // anonymous namespace

// ─── Threshold ────────────────────────────────────────────────────────────────

void set_level(Level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl) noexcept {
    return lvl != Level::Off &&
           static_cast<std::uint8_t>(lvl) >= static_cast<std::uint8_t>(level());
}

// ─── Names ────────────────────────────────────────────────────────────────────

std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<Level> level_from_string(std::string_view name) noexcept {
    std::string lower(name);
    for (auto& ch : lower) {
        if (ch >= 'A' && ch <= 'Z') {
            ch = static_cast<char>(ch - 'A' + 'a');
        }
    }
    if (lower == "trace")                     return Level::Trace;
    if (lower == "debug")                     return Level::Debug;
    if (lower == "info")                      return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error")                     return Level::Error;
    if (lower == "off")                       return Level::Off;
    return std::nullopt;
}

// ─── Sink ─────────────────────────────────────────────────────────────────────

void set_sink(Sink sink) {
    std::lock_guard lock(sink_mutex());
    sink_slot() = std::move(sink);
}

void reset_sink() {
    std::lock_guard lock(sink_mutex());
    sink_slot() = nullptr;
}

void write(Level lvl, std::string_view component, std::string_view message) {
    std::lock_guard lock(sink_mutex());
    if (sink_slot()) {
        sink_slot()(lvl, component, message);
    } else {
        stderr_sink(lvl, component, message);
    }
}

} // namespace umb::log
