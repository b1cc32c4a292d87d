#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

/// @file include/umb/constants.hpp
/// @brief Defaults and limits for the UMB memory system.

namespace umb::constants {

// ─── Cache ────────────────────────────────────────────────────────────────────

/// Default key namespace for the volatile cache.
static constexpr const char* DEFAULT_CACHE_NAMESPACE = "umb";

static constexpr std::uint16_t DEFAULT_CACHE_PORT = 6379;

/// Network round-trip bound for the external cache backend.
static constexpr std::chrono::milliseconds DEFAULT_CACHE_TIMEOUT{100};
static constexpr std::chrono::milliseconds MAX_CACHE_TIMEOUT{1000};

/// While degraded, the external backend is probed at most this often.
static constexpr std::chrono::milliseconds DEFAULT_RECONNECT_INTERVAL{1000};

/// Capacity bound of the in-process fallback cache.
static constexpr std::size_t DEFAULT_CACHE_MAX_ENTRIES = 10'000;

static constexpr std::chrono::milliseconds DEFAULT_EXPIRY_SWEEP_INTERVAL{1000};

// ─── Cache TTLs per category ──────────────────────────────────────────────────

static constexpr std::chrono::seconds MARKET_DATA_TTL{3600};
static constexpr std::chrono::seconds AGENT_DECISION_TTL{1800};
static constexpr std::chrono::seconds TRADING_SIGNAL_TTL{900};
static constexpr std::chrono::seconds SYSTEM_STATE_TTL{300};
static constexpr std::chrono::seconds EVENT_TTL{300};

// ─── Durable store ────────────────────────────────────────────────────────────

static constexpr const char* DEFAULT_DB_PATH = "umb_memory.db";

static constexpr int SQLITE_BUSY_TIMEOUT_MS = 5000;

/// Rows deleted per statement during a retention sweep.
static constexpr std::size_t SWEEP_BATCH_ROWS = 500;

static constexpr int DEFAULT_DAYS_TO_KEEP = 7;

static constexpr std::chrono::seconds DEFAULT_SWEEP_INTERVAL{3600};

static constexpr std::size_t DEFAULT_LIST_LIMIT = 100;

// ─── Bridge ───────────────────────────────────────────────────────────────────

/// Decisions at or above this confidence raise a high_confidence_signal event.
static constexpr double HIGH_CONFIDENCE_THRESHOLD = 0.8;

/// Order-book depth retained per side.
static constexpr std::size_t ORDER_BOOK_DEPTH = 10;

} // namespace umb::constants
