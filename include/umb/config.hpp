#pragma once

/// @file include/umb/config.hpp
/// @brief MemoryConfig: every tunable of the memory system in one aggregate.
///
/// # Module: Configuration
///
/// ## Responsibility
/// Hold defaults, load overrides from a JSON file and from `UMB_*`
/// environment variables, and validate the result.
///
/// ## JSON Layout
/// ```
/// {
///   "db_path": "/var/lib/umb/memory.db",
///   "log_level": "info",
///   "cache":     {"host": "127.0.0.1", "port": 6379, "timeout_ms": 100, ...},
///   "ttl":       {"market_data": 3600, "agent_decision": 1800, ...},
///   "retention": {"days_to_keep": 7, "max_rows_per_category": 0,
///                 "sweep_interval_s": 3600},
///   "high_confidence_threshold": 0.8
/// }
/// ```
/// Unknown keys are ignored; missing keys keep their defaults.

#include "umb/constants.hpp"
#include "umb/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace umb::core {

// ─── CacheConfig ──────────────────────────────────────────────────────────────

/// Volatile cache settings. An empty `host` means no external backend: the
/// in-process cache is used directly and the system is never "degraded".
struct CacheConfig {
    std::string                host;
    std::uint16_t              port = constants::DEFAULT_CACHE_PORT;
    std::optional<std::string> password;
    int                        db = 0;
    std::string                namespace_prefix = constants::DEFAULT_CACHE_NAMESPACE;

    std::chrono::milliseconds timeout               = constants::DEFAULT_CACHE_TIMEOUT;
    std::chrono::milliseconds reconnect_interval    = constants::DEFAULT_RECONNECT_INTERVAL;
    std::size_t               max_entries           = constants::DEFAULT_CACHE_MAX_ENTRIES;
    std::chrono::milliseconds expiry_sweep_interval = constants::DEFAULT_EXPIRY_SWEEP_INTERVAL;
};

// ─── TtlConfig ────────────────────────────────────────────────────────────────

/// Default cache lifetime per category, used when an Entry carries no ttl.
struct TtlConfig {
    Seconds market_data    = constants::MARKET_DATA_TTL;
    Seconds agent_decision = constants::AGENT_DECISION_TTL;
    Seconds trading_signal = constants::TRADING_SIGNAL_TTL;
    Seconds system_state   = constants::SYSTEM_STATE_TTL;
    Seconds event          = constants::EVENT_TTL;

    [[nodiscard]] Seconds for_category(Category c) const noexcept;
};

// ─── RetentionConfig ──────────────────────────────────────────────────────────

struct RetentionConfig {
    int         days_to_keep          = constants::DEFAULT_DAYS_TO_KEEP;
    std::size_t max_rows_per_category = 0;   ///< 0 = unbounded
    Seconds     sweep_interval        = constants::DEFAULT_SWEEP_INTERVAL;  ///< 0 = no background sweep
};

// ─── MemoryConfig ─────────────────────────────────────────────────────────────

struct MemoryConfig {
    std::string     db_path = constants::DEFAULT_DB_PATH;
    CacheConfig     cache{};
    TtlConfig       ttl{};
    RetentionConfig retention{};
    std::string     log_level = "info";
    double          high_confidence_threshold = constants::HIGH_CONFIDENCE_THRESHOLD;
};

// ─── Loading ──────────────────────────────────────────────────────────────────

/// Apply the members present in `json` on top of `base`.
/// Returns nullopt if a present member has the wrong type.
[[nodiscard]] std::optional<MemoryConfig>
apply_json(const MemoryConfig& base, const Payload& json) noexcept;

/// Read and apply a JSON configuration file on top of the defaults.
/// Returns nullopt if the file cannot be read or is malformed.
[[nodiscard]] std::optional<MemoryConfig>
load_config_file(const std::string& path) noexcept;

/// Override fields from `UMB_*` environment variables. Unparseable numeric
/// values are reported in `errors` and leave the field unchanged.
void apply_env(MemoryConfig& config, std::vector<std::string>& errors);

/// Return every problem found; empty means the configuration is usable.
[[nodiscard]] std::vector<std::string> validate(const MemoryConfig& config);

/// Serialize for diagnostics. The cache password is masked.
[[nodiscard]] Payload to_json(const MemoryConfig& config);

} // namespace umb::core
