#pragma once

/// @file include/umb/types.hpp
/// @brief Shared value types for the Unified Memory Bridge (UMB).
///
/// Every module includes this file. It defines the Entry and Event units that
/// the AI decision side and the trading side exchange, together with the
/// category / provenance / write-policy enumerations and their stable text
/// names (the names are part of the durable and cache formats).

#include <json/json.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace umb {

// ─── Time ─────────────────────────────────────────────────────────────────────

using Clock     = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Seconds   = std::chrono::seconds;

/// Wall-clock now, truncated to microseconds (the durable resolution), so a
/// timestamp read back from the store compares equal to the one written.
[[nodiscard]] Timestamp now() noexcept;

[[nodiscard]] std::int64_t to_epoch_micros(Timestamp t) noexcept;
[[nodiscard]] Timestamp    from_epoch_micros(std::int64_t us) noexcept;

// ─── Payload ──────────────────────────────────────────────────────────────────

/// Opaque structured value (field → value). Always a JSON object for Entries.
using Payload = Json::Value;

/// `{"a": 1, "b": "x"}` as `make_payload({{"a", 1}, {"b", "x"}})`.
/// Store unsigned counters as Json::Int64: parsed integers come back signed
/// and Json::Value equality compares the stored type.
[[nodiscard]] Payload make_payload(std::initializer_list<std::pair<std::string, Payload>> fields);

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// Data category. One durable table and one cache key space per category.
enum class Category : std::uint8_t {
    MarketData,
    AgentDecision,
    TradingSignal,
    SystemState,
    Event,
};

inline constexpr std::array<Category, 5> ALL_CATEGORIES{
    Category::MarketData,
    Category::AgentDecision,
    Category::TradingSignal,
    Category::SystemState,
    Category::Event,
};

/// Which subsystem produced an entry.
enum class Source : std::uint8_t {
    AIFramework,
    TradingFramework,
    Shared,
};

/// Write policy chosen by the producer.
enum class MemoryType : std::uint8_t {
    CacheOnly,
    PersistentOnly,
    Both,
};

[[nodiscard]] constexpr bool uses_cache(MemoryType t) noexcept {
    return t != MemoryType::PersistentOnly;
}

[[nodiscard]] constexpr bool uses_durable(MemoryType t) noexcept {
    return t != MemoryType::CacheOnly;
}

/// "market_data", "agent_decision", "trading_signal", "system_state", "event".
[[nodiscard]] std::string_view to_string(Category c) noexcept;
/// "ai", "trading", "shared".
[[nodiscard]] std::string_view to_string(Source s) noexcept;
/// "cache", "persistent", "both".
[[nodiscard]] std::string_view to_string(MemoryType m) noexcept;

[[nodiscard]] std::optional<Category>   category_from_string(std::string_view s) noexcept;
[[nodiscard]] std::optional<Source>     source_from_string(std::string_view s) noexcept;
[[nodiscard]] std::optional<MemoryType> memory_type_from_string(std::string_view s) noexcept;

// ─── Entry ────────────────────────────────────────────────────────────────────

/// The atomic unit of shared state.
///
/// `(category, key)` is unique in the durable store; a repeat write replaces
/// the previous value. `ttl` applies only to the cache copy.
struct Entry {
    Category               category{Category::MarketData};
    std::string            key;
    Payload                payload = Payload(Json::objectValue);
    Source                 source{Source::Shared};
    MemoryType             memory_type{MemoryType::Both};
    Timestamp              created_at{};   ///< Set by the memory facade on write
    std::optional<Seconds> ttl;            ///< Cache lifetime; category default if unset
    std::optional<double>  confidence;     ///< [0,1]; decisions and signals only
};

// ─── Event ────────────────────────────────────────────────────────────────────

/// A lightweight "new data available" notification.
struct Event {
    std::string           id;              ///< Assigned by the bus if empty
    std::string           event_type;
    Payload               event_data = Payload(Json::objectValue);
    Source                source{Source::Shared};
    std::optional<Source> target;          ///< Unset = broadcast
    Timestamp             created_at{};    ///< Assigned by the bus
    bool                  processed{false};
};

} // namespace umb
