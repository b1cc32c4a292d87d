/// @file src/core/types.cpp
/// @brief Enum names and time helpers for the shared value types.

#include "umb/types.hpp"

namespace umb {

// ─── Time ─────────────────────────────────────────────────────────────────────

Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

std::int64_t to_epoch_micros(Timestamp t) noexcept {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        t.time_since_epoch()).count();
}

Timestamp from_epoch_micros(std::int64_t us) noexcept {
    return Timestamp{std::chrono::duration_cast<Clock::duration>(
        std::chrono::microseconds{us})};
}

// ─── Payload ──────────────────────────────────────────────────────────────────

Payload make_payload(std::initializer_list<std::pair<std::string, Payload>> fields) {
    Payload out(Json::objectValue);
    for (const auto& [name, value] : fields) {
        out[name] = value;
    }
    return out;
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string_view to_string(Category c) noexcept {
    switch (c) {
        case Category::MarketData:    return "market_data";
        case Category::AgentDecision: return "agent_decision";
        case Category::TradingSignal: return "trading_signal";
        case Category::SystemState:   return "system_state";
        case Category::Event:         return "event";
    }
    return "unknown";
}

std::string_view to_string(Source s) noexcept {
    switch (s) {
        case Source::AIFramework:      return "ai";
        case Source::TradingFramework: return "trading";
        case Source::Shared:           return "shared";
    }
    return "unknown";
}

std::string_view to_string(MemoryType m) noexcept {
    switch (m) {
        case MemoryType::CacheOnly:      return "cache";
        case MemoryType::PersistentOnly: return "persistent";
        case MemoryType::Both:           return "both";
    }
    return "unknown";
}

// ─── from_string ──────────────────────────────────────────────────────────────

std::optional<Category> category_from_string(std::string_view s) noexcept {
    for (Category c : ALL_CATEGORIES) {
        if (to_string(c) == s) {
            return c;
        }
    }
    return std::nullopt;
}

std::optional<Source> source_from_string(std::string_view s) noexcept {
    for (Source src : {Source::AIFramework, Source::TradingFramework, Source::Shared}) {
        if (to_string(src) == s) {
            return src;
        }
    }
    return std::nullopt;
}

std::optional<MemoryType> memory_type_from_string(std::string_view s) noexcept {
    for (MemoryType m : {MemoryType::CacheOnly, MemoryType::PersistentOnly, MemoryType::Both}) {
        if (to_string(m) == s) {
            return m;
        }
    }
    return std::nullopt;
}

} // namespace umb
