#pragma once

/// @file include/umb/bridge.hpp
/// @brief Bridge: native trading/AI objects ↔ Entries, and the adapter that
///        writes them through UnifiedMemory and announces them on the bus.
///
/// # Module: Bridge Adapter
///
/// ## Responsibility
/// - Pure mappings `to_entry(native, source)` and `*_from_entry(entry)`.
///   `from_entry(to_entry(x)) == x` for every field below (order books are
///   first cut to their top ORDER_BOOK_DEPTH levels per side)
/// - `BridgeAdapter` applies the write policy per object kind and publishes
///   the matching event once the write has committed
///
/// ## Keys & Policies
/// | object            | key                              | policy    | event (target)                     |
/// |-------------------|----------------------------------|-----------|------------------------------------|
/// | MarketBar         | `{instrument}:bar:{ts_event}`    | Both      | market_bar_received (ai)           |
/// | MarketTick        | `{instrument}:tick:{ts_event}`   | CacheOnly | market_tick_received (ai)          |
/// | OrderBookSnapshot | `{instrument}:orderbook:{ts_event}` | CacheOnly | orderbook_updated (ai)          |
/// | AgentDecision     | `{agent_id}:{decision_type}:{sequence}` | Both | agent_decision_made (trading), high_confidence_signal (trading) |
/// | TradingSignal     | `{instrument}:signal:{signal_id}`| Both      | trading_signal_generated (all)     |
/// | ComponentState    | `{component}:state:current`      | CacheOnly | system_state_updated (all)         |
///
/// ## NOT Responsible For
/// - Any state beyond the memory reference and its own side

#include "umb/memory.hpp"
#include "umb/types.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace umb::bridge {

// ─── Trading-side objects ─────────────────────────────────────────────────────

struct MarketBar {
    std::string  instrument;
    std::int64_t ts_event = 0;  ///< bar close, epoch ns
    double       open     = 0.0;
    double       high     = 0.0;
    double       low      = 0.0;
    double       close    = 0.0;
    double       volume   = 0.0;
    std::string  bar_type;      ///< e.g. "1-MINUTE-LAST"

    bool operator==(const MarketBar&) const = default;
};

struct MarketTick {
    std::string           instrument;
    std::int64_t          ts_event = 0;
    double                bid      = 0.0;
    double                ask      = 0.0;
    double                bid_size = 0.0;
    double                ask_size = 0.0;
    std::optional<double> last_price;

    bool operator==(const MarketTick&) const = default;
};

struct BookLevel {
    double price = 0.0;
    double size  = 0.0;

    bool operator==(const BookLevel&) const = default;
};

struct OrderBookSnapshot {
    std::string            instrument;
    std::int64_t           ts_event = 0;
    std::vector<BookLevel> bids;  ///< best first
    std::vector<BookLevel> asks;  ///< best first

    [[nodiscard]] std::optional<double> best_bid() const noexcept;
    [[nodiscard]] std::optional<double> best_ask() const noexcept;
    [[nodiscard]] std::optional<double> spread() const noexcept;

    bool operator==(const OrderBookSnapshot&) const = default;
};

// ─── AI-side objects ──────────────────────────────────────────────────────────

struct AgentDecision {
    std::string                agent_id;
    std::string                decision_type;  ///< e.g. "buy_signal"
    Payload                    data = Payload(Json::objectValue);
    double                     confidence = 0.0;
    std::optional<std::string> task_id;
    std::uint64_t              sequence = 0;   ///< 0 → assigned by the adapter

    bool operator==(const AgentDecision&) const = default;
};

struct TradingSignal {
    std::string signal_id;
    std::string instrument;
    std::string action;  ///< "buy", "sell", "hold", ...
    double      confidence = 0.0;
    Payload     parameters = Payload(Json::objectValue);

    bool operator==(const TradingSignal&) const = default;
};

struct ComponentState {
    std::string component;
    std::string status;  ///< e.g. "running", "stopped"
    Payload     details = Payload(Json::objectValue);

    bool operator==(const ComponentState&) const = default;
};

// ─── Keys ─────────────────────────────────────────────────────────────────────

[[nodiscard]] std::string bar_key(std::string_view instrument, std::int64_t ts_event);
[[nodiscard]] std::string tick_key(std::string_view instrument, std::int64_t ts_event);
[[nodiscard]] std::string order_book_key(std::string_view instrument, std::int64_t ts_event);
[[nodiscard]] std::string decision_key(std::string_view agent_id, std::string_view decision_type,
                                       std::uint64_t sequence);
[[nodiscard]] std::string signal_key(std::string_view instrument, std::string_view signal_id);
[[nodiscard]] std::string state_key(std::string_view component);

// ─── Mappings ─────────────────────────────────────────────────────────────────

[[nodiscard]] Entry to_entry(const MarketBar& bar, Source source);
[[nodiscard]] Entry to_entry(const MarketTick& tick, Source source);
[[nodiscard]] Entry to_entry(const OrderBookSnapshot& book, Source source);
[[nodiscard]] Entry to_entry(const AgentDecision& decision, Source source);
[[nodiscard]] Entry to_entry(const TradingSignal& signal, Source source);
[[nodiscard]] Entry to_entry(const ComponentState& state, Source source);

/// Each returns nullopt when the entry is of another kind or its payload
/// lacks a field the object needs.
[[nodiscard]] std::optional<MarketBar>         bar_from_entry(const Entry& entry) noexcept;
[[nodiscard]] std::optional<MarketTick>        tick_from_entry(const Entry& entry) noexcept;
[[nodiscard]] std::optional<OrderBookSnapshot> order_book_from_entry(const Entry& entry) noexcept;
[[nodiscard]] std::optional<AgentDecision>     decision_from_entry(const Entry& entry) noexcept;
[[nodiscard]] std::optional<TradingSignal>     signal_from_entry(const Entry& entry) noexcept;
[[nodiscard]] std::optional<ComponentState>    state_from_entry(const Entry& entry) noexcept;

// ─── BridgeAdapter ────────────────────────────────────────────────────────────

/// One per subsystem. Entries it writes carry `side` as their source.
class BridgeAdapter {
public:
    BridgeAdapter(memory::UnifiedMemory& memory, Source side);

    // ── Producers ────────────────────────────────────────────────────────────
    memory::WriteResult on_bar(const MarketBar& bar);
    memory::WriteResult on_tick(const MarketTick& tick);
    memory::WriteResult on_order_book(const OrderBookSnapshot& book);
    memory::WriteResult save_agent_decision(AgentDecision decision);
    memory::WriteResult save_trading_signal(const TradingSignal& signal);
    memory::WriteResult set_system_state(const ComponentState& state);

    // ── Consumers ────────────────────────────────────────────────────────────
    [[nodiscard]] std::optional<MarketBar>         latest_bar(std::string_view instrument);
    [[nodiscard]] std::optional<MarketTick>        latest_tick(std::string_view instrument);
    [[nodiscard]] std::optional<OrderBookSnapshot> latest_order_book(std::string_view instrument);
    [[nodiscard]] std::optional<AgentDecision>     latest_decision(std::string_view agent_id,
                                                                   std::string_view decision_type);
    /// Newest first.
    [[nodiscard]] std::vector<AgentDecision> decision_history(
        std::string_view agent_id, std::size_t limit = constants::DEFAULT_LIST_LIMIT);
    [[nodiscard]] std::optional<TradingSignal>  trading_signal(std::string_view instrument,
                                                               std::string_view signal_id);
    [[nodiscard]] std::optional<ComponentState> system_state(std::string_view component);

    /// Unprocessed events addressed to this side (or broadcast), oldest first.
    [[nodiscard]] std::vector<Event> pending_events(
        std::size_t limit = constants::DEFAULT_LIST_LIMIT);

    [[nodiscard]] Source side() const noexcept { return side_; }

private:
    void announce(std::string event_type, Payload data, std::optional<Source> target);

    memory::UnifiedMemory&     memory_;
    Source                     side_;
    std::atomic<std::uint64_t> last_sequence_{0};
};

} // namespace umb::bridge
