/// @file src/bridge/bridge_adapter.cpp
/// @brief BridgeAdapter: policy-driven writes plus cross-side announcements.

#include "umb/bridge.hpp"
#include "umb/log.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace umb::bridge {

namespace {

constexpr const char* kComponent = "bridge";

template <typename T, typename FromEntry>
std::optional<T> decode(const memory::ReadResult& r, FromEntry from_entry) {
    if (!r.found() || !r.entry) {
        return std::nullopt;
    }
    return from_entry(*r.entry);
}

} // anonymous namespace

BridgeAdapter::BridgeAdapter(memory::UnifiedMemory& memory, Source side)
    : memory_(memory), side_(side) {}

void BridgeAdapter::announce(std::string event_type, Payload data,
                             std::optional<Source> target) {
    Event ev;
    ev.event_type = std::move(event_type);
    ev.event_data = std::move(data);
    ev.source     = side_;
    ev.target     = target;
    const events::PublishResult r = memory_.publish(std::move(ev));
    log::debug(kComponent, "{} announced to {} handlers{}", r.event_id, r.delivered,
               r.persisted ? "" : " (not persisted)");
}

// ─── Trading side ─────────────────────────────────────────────────────────────

memory::WriteResult BridgeAdapter::on_bar(const MarketBar& bar) {
    Entry entry = to_entry(bar, side_);
    Payload bar_data = entry.payload;
    const std::string key = entry.key;

    memory::WriteResult result = memory_.write(std::move(entry));
    if (result.committed()) {
        announce("market_bar_received",
                 make_payload({{"instrument_id", bar.instrument},
                         {"key", key},
                         {"bar_data", std::move(bar_data)},
                         {"timestamp", Json::Int64{bar.ts_event}}}),
                 Source::AIFramework);
    } else {
        log::warn(kComponent, "bar {} not stored: {}", key, result.detail);
    }
    return result;
}

memory::WriteResult BridgeAdapter::on_tick(const MarketTick& tick) {
    Entry entry = to_entry(tick, side_);
    Payload tick_data = entry.payload;
    const std::string key = entry.key;

    memory::WriteResult result = memory_.write(std::move(entry));
    if (result.committed()) {
        announce("market_tick_received",
                 make_payload({{"instrument_id", tick.instrument},
                         {"key", key},
                         {"tick_data", std::move(tick_data)},
                         {"timestamp", Json::Int64{tick.ts_event}}}),
                 Source::AIFramework);
    }
    return result;
}

memory::WriteResult BridgeAdapter::on_order_book(const OrderBookSnapshot& book) {
    Entry entry = to_entry(book, side_);
    Payload book_data = entry.payload;
    const std::string key = entry.key;

    memory::WriteResult result = memory_.write(std::move(entry));
    if (result.committed()) {
        announce("orderbook_updated",
                 make_payload({{"instrument_id", book.instrument},
                         {"key", key},
                         {"orderbook_data", std::move(book_data)},
                         {"timestamp", Json::Int64{book.ts_event}}}),
                 Source::AIFramework);
    }
    return result;
}

// ─── AI side ──────────────────────────────────────────────────────────────────

memory::WriteResult BridgeAdapter::save_agent_decision(AgentDecision decision) {
    if (decision.sequence == 0) {
        // Microsecond clock, forced strictly increasing within this adapter.
        const auto stamp = static_cast<std::uint64_t>(to_epoch_micros(now()));
        std::uint64_t prev = last_sequence_.load();
        std::uint64_t next = 0;
        do {
            next = std::max(stamp, prev + 1);
        } while (!last_sequence_.compare_exchange_weak(prev, next));
        decision.sequence = next;
    }

    Entry entry = to_entry(decision, side_);
    const std::string key = entry.key;

    memory::WriteResult result = memory_.write(std::move(entry));
    if (!result.committed()) {
        log::warn(kComponent, "decision {} not stored: {}", key, result.detail);
        return result;
    }

    announce("agent_decision_made",
             make_payload({{"agent_id", decision.agent_id},
                     {"decision_type", decision.decision_type},
                     {"decision_data", decision.data},
                     {"confidence", decision.confidence},
                     {"task_id", decision.task_id ? Payload(*decision.task_id) : Payload(Json::nullValue)},
                     {"key", key}}),
             Source::TradingFramework);

    if (decision.confidence >= memory_.config().high_confidence_threshold) {
        log::info(kComponent, "high confidence decision {} ({:.2f})", key, decision.confidence);
        announce("high_confidence_signal",
                 make_payload({{"agent_id", decision.agent_id},
                         {"decision_type", decision.decision_type},
                         {"confidence", decision.confidence},
                         {"key", key},
                         {"priority", "high"},
                         {"requires_action", true}}),
                 Source::TradingFramework);
    }
    return result;
}

memory::WriteResult BridgeAdapter::save_trading_signal(const TradingSignal& signal) {
    Entry entry = to_entry(signal, side_);
    const std::string key = entry.key;

    memory::WriteResult result = memory_.write(std::move(entry));
    if (!result.committed()) {
        log::warn(kComponent, "signal {} not stored: {}", key, result.detail);
        return result;
    }
    announce("trading_signal_generated",
             make_payload({{"signal_id", signal.signal_id},
                     {"instrument", signal.instrument},
                     {"action", signal.action},
                     {"confidence", signal.confidence},
                     {"key", key},
                     {"source", std::string(to_string(side_))}}),
             std::nullopt);
    return result;
}

memory::WriteResult BridgeAdapter::set_system_state(const ComponentState& state) {
    memory::WriteResult result = memory_.write(to_entry(state, side_));
    if (result.committed()) {
        announce("system_state_updated",
                 make_payload({{"component", state.component},
                         {"status", state.status},
                         {"key", state_key(state.component)}}),
                 std::nullopt);
    }
    return result;
}

// ─── Consumers ────────────────────────────────────────────────────────────────

std::optional<MarketBar> BridgeAdapter::latest_bar(std::string_view instrument) {
    return decode<MarketBar>(memory_.latest(Category::MarketData,
                                            fmt::format("{}:bar", instrument)),
                             bar_from_entry);
}

std::optional<MarketTick> BridgeAdapter::latest_tick(std::string_view instrument) {
    return decode<MarketTick>(memory_.latest(Category::MarketData,
                                             fmt::format("{}:tick", instrument)),
                              tick_from_entry);
}

std::optional<OrderBookSnapshot>
BridgeAdapter::latest_order_book(std::string_view instrument) {
    return decode<OrderBookSnapshot>(memory_.latest(Category::MarketData,
                                                    fmt::format("{}:orderbook", instrument)),
                                     order_book_from_entry);
}

std::optional<AgentDecision>
BridgeAdapter::latest_decision(std::string_view agent_id, std::string_view decision_type) {
    return decode<AgentDecision>(
        memory_.latest(Category::AgentDecision, fmt::format("{}:{}", agent_id, decision_type)),
        decision_from_entry);
}

std::vector<AgentDecision>
BridgeAdapter::decision_history(std::string_view agent_id, std::size_t limit) {
    store::ListFilter filter;
    filter.key_prefix = fmt::format("{}:", agent_id);
    filter.limit      = limit;

    std::vector<AgentDecision> out;
    if (auto rows = memory_.list(Category::AgentDecision, filter)) {
        for (const Entry& e : *rows) {
            if (auto d = decision_from_entry(e); d && d->agent_id == agent_id) {
                out.push_back(std::move(*d));
            }
        }
    }
    return out;
}

std::optional<TradingSignal>
BridgeAdapter::trading_signal(std::string_view instrument, std::string_view signal_id) {
    return decode<TradingSignal>(
        memory_.read(Category::TradingSignal, signal_key(instrument, signal_id)),
        signal_from_entry);
}

std::optional<ComponentState> BridgeAdapter::system_state(std::string_view component) {
    return decode<ComponentState>(memory_.read(Category::SystemState, state_key(component)),
                                  state_from_entry);
}

std::vector<Event> BridgeAdapter::pending_events(std::size_t limit) {
    return memory_.unprocessed_events(side_, limit).value_or(std::vector<Event>{});
}

} // namespace umb::bridge
