/// @file src/bridge/mapping.cpp
/// @brief Pure native-object ↔ Entry mappings and key builders.

#include "umb/bridge.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstring>
#include <exception>
#include <utility>

namespace umb::bridge {

namespace {

// ─── Payload field readers ────────────────────────────────────────────────────

const Payload* field(const Payload& p, const char* name) {
    return p.isObject() ? p.find(name, name + std::strlen(name)) : nullptr;
}

bool is_integer(const Payload& v) {
    return v.type() == Json::intValue || v.type() == Json::uintValue;
}

bool read(const Payload& p, const char* name, double& out) {
    const Payload* v = field(p, name);
    if (v == nullptr || !v->isNumeric()) return false;
    out = v->asDouble();
    return true;
}

bool read(const Payload& p, const char* name, std::int64_t& out) {
    const Payload* v = field(p, name);
    if (v == nullptr || !is_integer(*v) || !v->isInt64()) return false;
    out = v->asInt64();
    return true;
}

bool read(const Payload& p, const char* name, std::uint64_t& out) {
    const Payload* v = field(p, name);
    if (v == nullptr || !is_integer(*v) || !v->isUInt64()) return false;
    out = v->asUInt64();
    return true;
}

bool read(const Payload& p, const char* name, std::string& out) {
    const Payload* v = field(p, name);
    if (v == nullptr || !v->isString()) return false;
    out = v->asString();
    return true;
}

bool read_object(const Payload& p, const char* name, Payload& out) {
    const Payload* v = field(p, name);
    if (v == nullptr || !v->isObject()) return false;
    out = *v;
    return true;
}

bool is_kind(const Entry& e, Category category, std::string_view data_type) {
    if (e.category != category) return false;
    std::string kind;
    return read(e.payload, "data_type", kind) && kind == data_type;
}

Entry make_entry(Category category, std::string key, Payload payload,
                 Source source, MemoryType memory_type) {
    Entry e;
    e.category    = category;
    e.key         = std::move(key);
    e.payload     = std::move(payload);
    e.source      = source;
    e.memory_type = memory_type;
    return e;
}

/// `[[price, size], ...]`, top ORDER_BOOK_DEPTH levels.
Payload levels_to_json(const std::vector<BookLevel>& levels) {
    Payload out(Json::arrayValue);
    const std::size_t n = std::min(levels.size(), constants::ORDER_BOOK_DEPTH);
    for (std::size_t i = 0; i < n; ++i) {
        Payload level(Json::arrayValue);
        level.append(levels[i].price);
        level.append(levels[i].size);
        out.append(std::move(level));
    }
    return out;
}

bool levels_from_json(const Payload& p, const char* name, std::vector<BookLevel>& out) {
    const Payload* v = field(p, name);
    if (v == nullptr || !v->isArray()) return false;
    out.clear();
    for (const auto& level : *v) {
        if (!level.isArray() || level.size() != 2 ||
            !level[0].isNumeric() || !level[1].isNumeric()) {
            return false;
        }
        out.push_back(BookLevel{level[0].asDouble(), level[1].asDouble()});
    }
    return true;
}

Payload optional_number(const std::optional<double>& v) {
    return v ? Payload(*v) : Payload(Json::nullValue);
}

} // anonymous namespace

// ─── OrderBookSnapshot ────────────────────────────────────────────────────────

std::optional<double> OrderBookSnapshot::best_bid() const noexcept {
    if (bids.empty()) return std::nullopt;
    return bids.front().price;
}

std::optional<double> OrderBookSnapshot::best_ask() const noexcept {
    if (asks.empty()) return std::nullopt;
    return asks.front().price;
}

std::optional<double> OrderBookSnapshot::spread() const noexcept {
    const auto bid = best_bid();
    const auto ask = best_ask();
    if (!bid || !ask) return std::nullopt;
    return *ask - *bid;
}

// ─── Keys ─────────────────────────────────────────────────────────────────────

std::string bar_key(std::string_view instrument, std::int64_t ts_event) {
    return fmt::format("{}:bar:{}", instrument, ts_event);
}

std::string tick_key(std::string_view instrument, std::int64_t ts_event) {
    return fmt::format("{}:tick:{}", instrument, ts_event);
}

std::string order_book_key(std::string_view instrument, std::int64_t ts_event) {
    return fmt::format("{}:orderbook:{}", instrument, ts_event);
}

std::string decision_key(std::string_view agent_id, std::string_view decision_type,
                         std::uint64_t sequence) {
    return fmt::format("{}:{}:{}", agent_id, decision_type, sequence);
}

std::string signal_key(std::string_view instrument, std::string_view signal_id) {
    return fmt::format("{}:signal:{}", instrument, signal_id);
}

std::string state_key(std::string_view component) {
    return fmt::format("{}:state:current", component);
}

// ─── to_entry ─────────────────────────────────────────────────────────────────

Entry to_entry(const MarketBar& bar, Source source) {
    return make_entry(Category::MarketData, bar_key(bar.instrument, bar.ts_event),
                      make_payload({
                          {"data_type", "bar"},
                          {"instrument", bar.instrument},
                          {"ts_event", Json::Int64{bar.ts_event}},
                          {"open", bar.open},
                          {"high", bar.high},
                          {"low", bar.low},
                          {"close", bar.close},
                          {"volume", bar.volume},
                          {"bar_type", bar.bar_type},
                      }),
                      source, MemoryType::Both);
}

Entry to_entry(const MarketTick& tick, Source source) {
    return make_entry(Category::MarketData, tick_key(tick.instrument, tick.ts_event),
                      make_payload({
                          {"data_type", "tick"},
                          {"instrument", tick.instrument},
                          {"ts_event", Json::Int64{tick.ts_event}},
                          {"bid", tick.bid},
                          {"ask", tick.ask},
                          {"bid_size", tick.bid_size},
                          {"ask_size", tick.ask_size},
                          {"last_price", optional_number(tick.last_price)},
                      }),
                      source, MemoryType::CacheOnly);
}

Entry to_entry(const OrderBookSnapshot& book, Source source) {
    OrderBookSnapshot top = book;
    if (top.bids.size() > constants::ORDER_BOOK_DEPTH) top.bids.resize(constants::ORDER_BOOK_DEPTH);
    if (top.asks.size() > constants::ORDER_BOOK_DEPTH) top.asks.resize(constants::ORDER_BOOK_DEPTH);

    return make_entry(Category::MarketData, order_book_key(book.instrument, book.ts_event),
                      make_payload({
                          {"data_type", "orderbook"},
                          {"instrument", book.instrument},
                          {"ts_event", Json::Int64{book.ts_event}},
                          {"bids", levels_to_json(top.bids)},
                          {"asks", levels_to_json(top.asks)},
                          {"best_bid", optional_number(top.best_bid())},
                          {"best_ask", optional_number(top.best_ask())},
                          {"spread", optional_number(top.spread())},
                      }),
                      source, MemoryType::CacheOnly);
}

Entry to_entry(const AgentDecision& decision, Source source) {
    Entry e = make_entry(
        Category::AgentDecision,
        decision_key(decision.agent_id, decision.decision_type, decision.sequence),
        make_payload({
            {"data_type", "agent_decision"},
            {"agent_id", decision.agent_id},
            {"decision_type", decision.decision_type},
            {"data", decision.data},
            {"confidence", decision.confidence},
            {"task_id", decision.task_id ? Payload(*decision.task_id) : Payload(Json::nullValue)},
            {"sequence", Json::UInt64{decision.sequence}},
        }),
        source, MemoryType::Both);
    e.confidence = decision.confidence;
    return e;
}

Entry to_entry(const TradingSignal& signal, Source source) {
    Entry e = make_entry(Category::TradingSignal,
                         signal_key(signal.instrument, signal.signal_id),
                         make_payload({
                             {"data_type", "trading_signal"},
                             {"signal_id", signal.signal_id},
                             {"instrument", signal.instrument},
                             {"action", signal.action},
                             {"confidence", signal.confidence},
                             {"parameters", signal.parameters},
                         }),
                         source, MemoryType::Both);
    e.confidence = signal.confidence;
    return e;
}

Entry to_entry(const ComponentState& state, Source source) {
    return make_entry(Category::SystemState, state_key(state.component),
                      make_payload({
                          {"data_type", "system_state"},
                          {"component", state.component},
                          {"status", state.status},
                          {"details", state.details},
                      }),
                      source, MemoryType::CacheOnly);
}

// ─── from_entry ───────────────────────────────────────────────────────────────

std::optional<MarketBar> bar_from_entry(const Entry& entry) noexcept {
    try {
        if (!is_kind(entry, Category::MarketData, "bar")) return std::nullopt;
        const Payload& p = entry.payload;
        MarketBar bar;
        if (!read(p, "instrument", bar.instrument) || !read(p, "ts_event", bar.ts_event) ||
            !read(p, "open", bar.open) || !read(p, "high", bar.high) ||
            !read(p, "low", bar.low) || !read(p, "close", bar.close) ||
            !read(p, "volume", bar.volume) || !read(p, "bar_type", bar.bar_type)) {
            return std::nullopt;
        }
        return bar;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<MarketTick> tick_from_entry(const Entry& entry) noexcept {
    try {
        if (!is_kind(entry, Category::MarketData, "tick")) return std::nullopt;
        const Payload& p = entry.payload;
        MarketTick tick;
        if (!read(p, "instrument", tick.instrument) || !read(p, "ts_event", tick.ts_event) ||
            !read(p, "bid", tick.bid) || !read(p, "ask", tick.ask) ||
            !read(p, "bid_size", tick.bid_size) || !read(p, "ask_size", tick.ask_size)) {
            return std::nullopt;
        }
        double last = 0.0;
        if (read(p, "last_price", last)) {
            tick.last_price = last;
        }
        return tick;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<OrderBookSnapshot> order_book_from_entry(const Entry& entry) noexcept {
    try {
        if (!is_kind(entry, Category::MarketData, "orderbook")) return std::nullopt;
        const Payload& p = entry.payload;
        OrderBookSnapshot book;
        if (!read(p, "instrument", book.instrument) || !read(p, "ts_event", book.ts_event) ||
            !levels_from_json(p, "bids", book.bids) || !levels_from_json(p, "asks", book.asks)) {
            return std::nullopt;
        }
        return book;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<AgentDecision> decision_from_entry(const Entry& entry) noexcept {
    try {
        if (!is_kind(entry, Category::AgentDecision, "agent_decision")) return std::nullopt;
        const Payload& p = entry.payload;
        AgentDecision d;
        if (!read(p, "agent_id", d.agent_id) || !read(p, "decision_type", d.decision_type) ||
            !read_object(p, "data", d.data) || !read(p, "confidence", d.confidence) ||
            !read(p, "sequence", d.sequence)) {
            return std::nullopt;
        }
        std::string task;
        if (read(p, "task_id", task)) {
            d.task_id = std::move(task);
        }
        return d;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<TradingSignal> signal_from_entry(const Entry& entry) noexcept {
    try {
        if (!is_kind(entry, Category::TradingSignal, "trading_signal")) return std::nullopt;
        const Payload& p = entry.payload;
        TradingSignal s;
        if (!read(p, "signal_id", s.signal_id) || !read(p, "instrument", s.instrument) ||
            !read(p, "action", s.action) || !read(p, "confidence", s.confidence) ||
            !read_object(p, "parameters", s.parameters)) {
            return std::nullopt;
        }
        return s;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<ComponentState> state_from_entry(const Entry& entry) noexcept {
    try {
        if (!is_kind(entry, Category::SystemState, "system_state")) return std::nullopt;
        const Payload& p = entry.payload;
        ComponentState s;
        if (!read(p, "component", s.component) || !read(p, "status", s.status) ||
            !read_object(p, "details", s.details)) {
            return std::nullopt;
        }
        return s;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace umb::bridge
