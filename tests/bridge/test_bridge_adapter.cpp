#include <gtest/gtest.h>
#include "umb/bridge.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

using namespace umb;
using namespace umb::bridge;
using umb::testing_support::LogCapture;
using umb::testing_support::TempDb;
using umb::testing_support::test_config;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static MarketBar eurusd_bar(std::int64_t ts, double close = 1.0849) {
    return MarketBar{.instrument = "EURUSD", .ts_event = ts, .open = 1.0840, .high = 1.0852,
                     .low = 1.0831, .close = close, .volume = 1250.0,
                     .bar_type = "1-MINUTE-LAST"};
}

static OrderBookSnapshot deep_book(std::size_t depth) {
    OrderBookSnapshot book{.instrument = "ESZ5", .ts_event = 77, .bids = {}, .asks = {}};
    for (std::size_t i = 0; i < depth; ++i) {
        book.bids.push_back(BookLevel{5000.0 - 0.25 * i, 10.0 + i});
        book.asks.push_back(BookLevel{5000.25 + 0.25 * i, 12.0 + i});
    }
    return book;
}

class BridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        memory_ = memory::UnifiedMemory::open(test_config(db_.path()));
        ASSERT_NE(memory_, nullptr);
        trading_ = std::make_unique<BridgeAdapter>(*memory_, Source::TradingFramework);
        ai_      = std::make_unique<BridgeAdapter>(*memory_, Source::AIFramework);
    }

    TempDb                                 db_;
    std::unique_ptr<memory::UnifiedMemory> memory_;
    std::unique_ptr<BridgeAdapter>         trading_;
    std::unique_ptr<BridgeAdapter>         ai_;
};

// ─── Keys ────────────────────────────────────────────────────────────────────

TEST(Bridge_Keys, Formats) {
    EXPECT_EQ(bar_key("EURUSD", 1), "EURUSD:bar:1");
    EXPECT_EQ(tick_key("EURUSD", 2), "EURUSD:tick:2");
    EXPECT_EQ(order_book_key("ESZ5", 3), "ESZ5:orderbook:3");
    EXPECT_EQ(decision_key("agent_1", "buy_signal", 4), "agent_1:buy_signal:4");
    EXPECT_EQ(signal_key("EURUSD", "sig-9"), "EURUSD:signal:sig-9");
    EXPECT_EQ(state_key("risk"), "risk:state:current");
}

// ─── Mappings ────────────────────────────────────────────────────────────────

TEST(Bridge_Mapping, BarPolicyAndRoundTrip) {
    const MarketBar bar = eurusd_bar(1);
    const Entry e = to_entry(bar, Source::TradingFramework);
    EXPECT_EQ(e.category, Category::MarketData);
    EXPECT_EQ(e.memory_type, MemoryType::Both);
    EXPECT_EQ(e.payload["data_type"].asString(), "bar");
    EXPECT_EQ(bar_from_entry(e), bar);
}

TEST(Bridge_Mapping, TickWithAndWithoutLastPrice) {
    MarketTick tick{.instrument = "EURUSD", .ts_event = 5, .bid = 1.1, .ask = 1.2,
                    .bid_size = 3, .ask_size = 4, .last_price = std::nullopt};
    Entry e = to_entry(tick, Source::TradingFramework);
    EXPECT_EQ(e.memory_type, MemoryType::CacheOnly);
    EXPECT_EQ(tick_from_entry(e), tick);

    tick.last_price = 1.15;
    EXPECT_EQ(tick_from_entry(to_entry(tick, Source::TradingFramework)), tick);
}

TEST(Bridge_Mapping, OrderBookTruncatedToTopLevels) {
    const OrderBookSnapshot book = deep_book(15);
    const Entry e = to_entry(book, Source::TradingFramework);
    EXPECT_EQ(static_cast<std::size_t>(e.payload["bids"].size()), constants::ORDER_BOOK_DEPTH);
    EXPECT_DOUBLE_EQ(e.payload["best_bid"].asDouble(), 5000.0);
    EXPECT_DOUBLE_EQ(e.payload["spread"].asDouble(), 0.25);

    const auto back = order_book_from_entry(e);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->bids.size(), constants::ORDER_BOOK_DEPTH);
    EXPECT_EQ(back->asks.front(), book.asks.front());
}

TEST(Bridge_Mapping, EmptyBookHasNoSpread) {
    const OrderBookSnapshot book = deep_book(0);
    EXPECT_FALSE(book.spread().has_value());
    const Entry e = to_entry(book, Source::TradingFramework);
    EXPECT_TRUE(e.payload["spread"].isNull());
    EXPECT_EQ(order_book_from_entry(e), book);
}

TEST(Bridge_Mapping, DecisionCarriesConfidence) {
    const AgentDecision d{.agent_id = "agent_1", .decision_type = "buy_signal",
                          .data = make_payload({{"instrument", "EURUSD"}}), .confidence = 0.7,
                          .task_id = "task-3", .sequence = 11};
    const Entry e = to_entry(d, Source::AIFramework);
    EXPECT_EQ(e.category, Category::AgentDecision);
    EXPECT_EQ(e.key, "agent_1:buy_signal:11");
    EXPECT_EQ(e.confidence, 0.7);
    EXPECT_EQ(decision_from_entry(e), d);
}

TEST(Bridge_Mapping, SignalAndStateRoundTrip) {
    const TradingSignal s{.signal_id = "sig-1", .instrument = "EURUSD", .action = "buy",
                          .confidence = 0.9, .parameters = make_payload({{"size", 2}})};
    EXPECT_EQ(signal_from_entry(to_entry(s, Source::AIFramework)), s);

    const ComponentState st{.component = "risk", .status = "running",
                            .details = make_payload({{"exposure", 0.3}})};
    const Entry e = to_entry(st, Source::TradingFramework);
    EXPECT_EQ(e.memory_type, MemoryType::CacheOnly);
    EXPECT_EQ(state_from_entry(e), st);
}

TEST(Bridge_Mapping, WrongKind_Nullopt) {
    const Entry bar = to_entry(eurusd_bar(1), Source::TradingFramework);
    EXPECT_FALSE(tick_from_entry(bar).has_value());
    EXPECT_FALSE(order_book_from_entry(bar).has_value());
    EXPECT_FALSE(decision_from_entry(bar).has_value());

    Entry broken = bar;
    broken.payload.removeMember("close");
    EXPECT_FALSE(bar_from_entry(broken).has_value());
}

// ─── Producers ───────────────────────────────────────────────────────────────

TEST_F(BridgeTest, BarIsStoredAndAnnouncedToAi) {
    std::vector<Event> seen;
    memory_->subscribe(Source::AIFramework, [&](const Event& ev) { seen.push_back(ev); });

    ASSERT_EQ(trading_->on_bar(eurusd_bar(1)).status, memory::WriteStatus::Ok);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].event_type, "market_bar_received");
    EXPECT_EQ(seen[0].source, Source::TradingFramework);
    EXPECT_EQ(seen[0].target, Source::AIFramework);
    EXPECT_EQ(seen[0].event_data["instrument_id"].asString(), "EURUSD");
    EXPECT_DOUBLE_EQ(seen[0].event_data["bar_data"]["close"].asDouble(), 1.0849);
    EXPECT_EQ(memory_->durable().count(Category::MarketData), 1u);
}

TEST_F(BridgeTest, TickAndBookAreCacheOnly) {
    ASSERT_TRUE(trading_->on_tick(MarketTick{.instrument = "EURUSD", .ts_event = 1, .bid = 1,
                                             .ask = 2, .bid_size = 1, .ask_size = 1,
                                             .last_price = std::nullopt}).committed());
    ASSERT_TRUE(trading_->on_order_book(deep_book(3)).committed());
    EXPECT_EQ(memory_->durable().count(Category::MarketData), 0u);
    EXPECT_TRUE(ai_->latest_tick("EURUSD").has_value());
    EXPECT_TRUE(ai_->latest_order_book("ESZ5").has_value());

    const auto events = ai_->pending_events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].event_type, "market_tick_received");
    EXPECT_EQ(events[1].event_type, "orderbook_updated");
}

TEST_F(BridgeTest, DecisionSequenceAssignedAndIncreasing) {
    AgentDecision d{.agent_id = "agent_1", .decision_type = "buy_signal",
                    .data = Payload(Json::objectValue), .confidence = 0.5, .task_id = std::nullopt,
                    .sequence = 0};
    ASSERT_TRUE(ai_->save_agent_decision(d).committed());
    ASSERT_TRUE(ai_->save_agent_decision(d).committed());

    const auto history = ai_->decision_history("agent_1");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_GT(history[0].sequence, history[1].sequence);
    EXPECT_GT(history[1].sequence, 0u);
}

TEST_F(BridgeTest, HighConfidenceDecisionRaisesSignal) {
    std::vector<std::string> types;
    memory_->subscribe(Source::TradingFramework, [&](const Event& ev) { types.push_back(ev.event_type); });

    AgentDecision low{.agent_id = "a", .decision_type = "buy", .data = Payload(Json::objectValue),
                      .confidence = 0.79, .task_id = std::nullopt, .sequence = 1};
    AgentDecision high = low;
    high.confidence = 0.8;
    high.sequence   = 2;

    ASSERT_TRUE(ai_->save_agent_decision(low).committed());
    ASSERT_TRUE(ai_->save_agent_decision(high).committed());
    EXPECT_EQ(types, (std::vector<std::string>{"agent_decision_made", "agent_decision_made",
                                               "high_confidence_signal"}));
}

TEST_F(BridgeTest, RejectedDecisionIsNotAnnounced) {
    LogCapture capture(log::Level::Off);
    int events = 0;
    memory_->subscribe(events::Subscription{}, [&](const Event&) { ++events; });
    AgentDecision d{.agent_id = "a", .decision_type = "buy", .data = Payload(Json::objectValue),
                    .confidence = 1.7, .task_id = std::nullopt, .sequence = 1};
    EXPECT_EQ(ai_->save_agent_decision(d).status, memory::WriteStatus::Failure);
    EXPECT_EQ(events, 0);
}

TEST_F(BridgeTest, SignalAndStateBroadcast) {
    int ai_seen = 0, trading_seen = 0;
    memory_->subscribe(Source::AIFramework, [&](const Event&) { ++ai_seen; });
    memory_->subscribe(Source::TradingFramework, [&](const Event&) { ++trading_seen; });

    ASSERT_TRUE(ai_->save_trading_signal(TradingSignal{.signal_id = "s1", .instrument = "EURUSD",
                                                       .action = "sell", .confidence = 0.6,
                                                       .parameters = Payload(Json::objectValue)}).committed());
    ASSERT_TRUE(trading_->set_system_state(ComponentState{.component = "executor",
                                                          .status = "running",
                                                          .details = Payload(Json::objectValue)}).committed());
    EXPECT_EQ(ai_seen, 2);
    EXPECT_EQ(trading_seen, 2);
}

// ─── Consumers ───────────────────────────────────────────────────────────────

TEST_F(BridgeTest, LatestBarIsNewest) {
    ASSERT_TRUE(trading_->on_bar(eurusd_bar(1, 1.0849)).committed());
    ASSERT_TRUE(trading_->on_bar(eurusd_bar(2, 1.0858)).committed());
    const auto bar = ai_->latest_bar("EURUSD");
    ASSERT_TRUE(bar.has_value());
    EXPECT_EQ(*bar, eurusd_bar(2, 1.0858));
    EXPECT_FALSE(ai_->latest_bar("GBPUSD").has_value());
}

TEST_F(BridgeTest, LatestDecisionAndSignalLookup) {
    AgentDecision d{.agent_id = "agent_7", .decision_type = "sell_signal",
                    .data = make_payload({{"qty", 3}}), .confidence = 0.4, .task_id = "t",
                    .sequence = 0};
    ASSERT_TRUE(ai_->save_agent_decision(d).committed());
    const auto latest = trading_->latest_decision("agent_7", "sell_signal");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->data, d.data);
    EXPECT_EQ(latest->task_id, d.task_id);

    const TradingSignal s{.signal_id = "s1", .instrument = "EURUSD", .action = "buy",
                          .confidence = 0.9, .parameters = Payload(Json::objectValue)};
    ASSERT_TRUE(ai_->save_trading_signal(s).committed());
    EXPECT_EQ(trading_->trading_signal("EURUSD", "s1"), s);
    EXPECT_FALSE(trading_->trading_signal("EURUSD", "s2").has_value());
}

TEST_F(BridgeTest, DecisionHistoryIsPerAgent) {
    AgentDecision d{.agent_id = "agent_1", .decision_type = "buy", .data = Payload(Json::objectValue),
                    .confidence = 0.1, .task_id = std::nullopt, .sequence = 0};
    ASSERT_TRUE(ai_->save_agent_decision(d).committed());
    d.agent_id = "agent_10";
    ASSERT_TRUE(ai_->save_agent_decision(d).committed());
    EXPECT_EQ(trading_->decision_history("agent_1").size(), 1u);
    EXPECT_EQ(trading_->decision_history("agent_1", 0).size(), 0u);
}

TEST_F(BridgeTest, SystemStateOverwrites) {
    ASSERT_TRUE(trading_->set_system_state(ComponentState{.component = "feed", .status = "starting",
                                                          .details = Payload(Json::objectValue)}).committed());
    ASSERT_TRUE(trading_->set_system_state(ComponentState{.component = "feed", .status = "running",
                                                          .details = Payload(Json::objectValue)}).committed());
    const auto st = ai_->system_state("feed");
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->status, "running");
}

TEST_F(BridgeTest, PendingEventsArePerSide) {
    ASSERT_TRUE(trading_->on_bar(eurusd_bar(1)).committed());
    EXPECT_EQ(ai_->pending_events().size(), 1u);
    EXPECT_TRUE(trading_->pending_events().empty());
}
