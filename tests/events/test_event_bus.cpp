#include <gtest/gtest.h>
#include "umb/event_bus.hpp"
#include "test_support.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace umb;
using namespace umb::events;
using umb::testing_support::LogCapture;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Event make_event(std::string type, std::optional<Source> target = std::nullopt) {
    Event ev;
    ev.event_type = std::move(type);
    ev.event_data = make_payload({{"instrument_id", "EURUSD"}});
    ev.source     = Source::TradingFramework;
    ev.target     = target;
    return ev;
}

class EventBusTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = store::DurableStore::open(":memory:");
        ASSERT_NE(store_, nullptr);
        bus_ = std::make_unique<EventBus>(*store_);
    }

    std::unique_ptr<store::DurableStore> store_;
    std::unique_ptr<EventBus>            bus_;
};

// ─── matches ─────────────────────────────────────────────────────────────────

TEST(EventBus_Matches, EmptyFilterMatchesEverything) {
    EXPECT_TRUE(matches(Subscription{}, make_event("x", Source::AIFramework)));
    EXPECT_TRUE(matches(Subscription{}, make_event("y")));
}

TEST(EventBus_Matches, TargetFilterAcceptsBroadcast) {
    const Subscription ai{std::nullopt, Source::AIFramework};
    EXPECT_TRUE(matches(ai, make_event("x", Source::AIFramework)));
    EXPECT_TRUE(matches(ai, make_event("x")));
    EXPECT_FALSE(matches(ai, make_event("x", Source::TradingFramework)));
}

TEST(EventBus_Matches, TypeFilter) {
    const Subscription bars{std::string("market_bar_received"), std::nullopt};
    EXPECT_TRUE(matches(bars, make_event("market_bar_received")));
    EXPECT_FALSE(matches(bars, make_event("orderbook_updated")));
}

// ─── publish ─────────────────────────────────────────────────────────────────

TEST_F(EventBusTest, PublishPersistsBeforeDelivery) {
    bool seen_in_store = false;
    bus_->subscribe("market_bar_received", [&](const Event& ev) {
        seen_in_store = store_->get(Category::Event, ev.id).status == store::StoreStatus::Ok;
    });
    const auto r = bus_->publish(make_event("market_bar_received", Source::AIFramework));
    EXPECT_TRUE(r.persisted);
    EXPECT_EQ(r.delivered, 1u);
    EXPECT_TRUE(seen_in_store);
}

TEST_F(EventBusTest, AssignsIdAndTimestamp) {
    Event received;
    bus_->subscribe(Subscription{}, [&](const Event& ev) { received = ev; });
    const auto r = bus_->publish(make_event("orderbook_updated"));
    EXPECT_EQ(received.id, r.event_id);
    EXPECT_EQ(r.event_id.rfind("evt-trading-orderbook_updated-", 0), 0u);
    EXPECT_NE(received.created_at, Timestamp{});
    EXPECT_FALSE(received.processed);
}

TEST_F(EventBusTest, KeepsCallerSuppliedId) {
    Event ev = make_event("x");
    ev.id = "custom-1";
    EXPECT_EQ(bus_->publish(ev).event_id, "custom-1");
}

TEST_F(EventBusTest, IdsAreUnique) {
    const Timestamp t = now();
    const auto a = bus_->next_event_id(Source::AIFramework, "x", t);
    const auto b = bus_->next_event_id(Source::AIFramework, "x", t);
    EXPECT_NE(a, b);
}

TEST_F(EventBusTest, DeliveredInRegistrationOrder) {
    std::vector<int> order;
    bus_->subscribe(Subscription{}, [&](const Event&) { order.push_back(1); });
    bus_->subscribe(Subscription{}, [&](const Event&) { order.push_back(2); });
    bus_->subscribe(Subscription{}, [&](const Event&) { order.push_back(3); });
    bus_->publish(make_event("x"));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST_F(EventBusTest, TargetedEventSkipsOtherSide) {
    int ai = 0, trading = 0;
    bus_->subscribe(Source::AIFramework, [&](const Event&) { ++ai; });
    bus_->subscribe(Source::TradingFramework, [&](const Event&) { ++trading; });
    bus_->publish(make_event("agent_decision_made", Source::TradingFramework));
    bus_->publish(make_event("system_state_updated"));
    EXPECT_EQ(ai, 1);
    EXPECT_EQ(trading, 2);
}

TEST_F(EventBusTest, NoReplayForLateSubscriber) {
    bus_->publish(make_event("market_bar_received", Source::AIFramework));
    int calls = 0;
    bus_->subscribe("market_bar_received", [&](const Event&) { ++calls; });
    EXPECT_EQ(calls, 0);

    const auto pending = store_->unprocessed_events(Source::AIFramework);
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(pending->size(), 1u);
}

// ─── Handler failures ────────────────────────────────────────────────────────

TEST_F(EventBusTest, ThrowingHandlerDoesNotStopOthers) {
    LogCapture capture(log::Level::Error);
    int after = 0;
    bus_->subscribe(Subscription{}, [](const Event&) { throw std::runtime_error("boom"); });
    bus_->subscribe(Subscription{}, [](const Event&) { throw 42; });
    bus_->subscribe(Subscription{}, [&](const Event&) { ++after; });

    PublishResult r;
    EXPECT_NO_THROW(r = bus_->publish(make_event("x")));
    EXPECT_EQ(r.delivered, 3u);
    EXPECT_EQ(r.handler_errors, 2u);
    EXPECT_EQ(after, 1);
    EXPECT_EQ(bus_->handler_errors(), 2u);
    EXPECT_TRUE(capture.contains("boom"));
}

// ─── Re-entrancy ─────────────────────────────────────────────────────────────

TEST_F(EventBusTest, HandlerMayPublishAndUnsubscribe) {
    int followups = 0;
    SubscriptionId self = 0;
    self = bus_->subscribe("first", [&](const Event&) {
        bus_->unsubscribe(self);
        bus_->publish(make_event("second"));
    });
    bus_->subscribe("second", [&](const Event&) { ++followups; });

    bus_->publish(make_event("first"));
    bus_->publish(make_event("first"));
    EXPECT_EQ(followups, 1);
    EXPECT_EQ(bus_->subscriber_count(), 1u);
    EXPECT_EQ(bus_->published(), 3u);
}

TEST_F(EventBusTest, UnsubscribeUnknown_False) {
    EXPECT_FALSE(bus_->unsubscribe(999));
    const auto id = bus_->subscribe(Subscription{}, [](const Event&) {});
    EXPECT_TRUE(bus_->unsubscribe(id));
    EXPECT_FALSE(bus_->unsubscribe(id));
}
