#pragma once

/// @file include/umb/event_bus.hpp
/// @brief EventBus: in-process publish/subscribe with a durable audit trail.
///
/// # Module: Event Bus
///
/// ## Responsibility
/// Deliver "new data available" notifications from one side to the other
/// without polling. Every published event is appended to the durable events
/// table first, so a consumer that was not subscribed (or crashed) can find
/// it later through `DurableStore::unprocessed_events`.
///
/// ## Delivery
/// - Synchronous, in registration order, on the publisher's thread
/// - A subscription matches when its `event_type` (if set) equals the event's
///   and its `target` (if set) equals the event's target or the event is a
///   broadcast (no target)
/// - Only subscriptions registered before `publish` begins see the event;
///   there is no backlog replay
///
/// ## Guarantees
/// - Handler exceptions are caught, logged with the subscription id and
///   counted; they never reach the publisher or stop later handlers
/// - Handlers run outside the bus lock and may publish or (un)subscribe
/// - A failed durable append is reported (`persisted == false`) but does not
///   suppress live delivery
///
/// ## NOT Responsible For
/// - Slow handlers: there is no cancellation, handlers must return quickly

#include "umb/durable_store.hpp"
#include "umb/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace umb::events {

using Handler        = std::function<void(const Event&)>;
using SubscriptionId = std::uint64_t;

/// Unset fields match everything.
struct Subscription {
    std::optional<std::string> event_type;
    std::optional<Source>      target;
};

[[nodiscard]] bool matches(const Subscription& sub, const Event& event) noexcept;

struct PublishResult {
    std::string event_id;
    bool        persisted      = false;
    std::size_t delivered      = 0;  ///< handlers invoked
    std::size_t handler_errors = 0;  ///< of which threw
    std::string detail;              ///< store error text when !persisted
};

class EventBus {
public:
    explicit EventBus(store::DurableStore& store);

    EventBus(const EventBus&)            = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Assigns `id` (if empty) and `created_at`, persists, then delivers.
    PublishResult publish(Event event);

    SubscriptionId subscribe(Subscription filter, Handler handler);
    SubscriptionId subscribe(std::string event_type, Handler handler);
    SubscriptionId subscribe(Source target, Handler handler);

    /// False if `id` is not registered.
    bool unsubscribe(SubscriptionId id);

    [[nodiscard]] std::size_t   subscriber_count() const;
    [[nodiscard]] std::uint64_t published() const noexcept { return published_.load(); }
    [[nodiscard]] std::uint64_t handler_errors() const noexcept { return handler_errors_.load(); }

    /// `evt-{source}-{event_type}-{epoch_us}-{sequence}`; unique per bus.
    [[nodiscard]] std::string next_event_id(Source source, std::string_view event_type,
                                            Timestamp at);

private:
    struct Registration {
        SubscriptionId                  id;
        Subscription                    filter;
        std::shared_ptr<const Handler>  handler;
    };

    store::DurableStore&      store_;
    mutable std::mutex        mu_;
    std::vector<Registration> registrations_;
    SubscriptionId            next_id_ = 1;

    std::atomic<std::uint64_t> sequence_{0};
    std::atomic<std::uint64_t> published_{0};
    std::atomic<std::uint64_t> handler_errors_{0};
};

} // namespace umb::events
