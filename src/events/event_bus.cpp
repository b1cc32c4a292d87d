/// @file src/events/event_bus.cpp
/// @brief EventBus: persist-then-deliver publish, filtered subscriptions.

#include "umb/event_bus.hpp"
#include "umb/log.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <exception>

namespace umb::events {

namespace {
constexpr const char* kComponent = "events";
} // anonymous namespace

bool matches(const Subscription& sub, const Event& event) noexcept {
    if (sub.event_type && *sub.event_type != event.event_type) {
        return false;
    }
    if (sub.target && event.target && *sub.target != *event.target) {
        return false;
    }
    return true;
}

EventBus::EventBus(store::DurableStore& store) : store_(store) {}

std::string EventBus::next_event_id(Source source, std::string_view event_type,
                                    Timestamp at) {
    const auto seq = sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
    return fmt::format("evt-{}-{}-{}-{}", to_string(source), event_type,
                       to_epoch_micros(at), seq);
}

// ─── Subscriptions ────────────────────────────────────────────────────────────

SubscriptionId EventBus::subscribe(Subscription filter, Handler handler) {
    std::lock_guard lock(mu_);
    const SubscriptionId id = next_id_++;
    registrations_.push_back(Registration{
        id, std::move(filter), std::make_shared<const Handler>(std::move(handler))});
    log::debug(kComponent, "subscription {} registered", id);
    return id;
}

SubscriptionId EventBus::subscribe(std::string event_type, Handler handler) {
    return subscribe(Subscription{std::move(event_type), std::nullopt}, std::move(handler));
}

SubscriptionId EventBus::subscribe(Source target, Handler handler) {
    return subscribe(Subscription{std::nullopt, target}, std::move(handler));
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mu_);
    const auto it = std::find_if(registrations_.begin(), registrations_.end(),
                                 [id](const Registration& r) { return r.id == id; });
    if (it == registrations_.end()) {
        return false;
    }
    registrations_.erase(it);
    return true;
}

std::size_t EventBus::subscriber_count() const {
    std::lock_guard lock(mu_);
    return registrations_.size();
}

// ─── Publish ──────────────────────────────────────────────────────────────────

PublishResult EventBus::publish(Event event) {
    PublishResult result;

    if (event.created_at == Timestamp{}) {
        event.created_at = now();
    }
    if (event.id.empty()) {
        event.id = next_event_id(event.source, event.event_type, event.created_at);
    }
    event.processed = false;
    result.event_id = event.id;

    const store::StoreResult stored = store_.append_event(event);
    result.persisted = stored.ok();
    if (!result.persisted) {
        result.detail = stored.detail;
        log::error(kComponent, "event {} not persisted: {}", event.id, stored.detail);
    }

    // Snapshot so handlers can (un)subscribe or publish re-entrantly.
    std::vector<std::pair<SubscriptionId, std::shared_ptr<const Handler>>> targets;
    {
        std::lock_guard lock(mu_);
        targets.reserve(registrations_.size());
        for (const auto& r : registrations_) {
            if (matches(r.filter, event)) {
                targets.emplace_back(r.id, r.handler);
            }
        }
    }

    for (const auto& [id, handler] : targets) {
        ++result.delivered;
        try {
            (*handler)(event);
        } catch (const std::exception& ex) {
            ++result.handler_errors;
            log::error(kComponent, "handler {} threw on {} ({}): {}", id, event.event_type,
                       event.id, ex.what());
        } catch (...) {
            ++result.handler_errors;
            log::error(kComponent, "handler {} threw a non-standard exception on {} ({})",
                       id, event.event_type, event.id);
        }
    }

    published_.fetch_add(1, std::memory_order_relaxed);
    handler_errors_.fetch_add(result.handler_errors, std::memory_order_relaxed);
    log::trace(kComponent, "published {} to {} handlers", event.id, result.delivered);
    return result;
}

} // namespace umb::events
