/// @file src/memory/unified_memory.cpp
/// @brief UnifiedMemory: write/read routing, latest pointers, event
///        pass-through and the retention sweeper thread.

#include "umb/memory.hpp"

#include "umb/codec.hpp"
#include "umb/log.hpp"

#include <fmt/core.h>

#include <cmath>
#include <functional>

namespace umb::memory {

namespace {

constexpr const char* kComponent = "memory";

bool usable(const core::MemoryConfig& config) {
    const auto errors = core::validate(config);
    for (const auto& e : errors) {
        log::error(kComponent, "invalid configuration: {}", e);
    }
    return errors.empty();
}

std::optional<cache::Millis> cache_ttl(const Entry& entry) {
    if (!entry.ttl) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<cache::Millis>(*entry.ttl);
}

WriteResult closed_write() {
    return WriteResult{WriteStatus::Failure, "memory is closed"};
}

} // anonymous namespace

std::string_view to_string(WriteStatus s) noexcept {
    switch (s) {
        case WriteStatus::Ok:             return "ok";
        case WriteStatus::PartialFailure: return "partial_failure";
        case WriteStatus::Failure:        return "failure";
    }
    return "unknown";
}

std::string_view to_string(ReadStatus s) noexcept {
    switch (s) {
        case ReadStatus::Found:    return "found";
        case ReadStatus::NotFound: return "not_found";
        case ReadStatus::Failure:  return "failure";
    }
    return "unknown";
}

std::optional<std::string_view> key_prefix_of(std::string_view key) noexcept {
    const auto pos = key.rfind(':');
    if (pos == std::string_view::npos || pos == 0) {
        return std::nullopt;
    }
    return key.substr(0, pos);
}

// ─── Lifecycle ────────────────────────────────────────────────────────────────

UnifiedMemory::UnifiedMemory(Passkey, core::MemoryConfig config,
                             std::unique_ptr<store::DurableStore> store,
                             std::unique_ptr<cache::VolatileCache> cache)
    : config_(std::move(config))
    , store_(std::move(store))
    , cache_(std::move(cache))
    , bus_(std::make_unique<events::EventBus>(*store_)) {}

std::unique_ptr<UnifiedMemory> UnifiedMemory::open(const core::MemoryConfig& config) {
    return open(config, cache::make_remote_backend(config.cache));
}

std::unique_ptr<UnifiedMemory>
UnifiedMemory::open(const core::MemoryConfig& config,
                    std::unique_ptr<cache::CacheBackend> remote) {
    if (!usable(config)) {
        return nullptr;
    }
    auto store = store::DurableStore::open(config.db_path);
    if (!store) {
        return nullptr;
    }
    auto cache = std::make_unique<cache::VolatileCache>(config.cache, std::move(remote));
    log::info(kComponent, "memory open: store '{}', cache {}{}", config.db_path,
              cache->backend_name(), cache->degraded() ? " (degraded)" : "");
    return std::make_unique<UnifiedMemory>(Passkey{}, config, std::move(store),
                                           std::move(cache));
}

UnifiedMemory::~UnifiedMemory() {
    close();
}

void UnifiedMemory::start() {
    std::lock_guard lock(sweeper_mu_);
    if (closed_.load() || sweeper_.joinable() ||
        config_.retention.sweep_interval.count() <= 0) {
        return;
    }
    sweeper_stop_ = false;
    sweeper_ = std::thread([this] { sweeper_loop(); });
    log::debug(kComponent, "retention sweeper started (every {}s)",
               config_.retention.sweep_interval.count());
}

void UnifiedMemory::sweeper_loop() {
    std::unique_lock lock(sweeper_mu_);
    while (!sweeper_cv_.wait_for(lock, config_.retention.sweep_interval,
                                 [this] { return sweeper_stop_; })) {
        lock.unlock();
        if (!sweep()) {
            log::warn(kComponent, "scheduled sweep failed, retrying next interval");
        }
        lock.lock();
    }
}

void UnifiedMemory::close() {
    if (closed_.exchange(true)) {
        return;
    }
    {
        std::lock_guard lock(sweeper_mu_);
        sweeper_stop_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
    store_->checkpoint();
    log::info(kComponent, "memory closed");
}

std::optional<std::size_t> UnifiedMemory::sweep() {
    if (!store_) {
        return std::nullopt;
    }
    return store_->sweep(store::RetentionPolicy::from(config_.retention), now());
}

// ─── Keys ─────────────────────────────────────────────────────────────────────

std::string UnifiedMemory::cache_key(Category category, std::string_view key) const {
    return fmt::format("{}:{}:{}", config_.cache.namespace_prefix, to_string(category), key);
}

std::string UnifiedMemory::latest_key(Category category, std::string_view key_prefix) const {
    return fmt::format("{}:latest:{}:{}", config_.cache.namespace_prefix,
                       to_string(category), key_prefix);
}

// ─── Cache helpers ────────────────────────────────────────────────────────────

cache::CacheStatus UnifiedMemory::cache_put(const Entry& entry, bool durable_backed) {
    const auto ttl    = cache_ttl(entry);
    const auto status = cache_->set(cache_key(entry.category, entry.key),
                                    codec::encode_entry(entry), ttl, durable_backed);
    if (auto prefix = key_prefix_of(entry.key)) {
        cache_->set(latest_key(entry.category, *prefix), entry.key, ttl, durable_backed);
    }
    return status;
}

void UnifiedMemory::cache_drop(const Entry& entry) {
    const std::string ck = cache_key(entry.category, entry.key);
    cache_->remove(ck);
    if (auto prefix = key_prefix_of(entry.key)) {
        const std::string lk = latest_key(entry.category, *prefix);
        const cache::CacheReply pointer = cache_->get(lk);
        if (pointer.hit() && pointer.value == entry.key) {
            cache_->remove(lk);
        }
    }
}

std::mutex& UnifiedMemory::key_lock(Category category, std::string_view key) {
    const std::size_t h = std::hash<std::string_view>{}(key) + static_cast<std::size_t>(category);
    return key_locks_[h % kKeyLockStripes];
}

std::optional<std::string> UnifiedMemory::check(const Entry& entry) const {
    if (entry.key.empty()) {
        return "key must not be empty";
    }
    if (!entry.payload.isObject()) {
        return "payload must be an object";
    }
    if (entry.confidence &&
        !(std::isfinite(*entry.confidence) && *entry.confidence >= 0.0 &&
          *entry.confidence <= 1.0)) {
        return fmt::format("confidence {} outside [0, 1]", *entry.confidence);
    }
    if (entry.ttl && entry.ttl->count() <= 0) {
        return "ttl must be positive";
    }
    if (entry.category == Category::Event && !codec::event_from_entry(entry)) {
        return "event entry needs a string event_type";
    }
    return std::nullopt;
}

// ─── write ────────────────────────────────────────────────────────────────────

WriteResult UnifiedMemory::write(Entry entry) {
    if (closed_.load()) {
        return closed_write();
    }
    if (auto problem = check(entry)) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        log::error(kComponent, "rejected {}/{}: {}", to_string(entry.category), entry.key,
                   *problem);
        return WriteResult{WriteStatus::Failure, std::move(*problem)};
    }

    // Cache and durable copies of one key change together.
    std::lock_guard key_guard(key_lock(entry.category, entry.key));

    entry.created_at = now();
    if (!entry.ttl && uses_cache(entry.memory_type)) {
        entry.ttl = config_.ttl.for_category(entry.category);
    }
    writes_.fetch_add(1, std::memory_order_relaxed);

    switch (entry.memory_type) {
        case MemoryType::CacheOnly: {
            if (cache_put(entry, /*durable_backed=*/false) == cache::CacheStatus::Unavailable) {
                log::warn(kComponent, "{}/{} held in the in-process cache, backend unavailable",
                          to_string(entry.category), entry.key);
            }
            return WriteResult{};
        }

        case MemoryType::PersistentOnly: {
            const store::StoreResult put = store_->put(entry);
            if (!put.ok()) {
                failures_.fetch_add(1, std::memory_order_relaxed);
                log::error(kComponent, "durable write {}/{} failed: {}",
                           to_string(entry.category), entry.key, put.detail);
                return WriteResult{WriteStatus::Failure, put.detail};
            }
            cache_drop(entry);
            return WriteResult{};
        }

        case MemoryType::Both: {
            const auto cached = cache_put(entry, /*durable_backed=*/true);
            const store::StoreResult put = store_->put(entry);
            if (!put.ok()) {
                cache_drop(entry);
                failures_.fetch_add(1, std::memory_order_relaxed);
                log::error(kComponent, "durable write {}/{} failed: {}",
                           to_string(entry.category), entry.key, put.detail);
                return WriteResult{WriteStatus::Failure, put.detail};
            }
            if (cached == cache::CacheStatus::Unavailable) {
                partial_failures_.fetch_add(1, std::memory_order_relaxed);
                std::string detail = fmt::format(
                    "cache backend unavailable, {}/{} committed to the durable store only",
                    to_string(entry.category), entry.key);
                log::warn(kComponent, "{}", detail);
                return WriteResult{WriteStatus::PartialFailure, std::move(detail)};
            }
            return WriteResult{};
        }
    }
    return WriteResult{WriteStatus::Failure, "unknown memory type"};
}

// ─── read ─────────────────────────────────────────────────────────────────────

ReadResult UnifiedMemory::read(Category category, std::string_view key, bool prefer_cache) {
    if (closed_.load()) {
        return ReadResult{ReadStatus::Failure, std::nullopt, false, "memory is closed"};
    }

    if (prefer_cache) {
        const std::string ck = cache_key(category, key);
        const cache::CacheReply reply = cache_->get(ck);
        if (reply.hit()) {
            auto entry = codec::decode_entry(reply.value);
            if (entry && entry->category == category && entry->key == key) {
                cache_hits_.fetch_add(1, std::memory_order_relaxed);
                return ReadResult{ReadStatus::Found, std::move(entry), true, {}};
            }
            log::warn(kComponent, "discarding corrupt cache value at '{}'", ck);
            cache_->remove(ck);
        }
        cache_misses_.fetch_add(1, std::memory_order_relaxed);
    }

    store::StoreLookup lookup = store_->get(category, key);
    switch (lookup.status) {
        case store::StoreStatus::Ok:
            return ReadResult{ReadStatus::Found, std::move(lookup.entry), false, {}};
        case store::StoreStatus::NotFound:
            return ReadResult{};
        case store::StoreStatus::Error:
            break;
    }
    return ReadResult{ReadStatus::Failure, std::nullopt, false, std::move(lookup.detail)};
}

ReadResult UnifiedMemory::latest(Category category, std::string_view key_prefix) {
    if (closed_.load()) {
        return ReadResult{ReadStatus::Failure, std::nullopt, false, "memory is closed"};
    }

    const cache::CacheReply pointer = cache_->get(latest_key(category, key_prefix));
    if (pointer.hit() && key_prefix_of(pointer.value) == key_prefix) {
        ReadResult r = read(category, pointer.value);
        if (r.found()) {
            return r;
        }
    }

    store::ListFilter filter;
    filter.key_prefix = fmt::format("{}:", key_prefix);
    filter.limit      = 1;
    auto rows = store_->list(category, filter);
    if (!rows) {
        return ReadResult{ReadStatus::Failure, std::nullopt, false, "durable list failed"};
    }
    if (rows->empty()) {
        return ReadResult{};
    }
    return ReadResult{ReadStatus::Found, std::move(rows->front()), false, {}};
}

std::optional<std::vector<Entry>>
UnifiedMemory::list(Category category, const store::ListFilter& filter) {
    if (closed_.load()) {
        return std::nullopt;
    }
    return store_->list(category, filter);
}

ReadResult UnifiedMemory::refresh(Category category, std::string_view key) {
    std::lock_guard key_guard(key_lock(category, key));
    ReadResult r = read(category, key, /*prefer_cache=*/false);
    if (!r.found()) {
        return r;
    }
    Entry& entry = *r.entry;
    if (!entry.ttl) {
        entry.ttl = config_.ttl.for_category(category);
    }
    cache_put(entry, /*durable_backed=*/true);
    return r;
}

void UnifiedMemory::invalidate(Category category, std::string_view key) {
    if (closed_.load()) {
        return;
    }
    Entry target;
    target.category = category;
    target.key      = std::string(key);
    std::lock_guard key_guard(key_lock(category, key));
    cache_drop(target);
}

// ─── Events ───────────────────────────────────────────────────────────────────

events::PublishResult UnifiedMemory::publish(Event event) {
    if (closed_.load()) {
        events::PublishResult r;
        r.detail = "memory is closed";
        return r;
    }
    if (event.created_at == Timestamp{}) {
        event.created_at = now();
    }
    if (event.id.empty()) {
        event.id = bus_->next_event_id(event.source, event.event_type, event.created_at);
    }

    events::PublishResult result = bus_->publish(event);

    Entry cached = codec::event_to_entry(event);
    cached.ttl   = config_.ttl.event;
    cache_->set(cache_key(Category::Event, cached.key), codec::encode_entry(cached),
                cache_ttl(cached), result.persisted);
    return result;
}

events::SubscriptionId UnifiedMemory::subscribe(events::Subscription filter,
                                                events::Handler handler) {
    return bus_->subscribe(std::move(filter), std::move(handler));
}

events::SubscriptionId UnifiedMemory::subscribe(std::string event_type,
                                                events::Handler handler) {
    return bus_->subscribe(std::move(event_type), std::move(handler));
}

events::SubscriptionId UnifiedMemory::subscribe(Source target, events::Handler handler) {
    return bus_->subscribe(target, std::move(handler));
}

bool UnifiedMemory::unsubscribe(events::SubscriptionId id) {
    return bus_->unsubscribe(id);
}

std::optional<std::vector<Event>>
UnifiedMemory::unprocessed_events(std::optional<Source> target, std::size_t limit) {
    if (closed_.load()) {
        return std::nullopt;
    }
    return store_->unprocessed_events(target, limit);
}

store::StoreResult UnifiedMemory::mark_event_processed(std::string_view event_id) {
    if (closed_.load()) {
        return store::StoreResult{store::StoreStatus::Error, "memory is closed"};
    }
    return store_->mark_event_processed(event_id);
}

std::optional<std::vector<Event>>
UnifiedMemory::list_events(const store::EventFilter& filter) {
    if (closed_.load()) {
        return std::nullopt;
    }
    return store_->list_events(filter);
}

// ─── stats ────────────────────────────────────────────────────────────────────

Stats UnifiedMemory::stats() {
    Stats s;
    s.cache_hits   = cache_hits_.load();
    s.cache_misses = cache_misses_.load();
    const auto lookups = s.cache_hits + s.cache_misses;
    if (lookups > 0) {
        s.hit_rate  = static_cast<double>(s.cache_hits) / static_cast<double>(lookups);
        s.miss_rate = 1.0 - s.hit_rate;
    }

    const cache::VolatileCacheStats cs = cache_->stats();
    s.degraded         = cs.degraded;
    s.cache_backend    = cs.backend;
    s.fallback_entries = cs.fallback_entries;
    s.evictions        = cs.evictions;
    s.drops            = cs.drops;

    s.writes           = writes_.load();
    s.partial_failures = partial_failures_.load();
    s.failures         = failures_.load();
    s.events_published = bus_->published();
    s.handler_errors   = bus_->handler_errors();

    for (Category c : ALL_CATEGORIES) {
        s.entry_counts[c] = store_->count(c).value_or(0);
    }
    s.database_size_bytes = store_->database_size_bytes();
    return s;
}

} // namespace umb::memory
