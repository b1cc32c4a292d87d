/// @file src/cache/in_process_cache.cpp
/// @brief Bounded, expiring in-process key/value store with two LRU lanes.

#include "umb/cache.hpp"
#include "umb/log.hpp"

#include <algorithm>

namespace umb::cache {

namespace {
constexpr const char* kComponent = "cache";
} // anonymous namespace

std::string_view to_string(CacheStatus s) noexcept {
    switch (s) {
        case CacheStatus::Ok:          return "ok";
        case CacheStatus::Miss:        return "miss";
        case CacheStatus::Unavailable: return "unavailable";
    }
    return "unknown";
}

// ─── Lifecycle ────────────────────────────────────────────────────────────────

InProcessCache::InProcessCache(std::size_t max_entries, Millis sweep_interval)
    : max_entries_(std::max<std::size_t>(max_entries, 1))
    , sweep_interval_(sweep_interval) {
    if (sweep_interval_.count() > 0) {
        sweeper_ = std::thread([this] { sweeper_loop(); });
    }
}

InProcessCache::~InProcessCache() {
    {
        std::lock_guard lock(stop_mu_);
        stopping_ = true;
    }
    stop_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

void InProcessCache::sweeper_loop() {
    std::unique_lock lock(stop_mu_);
    while (!stop_cv_.wait_for(lock, sweep_interval_, [this] { return stopping_; })) {
        lock.unlock();
        const std::size_t n = expire_now();
        if (n > 0) {
            log::trace(kComponent, "expiry sweep removed {} entries", n);
        }
        lock.lock();
    }
}

// ─── Internals (mu_ held) ─────────────────────────────────────────────────────

void InProcessCache::erase_locked(Map::iterator it) {
    lru_for(it->second.durable_backed).erase(it->second.lru_pos);
    slots_.erase(it);
}

std::size_t InProcessCache::expire_locked(Steady::time_point now) {
    std::size_t removed = 0;
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (it->second.expires_at && *it->second.expires_at <= now) {
            auto next = std::next(it);
            erase_locked(it);
            it = next;
            ++removed;
        } else {
            ++it;
        }
    }
    stats_.expirations += removed;
    return removed;
}

void InProcessCache::evict_one_locked(Steady::time_point now) {
    // An already-expired LRU tail costs nothing to drop.
    for (LruList* lane : {&durable_lru_, &volatile_lru_}) {
        if (lane->empty()) continue;
        auto it = slots_.find(lane->back());
        if (it != slots_.end() && it->second.expires_at && *it->second.expires_at <= now) {
            erase_locked(it);
            ++stats_.expirations;
            return;
        }
    }

    if (!durable_lru_.empty()) {
        auto it = slots_.find(durable_lru_.back());
        log::debug(kComponent, "evicting durable-backed '{}'", it->first);
        erase_locked(it);
        ++stats_.evictions;
        return;
    }

    // Capacity exhausted by cache-only data: this loses the only copy.
    auto it = slots_.find(volatile_lru_.back());
    log::debug(kComponent, "capacity exhausted, dropping cache-only '{}'", it->first);
    erase_locked(it);
    ++stats_.evictions;
    ++stats_.drops;
}

// ─── CacheBackend ─────────────────────────────────────────────────────────────

CacheStatus InProcessCache::set(const std::string& key, const std::string& value,
                                std::optional<Millis> ttl, bool durable_backed) {
    const auto now = Steady::now();
    std::lock_guard lock(mu_);

    if (auto it = slots_.find(key); it != slots_.end()) {
        erase_locked(it);
    } else if (slots_.size() >= max_entries_) {
        evict_one_locked(now);
    }

    LruList& lane = lru_for(durable_backed);
    lane.push_front(key);

    Slot slot;
    slot.value          = value;
    slot.durable_backed = durable_backed;
    slot.lru_pos        = lane.begin();
    if (ttl) {
        slot.expires_at = now + *ttl;
    }
    slots_.emplace(key, std::move(slot));
    return CacheStatus::Ok;
}

CacheReply InProcessCache::get(const std::string& key) {
    const auto now = Steady::now();
    std::lock_guard lock(mu_);

    auto it = slots_.find(key);
    if (it == slots_.end()) {
        return CacheReply{CacheStatus::Miss, {}};
    }
    if (it->second.expires_at && *it->second.expires_at <= now) {
        erase_locked(it);
        ++stats_.expirations;
        return CacheReply{CacheStatus::Miss, {}};
    }

    LruList& lane = lru_for(it->second.durable_backed);
    lane.splice(lane.begin(), lane, it->second.lru_pos);
    return CacheReply{CacheStatus::Ok, it->second.value};
}

CacheStatus InProcessCache::remove(const std::string& key) {
    std::lock_guard lock(mu_);
    if (auto it = slots_.find(key); it != slots_.end()) {
        erase_locked(it);
    }
    return CacheStatus::Ok;
}

// ─── Inspection ───────────────────────────────────────────────────────────────

std::vector<InProcessCache::Item> InProcessCache::snapshot() const {
    const auto now = Steady::now();
    std::lock_guard lock(mu_);

    std::vector<Item> out;
    out.reserve(slots_.size());
    for (const auto& [key, slot] : slots_) {
        Item item{key, slot.value, std::nullopt, slot.durable_backed};
        if (slot.expires_at) {
            if (*slot.expires_at <= now) continue;
            auto left = std::chrono::ceil<Millis>(*slot.expires_at - now);
            item.remaining = std::max(left, Millis{1});
        }
        out.push_back(std::move(item));
    }
    return out;
}

void InProcessCache::clear() {
    std::lock_guard lock(mu_);
    slots_.clear();
    durable_lru_.clear();
    volatile_lru_.clear();
}

std::size_t InProcessCache::expire_now() {
    const auto now = Steady::now();
    std::lock_guard lock(mu_);
    return expire_locked(now);
}

std::size_t InProcessCache::size() const {
    std::lock_guard lock(mu_);
    return slots_.size();
}

InProcessStats InProcessCache::stats() const {
    std::lock_guard lock(mu_);
    InProcessStats out = stats_;
    out.entries = slots_.size();
    return out;
}

} // namespace umb::cache
