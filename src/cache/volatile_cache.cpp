/// @file src/cache/volatile_cache.cpp
/// @brief VolatileCache: remote-first cache with in-process fallback,
///        degraded-window accounting and replay on recovery.

#include "umb/cache.hpp"
#include "umb/log.hpp"

#include <unordered_set>

namespace umb::cache {

namespace {

constexpr const char* kComponent = "cache";

} // anonymous namespace

std::unique_ptr<CacheBackend> make_remote_backend(const core::CacheConfig& cfg) {
    if (cfg.host.empty()) {
        return nullptr;
    }
#ifdef UMB_HAVE_REDIS
    return std::make_unique<RedisBackend>(RedisEndpoint{
        .host     = cfg.host,
        .port     = cfg.port,
        .password = cfg.password,
        .db       = cfg.db,
        .timeout  = cfg.timeout,
    });
#else
    log::error(kComponent, "built without redis-plus-plus, cache host '{}' ignored", cfg.host);
    return nullptr;
#endif
}

// ─── Construction ─────────────────────────────────────────────────────────────

VolatileCache::VolatileCache(const core::CacheConfig& config)
    : VolatileCache(config, make_remote_backend(config)) {}

VolatileCache::VolatileCache(const core::CacheConfig& config,
                             std::unique_ptr<CacheBackend> remote)
    : config_(config)
    , remote_(std::move(remote))
    , fallback_(std::make_unique<InProcessCache>(config.max_entries,
                                                 config.expiry_sweep_interval)) {
    if (remote_ && !remote_->ping()) {
        log::warn(kComponent, "{} backend unreachable at start, using in-process cache",
                  remote_->name());
        enter_degraded();
    }
}

std::string_view VolatileCache::backend_name() const noexcept {
    if (!remote_ || degraded_.load()) {
        return fallback_->name();
    }
    return remote_->name();
}

// ─── Degraded mode ────────────────────────────────────────────────────────────

template <typename Call>
auto VolatileCache::with_retry(Call&& call) {
    auto first = call();
    if (first != CacheStatus::Unavailable) {
        return first;
    }
    remote_failures_.fetch_add(1, std::memory_order_relaxed);
    auto second = call();
    if (second == CacheStatus::Unavailable) {
        remote_failures_.fetch_add(1, std::memory_order_relaxed);
    }
    return second;
}

void VolatileCache::enter_degraded() {
    std::lock_guard lock(state_mu_);
    if (degraded_.load()) {
        return;
    }
    degraded_.store(true);
    window_reported_ = false;
    last_probe_      = Steady::now();
    unavailable_windows_.fetch_add(1, std::memory_order_relaxed);
    log::warn(kComponent, "cache backend unavailable, degraded to in-process store");
}

bool VolatileCache::claim_window_report() {
    std::lock_guard lock(state_mu_);
    if (window_reported_) {
        return false;
    }
    window_reported_ = true;
    return true;
}

void VolatileCache::maybe_recover() {
    if (!remote_ || !degraded_.load()) {
        return;
    }
    {
        std::lock_guard lock(state_mu_);
        const auto now = Steady::now();
        if (now - last_probe_ < config_.reconnect_interval) {
            return;
        }
        last_probe_ = now;
    }
    if (!remote_->ping()) {
        return;
    }

    std::unique_lock mode(mode_mu_);
    if (!degraded_.load()) {
        return;
    }

    std::lock_guard lock(state_mu_);
    const auto items = fallback_->snapshot();
    std::unordered_set<std::string> live;
    for (const auto& item : items) {
        if (remote_->set(item.key, item.value, item.remaining, item.durable_backed)
                != CacheStatus::Ok) {
            log::warn(kComponent, "replay of '{}' failed, staying degraded", item.key);
            return;
        }
        live.insert(item.key);
    }
    // Keys removed, evicted or expired from the fallback during the outage
    // must not resurface with their pre-outage remote value.
    std::size_t deleted = 0;
    for (const auto& key : touched_) {
        if (live.count(key) != 0) continue;
        if (remote_->remove(key) != CacheStatus::Ok) {
            log::warn(kComponent, "replay delete of '{}' failed, staying degraded", key);
            return;
        }
        ++deleted;
    }

    fallback_->clear();
    touched_.clear();
    degraded_.store(false);
    recoveries_.fetch_add(1, std::memory_order_relaxed);
    log::info(kComponent, "{} backend recovered, replayed {} entries, deleted {} keys",
              remote_->name(), items.size(), deleted);
}

// ─── Operations ───────────────────────────────────────────────────────────────

CacheStatus VolatileCache::set(const std::string& key, const std::string& value,
                               std::optional<Millis> ttl, bool durable_backed) {
    maybe_recover();
    std::shared_lock mode(mode_mu_);

    if (!remote_) {
        return fallback_->set(key, value, ttl, durable_backed);
    }
    if (!degraded_.load()) {
        const auto status = with_retry(
            [&] { return remote_->set(key, value, ttl, durable_backed); });
        if (status == CacheStatus::Ok) {
            return status;
        }
        enter_degraded();
    }

    fallback_->set(key, value, ttl, durable_backed);
    {
        std::lock_guard lock(state_mu_);
        touched_.insert(key);
    }
    return claim_window_report() ? CacheStatus::Unavailable : CacheStatus::Ok;
}

CacheReply VolatileCache::get(const std::string& key) {
    maybe_recover();
    std::shared_lock mode(mode_mu_);

    if (remote_ && !degraded_.load()) {
        CacheReply reply;
        const auto status = with_retry([&] {
            reply = remote_->get(key);
            return reply.status;
        });
        if (status != CacheStatus::Unavailable) {
            return reply;
        }
        enter_degraded();
    }
    return fallback_->get(key);
}

CacheStatus VolatileCache::remove(const std::string& key) {
    maybe_recover();
    std::shared_lock mode(mode_mu_);

    if (remote_ && !degraded_.load()) {
        if (with_retry([&] { return remote_->remove(key); }) == CacheStatus::Ok) {
            return CacheStatus::Ok;
        }
        enter_degraded();
    }
    fallback_->remove(key);
    if (remote_) {
        std::lock_guard lock(state_mu_);
        touched_.insert(key);
    }
    return CacheStatus::Ok;
}

// ─── Stats ────────────────────────────────────────────────────────────────────

VolatileCacheStats VolatileCache::stats() const {
    const InProcessStats local = fallback_->stats();
    return VolatileCacheStats{
        .backend             = std::string(backend_name()),
        .degraded            = degraded_.load(),
        .fallback_entries    = local.entries,
        .evictions           = local.evictions,
        .drops               = local.drops,
        .expirations         = local.expirations,
        .unavailable_windows = unavailable_windows_.load(),
        .recoveries          = recoveries_.load(),
        .remote_failures     = remote_failures_.load(),
    };
}

} // namespace umb::cache
