#pragma once

/// @file include/umb/cache.hpp
/// @brief Volatile cache tier: backend interface, in-process LRU store,
///        Redis client (redis-plus-plus), and the degrading VolatileCache front.
///
/// # Module: Volatile Cache
///
/// ## Responsibility
/// Low-latency string key/value storage with per-key expiry. An external
/// Redis-compatible server is optional: when it cannot be reached within the
/// configured timeout, VolatileCache switches to its in-process store and
/// reports itself degraded. Callers never branch on backend availability.
///
/// ## Guarantees
/// - No method throws or blocks beyond the configured socket timeout
/// - At most one retry of a failed remote call before falling back
/// - `CacheStatus::Unavailable` is returned by the first `set` of each
///   unavailable window only; the write itself still lands in the fallback
/// - The in-process store never exceeds its entry bound. Entries with a
///   durable copy are evicted before cache-only ones; evicting a cache-only
///   entry is counted as a drop
///
/// ## NOT Responsible For
/// - Key naming (UnifiedMemory builds `{ns}:{category}:{key}` keys)
/// - Value encoding (values are opaque strings)

#include "umb/config.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sw::redis { class Redis; }

namespace umb::cache {

using Millis = std::chrono::milliseconds;

// ─── Results ──────────────────────────────────────────────────────────────────

enum class CacheStatus : std::uint8_t {
    Ok,
    Miss,
    Unavailable,
};

[[nodiscard]] std::string_view to_string(CacheStatus s) noexcept;

struct CacheReply {
    CacheStatus status = CacheStatus::Miss;
    std::string value;

    [[nodiscard]] bool hit() const noexcept { return status == CacheStatus::Ok; }
};

// ─── CacheBackend ─────────────────────────────────────────────────────────────

/// Storage seam shared by the in-process store and the Redis client.
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    /// `ttl` unset = no expiry. `durable_backed` marks values that also live
    /// in the durable store (eviction preference only).
    virtual CacheStatus set(const std::string& key, const std::string& value,
                            std::optional<Millis> ttl, bool durable_backed) = 0;
    virtual CacheReply  get(const std::string& key) = 0;
    virtual CacheStatus remove(const std::string& key) = 0;
    virtual bool        ping() = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ─── InProcessCache ───────────────────────────────────────────────────────────

struct InProcessStats {
    std::size_t   entries     = 0;
    std::uint64_t evictions   = 0;  ///< capacity evictions of live entries
    std::uint64_t drops       = 0;  ///< of which cache-only (no durable copy)
    std::uint64_t expirations = 0;
};

class InProcessCache final : public CacheBackend {
public:
    struct Item {
        std::string           key;
        std::string           value;
        std::optional<Millis> remaining;  ///< unset = no expiry
        bool                  durable_backed = false;
    };

    /// `sweep_interval` of zero disables the background expiry thread; expiry
    /// is then only checked lazily on access.
    explicit InProcessCache(std::size_t max_entries,
                            Millis sweep_interval = constants::DEFAULT_EXPIRY_SWEEP_INTERVAL);
    ~InProcessCache() override;

    InProcessCache(const InProcessCache&)            = delete;
    InProcessCache& operator=(const InProcessCache&) = delete;

    CacheStatus set(const std::string& key, const std::string& value,
                    std::optional<Millis> ttl, bool durable_backed) override;
    CacheReply  get(const std::string& key) override;
    CacheStatus remove(const std::string& key) override;
    bool        ping() override { return true; }
    [[nodiscard]] std::string_view name() const noexcept override { return "in_process"; }

    /// Live entries with their remaining lifetime.
    [[nodiscard]] std::vector<Item> snapshot() const;

    void clear();

    /// Remove every expired entry now. Returns how many were removed.
    std::size_t expire_now();

    [[nodiscard]] std::size_t    size() const;
    [[nodiscard]] std::size_t    capacity() const noexcept { return max_entries_; }
    [[nodiscard]] InProcessStats stats() const;

private:
    using Steady  = std::chrono::steady_clock;
    using LruList = std::list<std::string>;

    struct Slot {
        std::string                       value;
        std::optional<Steady::time_point> expires_at;
        bool                              durable_backed = false;
        LruList::iterator                 lru_pos;
    };

    using Map = std::unordered_map<std::string, Slot>;

    [[nodiscard]] LruList& lru_for(bool durable_backed) noexcept {
        return durable_backed ? durable_lru_ : volatile_lru_;
    }
    void erase_locked(Map::iterator it);
    void evict_one_locked(Steady::time_point now);
    std::size_t expire_locked(Steady::time_point now);
    void sweeper_loop();

    const std::size_t max_entries_;
    const Millis      sweep_interval_;

    mutable std::mutex mu_;
    Map                slots_;
    LruList            durable_lru_;   ///< front = most recently used
    LruList            volatile_lru_;
    InProcessStats     stats_{};

    std::mutex              stop_mu_;
    std::condition_variable stop_cv_;
    bool                    stopping_ = false;
    std::thread             sweeper_;
};

// ─── RedisBackend ─────────────────────────────────────────────────────────────

struct RedisEndpoint {
    std::string                host;
    std::uint16_t              port = constants::DEFAULT_CACHE_PORT;
    std::optional<std::string> password;
    int                        db = 0;
    Millis                     timeout = constants::DEFAULT_CACHE_TIMEOUT;
};

/// Redis client on redis-plus-plus: SET (PX), GET, DEL, PING. The
/// connection is opened lazily by the library and re-established on the
/// next call after a failure. Connect and socket timeouts both come from
/// `RedisEndpoint::timeout`. Every `sw::redis::Error` is logged and mapped to
/// Unavailable.
///
/// Only compiled when the build finds redis-plus-plus (`UMB_HAVE_REDIS`).
class RedisBackend final : public CacheBackend {
public:
    explicit RedisBackend(const RedisEndpoint& endpoint);
    ~RedisBackend() override;

    RedisBackend(const RedisBackend&)            = delete;
    RedisBackend& operator=(const RedisBackend&) = delete;

    CacheStatus set(const std::string& key, const std::string& value,
                    std::optional<Millis> ttl, bool durable_backed) override;
    CacheReply  get(const std::string& key) override;
    CacheStatus remove(const std::string& key) override;
    bool        ping() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "redis"; }

private:
    std::string                       address_;  ///< host:port, for log lines
    std::unique_ptr<sw::redis::Redis> redis_;
};

/// The external backend `config` names: a RedisBackend for a non-empty host,
/// nullptr for none (or when the build has no Redis client).
[[nodiscard]] std::unique_ptr<CacheBackend> make_remote_backend(const core::CacheConfig& config);

// ─── VolatileCache ────────────────────────────────────────────────────────────

struct VolatileCacheStats {
    std::string   backend;               ///< "redis" or "in_process"
    bool          degraded = false;
    std::size_t   fallback_entries = 0;
    std::uint64_t evictions = 0;
    std::uint64_t drops = 0;
    std::uint64_t expirations = 0;
    std::uint64_t unavailable_windows = 0;
    std::uint64_t recoveries = 0;
    std::uint64_t remote_failures = 0;   ///< remote calls that returned Unavailable
};

/// The cache front used by UnifiedMemory.
///
/// Without a configured host it is a plain InProcessCache and never degraded.
/// With one, calls go to the remote first. After a retry fails the cache
/// enters degraded mode: calls are served by the in-process fallback, and the
/// remote is probed (PING) at most once per `reconnect_interval`. When a
/// probe succeeds the fallback's live entries are replayed to the remote with
/// their remaining TTL. Every other key written or removed while degraded
/// (removed, evicted, or expired from the fallback) is deleted remotely, so
/// no value older than the outage survives it. Then the fallback is cleared.
class VolatileCache {
public:
    explicit VolatileCache(const core::CacheConfig& config);

    /// Use `remote` as the external backend (nullptr = in-process only).
    VolatileCache(const core::CacheConfig& config, std::unique_ptr<CacheBackend> remote);

    VolatileCache(const VolatileCache&)            = delete;
    VolatileCache& operator=(const VolatileCache&) = delete;

    CacheStatus set(const std::string& key, const std::string& value,
                    std::optional<Millis> ttl, bool durable_backed = false);
    CacheReply  get(const std::string& key);
    CacheStatus remove(const std::string& key);

    [[nodiscard]] bool               degraded() const noexcept { return degraded_.load(); }
    [[nodiscard]] bool               has_remote() const noexcept { return remote_ != nullptr; }
    [[nodiscard]] std::string_view   backend_name() const noexcept;
    [[nodiscard]] VolatileCacheStats stats() const;
    [[nodiscard]] InProcessCache&    fallback() noexcept { return *fallback_; }

private:
    using Steady = std::chrono::steady_clock;

    template <typename Call>
    auto with_retry(Call&& call);

    void enter_degraded();
    void maybe_recover();
    [[nodiscard]] bool claim_window_report();

    core::CacheConfig               config_;
    std::unique_ptr<CacheBackend>   remote_;
    std::unique_ptr<InProcessCache> fallback_;

    mutable std::shared_mutex mode_mu_;   ///< exclusive while replaying to the remote
    std::atomic<bool>         degraded_{false};

    std::mutex                      state_mu_;
    bool                            window_reported_ = false;
    Steady::time_point              last_probe_{};
    std::unordered_set<std::string> touched_;  ///< keys set or removed while degraded

    std::atomic<std::uint64_t> unavailable_windows_{0};
    std::atomic<std::uint64_t> recoveries_{0};
    std::atomic<std::uint64_t> remote_failures_{0};
};

} // namespace umb::cache
