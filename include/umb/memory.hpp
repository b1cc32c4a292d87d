#pragma once

/// @file include/umb/memory.hpp
/// @brief UnifiedMemory: the single API both subsystems use.
///
/// # Module: Unified Memory Facade
///
/// ## Responsibility
/// Route every write to the volatile cache, the durable store, or both,
/// according to the entry's MemoryType. Route every read to the fastest source
/// with fallback to the durable store. Pass events through to the EventBus and
/// expose one observability surface (`stats()`).
///
/// ## Write Routing
/// | MemoryType     | cache            | durable          | result on cache outage |
/// |----------------|------------------|------------------|------------------------|
/// | CacheOnly      | set (fallback ok)| -                | Ok (warning logged)    |
/// | PersistentOnly | copy invalidated | put              | Ok                     |
/// | Both           | set first        | put (authority)  | PartialFailure, once per window |
///
/// A failed durable put is `Failure`; for `Both` the cache copy just written is
/// removed again so no reader sees data that was not persisted.
///
/// ## Read Routing
/// `prefer_cache` → cache, then durable on a miss. A durable hit is not copied
/// back into the cache; call `refresh` for that. A cache value that fails to
/// decode is deleted and treated as a miss.
///
/// ## Cache Keys
/// `{ns}:{category}:{key}` for entries, `{ns}:latest:{category}:{prefix}` for
/// the latest-entry pointer (prefix = key minus its last `:` segment).
///
/// ## Guarantees
/// - Safe for concurrent use from any number of threads; no method throws
/// - Writes, refreshes and invalidations of one `(category, key)` are
///   serialised, so the cache copy matches the last durable write
/// - The durable copy is authoritative; the cache is a derived accelerator
/// - After `close()` every operation fails fast with `Failure`

#include "umb/cache.hpp"
#include "umb/config.hpp"
#include "umb/durable_store.hpp"
#include "umb/event_bus.hpp"
#include "umb/types.hpp"

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace umb::memory {

// ─── Results ──────────────────────────────────────────────────────────────────

enum class WriteStatus : std::uint8_t {
    Ok,
    PartialFailure,  ///< durable committed, cache copy missing
    Failure,         ///< not persisted
};

enum class ReadStatus : std::uint8_t {
    Found,
    NotFound,
    Failure,
};

[[nodiscard]] std::string_view to_string(WriteStatus s) noexcept;
[[nodiscard]] std::string_view to_string(ReadStatus s) noexcept;

struct WriteResult {
    WriteStatus status = WriteStatus::Ok;
    std::string detail;

    /// Ok or PartialFailure: the data is stored per its policy.
    [[nodiscard]] bool committed() const noexcept { return status != WriteStatus::Failure; }
};

struct ReadResult {
    ReadStatus           status = ReadStatus::NotFound;
    std::optional<Entry> entry;
    bool                 from_cache = false;
    std::string          detail;

    [[nodiscard]] bool found() const noexcept { return status == ReadStatus::Found; }
};

// ─── Stats ────────────────────────────────────────────────────────────────────

struct Stats {
    double        hit_rate  = 0.0;
    double        miss_rate = 0.0;
    std::uint64_t cache_hits   = 0;
    std::uint64_t cache_misses = 0;

    bool          degraded = false;
    std::string   cache_backend;
    std::size_t   fallback_entries = 0;
    std::uint64_t evictions = 0;
    std::uint64_t drops     = 0;

    std::uint64_t writes           = 0;
    std::uint64_t partial_failures = 0;
    std::uint64_t failures         = 0;
    std::uint64_t events_published = 0;
    std::uint64_t handler_errors   = 0;

    std::map<Category, std::size_t> entry_counts;  ///< durable rows per category
    std::optional<std::int64_t>     database_size_bytes;

    [[nodiscard]] Payload     to_json() const;
    [[nodiscard]] std::string to_string() const;
};

// ─── UnifiedMemory ────────────────────────────────────────────────────────────

class UnifiedMemory {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /// Validate `config`, open the durable store and connect the cache.
    /// Returns nullptr if the configuration is invalid or the store cannot
    /// be opened (a missing cache backend is not an error).
    [[nodiscard]] static std::unique_ptr<UnifiedMemory> open(const core::MemoryConfig& config);

    /// As above with an explicit external cache backend (nullptr = in-process only).
    [[nodiscard]] static std::unique_ptr<UnifiedMemory>
    open(const core::MemoryConfig& config, std::unique_ptr<cache::CacheBackend> remote);

    /// Use `open`; the passkey keeps construction there.
    UnifiedMemory(Passkey, core::MemoryConfig config,
                  std::unique_ptr<store::DurableStore> store,
                  std::unique_ptr<cache::VolatileCache> cache);

    ~UnifiedMemory();
    UnifiedMemory(const UnifiedMemory&)            = delete;
    UnifiedMemory& operator=(const UnifiedMemory&) = delete;

    // ── Entries ──────────────────────────────────────────────────────────────

    /// Stamps `created_at`, applies the category TTL if `ttl` is unset, routes.
    WriteResult write(Entry entry);

    [[nodiscard]] ReadResult read(Category category, std::string_view key,
                                  bool prefer_cache = true);

    /// Newest entry whose key is `key_prefix` + ":" + something.
    [[nodiscard]] ReadResult latest(Category category, std::string_view key_prefix);

    [[nodiscard]] std::optional<std::vector<Entry>>
    list(Category category, const store::ListFilter& filter = {});

    /// Copy the durable entry into the cache (Found), or report NotFound.
    ReadResult refresh(Category category, std::string_view key);

    /// Drop the cache copy; the durable copy is untouched.
    void invalidate(Category category, std::string_view key);

    // ── Events ───────────────────────────────────────────────────────────────

    events::PublishResult  publish(Event event);
    events::SubscriptionId subscribe(events::Subscription filter, events::Handler handler);
    events::SubscriptionId subscribe(std::string event_type, events::Handler handler);
    events::SubscriptionId subscribe(Source target, events::Handler handler);
    bool                   unsubscribe(events::SubscriptionId id);

    [[nodiscard]] std::optional<std::vector<Event>>
    unprocessed_events(std::optional<Source> target,
                       std::size_t limit = constants::DEFAULT_LIST_LIMIT);
    store::StoreResult mark_event_processed(std::string_view event_id);
    [[nodiscard]] std::optional<std::vector<Event>>
    list_events(const store::EventFilter& filter = {});

    // ── Lifecycle & maintenance ──────────────────────────────────────────────

    /// Launch the background retention sweeper (no-op if the interval is 0
    /// or it is already running).
    void start();

    /// Stop the sweeper, checkpoint the store, refuse further operations.
    /// Idempotent; the destructor calls it.
    void close();

    [[nodiscard]] bool closed() const noexcept { return closed_.load(); }

    /// One retention pass now. nullopt if the store reported an error.
    std::optional<std::size_t> sweep();

    [[nodiscard]] Stats stats();

    [[nodiscard]] const core::MemoryConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::string cache_key(Category category, std::string_view key) const;
    [[nodiscard]] std::string latest_key(Category category, std::string_view key_prefix) const;

    [[nodiscard]] store::DurableStore& durable() noexcept { return *store_; }
    [[nodiscard]] cache::VolatileCache& volatile_cache() noexcept { return *cache_; }

private:
    static constexpr std::size_t kKeyLockStripes = 64;

    [[nodiscard]] std::optional<std::string> check(const Entry& entry) const;
    [[nodiscard]] std::mutex& key_lock(Category category, std::string_view key);
    cache::CacheStatus cache_put(const Entry& entry, bool durable_backed);
    void cache_drop(const Entry& entry);
    void sweeper_loop();

    core::MemoryConfig                    config_;
    std::unique_ptr<store::DurableStore>  store_;
    std::unique_ptr<cache::VolatileCache> cache_;
    std::unique_ptr<events::EventBus>     bus_;

    std::atomic<bool> closed_{false};

    std::array<std::mutex, kKeyLockStripes> key_locks_;

    std::mutex              sweeper_mu_;
    std::condition_variable sweeper_cv_;
    bool                    sweeper_stop_ = false;
    std::thread             sweeper_;

    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> cache_misses_{0};
    std::atomic<std::uint64_t> writes_{0};
    std::atomic<std::uint64_t> partial_failures_{0};
    std::atomic<std::uint64_t> failures_{0};
};

/// Key prefix used for the latest pointer: `key` without its last `:`
/// segment, or nullopt if `key` has no `:`.
[[nodiscard]] std::optional<std::string_view> key_prefix_of(std::string_view key) noexcept;

} // namespace umb::memory
