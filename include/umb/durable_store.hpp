#pragma once

/// @file include/umb/durable_store.hpp
/// @brief DurableStore: SQLite-backed persistence of Entries and Events.
///
/// # Module: Durable Store
///
/// ## Responsibility
/// Persist Entries across process lifetime, one table per category, queryable
/// by key, by source, by time and by key prefix. Keep the Event audit log and
/// its `processed` flags. Apply the retention policy on request.
///
/// ## Storage Layout
/// ```
/// market_data | agent_decisions | trading_signals | system_state
///   key TEXT PRIMARY KEY, payload TEXT, source TEXT, memory_type TEXT,
///   created_at INTEGER (epoch µs), ttl INTEGER NULL, confidence REAL NULL
/// events
///   id TEXT PRIMARY KEY, event_type TEXT, event_data TEXT, source TEXT,
///   target TEXT NULL, created_at INTEGER, processed INTEGER
/// ```
///
/// ## Guarantees
/// - `put` is one `INSERT OR REPLACE`: last writer wins per (category, key)
/// - Missing keys yield `StoreStatus::NotFound`, never `Error`
/// - No method throws; SQLite failures come back as `Error` with the
///   `sqlite3_errmsg` text in `detail`
/// - Thread-safe. File databases use WAL with separate writer and reader
///   connections, so reads do not wait for a writer's commit
///
/// ## NOT Responsible For
/// - Cache coherence (see UnifiedMemory)
/// - Scheduling sweeps (UnifiedMemory::start runs them)

#include "umb/config.hpp"
#include "umb/constants.hpp"
#include "umb/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace umb::store {

// ─── Results ──────────────────────────────────────────────────────────────────

enum class StoreStatus : std::uint8_t {
    Ok,
    NotFound,
    Error,
};

[[nodiscard]] std::string_view to_string(StoreStatus s) noexcept;

struct StoreResult {
    StoreStatus status = StoreStatus::Ok;
    std::string detail;

    [[nodiscard]] bool ok() const noexcept { return status == StoreStatus::Ok; }
};

struct StoreLookup {
    StoreStatus          status = StoreStatus::NotFound;
    std::optional<Entry> entry;
    std::string          detail;
};

// ─── Queries ──────────────────────────────────────────────────────────────────

struct ListFilter {
    std::optional<Source>      source;
    std::optional<Timestamp>   since;       ///< created_at >= since
    std::optional<std::string> key_prefix;  ///< keys starting with this text
    std::size_t                limit = constants::DEFAULT_LIST_LIMIT;
};

struct EventFilter {
    std::optional<std::string> event_type;
    std::optional<Source>      source;
    std::optional<Source>      target;      ///< matches this target or broadcast
    std::optional<bool>        processed;
    std::optional<Timestamp>   since;
    std::size_t                limit = constants::DEFAULT_LIST_LIMIT;
};

struct RetentionPolicy {
    Seconds     max_age{Seconds{constants::DEFAULT_DAYS_TO_KEEP * 86'400LL}};
    std::size_t max_rows_per_category = 0;  ///< 0 = no row cap

    [[nodiscard]] static RetentionPolicy from(const core::RetentionConfig& cfg) noexcept;
};

// ─── DurableStore ─────────────────────────────────────────────────────────────

class DurableStore {
    struct Passkey {
        explicit Passkey() = default;
    };
    struct Connection;

public:
    /// Open (creating if needed) the database at `path`. ":memory:" gives a
    /// private in-memory database. Returns nullptr if SQLite cannot open the
    /// file or the schema cannot be created.
    [[nodiscard]] static std::unique_ptr<DurableStore> open(const std::string& path);

    /// Use `open`; the passkey keeps construction there.
    DurableStore(Passkey, std::string path,
                 std::unique_ptr<Connection> writer,
                 std::unique_ptr<Connection> reader);

    ~DurableStore();
    DurableStore(const DurableStore&)            = delete;
    DurableStore& operator=(const DurableStore&) = delete;

    // ── Entries ──────────────────────────────────────────────────────────────

    /// Upsert by (category, key). An Event-category entry is stored in the
    /// events table (see codec::event_from_entry).
    [[nodiscard]] StoreResult put(const Entry& entry) noexcept;

    [[nodiscard]] StoreLookup get(Category category, std::string_view key) noexcept;

    /// Newest first (created_at, then insertion order). nullopt on SQL error.
    [[nodiscard]] std::optional<std::vector<Entry>>
    list(Category category, const ListFilter& filter = {}) noexcept;

    [[nodiscard]] std::optional<std::size_t> count(Category category) noexcept;

    // ── Events ───────────────────────────────────────────────────────────────

    [[nodiscard]] StoreResult append_event(const Event& event) noexcept;

    /// Unprocessed events addressed to `target` or broadcast, oldest first.
    /// With no target, every unprocessed event.
    [[nodiscard]] std::optional<std::vector<Event>>
    unprocessed_events(std::optional<Source> target,
                       std::size_t limit = constants::DEFAULT_LIST_LIMIT) noexcept;

    /// NotFound if no event has this id.
    [[nodiscard]] StoreResult mark_event_processed(std::string_view event_id) noexcept;

    /// Newest first.
    [[nodiscard]] std::optional<std::vector<Event>>
    list_events(const EventFilter& filter = {}) noexcept;

    // ── Maintenance ──────────────────────────────────────────────────────────

    /// Delete rows older than `policy.max_age` (events only once processed),
    /// then trim each table to `policy.max_rows_per_category` newest rows.
    /// Works in batches so concurrent writers interleave. Returns the number
    /// of rows removed, or nullopt if a delete failed.
    [[nodiscard]] std::optional<std::size_t>
    sweep(const RetentionPolicy& policy, Timestamp now) noexcept;

    /// page_count * page_size of the main database. nullopt on error.
    [[nodiscard]] std::optional<std::int64_t> database_size_bytes() noexcept;

    /// Fold the WAL back into the main file (no-op for ":memory:").
    void checkpoint() noexcept;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    [[nodiscard]] Connection& reader() noexcept;

    std::string                 path_;
    std::unique_ptr<Connection> writer_;
    std::unique_ptr<Connection> reader_;  ///< null → reads share writer_
};

} // namespace umb::store
