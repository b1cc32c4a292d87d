/// @file src/store/durable_store.cpp
/// @brief DurableStore implementation over SQLite (WAL, reader/writer pair).

#include "umb/durable_store.hpp"

#include "umb/codec.hpp"
#include "umb/log.hpp"
#include "store/sqlite_handle.hpp"

#include <fmt/core.h>

#include <exception>
#include <mutex>
#include <utility>
#include <variant>

namespace umb::store {

using detail::DbHandle;
using detail::Statement;

struct DurableStore::Connection {
    DbHandle   db;
    std::mutex mu;
};

namespace {

constexpr const char* kComponent = "store";

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS market_data (
    key TEXT PRIMARY KEY, payload TEXT NOT NULL, source TEXT NOT NULL,
    memory_type TEXT NOT NULL, created_at INTEGER NOT NULL,
    ttl INTEGER, confidence REAL);
CREATE INDEX IF NOT EXISTS idx_market_data_created ON market_data(created_at);

CREATE TABLE IF NOT EXISTS agent_decisions (
    key TEXT PRIMARY KEY, payload TEXT NOT NULL, source TEXT NOT NULL,
    memory_type TEXT NOT NULL, created_at INTEGER NOT NULL,
    ttl INTEGER, confidence REAL);
CREATE INDEX IF NOT EXISTS idx_agent_decisions_created ON agent_decisions(created_at);

CREATE TABLE IF NOT EXISTS trading_signals (
    key TEXT PRIMARY KEY, payload TEXT NOT NULL, source TEXT NOT NULL,
    memory_type TEXT NOT NULL, created_at INTEGER NOT NULL,
    ttl INTEGER, confidence REAL);
CREATE INDEX IF NOT EXISTS idx_trading_signals_created ON trading_signals(created_at);

CREATE TABLE IF NOT EXISTS system_state (
    key TEXT PRIMARY KEY, payload TEXT NOT NULL, source TEXT NOT NULL,
    memory_type TEXT NOT NULL, created_at INTEGER NOT NULL,
    ttl INTEGER, confidence REAL);
CREATE INDEX IF NOT EXISTS idx_system_state_created ON system_state(created_at);

CREATE TABLE IF NOT EXISTS events (
    id TEXT PRIMARY KEY, event_type TEXT NOT NULL, event_data TEXT NOT NULL,
    source TEXT NOT NULL, target TEXT, created_at INTEGER NOT NULL,
    processed INTEGER NOT NULL DEFAULT 0);
CREATE INDEX IF NOT EXISTS idx_events_pending ON events(processed, created_at);
)sql";

constexpr const char* kEntryColumns =
    "key, payload, source, memory_type, created_at, ttl, confidence";
constexpr const char* kEventColumns =
    "id, event_type, event_data, source, target, created_at, processed";

std::string_view table_for(Category c) noexcept {
    switch (c) {
        case Category::MarketData:    return "market_data";
        case Category::AgentDecision: return "agent_decisions";
        case Category::TradingSignal: return "trading_signals";
        case Category::SystemState:   return "system_state";
        case Category::Event:         return "events";
    }
    return "market_data";
}

bool is_in_memory(const std::string& path) noexcept {
    return path == ":memory:";
}

// ─── Dynamic WHERE clauses ────────────────────────────────────────────────────

using Binding = std::variant<std::string, std::int64_t>;

struct Query {
    std::string          sql;
    std::vector<Binding> bindings;

    void where(std::string_view clause) {
        sql += has_where ? " AND " : " WHERE ";
        sql += clause;
        has_where = true;
    }

    bool bind_all(Statement& stmt) const {
        int idx = 1;
        for (const auto& b : bindings) {
            const bool ok = std::visit([&](const auto& v) { return stmt.bind(idx, v); }, b);
            if (!ok) return false;
            ++idx;
        }
        return true;
    }

    bool has_where = false;
};

// ─── Row decoding ─────────────────────────────────────────────────────────────

std::optional<Entry> entry_from_row(const Statement& stmt, Category category) {
    auto payload     = codec::decode_payload(stmt.text(1));
    auto source      = source_from_string(stmt.text(2));
    auto memory_type = memory_type_from_string(stmt.text(3));
    if (!payload || !payload->isObject() || !source || !memory_type) {
        return std::nullopt;
    }

    Entry e;
    e.category    = category;
    e.key         = stmt.text(0);
    e.payload     = std::move(*payload);
    e.source      = *source;
    e.memory_type = *memory_type;
    e.created_at  = from_epoch_micros(stmt.int64(4));
    if (!stmt.is_null(5)) e.ttl = Seconds{stmt.int64(5)};
    if (!stmt.is_null(6)) e.confidence = stmt.real(6);
    return e;
}

std::optional<Event> event_from_row(const Statement& stmt) {
    auto data   = codec::decode_payload(stmt.text(2));
    auto source = source_from_string(stmt.text(3));
    if (!data || !source) {
        return std::nullopt;
    }

    Event ev;
    ev.id         = stmt.text(0);
    ev.event_type = stmt.text(1);
    ev.event_data = std::move(*data);
    ev.source     = *source;
    if (!stmt.is_null(4)) {
        auto target = source_from_string(stmt.text(4));
        if (!target) return std::nullopt;
        ev.target = *target;
    }
    ev.created_at = from_epoch_micros(stmt.int64(5));
    ev.processed  = stmt.int64(6) != 0;
    return ev;
}

StoreResult error_result(std::string detail) {
    log::error(kComponent, "{}", detail);
    return StoreResult{StoreStatus::Error, std::move(detail)};
}

/// Open one connection with the pragmas every connection carries.
DbHandle open_connection(const std::string& path, bool read_only, std::string& err) {
    sqlite3* raw = nullptr;
    const int flags = read_only ? SQLITE_OPEN_READONLY
                                : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    const int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    DbHandle db(raw);
    if (rc != SQLITE_OK) {
        err = detail::last_error(db.get());
        return nullptr;
    }
    sqlite3_busy_timeout(db.get(), constants::SQLITE_BUSY_TIMEOUT_MS);
    return db;
}

} // anonymous namespace

// ─── StoreStatus ──────────────────────────────────────────────────────────────

std::string_view to_string(StoreStatus s) noexcept {
    switch (s) {
        case StoreStatus::Ok:       return "ok";
        case StoreStatus::NotFound: return "not_found";
        case StoreStatus::Error:    return "error";
    }
    return "unknown";
}

RetentionPolicy RetentionPolicy::from(const core::RetentionConfig& cfg) noexcept {
    return RetentionPolicy{
        .max_age               = Seconds{static_cast<std::int64_t>(cfg.days_to_keep) * 86'400},
        .max_rows_per_category = cfg.max_rows_per_category,
    };
}

// ─── Lifecycle ────────────────────────────────────────────────────────────────

DurableStore::DurableStore(Passkey, std::string path,
                           std::unique_ptr<Connection> writer,
                           std::unique_ptr<Connection> reader)
    : path_(std::move(path)), writer_(std::move(writer)), reader_(std::move(reader)) {}

DurableStore::~DurableStore() = default;

std::unique_ptr<DurableStore> DurableStore::open(const std::string& path) {
    std::string err;
    auto writer = std::make_unique<Connection>();
    writer->db  = open_connection(path, /*read_only=*/false, err);
    if (!writer->db) {
        log::error(kComponent, "cannot open '{}': {}", path, err);
        return nullptr;
    }

    const bool memory = is_in_memory(path);
    if (!memory) {
        if (auto e = detail::exec(writer->db.get(), "PRAGMA journal_mode=WAL;")) {
            log::error(kComponent, "cannot enable WAL on '{}': {}", path, *e);
            return nullptr;
        }
        if (auto e = detail::exec(writer->db.get(), "PRAGMA synchronous=NORMAL;")) {
            log::warn(kComponent, "synchronous=NORMAL rejected: {}", *e);
        }
    }
    if (auto e = detail::exec(writer->db.get(), kSchema)) {
        log::error(kComponent, "cannot create schema in '{}': {}", path, *e);
        return nullptr;
    }

    std::unique_ptr<Connection> reader;
    if (!memory) {
        reader     = std::make_unique<Connection>();
        reader->db = open_connection(path, /*read_only=*/true, err);
        if (!reader->db) {
            log::error(kComponent, "cannot open reader on '{}': {}", path, err);
            return nullptr;
        }
    }

    log::debug(kComponent, "opened '{}'{}", path, memory ? " (in-memory)" : " (WAL)");
    return std::make_unique<DurableStore>(Passkey{}, path, std::move(writer), std::move(reader));
}

DurableStore::Connection& DurableStore::reader() noexcept {
    return reader_ ? *reader_ : *writer_;
}

// ─── Entries ──────────────────────────────────────────────────────────────────

StoreResult DurableStore::put(const Entry& entry) noexcept {
    try {
        if (entry.category == Category::Event) {
            auto ev = codec::event_from_entry(entry);
            if (!ev) {
                return error_result(fmt::format(
                    "event entry '{}' has no event_type", entry.key));
            }
            return append_event(*ev);
        }

        const std::string payload = codec::encode_payload(entry.payload);
        const std::string sql = fmt::format(
            "INSERT OR REPLACE INTO {} ({}) VALUES (?, ?, ?, ?, ?, ?, ?)",
            table_for(entry.category), kEntryColumns);

        std::lock_guard lock(writer_->mu);
        Statement stmt(writer_->db.get(), sql);
        if (!stmt.ok()) {
            return error_result(fmt::format("prepare put: {}", stmt.error()));
        }
        const bool bound =
            stmt.bind(1, std::string_view{entry.key}) &&
            stmt.bind(2, std::string_view{payload}) &&
            stmt.bind(3, to_string(entry.source)) &&
            stmt.bind(4, to_string(entry.memory_type)) &&
            stmt.bind(5, to_epoch_micros(entry.created_at)) &&
            (entry.ttl ? stmt.bind(6, static_cast<std::int64_t>(entry.ttl->count()))
                       : stmt.bind_null(6)) &&
            (entry.confidence ? stmt.bind(7, *entry.confidence) : stmt.bind_null(7));
        if (!bound) {
            return error_result(fmt::format("bind put: {}", stmt.error()));
        }
        if (stmt.step() != SQLITE_DONE) {
            return error_result(fmt::format("put {}/{}: {}",
                                            to_string(entry.category), entry.key,
                                            stmt.error()));
        }
        return StoreResult{};
    } catch (const std::exception& ex) {
        return error_result(fmt::format("put {}/{}: {}",
                                        to_string(entry.category), entry.key, ex.what()));
    }
}

StoreLookup DurableStore::get(Category category, std::string_view key) noexcept {
    try {
        Connection& conn = reader();
        std::lock_guard lock(conn.mu);

        if (category == Category::Event) {
            Statement stmt(conn.db.get(),
                           fmt::format("SELECT {} FROM events WHERE id = ?", kEventColumns));
            if (!stmt.ok() || !stmt.bind(1, key)) {
                return StoreLookup{StoreStatus::Error, std::nullopt, stmt.error()};
            }
            const int rc = stmt.step();
            if (rc == SQLITE_DONE) return StoreLookup{};
            if (rc != SQLITE_ROW) {
                return StoreLookup{StoreStatus::Error, std::nullopt, stmt.error()};
            }
            auto ev = event_from_row(stmt);
            if (!ev) {
                return StoreLookup{StoreStatus::Error, std::nullopt,
                                   fmt::format("corrupt event row '{}'", key)};
            }
            return StoreLookup{StoreStatus::Ok, codec::event_to_entry(*ev), {}};
        }

        Statement stmt(conn.db.get(),
                       fmt::format("SELECT {} FROM {} WHERE key = ?",
                                   kEntryColumns, table_for(category)));
        if (!stmt.ok() || !stmt.bind(1, key)) {
            return StoreLookup{StoreStatus::Error, std::nullopt, stmt.error()};
        }
        const int rc = stmt.step();
        if (rc == SQLITE_DONE) return StoreLookup{};
        if (rc != SQLITE_ROW) {
            log::error(kComponent, "get {}/{}: {}", to_string(category), key, stmt.error());
            return StoreLookup{StoreStatus::Error, std::nullopt, stmt.error()};
        }
        auto entry = entry_from_row(stmt, category);
        if (!entry) {
            std::string msg = fmt::format("corrupt row {}/{}", to_string(category), key);
            log::error(kComponent, "{}", msg);
            return StoreLookup{StoreStatus::Error, std::nullopt, std::move(msg)};
        }
        return StoreLookup{StoreStatus::Ok, std::move(entry), {}};
    } catch (const std::exception& ex) {
        return StoreLookup{StoreStatus::Error, std::nullopt, ex.what()};
    }
}

std::optional<std::vector<Entry>>
DurableStore::list(Category category, const ListFilter& filter) noexcept {
    try {
        if (category == Category::Event) {
            EventFilter ef;
            ef.source = filter.source;
            ef.since  = filter.since;
            ef.limit  = filter.limit;
            Query q{fmt::format("SELECT {} FROM events", kEventColumns), {}};
            if (ef.source) {
                q.where("source = ?");
                q.bindings.emplace_back(std::string(to_string(*ef.source)));
            }
            if (ef.since) {
                q.where("created_at >= ?");
                q.bindings.emplace_back(to_epoch_micros(*ef.since));
            }
            if (filter.key_prefix) {
                q.where("instr(id, ?) = 1");
                q.bindings.emplace_back(*filter.key_prefix);
            }
            q.sql += " ORDER BY created_at DESC, rowid DESC LIMIT ?";
            q.bindings.emplace_back(static_cast<std::int64_t>(ef.limit));

            Connection& conn = reader();
            std::lock_guard lock(conn.mu);
            Statement stmt(conn.db.get(), q.sql);
            if (!stmt.ok() || !q.bind_all(stmt)) {
                log::error(kComponent, "list events: {}", stmt.error());
                return std::nullopt;
            }
            std::vector<Entry> out;
            int rc;
            while ((rc = stmt.step()) == SQLITE_ROW) {
                if (auto ev = event_from_row(stmt)) {
                    out.push_back(codec::event_to_entry(*ev));
                }
            }
            if (rc != SQLITE_DONE) {
                log::error(kComponent, "list events: {}", stmt.error());
                return std::nullopt;
            }
            return out;
        }

        Query q{fmt::format("SELECT {} FROM {}", kEntryColumns, table_for(category)), {}};
        if (filter.source) {
            q.where("source = ?");
            q.bindings.emplace_back(std::string(to_string(*filter.source)));
        }
        if (filter.since) {
            q.where("created_at >= ?");
            q.bindings.emplace_back(to_epoch_micros(*filter.since));
        }
        if (filter.key_prefix) {
            q.where("instr(key, ?) = 1");
            q.bindings.emplace_back(*filter.key_prefix);
        }
        q.sql += " ORDER BY created_at DESC, rowid DESC LIMIT ?";
        q.bindings.emplace_back(static_cast<std::int64_t>(filter.limit));

        Connection& conn = reader();
        std::lock_guard lock(conn.mu);
        Statement stmt(conn.db.get(), q.sql);
        if (!stmt.ok() || !q.bind_all(stmt)) {
            log::error(kComponent, "list {}: {}", to_string(category), stmt.error());
            return std::nullopt;
        }

        std::vector<Entry> out;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            if (auto e = entry_from_row(stmt, category)) {
                out.push_back(std::move(*e));
            } else {
                log::warn(kComponent, "skipping corrupt row {}/{}",
                          to_string(category), stmt.text(0));
            }
        }
        if (rc != SQLITE_DONE) {
            log::error(kComponent, "list {}: {}", to_string(category), stmt.error());
            return std::nullopt;
        }
        return out;
    } catch (const std::exception& ex) {
        log::error(kComponent, "list {}: {}", to_string(category), ex.what());
        return std::nullopt;
    }
}

std::optional<std::size_t> DurableStore::count(Category category) noexcept {
    Connection& conn = reader();
    std::lock_guard lock(conn.mu);
    Statement stmt(conn.db.get(),
                   fmt::format("SELECT COUNT(*) FROM {}", table_for(category)));
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        log::error(kComponent, "count {}: {}", to_string(category), stmt.error());
        return std::nullopt;
    }
    return static_cast<std::size_t>(stmt.int64(0));
}

// ─── Events ───────────────────────────────────────────────────────────────────

StoreResult DurableStore::append_event(const Event& event) noexcept {
    try {
        if (event.id.empty() || event.event_type.empty()) {
            return error_result("event needs an id and an event_type");
        }
        const std::string data = codec::encode_payload(event.event_data);

        std::lock_guard lock(writer_->mu);
        Statement stmt(writer_->db.get(),
                       fmt::format("INSERT OR REPLACE INTO events ({}) "
                                   "VALUES (?, ?, ?, ?, ?, ?, ?)", kEventColumns));
        if (!stmt.ok()) {
            return error_result(fmt::format("prepare append_event: {}", stmt.error()));
        }
        const bool bound =
            stmt.bind(1, std::string_view{event.id}) &&
            stmt.bind(2, std::string_view{event.event_type}) &&
            stmt.bind(3, std::string_view{data}) &&
            stmt.bind(4, to_string(event.source)) &&
            (event.target ? stmt.bind(5, to_string(*event.target)) : stmt.bind_null(5)) &&
            stmt.bind(6, to_epoch_micros(event.created_at)) &&
            stmt.bind(7, static_cast<std::int64_t>(event.processed ? 1 : 0));
        if (!bound) {
            return error_result(fmt::format("bind append_event: {}", stmt.error()));
        }
        if (stmt.step() != SQLITE_DONE) {
            return error_result(fmt::format("append_event {}: {}", event.id, stmt.error()));
        }
        return StoreResult{};
    } catch (const std::exception& ex) {
        return error_result(fmt::format("append_event {}: {}", event.id, ex.what()));
    }
}

std::optional<std::vector<Event>>
DurableStore::unprocessed_events(std::optional<Source> target, std::size_t limit) noexcept {
    try {
        Query q{fmt::format("SELECT {} FROM events", kEventColumns), {}};
        q.where("processed = 0");
        if (target) {
            q.where("(target = ? OR target IS NULL)");
            q.bindings.emplace_back(std::string(to_string(*target)));
        }
        q.sql += " ORDER BY created_at ASC, rowid ASC LIMIT ?";
        q.bindings.emplace_back(static_cast<std::int64_t>(limit));

        Connection& conn = reader();
        std::lock_guard lock(conn.mu);
        Statement stmt(conn.db.get(), q.sql);
        if (!stmt.ok() || !q.bind_all(stmt)) {
            log::error(kComponent, "unprocessed_events: {}", stmt.error());
            return std::nullopt;
        }
        std::vector<Event> out;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            if (auto ev = event_from_row(stmt)) {
                out.push_back(std::move(*ev));
            }
        }
        if (rc != SQLITE_DONE) {
            log::error(kComponent, "unprocessed_events: {}", stmt.error());
            return std::nullopt;
        }
        return out;
    } catch (const std::exception& ex) {
        log::error(kComponent, "unprocessed_events: {}", ex.what());
        return std::nullopt;
    }
}

StoreResult DurableStore::mark_event_processed(std::string_view event_id) noexcept {
    std::lock_guard lock(writer_->mu);
    Statement stmt(writer_->db.get(), "UPDATE events SET processed = 1 WHERE id = ?");
    if (!stmt.ok() || !stmt.bind(1, event_id)) {
        return error_result(fmt::format("mark_event_processed: {}", stmt.error()));
    }
    if (stmt.step() != SQLITE_DONE) {
        return error_result(fmt::format("mark_event_processed {}: {}", event_id, stmt.error()));
    }
    if (sqlite3_changes(writer_->db.get()) == 0) {
        return StoreResult{StoreStatus::NotFound, fmt::format("no event '{}'", event_id)};
    }
    return StoreResult{};
}

std::optional<std::vector<Event>>
DurableStore::list_events(const EventFilter& filter) noexcept {
    try {
        Query q{fmt::format("SELECT {} FROM events", kEventColumns), {}};
        if (filter.event_type) {
            q.where("event_type = ?");
            q.bindings.emplace_back(*filter.event_type);
        }
        if (filter.source) {
            q.where("source = ?");
            q.bindings.emplace_back(std::string(to_string(*filter.source)));
        }
        if (filter.target) {
            q.where("(target = ? OR target IS NULL)");
            q.bindings.emplace_back(std::string(to_string(*filter.target)));
        }
        if (filter.processed) {
            q.where("processed = ?");
            q.bindings.emplace_back(static_cast<std::int64_t>(*filter.processed ? 1 : 0));
        }
        if (filter.since) {
            q.where("created_at >= ?");
            q.bindings.emplace_back(to_epoch_micros(*filter.since));
        }
        q.sql += " ORDER BY created_at DESC, rowid DESC LIMIT ?";
        q.bindings.emplace_back(static_cast<std::int64_t>(filter.limit));

        Connection& conn = reader();
        std::lock_guard lock(conn.mu);
        Statement stmt(conn.db.get(), q.sql);
        if (!stmt.ok() || !q.bind_all(stmt)) {
            log::error(kComponent, "list_events: {}", stmt.error());
            return std::nullopt;
        }
        std::vector<Event> out;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            if (auto ev = event_from_row(stmt)) {
                out.push_back(std::move(*ev));
            }
        }
        if (rc != SQLITE_DONE) {
            log::error(kComponent, "list_events: {}", stmt.error());
            return std::nullopt;
        }
        return out;
    } catch (const std::exception& ex) {
        log::error(kComponent, "list_events: {}", ex.what());
        return std::nullopt;
    }
}

// ─── Maintenance ──────────────────────────────────────────────────────────────

std::optional<std::size_t>
DurableStore::sweep(const RetentionPolicy& policy, Timestamp now) noexcept {
    try {
        const std::int64_t cutoff =
            to_epoch_micros(now) -
            std::chrono::duration_cast<std::chrono::microseconds>(policy.max_age).count();

        // Runs `sql` with the given binding until a batch deletes nothing.
        auto drain = [&](const std::string& sql, std::int64_t arg) -> std::optional<std::size_t> {
            std::size_t removed = 0;
            for (;;) {
                std::lock_guard lock(writer_->mu);
                Statement stmt(writer_->db.get(), sql);
                if (!stmt.ok() || !stmt.bind(1, arg) || stmt.step() != SQLITE_DONE) {
                    log::error(kComponent, "sweep: {}", stmt.error());
                    return std::nullopt;
                }
                const int changed = sqlite3_changes(writer_->db.get());
                removed += static_cast<std::size_t>(changed);
                if (static_cast<std::size_t>(changed) < constants::SWEEP_BATCH_ROWS) {
                    return removed;
                }
            }
        };

        std::size_t total = 0;
        for (Category c : ALL_CATEGORIES) {
            const std::string_view table = table_for(c);
            const char* extra = c == Category::Event ? " AND processed = 1" : "";

            auto aged = drain(fmt::format(
                "DELETE FROM {0} WHERE rowid IN (SELECT rowid FROM {0} "
                "WHERE created_at < ?{1} LIMIT {2})",
                table, extra, constants::SWEEP_BATCH_ROWS), cutoff);
            if (!aged) return std::nullopt;
            total += *aged;

            if (policy.max_rows_per_category > 0) {
                auto capped = drain(fmt::format(
                    "DELETE FROM {0} WHERE rowid IN (SELECT rowid FROM {0} "
                    "ORDER BY created_at DESC, rowid DESC LIMIT {1} OFFSET ?)",
                    table, constants::SWEEP_BATCH_ROWS),
                    static_cast<std::int64_t>(policy.max_rows_per_category));
                if (!capped) return std::nullopt;
                total += *capped;
            }
        }

        if (total > 0) {
            log::info(kComponent, "sweep removed {} rows", total);
        }
        return total;
    } catch (const std::exception& ex) {
        log::error(kComponent, "sweep: {}", ex.what());
        return std::nullopt;
    }
}

std::optional<std::int64_t> DurableStore::database_size_bytes() noexcept {
    Connection& conn = reader();
    std::lock_guard lock(conn.mu);
    Statement stmt(conn.db.get(),
                   "SELECT page_count * page_size FROM pragma_page_count(), pragma_page_size()");
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        log::warn(kComponent, "database size: {}", stmt.error());
        return std::nullopt;
    }
    return stmt.int64(0);
}

void DurableStore::checkpoint() noexcept {
    if (is_in_memory(path_)) {
        return;
    }
    std::lock_guard lock(writer_->mu);
    if (auto err = detail::exec(writer_->db.get(), "PRAGMA wal_checkpoint(TRUNCATE);")) {
        log::warn(kComponent, "checkpoint '{}': {}", path_, *err);
    }
}

} // namespace umb::store
