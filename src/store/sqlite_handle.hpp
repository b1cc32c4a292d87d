#pragma once

/// @file src/store/sqlite_handle.hpp
/// @brief RAII wrappers over the SQLite C API (internal to the store).

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace umb::store::detail {

struct DbCloser {
    void operator()(sqlite3* db) const noexcept { sqlite3_close_v2(db); }
};

using DbHandle = std::unique_ptr<sqlite3, DbCloser>;

[[nodiscard]] inline std::string last_error(sqlite3* db) {
    return db != nullptr ? std::string(sqlite3_errmsg(db)) : std::string("no database");
}

/// Run statements that return no rows. Returns the error text on failure.
[[nodiscard]] inline std::optional<std::string> exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err != nullptr ? err : last_error(db);
        sqlite3_free(err);
        return msg;
    }
    return std::nullopt;
}

// ─── Statement ────────────────────────────────────────────────────────────────

/// A prepared statement, finalized on destruction. Bind indices are 1-based,
/// column indices 0-based (as in the C API). Text is bound SQLITE_TRANSIENT.
class Statement {
public:
    Statement(sqlite3* db, std::string_view sql) noexcept : db_(db) {
        if (sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()),
                               &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
        }
    }

    ~Statement() {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&)            = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] bool ok() const noexcept { return stmt_ != nullptr; }

    bool bind(int idx, std::string_view text) noexcept {
        return sqlite3_bind_text(stmt_, idx, text.data(), static_cast<int>(text.size()),
                                 SQLITE_TRANSIENT) == SQLITE_OK;
    }
    bool bind(int idx, std::int64_t value) noexcept {
        return sqlite3_bind_int64(stmt_, idx, value) == SQLITE_OK;
    }
    bool bind(int idx, double value) noexcept {
        return sqlite3_bind_double(stmt_, idx, value) == SQLITE_OK;
    }
    bool bind_null(int idx) noexcept {
        return sqlite3_bind_null(stmt_, idx) == SQLITE_OK;
    }

    /// SQLITE_ROW, SQLITE_DONE, or an error code.
    [[nodiscard]] int step() noexcept { return sqlite3_step(stmt_); }

    [[nodiscard]] bool is_null(int col) const noexcept {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }
    [[nodiscard]] std::string text(int col) const {
        const auto* p = sqlite3_column_text(stmt_, col);
        const int   n = sqlite3_column_bytes(stmt_, col);
        return p != nullptr ? std::string(reinterpret_cast<const char*>(p),
                                          static_cast<std::size_t>(n))
                            : std::string{};
    }
    [[nodiscard]] std::int64_t int64(int col) const noexcept {
        return sqlite3_column_int64(stmt_, col);
    }
    [[nodiscard]] double real(int col) const noexcept {
        return sqlite3_column_double(stmt_, col);
    }

    [[nodiscard]] std::string error() const { return last_error(db_); }

private:
    sqlite3*      db_   = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

} // namespace umb::store::detail
