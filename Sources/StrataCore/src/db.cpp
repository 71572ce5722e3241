#include "strata/db.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"

#include <cctype>
#include <type_traits>

namespace strata {

void throw_sqlite_error(int rc, const std::string& msg) {
    switch (rc & 0xFF) {
        case SQLITE_CONSTRAINT:
            LOG_ERROR("db", "Constraint violation: %s", msg.c_str());
            throw constraint_violation_error(msg);
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            LOG_ERROR("db", "Store is locked: %s", msg.c_str());
            throw write_conflict_error(msg);
        default:
            LOG_ERROR("db", "%s", msg.c_str());
            throw storage_error(msg);
    }
}

// ============================================================================
// statement
// ============================================================================

statement::statement(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {
    int rc = sqlite3_prepare_v2(db_, sql_.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw_sqlite_error(rc, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)) +
                               " (SQL: " + sql_ + ")");
    }
}

statement::~statement() {
    sqlite3_finalize(stmt_);
}

void statement::bind(const std::vector<column_value_t>& params) {
    int index = 1;
    for (const auto& param : params) {
        int rc = std::visit([&](auto&& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(stmt_, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt_, index, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt_, index, v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            } else {
                // Empty blobs stay blobs rather than binding as null
                if (v.empty()) return sqlite3_bind_zeroblob(stmt_, index, 0);
                return sqlite3_bind_blob(stmt_, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }, param);
        if (rc != SQLITE_OK) {
            throw_sqlite_error(rc, "Failed to bind parameter " + std::to_string(index) + " (SQL: " + sql_ + ")");
        }
        ++index;
    }
}

bool statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite_error(rc, "Execution failed: " + std::string(sqlite3_errmsg(db_)) + " (SQL: " + sql_ + ")");
}

column_value_t statement::column(int index) const {
    switch (sqlite3_column_type(stmt_, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt_, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt_, index);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
            return std::string(text ? text : "", static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
        }
        case SQLITE_BLOB: {
            const auto* bytes = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, index));
            auto size = static_cast<size_t>(sqlite3_column_bytes(stmt_, index));
            if (!bytes) return std::vector<uint8_t>{};
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        default:
            return nullptr;
    }
}

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path, open_mode mode, int busy_timeout_ms) : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;
    flags |= mode == open_mode::read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw_sqlite_error(rc, "Failed to open store " + path + ": " + error);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);

    // WAL lets readers on other sessions proceed while one session commits
    if (mode == open_mode::read_write && path != ":memory:") {
        execute("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA temp_store = MEMORY");
}

database::~database() {
    if (!db_) return;
    if (mode_ == open_mode::read_write) {
        sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_PASSIVE, nullptr, nullptr);
    }
    sqlite3_close(db_);
}

std::string database::quote(const std::string& identifier) {
    std::string out = "\"";
    for (char c : identifier) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

int database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind(params);
    while (stmt.step()) {
        // PRAGMAs report their new value as a row
    }
    return sqlite3_changes(db_);
}

std::vector<database::row_t> database::query(const std::string& sql, const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind(params);

    std::vector<row_t> rows;
    const int columns = stmt.column_count();
    while (stmt.step()) {
        row_t row;
        for (int i = 0; i < columns; ++i) {
            row[stmt.column_name(i)] = stmt.column(i);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

bool database::table_exists(const std::string& name) {
    return !query("SELECT name FROM sqlite_master WHERE type = 'table' AND name = ?", {name}).empty();
}

std::unordered_map<std::string, std::string> database::get_table_info(const std::string& table) {
    std::unordered_map<std::string, std::string> columns;
    // cid, name, type, notnull, dflt_value, pk
    for (auto& row : query("PRAGMA table_info(" + quote(table) + ")")) {
        auto* name = std::get_if<std::string>(&row["name"]);
        auto* type = std::get_if<std::string>(&row["type"]);
        if (!name || !type) continue;
        std::string upper = *type;
        for (char& c : upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        columns[*name] = upper;
    }
    return columns;
}

void database::begin_transaction() {
    // IMMEDIATE takes the write lock up front; the busy timeout covers
    // waiting for another session to finish its commit
    execute("BEGIN IMMEDIATE");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// db_transaction
// ============================================================================

db_transaction::db_transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

db_transaction::~db_transaction() {
    if (completed_ || !db_.is_in_transaction()) return;
    try {
        db_.rollback();
    } catch (const std::exception& e) {
        LOG_ERROR("db", "Rollback of %s failed: %s", db_.path().c_str(), e.what());
    }
}

void db_transaction::commit() {
    db_.commit();
    completed_ = true;
}

} // namespace strata
