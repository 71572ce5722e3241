#pragma once

#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace strata {

// Values as SQLite stores them
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>
>;

/// Throw the strata error matching a SQLite result code:
/// SQLITE_CONSTRAINT -> constraint_violation_error, SQLITE_BUSY/SQLITE_LOCKED ->
/// write_conflict_error, anything else -> storage_error.
[[noreturn]] void throw_sqlite_error(int rc, const std::string& msg);

// ============================================================================
// statement - one prepared statement, finalized on scope exit
// ============================================================================

class statement {
public:
    statement(sqlite3* db, const std::string& sql);
    ~statement();

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    void bind(const std::vector<column_value_t>& params);

    /// true while rows remain; throws on anything but SQLITE_ROW / SQLITE_DONE
    bool step();

    int column_count() const { return sqlite3_column_count(stmt_); }
    const char* column_name(int index) const { return sqlite3_column_name(stmt_, index); }
    column_value_t column(int index) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

// ============================================================================
// database - one SQLite connection
// ============================================================================

class database {
public:
    enum class open_mode {
        read_write,  ///< creates the file if missing; WAL journal
        read_only    ///< the file must exist
    };

    explicit database(const std::string& path, open_mode mode = open_mode::read_write, int busy_timeout_ms = 5000);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    bool table_exists(const std::string& name);

    // column name -> declared SQL type (uppercase), for migration
    std::unordered_map<std::string, std::string> get_table_info(const std::string& table);

    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Returns the number of rows changed.
    int execute(const std::string& sql,
                const std::vector<column_value_t>& params = {});

    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    const std::string& path() const { return path_; }

    /// Double-quote an identifier for use in SQL.
    static std::string quote(const std::string& identifier);

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
};

// RAII transaction guard
class db_transaction {
public:
    explicit db_transaction(database& db);
    ~db_transaction();

    void commit();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace strata
