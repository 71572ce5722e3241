#pragma once

#include "db.hpp"
#include "storage.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace strata {

struct sqlite_options {
    int busy_timeout_ms = 5000;
    bool read_only = false;
};

class sqlite_session;

// ============================================================================
// session_registry - sessions open per store file, for cross-session commits
// ============================================================================

class session_registry {
public:
    // Singleton accessor - defined in sqlite_store.cpp to avoid ODR violations
    static session_registry& instance();

    void register_session(const std::string& path, sqlite_session* session);
    void unregister_session(const std::string& path, sqlite_session* session);
    std::vector<sqlite_session*> get_sessions(const std::string& path);

private:
    session_registry() = default;
    std::mutex mutex_;
    std::map<std::string, std::vector<sqlite_session*>> sessions_;
};

// ============================================================================
// sqlite_adapter - storage adapter over SQLite3
// ============================================================================
//
// Layout: one table per top-level entity, named after the entity. The primary
// key column is NOT NULL UNIQUE, every other stored property is a nullable
// column. Back-links have no column; embedded entities have no table (their
// values live as JSON in the owning column). The schema snapshot is kept in
// _strata_meta and checked on every open.

class sqlite_adapter : public storage_adapter {
public:
    explicit sqlite_adapter(sqlite_options options = {}) : options_(options) {}

    std::unique_ptr<storage_session> open_session(const std::string& path,
                                                  std::shared_ptr<const schema_graph> graph) override;

    /// SQL column type for a property ("INTEGER", "REAL", "TEXT", "BLOB").
    static const char* column_type(const schema_graph& graph, const property_descriptor& prop);

private:
    sqlite_options options_;
};

class sqlite_session : public storage_session {
public:
    sqlite_session(const std::string& path, std::shared_ptr<const schema_graph> graph, sqlite_options options);
    ~sqlite_session() override;

    sqlite_session(const sqlite_session&) = delete;
    sqlite_session& operator=(const sqlite_session&) = delete;

    void begin_tx() override;
    void commit_tx() override;
    void rollback_tx() override;
    bool in_tx() const override;

    std::optional<record> read_by_key(const entity_schema& entity, const value_t& key) override;
    void write_record(const entity_schema& entity, const value_t& key,
                      const record& fields, write_mode mode) override;
    void delete_record(const entity_schema& entity, const value_t& key) override;
    std::vector<record> scan(const compiled_query& query) override;

    uint64_t on_commit(commit_callback callback) override;
    void remove_commit_callback(uint64_t id) override;

    void close() override;
    bool is_open() const override { return db_ != nullptr; }

    database& db() const;

private:
    friend class sqlite_adapter;

    // Create missing tables and columns, verify the stored snapshot
    void migrate();
    void verify_tables() const;

    column_value_t to_column(const property_descriptor& prop, const value_t& value) const;
    value_t from_column(const property_descriptor& prop, const column_value_t& column) const;
    value_t from_column(property_type type, const column_value_t& column, const std::string& where) const;
    record to_record(const entity_schema& entity, const database::row_t& row) const;

    std::string select_sql(const entity_schema& entity) const;
    std::string filter_sql(const entity_schema& entity, const query_ptr& filter,
                           std::vector<column_value_t>& params) const;

    void track(const entity_schema& entity, const value_t& key, change_type op,
               std::vector<std::string> properties);

    // Called on sibling sessions after this one commits
    void deliver(const commit_info& info);

    std::string path_;
    std::shared_ptr<const schema_graph> graph_;
    sqlite_options options_;
    std::unique_ptr<database> db_;

    std::vector<record_change> pending_changes_;
    std::map<std::string, size_t> pending_index_;  // entity + key -> pending_changes_ slot

    std::mutex callbacks_mutex_;
    std::map<uint64_t, commit_callback> callbacks_;
    uint64_t next_callback_id_ = 1;
};

} // namespace strata
