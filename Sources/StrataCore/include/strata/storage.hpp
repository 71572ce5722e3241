#pragma once

#include "query.hpp"
#include "schema.hpp"
#include "types.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// One record written by a committed transaction
struct record_change {
    std::string entity;
    value_t key;
    change_type op = change_type::update;
    std::vector<std::string> changed_properties;  // insert: every stored property
};

// Delivered to commit callbacks after the storage transaction is durable
struct commit_info {
    std::vector<record_change> changes;
    bool external = false;  // committed by another session on the same store file
};

using commit_callback = std::function<void(const commit_info&)>;

enum class write_mode {
    insert,  // fails with constraint_violation_error if the key exists
    update   // fails with write_conflict_error if the key no longer exists
};

// ============================================================================
// storage_session - one open connection to the record store
// ============================================================================
//
// Every write must happen between begin_tx() and commit_tx()/rollback_tx().
// Reads outside a transaction see the last committed state. Errors are thrown
// as constraint_violation_error, write_conflict_error or storage_error.

class storage_session {
public:
    virtual ~storage_session() = default;

    virtual void begin_tx() = 0;
    virtual void commit_tx() = 0;
    virtual void rollback_tx() = 0;
    [[nodiscard]] virtual bool in_tx() const = 0;

    /// nullopt when no record has this key.
    virtual std::optional<record> read_by_key(const entity_schema& entity, const value_t& key) = 0;

    /// fields holds stored properties only (never back-links). For update, only
    /// the given fields are written.
    virtual void write_record(const entity_schema& entity, const value_t& key,
                              const record& fields, write_mode mode) = 0;

    /// Deleting a missing record is not an error.
    virtual void delete_record(const entity_schema& entity, const value_t& key) = 0;

    /// Records of query.entity matching the filter, in sort order (ties by
    /// primary key) or store iteration order when unsorted.
    virtual std::vector<record> scan(const compiled_query& query) = 0;

    /// Register a callback run after each successful commit_tx() of this session
    /// and for commits of other sessions on the same store (external).
    virtual uint64_t on_commit(commit_callback callback) = 0;
    virtual void remove_commit_callback(uint64_t id) = 0;

    virtual void close() = 0;
    [[nodiscard]] virtual bool is_open() const = 0;
};

// ============================================================================
// storage_adapter - factory for sessions over a concrete record store
// ============================================================================

class storage_adapter {
public:
    virtual ~storage_adapter() = default;

    /// Prepare the store for the graph (create/migrate) and open a session.
    /// Throws schema_error for an incompatible stored schema, storage_error
    /// if the store cannot be opened.
    virtual std::unique_ptr<storage_session> open_session(const std::string& path,
                                                          std::shared_ptr<const schema_graph> graph) = 0;
};

} // namespace strata
