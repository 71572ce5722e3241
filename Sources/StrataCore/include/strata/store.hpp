#pragma once

#include "errors.hpp"
#include "live_collection.hpp"
#include "log.hpp"
#include "notification_bus.hpp"
#include "object.hpp"
#include "query.hpp"
#include "relationships.hpp"
#include "scheduler.hpp"
#include "schema.hpp"
#include "storage.hpp"
#include "transaction.hpp"
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Configuration
// ============================================================================

struct configuration {
    /// Store file path. Use ":memory:" for an in-memory store.
    std::string path = ":memory:";

    /// Entity descriptors registered at open.
    std::vector<entity_schema> schemas;

    /// Scheduler for dispatching observer callbacks. nullptr = immediate_scheduler.
    std::shared_ptr<scheduler> sched = nullptr;

    /// How long a commit waits for another session's write lock.
    int busy_timeout_ms = 5000;

    /// Read-only mode. When true:
    /// - The file is opened with SQLITE_OPEN_READONLY
    /// - No table creation or schema changes (tables must already exist)
    /// - Commits fail with storage_error
    bool read_only = false;

    // Default constructor - in-memory
    configuration() = default;

    // Path only
    explicit configuration(const std::string& p) : path(p) {}

    // Path + scheduler
    configuration(const std::string& p, std::shared_ptr<strata::scheduler> s)
        : path(p), sched(std::move(s)) {}

    configuration(const std::string& p, std::vector<entity_schema> s)
        : path(p), schemas(std::move(s)) {}
};

// ============================================================================
// store - one open session over a record store
// ============================================================================
//
// Usage:
//   strata::store db(strata::configuration(":memory:", {list_schema, item_schema}));
//   db.write([&] {
//       db.create("List", {{"_id", "L1"}, {"name", "Groceries"}});
//   });
//   auto open_items = db.query("Item", "done == false");

class store {
public:
    /// Registers config.schemas and opens a session through SQLite.
    /// Throws schema_error for an invalid or incompatible schema.
    explicit store(configuration config);

    /// Same, through a custom storage adapter.
    store(configuration config, std::shared_ptr<storage_adapter> adapter);

    ~store();

    // Non-copyable and non-moveable (proxies point back at the store)
    store(const store&) = delete;
    store& operator=(const store&) = delete;
    store(store&&) = delete;
    store& operator=(store&&) = delete;

    const configuration& config() const { return config_; }
    const schema_graph& schema() const;

    /// Throws unknown_entity_error.
    const entity_schema& resolve(const std::string& entity) const;

    // ========================================================================
    // Transactions
    // ========================================================================

    transaction_ptr begin() { return transactions().begin(); }
    void commit(const transaction_ptr& tx) { transactions().commit(tx); }
    void rollback(const transaction_ptr& tx) { transactions().rollback(tx); }
    bool in_transaction() const { return tx_manager_.in_transaction(); }

    /// Run fn in a (possibly nested) transaction: commit on return, roll back
    /// and rethrow on exception. Returns fn's result.
    template<typename F>
    auto mutator(F&& fn) -> std::invoke_result_t<F&> {
        return transactions().mutator(std::forward<F>(fn));
    }

    template<typename F>
    auto write(F&& fn) -> std::invoke_result_t<F&> {
        return transactions().mutator(std::forward<F>(fn));
    }

    transaction_manager& transactions();

    // ========================================================================
    // Objects
    // ========================================================================

    /// Stage a new record. Requires an active transaction.
    object create(const std::string& entity, const record& values);

    /// nullopt when no record has this key. Sees the active transaction's writes.
    std::optional<object> get(const std::string& entity, const value_t& key);

    /// Stage a delete. Requires an active transaction; invalidates obj at once.
    void remove(object& obj);

    // ========================================================================
    // Queries
    // ========================================================================

    live_collection query(const std::string& entity,
                          const std::string& filter = "",
                          const std::vector<value_t>& args = {},
                          const std::vector<sort_descriptor>& sort = {});

    live_collection query(const std::string& entity,
                          const query_ptr& filter,
                          const std::vector<sort_descriptor>& sort = {});

    // ========================================================================
    // Observation
    // ========================================================================

    notification_token observe(const object& obj, object_callback callback);
    notification_token observe(const live_collection& collection, collection_callback callback);

    /// Invalidate every proxy and collection, roll back an active transaction
    /// and close the session. Safe to call twice.
    void close();
    bool is_open() const { return session_ != nullptr; }

    scheduler& get_scheduler() const { return *scheduler_; }

private:
    friend class object;
    friend class live_collection;
    friend class transaction_manager;
    friend class query_engine;
    friend class notification_bus;
    friend class relationship_resolver;

    void open(std::shared_ptr<storage_adapter> adapter);
    void check_open() const;

    storage_session& session() const;
    const schema_graph& graph() const { return *graph_; }
    object_registry& objects() { return objects_; }
    query_engine& engine() { return engine_; }
    notification_bus& bus() { return bus_; }
    relationship_resolver& resolver() { return resolver_; }

    /// Stored values of the record behind state, overlaid with the active
    /// transaction's pending write. Invalidates state and throws
    /// invalid_object_error if the record is gone.
    record read_current(object_state& state);

    void set_value(object_state& state, const std::string& name, value_t value);

    /// Proxy for a record read from storage. A dead proxy left over from an
    /// earlier delete is replaced unless the active transaction removed it.
    std::shared_ptr<object_state> stored_proxy(const entity_schema& entity, const value_t& key);

    uint64_t generation() const { return generation_; }
    void bump_generation() { ++generation_; }

    void on_storage_commit(const commit_info& info);

    configuration config_;
    SharedScheduler scheduler_;
    schema_registry registry_;
    std::shared_ptr<const schema_graph> graph_;
    std::unique_ptr<storage_session> session_;
    uint64_t commit_callback_id_ = 0;

    object_registry objects_;
    transaction_manager tx_manager_;
    query_engine engine_;
    relationship_resolver resolver_;
    notification_bus bus_;

    uint64_t generation_ = 1;
};

// ============================================================================
// live_binding - hook interface for reactive view layers
// ============================================================================
//
// create_object and delete_object run in a mutator, so they work both inside
// and outside an active transaction.

class live_binding {
public:
    explicit live_binding(store& s) : store_(s) {}

    std::optional<object> get_object(const std::string& entity, const value_t& key) {
        return store_.get(entity, key);
    }

    live_collection get_query(const std::string& entity,
                              const std::string& filter = "",
                              const std::vector<value_t>& args = {},
                              const std::vector<sort_descriptor>& sort = {}) {
        return store_.query(entity, filter, args, sort);
    }

    template<typename F>
    auto run_mutator(F&& fn) -> std::invoke_result_t<F&> {
        return store_.mutator(std::forward<F>(fn));
    }

    object create_object(const std::string& entity, const record& values) {
        return store_.mutator([&] { return store_.create(entity, values); });
    }

    void delete_object(object& obj) {
        store_.mutator([&] { store_.remove(obj); });
    }

    notification_token observe(const object& obj, object_callback callback) {
        return store_.observe(obj, std::move(callback));
    }

    notification_token observe(const live_collection& collection, collection_callback callback) {
        return store_.observe(collection, std::move(callback));
    }

    store& get_store() { return store_; }

private:
    store& store_;
};

} // namespace strata
