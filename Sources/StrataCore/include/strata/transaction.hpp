#pragma once

#include "object.hpp"
#include "schema.hpp"
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata {

class store;

enum class transaction_state {
    idle,
    active,
    committing,
    committed,
    rolled_back,
    failed
};

const char* to_string(transaction_state state);

// One staged write. Writes to the same record coalesce into a single entry.
struct pending_write {
    change_type op = change_type::insert;
    const entity_schema* entity = nullptr;
    value_t key;
    std::string key_id;
    record fields;           // insert: full record; update: written properties only
    bool cancelled = false;  // inserted then removed in the same transaction
};

// ============================================================================
// transaction - pending-write log plus the proxies it touched
// ============================================================================

class transaction {
    // Only transaction_manager can name this, so only it can construct
    struct private_key {
        explicit private_key() = default;
    };

public:
    transaction(private_key, uint64_t id) : id_(id) {}

    transaction_state state() const noexcept { return state_; }
    uint64_t id() const noexcept { return id_; }

    /// Nesting level (1 for the outermost begin()).
    size_t depth() const noexcept { return depth_; }

    bool is_active() const noexcept { return state_ == transaction_state::active; }
    bool is_terminal() const noexcept {
        return state_ == transaction_state::committed || state_ == transaction_state::rolled_back ||
               state_ == transaction_state::failed;
    }

    const std::vector<pending_write>& log() const noexcept { return log_; }

    /// The live (not cancelled) staged write for a record, if any.
    const pending_write* pending_for(const std::string& entity, const std::string& key_id) const;

    void stage_insert(const entity_schema& entity, const value_t& key, record fields);
    void stage_update(const entity_schema& entity, const value_t& key, const std::string& property, value_t value);
    void stage_remove(const entity_schema& entity, const value_t& key);

    void track_created(std::shared_ptr<object_state> state) { created_.push_back(std::move(state)); }
    void track_modified(std::shared_ptr<object_state> state) { modified_.push_back(std::move(state)); }
    void track_deleted(std::shared_ptr<object_state> state) { deleted_.push_back(std::move(state)); }

private:
    friend class transaction_manager;

    pending_write* find(const std::string& entity, const std::string& key_id);

    transaction_state state_ = transaction_state::idle;
    uint64_t id_ = 0;
    size_t depth_ = 0;

    std::vector<pending_write> log_;
    std::unordered_map<std::string, size_t> index_;  // identity -> log_ slot

    std::vector<std::shared_ptr<object_state>> created_;
    std::vector<std::shared_ptr<object_state>> modified_;
    std::vector<std::shared_ptr<object_state>> deleted_;
};

using transaction_ptr = std::shared_ptr<transaction>;

// ============================================================================
// transaction_manager - one active transaction per session, re-entrant
// ============================================================================

class transaction_manager {
public:
    explicit transaction_manager(store& owner) : owner_(owner) {}

    /// Starts a transaction, or joins the active one (depth + 1).
    /// Throws transaction_already_active_error while the active one is committing.
    transaction_ptr begin();

    /// Nested level: depth - 1. Outermost: applies the log to storage in one
    /// storage transaction and runs the notification pass. On storage failure
    /// the transaction is failed, its effects undone, and the error rethrown.
    /// Throws no_active_transaction_error for a terminal transaction.
    void commit(const transaction_ptr& tx);

    /// Discards the whole transaction, even from a nested level. No-op for a
    /// terminal transaction.
    void rollback(const transaction_ptr& tx);

    /// The active transaction, or nullptr.
    transaction_ptr current() const { return current_; }
    bool in_transaction() const { return current_ && current_->is_active(); }
    bool is_committing() const { return current_ && current_->state_ == transaction_state::committing; }

    /// The active transaction; throws no_active_transaction_error naming operation.
    transaction& require_active(const char* operation) const;

    /// begin, fn, commit; rollback and rethrow if fn (or the commit) throws.
    template<typename F>
    auto mutator(F&& fn) -> std::invoke_result_t<F&> {
        using result_t = std::invoke_result_t<F&>;
        auto tx = begin();
        try {
            if constexpr (std::is_void_v<result_t>) {
                fn();
                commit(tx);
            } else {
                result_t result = fn();
                commit(tx);
                return result;
            }
        } catch (...) {
            rollback(tx);
            throw;
        }
    }

    /// Roll back whatever is active (store close).
    void abandon();

private:
    void finish_failed(transaction& tx);

    store& owner_;
    transaction_ptr current_;
    uint64_t next_id_ = 1;
};

// ============================================================================
// write_transaction - RAII guard, rolls back on scope exit unless committed
// ============================================================================

class write_transaction {
public:
    explicit write_transaction(transaction_manager& manager)
        : manager_(manager), tx_(manager.begin()) {}

    ~write_transaction();

    write_transaction(const write_transaction&) = delete;
    write_transaction& operator=(const write_transaction&) = delete;

    void commit();
    void rollback();

    const transaction_ptr& get() const { return tx_; }

private:
    transaction_manager& manager_;
    transaction_ptr tx_;
    bool completed_ = false;
};

} // namespace strata
