#include "strata/transaction.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"
#include "strata/store.hpp"

namespace strata {

const char* to_string(transaction_state state) {
    switch (state) {
        case transaction_state::idle: return "idle";
        case transaction_state::active: return "active";
        case transaction_state::committing: return "committing";
        case transaction_state::committed: return "committed";
        case transaction_state::rolled_back: return "rolled_back";
        case transaction_state::failed: return "failed";
    }
    return "unknown";
}

// ============================================================================
// transaction - pending-write log
// ============================================================================

pending_write* transaction::find(const std::string& entity, const std::string& key_id) {
    auto it = index_.find(object_registry::identity(entity, key_id));
    if (it == index_.end()) return nullptr;
    return &log_[it->second];
}

const pending_write* transaction::pending_for(const std::string& entity, const std::string& key_id) const {
    auto it = index_.find(object_registry::identity(entity, key_id));
    if (it == index_.end()) return nullptr;
    const auto& write = log_[it->second];
    return write.cancelled ? nullptr : &write;
}

void transaction::stage_insert(const entity_schema& entity, const value_t& key, record fields) {
    auto key_id = key_string(key);
    if (auto* existing = find(entity.name, key_id)) {
        if (existing->cancelled) {
            existing->op = change_type::insert;
            existing->fields = std::move(fields);
            existing->cancelled = false;
            return;
        }
        if (existing->op == change_type::remove) {
            // Deleted then created again: the stored record is replaced
            existing->op = change_type::update;
            existing->fields = std::move(fields);
            return;
        }
        throw constraint_violation_error("Duplicate primary key " + describe(key) + " for " + entity.name);
    }

    index_[object_registry::identity(entity.name, key_id)] = log_.size();
    log_.push_back({change_type::insert, &entity, key, std::move(key_id), std::move(fields), false});
}

void transaction::stage_update(const entity_schema& entity, const value_t& key,
                               const std::string& property, value_t value) {
    auto key_id = key_string(key);
    if (auto* existing = find(entity.name, key_id)) {
        if (existing->cancelled || existing->op == change_type::remove) {
            throw invalid_object_error("Object " + entity.name + " " + describe(key) + " was deleted");
        }
        existing->fields[property] = std::move(value);
        return;
    }

    index_[object_registry::identity(entity.name, key_id)] = log_.size();
    record fields;
    fields[property] = std::move(value);
    log_.push_back({change_type::update, &entity, key, std::move(key_id), std::move(fields), false});
}

void transaction::stage_remove(const entity_schema& entity, const value_t& key) {
    auto key_id = key_string(key);
    if (auto* existing = find(entity.name, key_id)) {
        if (existing->cancelled || existing->op == change_type::remove) return;
        if (existing->op == change_type::insert) {
            existing->cancelled = true;
            existing->fields.clear();
            return;
        }
        existing->op = change_type::remove;
        existing->fields.clear();
        return;
    }

    index_[object_registry::identity(entity.name, key_id)] = log_.size();
    log_.push_back({change_type::remove, &entity, key, std::move(key_id), {}, false});
}

// ============================================================================
// transaction_manager
// ============================================================================

transaction_ptr transaction_manager::begin() {
    owner_.check_open();
    if (current_) {
        if (current_->state_ == transaction_state::committing) {
            throw transaction_already_active_error("Cannot begin a transaction while transaction " +
                                                   std::to_string(current_->id_) + " is committing");
        }
        ++current_->depth_;
        LOG_DEBUG("tx", "Joined transaction %llu (depth %zu)",
                  static_cast<unsigned long long>(current_->id_), current_->depth_);
        return current_;
    }

    current_ = std::make_shared<transaction>(transaction::private_key{}, next_id_++);
    current_->state_ = transaction_state::active;
    current_->depth_ = 1;
    LOG_DEBUG("tx", "Began transaction %llu", static_cast<unsigned long long>(current_->id_));
    return current_;
}

transaction& transaction_manager::require_active(const char* operation) const {
    if (!current_ || !current_->is_active()) {
        throw no_active_transaction_error(std::string(operation) + " requires an active transaction");
    }
    return *current_;
}

void transaction_manager::commit(const transaction_ptr& tx) {
    if (!tx || tx->state_ != transaction_state::active || tx != current_) {
        throw no_active_transaction_error("Commit of a transaction that is not active (" +
                                          std::string(tx ? to_string(tx->state_) : "null") + ")");
    }

    if (tx->depth_ > 1) {
        --tx->depth_;
        return;
    }

    tx->state_ = transaction_state::committing;
    auto& session = owner_.session();

    bool has_writes = false;
    for (const auto& write : tx->log_) {
        if (!write.cancelled) has_writes = true;
    }

    size_t applied = 0;
    try {
        if (has_writes) {
            session.begin_tx();
            for (const auto& write : tx->log_) {
                if (write.cancelled) continue;
                switch (write.op) {
                    case change_type::insert:
                        session.write_record(*write.entity, write.key, write.fields, write_mode::insert);
                        break;
                    case change_type::update:
                        session.write_record(*write.entity, write.key, write.fields, write_mode::update);
                        break;
                    case change_type::remove:
                        session.delete_record(*write.entity, write.key);
                        break;
                }
                ++applied;
            }
            session.commit_tx();
        }
    } catch (const std::exception& e) {
        LOG_WARN("tx", "Commit of transaction %llu failed after %zu writes: %s",
                 static_cast<unsigned long long>(tx->id_), applied, e.what());
        try {
            session.rollback_tx();
        } catch (const std::exception& rollback_error) {
            LOG_ERROR("tx", "Storage rollback failed: %s", rollback_error.what());
        }
        finish_failed(*tx);
        throw;
    }

    tx->state_ = transaction_state::committed;
    tx->depth_ = 0;
    current_.reset();
    owner_.bump_generation();
    LOG_DEBUG("tx", "Committed transaction %llu (%zu writes)", static_cast<unsigned long long>(tx->id_), applied);

    owner_.bus().drain();
}

void transaction_manager::finish_failed(transaction& tx) {
    tx.state_ = transaction_state::failed;
    tx.depth_ = 0;
    current_.reset();

    // Deleted proxies come back before created ones are dropped, so an object
    // created and deleted in the same transaction ends up invalid
    for (auto& state : tx.deleted_) {
        state->valid = true;
        owner_.objects().adopt(state);
    }
    for (auto& state : tx.created_) {
        state->valid = false;
    }
    owner_.bump_generation();
}

void transaction_manager::rollback(const transaction_ptr& tx) {
    if (!tx || tx->is_terminal()) return;
    if (tx->state_ == transaction_state::committing) {
        throw transaction_already_active_error("Cannot roll back a committing transaction");
    }

    tx->state_ = transaction_state::rolled_back;
    tx->depth_ = 0;
    if (current_ == tx) current_.reset();

    for (auto& state : tx->deleted_) {
        state->valid = true;
        owner_.objects().adopt(state);
    }
    for (auto& state : tx->created_) {
        state->valid = false;
    }
    owner_.bump_generation();
    LOG_DEBUG("tx", "Rolled back transaction %llu (%zu pending writes discarded)",
              static_cast<unsigned long long>(tx->id_), tx->log_.size());
}

void transaction_manager::abandon() {
    if (current_ && current_->is_active()) {
        LOG_WARN("tx", "Rolling back transaction %llu left open at close",
                 static_cast<unsigned long long>(current_->id_));
        rollback(current_);
    }
    current_.reset();
}

// ============================================================================
// write_transaction
// ============================================================================

write_transaction::~write_transaction() {
    if (!completed_) {
        try {
            manager_.rollback(tx_);
        } catch (const std::exception& e) {
            LOG_ERROR("tx", "Rollback in destructor failed: %s", e.what());
        }
    }
}

void write_transaction::commit() {
    completed_ = true;
    manager_.commit(tx_);
}

void write_transaction::rollback() {
    completed_ = true;
    manager_.rollback(tx_);
}

} // namespace strata
