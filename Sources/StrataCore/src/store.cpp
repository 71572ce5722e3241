#include "strata/store.hpp"
#include "strata/sqlite_store.hpp"

#include <cstdio>
#include <cstdlib>

namespace strata {

std::atomic<log_level> g_log_level{log_level::off};

namespace {

void apply_log_level_from_environment() {
    static const bool applied = [] {
        const char* name = std::getenv("STRATA_LOG_LEVEL");
        if (!name) return false;
        if (auto level = parse_log_level(name)) {
            set_log_level(*level);
            return true;
        }
        std::fprintf(stderr, "[strata] ignoring STRATA_LOG_LEVEL=%s\n", name);
        return false;
    }();
    (void)applied;
}

} // namespace

// ============================================================================
// Open / close
// ============================================================================

store::store(configuration config)
    : store(config, std::make_shared<sqlite_adapter>(sqlite_options{config.busy_timeout_ms, config.read_only})) {}

store::store(configuration config, std::shared_ptr<storage_adapter> adapter)
    : config_(std::move(config))
    , scheduler_(config_.sched ? config_.sched : std::make_shared<immediate_scheduler>())
    , tx_manager_(*this)
    , engine_(*this)
    , resolver_(*this)
    , bus_(*this, scheduler_) {
    open(std::move(adapter));
}

store::~store() {
    try {
        close();
    } catch (const std::exception& e) {
        LOG_ERROR("store", "Close of %s failed: %s", config_.path.c_str(), e.what());
    }
}

void store::open(std::shared_ptr<storage_adapter> adapter) {
    apply_log_level_from_environment();
    if (!adapter) {
        throw storage_error("No storage adapter for " + config_.path);
    }
    graph_ = registry_.register_schemas(config_.schemas);
    session_ = adapter->open_session(config_.path, graph_);
    commit_callback_id_ = session_->on_commit([this](const commit_info& info) {
        on_storage_commit(info);
    });
    LOG_INFO("store", "Opened %s (%zu entities%s)", config_.path.c_str(), graph_->entities().size(),
             config_.read_only ? ", read-only" : "");
}

void store::close() {
    if (!session_) return;

    tx_manager_.abandon();
    objects_.invalidate_all();
    engine_.invalidate_all();
    bus_.clear();

    session_->remove_commit_callback(commit_callback_id_);
    session_->close();
    session_.reset();
    // graph_ stays: invalidated proxies still point at its entity descriptors
    registry_.reset();
    LOG_INFO("store", "Closed %s", config_.path.c_str());
}

void store::check_open() const {
    if (!session_) {
        throw storage_error("Store " + config_.path + " is closed");
    }
}

storage_session& store::session() const {
    check_open();
    return *session_;
}

const schema_graph& store::schema() const {
    return *graph_;
}

const entity_schema& store::resolve(const std::string& entity) const {
    return graph_->resolve(entity);
}

transaction_manager& store::transactions() {
    return tx_manager_;
}

// ============================================================================
// Reads
// ============================================================================

record store::read_current(object_state& state) {
    const auto& entity = *state.entity;
    auto gone = [&]() -> invalid_object_error {
        state.valid = false;
        return invalid_object_error("Object " + entity.name + " " + describe(state.key) + " no longer exists");
    };

    const pending_write* pending = nullptr;
    if (auto tx = tx_manager_.current(); tx && !tx->is_terminal()) {
        pending = tx->pending_for(entity.name, state.key_id);
    }

    if (pending && pending->op == change_type::insert) {
        return pending->fields;
    }
    if (pending && pending->op == change_type::remove) {
        throw gone();
    }

    auto stored = session().read_by_key(entity, state.key);
    if (!stored) {
        throw gone();
    }
    if (pending) {
        for (const auto& [name, value] : pending->fields) {
            (*stored)[name] = value;
        }
    }
    return *stored;
}

std::optional<object> store::get(const std::string& entity_name, const value_t& key) {
    check_open();
    const auto& entity = resolve(entity_name);
    if (entity.embedded) {
        throw unknown_entity_error(entity_name + " is embedded and has no records of its own");
    }
    if (is_null(key)) return std::nullopt;

    auto normalized = graph_->normalize(entity, *entity.primary_key(), key);
    auto key_id = key_string(normalized);

    if (auto tx = tx_manager_.current(); tx && tx->is_active()) {
        if (const auto* pending = tx->pending_for(entity.name, key_id)) {
            if (pending->op == change_type::remove) return std::nullopt;
            if (pending->op == change_type::insert) {
                return object(objects_.get_or_create(this, entity, normalized, false));
            }
        }
    }

    if (!session_->read_by_key(entity, normalized)) {
        return std::nullopt;
    }
    return object(objects_.get_or_create(this, entity, normalized, true));
}

std::shared_ptr<object_state> store::stored_proxy(const entity_schema& entity, const value_t& key) {
    bool removed_here = false;
    if (auto tx = tx_manager_.current(); tx && !tx->is_terminal()) {
        const auto* pending = tx->pending_for(entity.name, key_string(key));
        removed_here = pending && pending->op == change_type::remove;
    }
    return objects_.get_or_create(this, entity, key, !removed_here);
}

// ============================================================================
// Writes
// ============================================================================

object store::create(const std::string& entity_name, const record& values) {
    auto& tx = tx_manager_.require_active("create");
    const auto& entity = resolve(entity_name);
    if (entity.embedded) {
        throw unknown_entity_error(entity_name + " is embedded; create it as a value of its owner");
    }

    for (const auto& [name, _] : values) {
        const auto* prop = entity.property(name);
        if (!prop) {
            throw invalid_property_error("Unknown property '" + name + "' on " + entity.name);
        }
        if (!prop->is_stored()) {
            throw invalid_property_error(entity.name + "." + name + " is a back-link and cannot be written");
        }
    }

    record fields;
    for (const auto& prop : entity.properties) {
        if (!prop.is_stored()) continue;

        value_t value;
        auto given = values.find(prop.name);
        if (given != values.end()) {
            value = given->second;
        } else if (prop.default_generator) {
            value = prop.default_generator();
        } else if (prop.default_value) {
            value = *prop.default_value;
        } else if (!prop.optional && prop.type != property_type::list) {
            throw constraint_violation_error("Missing required property " + entity.name + "." + prop.name);
        }
        fields[prop.name] = graph_->normalize(entity, prop, value);
    }

    const auto& key = fields[entity.primary_key()->name];
    auto key_id = key_string(key);

    if (const auto* pending = tx.pending_for(entity.name, key_id)) {
        if (pending->op != change_type::remove) {
            throw constraint_violation_error("Duplicate primary key " + describe(key) + " for " + entity.name);
        }
    } else if (session().read_by_key(entity, key)) {
        throw constraint_violation_error("Duplicate primary key " + describe(key) + " for " + entity.name);
    }

    auto state_key = key;
    tx.stage_insert(entity, state_key, std::move(fields));
    auto state = objects_.get_or_create(this, entity, state_key, true);
    tx.track_created(state);
    bump_generation();

    LOG_DEBUG("store", "Staged insert %s %s", entity.name.c_str(), describe(state_key).c_str());
    return object(state);
}

void store::set_value(object_state& state, const std::string& name, value_t value) {
    auto& tx = tx_manager_.require_active("set");
    const auto& entity = *state.entity;

    const auto* prop = entity.property(name);
    if (!prop) {
        throw invalid_property_error("Unknown property '" + name + "' on " + entity.name);
    }
    if (prop->is_primary_key) {
        throw constraint_violation_error("Primary key " + entity.name + "." + name + " cannot be changed");
    }
    if (!prop->is_stored()) {
        throw invalid_property_error(entity.name + "." + name + " is a back-link and cannot be written");
    }

    auto normalized = graph_->normalize(entity, *prop, value);
    read_current(state);  // the record must still exist

    tx.stage_update(entity, state.key, name, std::move(normalized));
    if (auto shared = objects_.find(entity.name, state.key_id)) {
        tx.track_modified(std::move(shared));
    }
    bump_generation();
}

void store::remove(object& obj) {
    auto& tx = tx_manager_.require_active("remove");
    if (!obj.is_valid()) {
        throw invalid_object_error("Object " + obj.entity() + " " + describe(obj.key()) +
                                   " has already been deleted or invalidated");
    }
    auto& state = *obj.state();
    if (state.owner != this) {
        throw invalid_object_error("Object " + obj.entity() + " belongs to another store");
    }

    read_current(state);
    tx.stage_remove(*state.entity, state.key);
    state.valid = false;
    tx.track_deleted(obj.state());
    bump_generation();

    LOG_DEBUG("store", "Staged delete %s %s", state.entity->name.c_str(), describe(state.key).c_str());
}

// ============================================================================
// Queries and observation
// ============================================================================

live_collection store::query(const std::string& entity,
                             const std::string& filter,
                             const std::vector<value_t>& args,
                             const std::vector<sort_descriptor>& sort) {
    check_open();
    return live_collection(engine_.make_query(compile_query(*graph_, entity, filter, args, sort)));
}

live_collection store::query(const std::string& entity,
                             const query_ptr& filter,
                             const std::vector<sort_descriptor>& sort) {
    check_open();
    return live_collection(engine_.make_query(compile_query(*graph_, entity, filter, sort)));
}

notification_token store::observe(const object& obj, object_callback callback) {
    check_open();
    if (!obj.is_valid()) {
        throw invalid_object_error("Cannot observe a deleted or invalidated object");
    }
    if (obj.state()->owner != this) {
        throw invalid_object_error("Object " + obj.entity() + " belongs to another store");
    }
    return bus_.observe(obj.state(), std::move(callback));
}

notification_token store::observe(const live_collection& collection, collection_callback callback) {
    check_open();
    const auto& state = collection.state();
    if (!state || !state->valid) {
        throw invalid_object_error("Cannot observe a released or invalidated collection");
    }
    if (state->owner != this) {
        throw invalid_object_error("Collection belongs to another store");
    }
    // The first change set is relative to what the observer could read now
    engine_.ensure_current(*state);
    return bus_.observe(state, std::move(callback));
}

void store::on_storage_commit(const commit_info& info) {
    bus_.enqueue(info);
    // A sibling's commit landing inside our own commit waits for its trailing drain
    if (info.external && !tx_manager_.is_committing()) {
        bus_.drain();
    }
}

} // namespace strata
