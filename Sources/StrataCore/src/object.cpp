#include "strata/object.hpp"
#include "strata/live_collection.hpp"
#include "strata/log.hpp"
#include "strata/store.hpp"

#include <algorithm>

namespace strata {

// ============================================================================
// object_registry
// ============================================================================

std::shared_ptr<object_state> object_registry::get_or_create(store* owner, const entity_schema& entity,
                                                             const value_t& key, bool replace_invalid) {
    auto key_id = key_string(key);
    auto id = identity(entity.name, key_id);

    auto it = states_.find(id);
    if (it != states_.end()) {
        if (auto existing = it->second.lock()) {
            if (existing->valid || !replace_invalid) {
                return existing;
            }
        }
    }

    auto state = std::make_shared<object_state>();
    state->owner = owner;
    state->entity = &entity;
    state->key = key;
    state->key_id = std::move(key_id);
    states_[id] = state;

    if (states_.size() >= sweep_threshold_) {
        sweep();
    }
    return state;
}

std::shared_ptr<object_state> object_registry::find(const std::string& entity, const std::string& key_id) const {
    auto it = states_.find(identity(entity, key_id));
    if (it == states_.end()) return nullptr;
    return it->second.lock();
}

void object_registry::adopt(const std::shared_ptr<object_state>& state) {
    states_[identity(state->entity->name, state->key_id)] = state;
}

void object_registry::invalidate(const std::string& entity, const std::string& key_id) {
    if (auto state = find(entity, key_id)) {
        state->valid = false;
    }
}

void object_registry::invalidate_all() {
    for (auto& [_, weak] : states_) {
        if (auto state = weak.lock()) {
            state->valid = false;
        }
    }
    states_.clear();
}

void object_registry::sweep() {
    for (auto it = states_.begin(); it != states_.end();) {
        if (it->second.expired()) {
            it = states_.erase(it);
        } else {
            ++it;
        }
    }
    sweep_threshold_ = std::max<size_t>(64, states_.size() * 2);
}

// ============================================================================
// object
// ============================================================================

object::object(std::shared_ptr<object_state> state) : state_(std::move(state)) {}

const std::string& object::entity() const {
    return state_->entity->name;
}

const entity_schema& object::schema() const {
    return *state_->entity;
}

const value_t& object::key() const {
    return state_->key;
}

void object::check_valid() const {
    if (!is_valid()) {
        throw invalid_object_error("Object " + entity() + " " + describe(key()) +
                                   " has been deleted or invalidated");
    }
}

const property_descriptor& object::property(const std::string& name) const {
    auto* prop = state_->entity->property(name);
    if (!prop) {
        throw invalid_property_error("Unknown property '" + name + "' on " + entity());
    }
    return *prop;
}

value_t object::get(const std::string& name) const {
    check_valid();
    const auto& prop = property(name);
    if (prop.type == property_type::backlink) {
        throw invalid_property_error(entity() + "." + name + " is a back-link; use list()");
    }
    auto values = state_->owner->read_current(*state_);
    auto it = values.find(name);
    if (it == values.end()) return nullptr;
    return it->second;
}

record object::values() const {
    check_valid();
    return state_->owner->read_current(*state_);
}

void object::set(const std::string& name, value_t value) {
    check_valid();
    state_->owner->set_value(*state_, name, std::move(value));
}

std::optional<object> object::link(const std::string& name) const {
    check_valid();
    const auto& prop = property(name);
    if (prop.type != property_type::link) {
        throw invalid_property_error(entity() + "." + name + " is not a link");
    }
    return state_->owner->resolver().resolve_link(*this, prop);
}

live_collection object::list(const std::string& name) const {
    check_valid();
    const auto& prop = property(name);
    if (prop.type == property_type::backlink) {
        return state_->owner->resolver().backlinks(*this, prop);
    }
    if (prop.is_link_list()) {
        return state_->owner->resolver().link_list(*this, prop);
    }
    throw invalid_property_error(entity() + "." + name + " is not a back-link or a list of links");
}

notification_token object::observe(object_callback callback) const {
    check_valid();
    return state_->owner->observe(*this, std::move(callback));
}

bool object::operator==(const object& other) const {
    if (state_ == other.state_) return true;
    if (!state_ || !other.state_) return false;
    return state_->owner == other.state_->owner && state_->entity->name == other.state_->entity->name &&
           state_->key_id == other.state_->key_id;
}

} // namespace strata
