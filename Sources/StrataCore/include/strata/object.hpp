#pragma once

#include "errors.hpp"
#include "observation.hpp"
#include "schema.hpp"
#include "types.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace strata {

class store;
class live_collection;

// ============================================================================
// object_state - shared by every handle to one record in a session
// ============================================================================
//
// The state never owns record data: reads go back to the store (and the
// pending log of the active transaction). Invalidating the state invalidates
// every handle at once.

struct object_state {
    store* owner = nullptr;
    const entity_schema* entity = nullptr;
    value_t key;
    std::string key_id;  // key_string(key)
    bool valid = true;

    // Resolved forward links, dropped when the store generation moves on
    struct cached_link {
        uint64_t generation = 0;
        bool is_null = true;
        std::weak_ptr<object_state> target;
    };
    std::map<std::string, cached_link> link_cache;
};

// ============================================================================
// object_registry - identity map (entity + primary key -> state)
// ============================================================================

class object_registry {
public:
    /// Existing state for the record, or a new one. With replace_invalid, an
    /// invalidated state is replaced by a fresh valid one.
    std::shared_ptr<object_state> get_or_create(store* owner, const entity_schema& entity,
                                                const value_t& key, bool replace_invalid = true);

    std::shared_ptr<object_state> find(const std::string& entity, const std::string& key_id) const;

    /// Make state the registered state for its record again (rollback of a delete).
    void adopt(const std::shared_ptr<object_state>& state);

    void invalidate(const std::string& entity, const std::string& key_id);
    void invalidate_all();

    size_t size() const { return states_.size(); }

    static std::string identity(const std::string& entity, const std::string& key_id) {
        return entity + '\x1f' + key_id;
    }

private:
    void sweep();

    std::unordered_map<std::string, std::weak_ptr<object_state>> states_;
    size_t sweep_threshold_ = 64;
};

// ============================================================================
// object - handle to one stored record
// ============================================================================
//
// Usage:
//   store.write([&] {
//       auto list = store.create("List", {{"_id", "L1"}, {"name", "Groceries"}});
//       list.set("name", "Weekly groceries");
//   });
//   auto name = list.get<std::string>("name");
//   auto items = list.list("items");   // back-link collection

class object {
public:
    explicit object(std::shared_ptr<object_state> state);

    const std::string& entity() const;
    const entity_schema& schema() const;

    /// Primary key, immutable for the object's lifetime.
    const value_t& key() const;

    bool is_valid() const noexcept { return state_ && state_->valid; }

    /// Current value, including uncommitted writes of the active transaction.
    /// A link yields the stored target key. Throws invalid_object_error and
    /// invalid_property_error (unknown property, back-link).
    value_t get(const std::string& name) const;

    template<typename T>
    T get(const std::string& name) const {
        auto value = get(name);
        if (auto* v = std::get_if<T>(&value)) {
            return *v;
        }
        throw invalid_property_error(entity() + "." + name + " holds " + value_type_name(value));
    }

    /// Like get<T>(), with null as nullopt.
    template<typename T>
    std::optional<T> get_optional(const std::string& name) const {
        auto value = get(name);
        if (is_null(value)) return std::nullopt;
        if (auto* v = std::get_if<T>(&value)) {
            return *v;
        }
        throw invalid_property_error(entity() + "." + name + " holds " + value_type_name(value));
    }

    /// Every stored property (no back-links).
    record values() const;

    /// Requires an active transaction.
    void set(const std::string& name, value_t value);

    /// Forward link target; nullopt for a null or dangling link.
    std::optional<object> link(const std::string& name) const;

    /// Back-link or list-of-links property as a live collection.
    live_collection list(const std::string& name) const;

    notification_token observe(object_callback callback) const;

    const std::shared_ptr<object_state>& state() const { return state_; }

    bool operator==(const object& other) const;
    bool operator!=(const object& other) const { return !(*this == other); }

private:
    void check_valid() const;
    const property_descriptor& property(const std::string& name) const;

    std::shared_ptr<object_state> state_;
};

} // namespace strata
