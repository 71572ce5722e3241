#include "strata/relationships.hpp"
#include "strata/log.hpp"
#include "strata/store.hpp"

namespace strata {

std::optional<object> relationship_resolver::resolve_link(const object& source, const property_descriptor& link) {
    auto& state = *source.state();
    const auto generation = owner_.generation();

    auto cached = state.link_cache.find(link.name);
    if (cached != state.link_cache.end() && cached->second.generation == generation) {
        if (cached->second.is_null) return std::nullopt;
        auto target = cached->second.target.lock();
        if (target && target->valid) return object(target);
    }

    object_state::cached_link entry;
    entry.generation = generation;

    auto key = source.get(link.name);
    if (is_null(key)) {
        state.link_cache[link.name] = entry;
        return std::nullopt;
    }

    auto target = owner_.get(link.target_entity, key);
    if (!target) {
        LOG_DEBUG("store", "Dangling link %s.%s -> %s %s", source.entity().c_str(), link.name.c_str(),
                  link.target_entity.c_str(), describe(key).c_str());
        state.link_cache[link.name] = entry;
        return std::nullopt;
    }

    entry.is_null = false;
    entry.target = target->state();
    state.link_cache[link.name] = entry;
    return target;
}

live_collection relationship_resolver::backlinks(const object& target, const property_descriptor& backlink) {
    return live_collection(owner_.engine().make_backlink(target, backlink));
}

live_collection relationship_resolver::link_list(const object& owner, const property_descriptor& list_property) {
    return live_collection(owner_.engine().make_list(owner, list_property));
}

std::vector<std::shared_ptr<object_state>> relationship_resolver::resolve_keys(const entity_schema& target,
                                                                               const nlohmann::json& keys) {
    std::vector<std::shared_ptr<object_state>> resolved;
    if (!keys.is_array()) return resolved;

    const auto key_type = target.primary_key()->type;
    for (const auto& element : keys) {
        value_t key;
        if (key_type == property_type::integer && element.is_number_integer()) {
            key = element.get<int64_t>();
        } else if (key_type == property_type::string && element.is_string()) {
            key = element.get<std::string>();
        } else if (key_type == property_type::object_id && element.is_string()) {
            auto oid = object_id::parse(element.get<std::string>());
            if (!oid) continue;
            key = *oid;
        } else {
            LOG_WARN("store", "Skipping malformed %s key %s in list", target.name.c_str(), element.dump().c_str());
            continue;
        }

        if (!owner_.session().read_by_key(target, key)) {
            continue;  // dangling
        }
        resolved.push_back(owner_.stored_proxy(target, key));
    }
    return resolved;
}

} // namespace strata
