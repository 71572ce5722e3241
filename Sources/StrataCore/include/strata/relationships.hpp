#pragma once

#include "live_collection.hpp"
#include "object.hpp"
#include "schema.hpp"
#include <optional>
#include <vector>

namespace strata {

class store;

// Resolves forward links, back-links and lists of links on demand.
// Nothing cascades: deleting a target leaves dangling keys behind, which
// resolve to nothing.
class relationship_resolver {
public:
    explicit relationship_resolver(store& owner) : owner_(owner) {}

    /// Target of a forward link, nullopt when null or dangling. Cached on the
    /// source proxy until the next commit or rollback.
    std::optional<object> resolve_link(const object& source, const property_descriptor& link);

    /// Objects linking to target through backlink.link_property.
    live_collection backlinks(const object& target, const property_descriptor& backlink);

    /// Members of a list-of-links property, in list order.
    live_collection link_list(const object& owner, const property_descriptor& list_property);

    /// Objects for the keys of a stored link list, dangling keys skipped.
    std::vector<std::shared_ptr<object_state>> resolve_keys(const entity_schema& target, const nlohmann::json& keys);

private:
    store& owner_;
};

} // namespace strata
