#pragma once

#include "types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {

// Property descriptor (runtime info about a property)
struct property_descriptor {
    std::string name;
    property_type type = property_type::string;
    bool is_primary_key = false;
    bool optional = false;
    std::optional<value_t> default_value;
    std::function<value_t()> default_generator;  // evaluated per create() when no value is given
    std::string target_entity;                   // link / list of links / embedded: the referenced entity
                                                 // backlink: the entity owning the forward link
    std::string link_property;                   // backlink: forward link property on target_entity
    property_type element_type = property_type::string;  // list: element type (scalar or link)

    bool is_stored() const { return type != property_type::backlink; }
    bool is_link_list() const { return type == property_type::list && element_type == property_type::link; }
    bool is_relationship() const {
        return type == property_type::link || type == property_type::backlink || is_link_list();
    }
    bool has_default() const { return default_value.has_value() || static_cast<bool>(default_generator); }
};

// Schema info for an entity
struct entity_schema {
    std::string name;
    std::vector<property_descriptor> properties;
    bool embedded = false;  // stored inline in an embedded-object property, no primary key

    const property_descriptor* property(const std::string& property_name) const;
    const property_descriptor* primary_key() const;
};

/// Declarative descriptor builder.
///
/// Usage:
///   auto item = strata::entity_builder("Item")
///       .primary_key("_id", strata::property_type::string)
///       .property("description", strata::property_type::string)
///       .property("done", strata::property_type::boolean, false)
///       .link("listId", "List")
///       .build();
class entity_builder {
public:
    explicit entity_builder(std::string name);

    entity_builder& primary_key(std::string name, property_type type = property_type::string);
    entity_builder& property(std::string name, property_type type);
    entity_builder& property(std::string name, property_type type, value_t default_value);
    entity_builder& optional(std::string name, property_type type);
    entity_builder& generated(std::string name, property_type type, std::function<value_t()> generator);
    entity_builder& link(std::string name, std::string target_entity);
    entity_builder& list(std::string name, property_type element_type);
    entity_builder& link_list(std::string name, std::string target_entity);
    entity_builder& embedded_object(std::string name, std::string target_entity, bool optional = true);
    entity_builder& backlink(std::string name, std::string source_entity, std::string link_property);

    /// Mark the entity as embedded (inline only, no primary key).
    entity_builder& embedded();

    entity_schema build() const { return schema_; }
    operator entity_schema() const { return schema_; }

private:
    entity_schema schema_;
};

// Immutable, validated schema graph shared by every component of a store
class schema_graph {
public:
    /// Throws unknown_entity_error if absent.
    const entity_schema& resolve(const std::string& entity_name) const;
    const entity_schema* find(const std::string& entity_name) const noexcept;

    const std::vector<entity_schema>& entities() const noexcept { return entities_; }

    /// Type of the primary key of a top-level entity (link values carry it).
    property_type key_type(const std::string& entity_name) const;

    /// Validate a value for a property and return it in canonical form
    /// (floats accept integers, object ids accept their string form, dates are
    /// truncated to milliseconds). Throws invalid_property_error.
    value_t normalize(const entity_schema& entity, const property_descriptor& prop, const value_t& value) const;

    /// Snapshot used by storage adapters to detect incompatible schema changes.
    nlohmann::json to_json() const;

private:
    friend class schema_registry;

    value_t normalize_scalar(property_type type, const value_t& value, const std::string& where) const;
    void check_embedded(const entity_schema& embedded, const nlohmann::json& doc, const std::string& where) const;

    std::vector<entity_schema> entities_;
    std::unordered_map<std::string, size_t> index_;
};

// Schema registry: validates descriptor batches into a schema graph.
// One graph per store-open, torn down on close.
class schema_registry {
public:
    /// Validate all descriptors as one batch so forward references resolve.
    /// Throws schema_error; a second call without reset() also fails.
    std::shared_ptr<const schema_graph> register_schemas(std::vector<entity_schema> descriptors);

    /// Throws unknown_entity_error if absent (or nothing is registered).
    const entity_schema& resolve(const std::string& entity_name) const;

    std::shared_ptr<const schema_graph> graph() const { return graph_; }
    bool is_registered() const { return graph_ != nullptr; }

    void reset() { graph_.reset(); }

private:
    std::shared_ptr<const schema_graph> graph_;
};

} // namespace strata
