#include "strata/schema.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"

#include <set>

namespace strata {

namespace {

bool is_reserved_property_name(const std::string& name) {
    return name == "rowid" || name == "oid" || name == "_rowid_";
}

bool is_reserved_entity_name(const std::string& name) {
    return name.rfind("_strata", 0) == 0 || name.rfind("sqlite_", 0) == 0;
}

bool is_scalar(property_type type) {
    switch (type) {
        case property_type::integer:
        case property_type::floating:
        case property_type::string:
        case property_type::boolean:
        case property_type::date:
        case property_type::binary:
        case property_type::object_id:
            return true;
        default:
            return false;
    }
}

bool is_key_type(property_type type) {
    return type == property_type::integer || type == property_type::string || type == property_type::object_id;
}

// Validate one JSON-encoded list element or embedded field, returning its canonical form
nlohmann::json normalize_json_scalar(property_type type, const nlohmann::json& j, const std::string& where) {
    switch (type) {
        case property_type::integer:
            if (j.is_number_integer()) return j;
            break;
        case property_type::floating:
        case property_type::date:
            if (j.is_number()) return j.get<double>();
            break;
        case property_type::string:
            if (j.is_string()) return j;
            break;
        case property_type::boolean:
            if (j.is_boolean()) return j;
            break;
        case property_type::object_id:
            if (j.is_string()) {
                if (auto oid = object_id::parse(j.get<std::string>())) return oid->to_string();
            }
            break;
        default:
            break;
    }
    throw invalid_property_error(where + ": expected " + to_string(type) + ", got " + j.dump());
}

} // namespace

// ============================================================================
// entity_schema
// ============================================================================

const property_descriptor* entity_schema::property(const std::string& property_name) const {
    for (const auto& prop : properties) {
        if (prop.name == property_name) return &prop;
    }
    return nullptr;
}

const property_descriptor* entity_schema::primary_key() const {
    for (const auto& prop : properties) {
        if (prop.is_primary_key) return &prop;
    }
    return nullptr;
}

// ============================================================================
// entity_builder
// ============================================================================

entity_builder::entity_builder(std::string name) {
    schema_.name = std::move(name);
}

entity_builder& entity_builder::primary_key(std::string name, property_type type) {
    property_descriptor desc;
    desc.name = std::move(name);
    desc.type = type;
    desc.is_primary_key = true;
    if (type == property_type::object_id) {
        desc.default_generator = [] { return value_t(object_id::generate()); };
    }
    schema_.properties.push_back(std::move(desc));
    return *this;
}

entity_builder& entity_builder::property(std::string name, property_type type) {
    property_descriptor desc;
    desc.name = std::move(name);
    desc.type = type;
    schema_.properties.push_back(std::move(desc));
    return *this;
}

entity_builder& entity_builder::optional(std::string name, property_type type) {
    property_descriptor desc;
    desc.name = std::move(name);
    desc.type = type;
    desc.optional = true;
    schema_.properties.push_back(std::move(desc));
    return *this;
}

entity_builder& entity_builder::property(std::string name, property_type type, value_t default_value) {
    property_descriptor desc;
    desc.name = std::move(name);
    desc.type = type;
    desc.default_value = std::move(default_value);
    schema_.properties.push_back(std::move(desc));
    return *this;
}

entity_builder& entity_builder::generated(std::string name, property_type type, std::function<value_t()> generator) {
    property_descriptor desc;
    desc.name = std::move(name);
    desc.type = type;
    desc.default_generator = std::move(generator);
    schema_.properties.push_back(std::move(desc));
    return *this;
}

entity_builder& entity_builder::link(std::string name, std::string target_entity) {
    property_descriptor desc;
    desc.name = std::move(name);
    desc.type = property_type::link;
    desc.optional = true;  // links are always nullable
    desc.target_entity = std::move(target_entity);
    schema_.properties.push_back(std::move(desc));
    return *this;
}

entity_builder& entity_builder::list(std::string name, property_type element_type) {
    property_descriptor desc;
    desc.name = std::move(name);
    desc.type = property_type::list;
    desc.element_type = element_type;
    schema_.properties.push_back(std::move(desc));
    return *this;
}

entity_builder& entity_builder::link_list(std::string name, std::string target_entity) {
    property_descriptor desc;
    desc.name = std::move(name);
    desc.type = property_type::list;
    desc.element_type = property_type::link;
    desc.target_entity = std::move(target_entity);
    schema_.properties.push_back(std::move(desc));
    return *this;
}

entity_builder& entity_builder::embedded_object(std::string name, std::string target_entity, bool optional) {
    property_descriptor desc;
    desc.name = std::move(name);
    desc.type = property_type::embedded;
    desc.optional = optional;
    desc.target_entity = std::move(target_entity);
    schema_.properties.push_back(std::move(desc));
    return *this;
}

entity_builder& entity_builder::backlink(std::string name, std::string source_entity, std::string link_property) {
    property_descriptor desc;
    desc.name = std::move(name);
    desc.type = property_type::backlink;
    desc.target_entity = std::move(source_entity);
    desc.link_property = std::move(link_property);
    schema_.properties.push_back(std::move(desc));
    return *this;
}

entity_builder& entity_builder::embedded() {
    schema_.embedded = true;
    return *this;
}

// ============================================================================
// schema_graph
// ============================================================================

const entity_schema& schema_graph::resolve(const std::string& entity_name) const {
    auto* schema = find(entity_name);
    if (!schema) {
        throw unknown_entity_error("Unknown entity: " + entity_name);
    }
    return *schema;
}

const entity_schema* schema_graph::find(const std::string& entity_name) const noexcept {
    auto it = index_.find(entity_name);
    if (it == index_.end()) return nullptr;
    return &entities_[it->second];
}

property_type schema_graph::key_type(const std::string& entity_name) const {
    const auto& schema = resolve(entity_name);
    auto* pk = schema.primary_key();
    if (!pk) {
        throw invalid_property_error("Entity " + entity_name + " has no primary key");
    }
    return pk->type;
}

value_t schema_graph::normalize_scalar(property_type type, const value_t& value, const std::string& where) const {
    switch (type) {
        case property_type::integer:
            if (std::holds_alternative<int64_t>(value)) return value;
            break;
        case property_type::floating:
            if (std::holds_alternative<double>(value)) return value;
            if (auto* i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
            break;
        case property_type::string:
            if (std::holds_alternative<std::string>(value)) return value;
            break;
        case property_type::boolean:
            if (std::holds_alternative<bool>(value)) return value;
            break;
        case property_type::date:
            if (auto* t = std::get_if<timestamp_t>(&value)) {
                return timestamp_t(std::chrono::duration_cast<std::chrono::milliseconds>(t->time_since_epoch()));
            }
            break;
        case property_type::binary:
            if (std::holds_alternative<binary_t>(value)) return value;
            break;
        case property_type::object_id:
            if (std::holds_alternative<object_id>(value)) return value;
            if (auto* s = std::get_if<std::string>(&value)) {
                if (auto oid = object_id::parse(*s)) return *oid;
            }
            break;
        default:
            break;
    }
    throw invalid_property_error(where + ": expected " + to_string(type) + ", got " +
                                 value_type_name(value) + " " + describe(value));
}

void schema_graph::check_embedded(const entity_schema& embedded, const nlohmann::json& doc,
                                  const std::string& where) const {
    if (!doc.is_object()) {
        throw invalid_property_error(where + ": expected an embedded " + embedded.name + " object");
    }
    for (const auto& [field, _] : doc.items()) {
        if (!embedded.property(field)) {
            throw invalid_property_error(where + ": " + embedded.name + " has no property '" + field + "'");
        }
    }
    for (const auto& prop : embedded.properties) {
        auto it = doc.find(prop.name);
        if (it == doc.end() || it->is_null()) {
            if (!prop.optional && !prop.has_default()) {
                throw constraint_violation_error(where + "." + prop.name + " is required");
            }
            continue;
        }
        normalize_json_scalar(prop.type, *it, where + "." + prop.name);
    }
}

value_t schema_graph::normalize(const entity_schema& entity, const property_descriptor& prop,
                                const value_t& value) const {
    const std::string where = entity.name + "." + prop.name;

    if (prop.type == property_type::backlink) {
        throw invalid_property_error(where + " is a computed back-link and cannot be written");
    }

    if (is_null(value)) {
        if (prop.type == property_type::list) {
            return document(nlohmann::json::array());
        }
        if (!prop.optional) {
            throw constraint_violation_error(where + " is required and cannot be null");
        }
        return nullptr;
    }

    switch (prop.type) {
        case property_type::link:
            return normalize_scalar(key_type(prop.target_entity), value, where);

        case property_type::list: {
            auto* doc = std::get_if<document>(&value);
            if (!doc || !doc->json.is_array()) {
                throw invalid_property_error(where + ": expected a list, got " + value_type_name(value));
            }
            auto element_type = prop.is_link_list() ? key_type(prop.target_entity) : prop.element_type;
            auto normalized = nlohmann::json::array();
            for (const auto& element : doc->json) {
                if (element.is_null()) {
                    throw invalid_property_error(where + ": list elements cannot be null");
                }
                normalized.push_back(normalize_json_scalar(element_type, element, where));
            }
            return document(std::move(normalized));
        }

        case property_type::embedded: {
            auto* doc = std::get_if<document>(&value);
            if (!doc) {
                throw invalid_property_error(where + ": expected an embedded object, got " + value_type_name(value));
            }
            const auto& embedded = resolve(prop.target_entity);
            check_embedded(embedded, doc->json, where);
            auto normalized = doc->json;
            for (const auto& field : embedded.properties) {
                auto it = normalized.find(field.name);
                if (it == normalized.end() || it->is_null()) {
                    if (field.default_value) {
                        normalized[field.name] = to_json_scalar(*field.default_value);
                    } else if (field.default_generator) {
                        normalized[field.name] = to_json_scalar(field.default_generator());
                    }
                } else {
                    *it = normalize_json_scalar(field.type, *it, where + "." + field.name);
                }
            }
            return document(std::move(normalized));
        }

        default:
            return normalize_scalar(prop.type, value, where);
    }
}

nlohmann::json schema_graph::to_json() const {
    nlohmann::json entities = nlohmann::json::object();
    for (const auto& entity : entities_) {
        nlohmann::json props = nlohmann::json::object();
        for (const auto& prop : entity.properties) {
            nlohmann::json p = {
                {"type", to_string(prop.type)},
                {"optional", prop.optional},
                {"primary_key", prop.is_primary_key}
            };
            if (!prop.target_entity.empty()) p["target"] = prop.target_entity;
            if (!prop.link_property.empty()) p["link_property"] = prop.link_property;
            if (prop.type == property_type::list) p["element"] = to_string(prop.element_type);
            props[prop.name] = std::move(p);
        }
        entities[entity.name] = {
            {"embedded", entity.embedded},
            {"properties", std::move(props)}
        };
    }
    return {{"entities", std::move(entities)}};
}

// ============================================================================
// schema_registry
// ============================================================================

std::shared_ptr<const schema_graph> schema_registry::register_schemas(std::vector<entity_schema> descriptors) {
    if (graph_) {
        throw schema_error("A schema is already registered for this store");
    }

    auto graph = std::make_shared<schema_graph>();

    // Pass 1: entity names (so forward references inside the batch resolve)
    for (size_t i = 0; i < descriptors.size(); ++i) {
        const auto& name = descriptors[i].name;
        if (name.empty()) {
            throw schema_error("Entity name cannot be empty");
        }
        if (is_reserved_entity_name(name)) {
            throw schema_error("Entity name is reserved: " + name);
        }
        if (!graph->index_.emplace(name, i).second) {
            throw schema_error("Duplicate entity name: " + name);
        }
    }
    graph->entities_ = std::move(descriptors);

    auto require_top_level = [&](const std::string& where, const std::string& target) -> const entity_schema& {
        auto* schema = graph->find(target);
        if (!schema) {
            throw schema_error(where + " references unknown entity '" + target + "'");
        }
        if (schema->embedded) {
            throw schema_error(where + " cannot link to embedded entity '" + target + "'");
        }
        return *schema;
    };

    // Pass 2: per-entity structure and relationships
    for (const auto& entity : graph->entities_) {
        std::set<std::string> names;
        size_t primary_keys = 0;

        for (const auto& prop : entity.properties) {
            const std::string where = entity.name + "." + prop.name;

            if (prop.name.empty()) {
                throw schema_error("Property name cannot be empty in entity " + entity.name);
            }
            if (is_reserved_property_name(prop.name)) {
                throw schema_error("Property name is reserved: " + where);
            }
            if (!names.insert(prop.name).second) {
                throw schema_error("Duplicate property name: " + where);
            }

            if (prop.is_primary_key) {
                ++primary_keys;
                if (!is_key_type(prop.type)) {
                    throw schema_error("Primary key " + where + " must be integer, string or object-id, not " +
                                       to_string(prop.type));
                }
                if (prop.optional) {
                    throw schema_error("Primary key " + where + " cannot be optional");
                }
            }

            if (entity.embedded && !is_scalar(prop.type)) {
                throw schema_error("Embedded entity property " + where + " must be a scalar, not " +
                                   to_string(prop.type));
            }
            if (entity.embedded && prop.type == property_type::binary) {
                throw schema_error("Embedded entity property " + where + " cannot be binary");
            }

            switch (prop.type) {
                case property_type::link:
                    require_top_level(where, prop.target_entity);
                    break;

                case property_type::list:
                    if (prop.element_type == property_type::link) {
                        require_top_level(where, prop.target_entity);
                    } else if (!is_scalar(prop.element_type) || prop.element_type == property_type::binary) {
                        throw schema_error("List " + where + " cannot hold " + to_string(prop.element_type));
                    }
                    break;

                case property_type::embedded: {
                    auto* target = graph->find(prop.target_entity);
                    if (!target) {
                        throw schema_error(where + " references unknown entity '" + prop.target_entity + "'");
                    }
                    if (!target->embedded) {
                        throw schema_error(where + " must reference an embedded entity, '" +
                                           prop.target_entity + "' is top-level");
                    }
                    break;
                }

                case property_type::backlink: {
                    if (prop.optional || prop.has_default() || prop.is_primary_key) {
                        throw schema_error("Back-link " + where + " is computed and takes no flags or defaults");
                    }
                    const auto& source = require_top_level(where, prop.target_entity);
                    auto* forward = source.property(prop.link_property);
                    if (!forward) {
                        throw schema_error("Back-link " + where + " names unknown forward link " +
                                           source.name + "." + prop.link_property);
                    }
                    bool is_forward_link = forward->type == property_type::link || forward->is_link_list();
                    if (!is_forward_link) {
                        throw schema_error("Back-link " + where + " names " + source.name + "." +
                                           forward->name + " which is a " + to_string(forward->type) +
                                           ", not a forward link");
                    }
                    if (forward->target_entity != entity.name) {
                        throw schema_error("Back-link " + where + " names " + source.name + "." +
                                           forward->name + " which links to " + forward->target_entity +
                                           ", not " + entity.name);
                    }
                    break;
                }

                default:
                    break;
            }
        }

        if (primary_keys > 1) {
            throw schema_error("Entity " + entity.name + " declares multiple primary keys");
        }
        if (entity.embedded && primary_keys != 0) {
            throw schema_error("Embedded entity " + entity.name + " cannot declare a primary key");
        }
        if (!entity.embedded && primary_keys == 0) {
            throw schema_error("Entity " + entity.name + " must declare exactly one primary key");
        }
    }

    // Pass 3: default values, now that link key types are known
    for (const auto& entity : graph->entities_) {
        for (const auto& prop : entity.properties) {
            if (!prop.default_value) continue;
            try {
                graph->normalize(entity, prop, *prop.default_value);
            } catch (const error& e) {
                throw schema_error("Invalid default for " + entity.name + "." + prop.name + ": " + e.what());
            }
        }
    }

    LOG_INFO("schema", "Registered %zu entities", graph->entities_.size());
    graph_ = graph;
    return graph_;
}

const entity_schema& schema_registry::resolve(const std::string& entity_name) const {
    if (!graph_) {
        throw unknown_entity_error("Unknown entity: " + entity_name + " (no schema registered)");
    }
    return graph_->resolve(entity_name);
}

} // namespace strata
