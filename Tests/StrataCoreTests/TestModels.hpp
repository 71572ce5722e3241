#pragma once

#include <StrataCore.hpp>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// ============================================================================
// Model Definitions
// ============================================================================

inline strata::entity_schema list_schema() {
    return strata::entity_builder("List")
        .primary_key("_id")
        .property("name", strata::property_type::string)
        .backlink("items", "Item", "listId");
}

inline strata::entity_schema item_schema() {
    return strata::entity_builder("Item")
        .primary_key("_id")
        .property("description", strata::property_type::string)
        .property("done", strata::property_type::boolean, false)
        .optional("deadline", strata::property_type::date)
        .property("priority", strata::property_type::integer, int64_t(0))
        .link("listId", "List")
        .list("tags", strata::property_type::string);
}

inline strata::entity_schema board_schema() {
    return strata::entity_builder("Board")
        .primary_key("code", strata::property_type::integer)
        .property("title", strata::property_type::string)
        .link_list("lists", "List");
}

inline strata::entity_schema address_schema() {
    return strata::entity_builder("Address")
        .embedded()
        .property("street", strata::property_type::string)
        .property("city", strata::property_type::string, std::string("Springfield"));
}

inline strata::entity_schema person_schema() {
    return strata::entity_builder("Person")
        .primary_key("_id", strata::property_type::object_id)
        .property("name", strata::property_type::string)
        .optional("email", strata::property_type::string)
        .property("score", strata::property_type::floating, 0.0)
        .optional("avatar", strata::property_type::binary)
        .embedded_object("address", "Address");
}

inline std::vector<strata::entity_schema> all_schemas() {
    return {list_schema(), item_schema(), board_schema(), address_schema(), person_schema()};
}

inline strata::configuration memory_config() {
    return strata::configuration(":memory:", all_schemas());
}

// Fresh temp file path; removes the file and its WAL companions first
inline std::string temp_store_path(const std::string& name) {
    auto path = (std::filesystem::temp_directory_path() / ("strata_" + name + ".sqlite")).string();
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::filesystem::remove(path + suffix);
    }
    return path;
}

inline void remove_store_file(const std::string& path) {
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::filesystem::remove(path + suffix);
    }
}

// True if fn throws E
template<typename E, typename F>
bool throws(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

// The List / Item fixture: L1 "Home" with I1 "milk"
inline void seed_home_list(strata::store& db) {
    db.write([&] {
        db.create("List", {{"_id", "L1"}, {"name", "Home"}});
        db.create("Item", {{"_id", "I1"}, {"description", "milk"}, {"done", false}, {"listId", "L1"}});
    });
}
