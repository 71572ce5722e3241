#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata {

// Timestamp type (stored as seconds since Unix epoch with millisecond precision)
using timestamp_t = std::chrono::system_clock::time_point;

// Binary payload
using binary_t = std::vector<uint8_t>;

// Object id (RFC 4122 v4 UUID, stored as lowercase hyphenated TEXT)
struct object_id {
    std::array<uint8_t, 16> bytes{};

    object_id() = default;

    explicit object_id(const std::array<uint8_t, 16>& b) : bytes(b) {}

    // Convert to lowercase hyphenated string (e.g., "550e8400-e29b-41d4-a716-446655440000")
    std::string to_string() const;

    // Parse from string (accepts with or without hyphens). nullopt if malformed.
    static std::optional<object_id> parse(const std::string& s);

    // Generate a random object id (v4)
    static object_id generate();

    bool is_nil() const {
        for (auto b : bytes) if (b != 0) return false;
        return true;
    }

    bool operator==(const object_id& other) const { return bytes == other.bytes; }
    bool operator!=(const object_id& other) const { return bytes != other.bytes; }
    bool operator<(const object_id& other) const { return bytes < other.bytes; }
};

// List and embedded-object values. Wrapped so that string literals and numbers
// never convert to a JSON document implicitly.
struct document {
    nlohmann::json json;

    document() = default;
    explicit document(nlohmann::json j) : json(std::move(j)) {}

    bool operator==(const document& other) const { return json == other.json; }
    bool operator!=(const document& other) const { return json != other.json; }
};

// A single property value
using value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    bool,
    std::string,
    timestamp_t,
    binary_t,
    object_id,
    document
>;

// A stored record: property name -> value (back-links are never stored)
using record = std::map<std::string, value_t>;

// Semantic property types
enum class property_type {
    integer,
    floating,
    string,
    boolean,
    date,
    binary,
    object_id,
    embedded,   // inline object of an embedded entity
    link,       // forward link: stores the target's primary key
    list,       // list of element_type (scalars or links)
    backlink    // computed inverse of a forward link, never stored
};

// Change tracking for commits and notifications
enum class change_type {
    insert,
    update,
    remove
};

const char* to_string(property_type type);
std::optional<property_type> property_type_from_string(const std::string& name);
const char* to_string(change_type type);

inline bool is_null(const value_t& v) {
    return std::holds_alternative<std::nullptr_t>(v);
}

/// Human-readable rendering for logs and error messages.
std::string describe(const value_t& v);

/// Name of the alternative held by v ("null", "integer", "string", ...).
const char* value_type_name(const value_t& v);

/// Stable identity string for a primary key value, used by identity maps.
/// Keys of different types never collide ("i:1" vs "s:1").
std::string key_string(const value_t& key);

/// Scalar <-> JSON conversion for list elements and embedded fields.
/// Dates are seconds since epoch, object ids are strings.
nlohmann::json to_json_scalar(const value_t& v);

/// Helpers to build list values.
document make_list(const std::vector<value_t>& elements);

timestamp_t timestamp_from_seconds(double seconds);
double timestamp_to_seconds(timestamp_t t);

} // namespace strata
