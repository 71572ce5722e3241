#include "strata/types.hpp"
#include "strata/errors.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

namespace strata {

std::string object_id::to_string() const {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

std::optional<object_id> object_id::parse(const std::string& s) {
    std::string hex;
    for (char c : s) {
        if (c != '-') hex += c;
    }
    if (hex.size() != 32) return std::nullopt;
    object_id result;
    for (size_t i = 0; i < 16; ++i) {
        auto byte = hex.substr(i * 2, 2);
        if (!std::isxdigit(static_cast<unsigned char>(byte[0])) ||
            !std::isxdigit(static_cast<unsigned char>(byte[1]))) {
            return std::nullopt;
        }
        result.bytes[i] = static_cast<uint8_t>(std::stoi(byte, nullptr, 16));
    }
    return result;
}

object_id object_id::generate() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    object_id result;
    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    for (int i = 0; i < 8; ++i) {
        result.bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
        result.bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
    }

    // Set version (4) and variant (RFC 4122)
    result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;
    result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;

    return result;
}

const char* to_string(property_type type) {
    switch (type) {
        case property_type::integer: return "integer";
        case property_type::floating: return "float";
        case property_type::string: return "string";
        case property_type::boolean: return "boolean";
        case property_type::date: return "date";
        case property_type::binary: return "binary";
        case property_type::object_id: return "object-id";
        case property_type::embedded: return "embedded-object";
        case property_type::link: return "link";
        case property_type::list: return "list";
        case property_type::backlink: return "backlink";
    }
    return "unknown";
}

std::optional<property_type> property_type_from_string(const std::string& name) {
    static const std::map<std::string, property_type> names = {
        {"integer", property_type::integer},
        {"float", property_type::floating},
        {"string", property_type::string},
        {"boolean", property_type::boolean},
        {"date", property_type::date},
        {"binary", property_type::binary},
        {"object-id", property_type::object_id},
        {"embedded-object", property_type::embedded},
        {"link", property_type::link},
        {"list", property_type::list},
        {"backlink", property_type::backlink},
    };
    auto it = names.find(name);
    if (it == names.end()) return std::nullopt;
    return it->second;
}

const char* to_string(change_type type) {
    switch (type) {
        case change_type::insert: return "INSERT";
        case change_type::update: return "UPDATE";
        case change_type::remove: return "DELETE";
    }
    return "UNKNOWN";
}

const char* value_type_name(const value_t& v) {
    return std::visit([](auto&& x) -> const char* {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return "null";
        else if constexpr (std::is_same_v<T, int64_t>) return "integer";
        else if constexpr (std::is_same_v<T, double>) return "float";
        else if constexpr (std::is_same_v<T, bool>) return "boolean";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, timestamp_t>) return "date";
        else if constexpr (std::is_same_v<T, binary_t>) return "binary";
        else if constexpr (std::is_same_v<T, object_id>) return "object-id";
        else return "document";
    }, v);
}

std::string describe(const value_t& v) {
    return std::visit([](auto&& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return "null";
        else if constexpr (std::is_same_v<T, int64_t>) return std::to_string(x);
        else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream ss;
            ss << x;
            return ss.str();
        }
        else if constexpr (std::is_same_v<T, bool>) return x ? "true" : "false";
        else if constexpr (std::is_same_v<T, std::string>) return "'" + x + "'";
        else if constexpr (std::is_same_v<T, timestamp_t>) {
            std::ostringstream ss;
            ss << "date(" << timestamp_to_seconds(x) << ")";
            return ss.str();
        }
        else if constexpr (std::is_same_v<T, binary_t>) return "binary(" + std::to_string(x.size()) + " bytes)";
        else if constexpr (std::is_same_v<T, object_id>) return "oid(" + x.to_string() + ")";
        else return x.json.dump();
    }, v);
}

std::string key_string(const value_t& key) {
    if (auto* i = std::get_if<int64_t>(&key)) return "i:" + std::to_string(*i);
    if (auto* s = std::get_if<std::string>(&key)) return "s:" + *s;
    if (auto* o = std::get_if<object_id>(&key)) return "o:" + o->to_string();
    return std::string(value_type_name(key)) + ":" + describe(key);
}

nlohmann::json to_json_scalar(const value_t& v) {
    return std::visit([](auto&& x) -> nlohmann::json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return nullptr;
        else if constexpr (std::is_same_v<T, timestamp_t>) return timestamp_to_seconds(x);
        else if constexpr (std::is_same_v<T, binary_t>) return nlohmann::json(x);
        else if constexpr (std::is_same_v<T, object_id>) return x.to_string();
        else if constexpr (std::is_same_v<T, document>) return x.json;
        else return x;
    }, v);
}

document make_list(const std::vector<value_t>& elements) {
    auto array = nlohmann::json::array();
    for (const auto& e : elements) {
        array.push_back(to_json_scalar(e));
    }
    return document(std::move(array));
}

timestamp_t timestamp_from_seconds(double seconds) {
    auto millis = static_cast<int64_t>(std::llround(seconds * 1000.0));
    return timestamp_t(std::chrono::milliseconds(millis));
}

double timestamp_to_seconds(timestamp_t t) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    return static_cast<double>(millis) / 1000.0;
}

const char* to_string(error_kind kind) {
    switch (kind) {
        case error_kind::schema: return "SchemaError";
        case error_kind::unknown_entity: return "UnknownEntityError";
        case error_kind::invalid_query: return "InvalidQueryError";
        case error_kind::no_active_transaction: return "NoActiveTransactionError";
        case error_kind::transaction_already_active: return "TransactionAlreadyActiveError";
        case error_kind::constraint_violation: return "ConstraintViolationError";
        case error_kind::write_conflict: return "WriteConflictError";
        case error_kind::invalid_object: return "InvalidObjectError";
        case error_kind::invalid_property: return "InvalidPropertyError";
        case error_kind::storage: return "StorageError";
    }
    return "Error";
}

} // namespace strata
