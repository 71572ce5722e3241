#pragma once

#include <stdexcept>
#include <string>

namespace strata {

enum class error_kind {
    schema,
    unknown_entity,
    invalid_query,
    no_active_transaction,
    transaction_already_active,
    constraint_violation,
    write_conflict,
    invalid_object,
    invalid_property,
    storage
};

const char* to_string(error_kind kind);

/// Base of every error raised by the binding layer. Only kind() and what()
/// are part of the contract.
class error : public std::runtime_error {
public:
    error(error_kind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

/// Bad descriptor batch. Fatal at registration: the store cannot open.
class schema_error : public error {
public:
    explicit schema_error(const std::string& msg) : error(error_kind::schema, msg) {}
};

class unknown_entity_error : public error {
public:
    explicit unknown_entity_error(const std::string& msg) : error(error_kind::unknown_entity, msg) {}
};

class invalid_query_error : public error {
public:
    explicit invalid_query_error(const std::string& msg) : error(error_kind::invalid_query, msg) {}
};

/// Mutation attempted without an active transaction.
class no_active_transaction_error : public error {
public:
    explicit no_active_transaction_error(const std::string& msg) : error(error_kind::no_active_transaction, msg) {}
};

/// begin() while the current transaction is already committing.
/// Ordinary re-entrant begin() calls nest instead of raising this.
class transaction_already_active_error : public error {
public:
    explicit transaction_already_active_error(const std::string& msg)
        : error(error_kind::transaction_already_active, msg) {}
};

class constraint_violation_error : public error {
public:
    explicit constraint_violation_error(const std::string& msg) : error(error_kind::constraint_violation, msg) {}
};

class write_conflict_error : public error {
public:
    explicit write_conflict_error(const std::string& msg) : error(error_kind::write_conflict, msg) {}
};

/// Use of a deleted, rolled-back or closed proxy or collection.
class invalid_object_error : public error {
public:
    explicit invalid_object_error(const std::string& msg) : error(error_kind::invalid_object, msg) {}
};

/// Unknown property name or a value of the wrong type.
class invalid_property_error : public error {
public:
    explicit invalid_property_error(const std::string& msg) : error(error_kind::invalid_property, msg) {}
};

/// Failure reported by the storage engine that is neither a constraint
/// violation nor a write conflict.
class storage_error : public error {
public:
    explicit storage_error(const std::string& msg) : error(error_kind::storage, msg) {}
};

} // namespace strata
