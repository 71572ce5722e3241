#include "strata/sqlite_store.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace strata {

namespace {

bool is_shared_path(const std::string& path) {
    return !path.empty() && path != ":memory:";
}

std::string change_key(const std::string& entity, const value_t& key) {
    return entity + '\x1f' + key_string(key);
}

} // namespace

// ============================================================================
// session_registry
// ============================================================================

session_registry& session_registry::instance() {
    static session_registry registry;
    return registry;
}

void session_registry::register_session(const std::string& path, sqlite_session* session) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[path].push_back(session);
}

void session_registry::unregister_session(const std::string& path, sqlite_session* session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(path);
    if (it != sessions_.end()) {
        auto& vec = it->second;
        vec.erase(std::remove(vec.begin(), vec.end(), session), vec.end());
        if (vec.empty()) {
            sessions_.erase(it);
        }
    }
}

std::vector<sqlite_session*> session_registry::get_sessions(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(path);
    if (it != sessions_.end()) {
        return it->second;
    }
    return {};
}

// ============================================================================
// sqlite_adapter
// ============================================================================

const char* sqlite_adapter::column_type(const schema_graph& graph, const property_descriptor& prop) {
    switch (prop.type) {
        case property_type::integer:
        case property_type::boolean:
            return "INTEGER";
        case property_type::floating:
        case property_type::date:
            return "REAL";
        case property_type::binary:
            return "BLOB";
        case property_type::link: {
            property_descriptor key;
            key.type = graph.key_type(prop.target_entity);
            return column_type(graph, key);
        }
        case property_type::string:
        case property_type::object_id:
        case property_type::embedded:
        case property_type::list:
        case property_type::backlink:
            return "TEXT";
    }
    return "TEXT";
}

std::unique_ptr<storage_session> sqlite_adapter::open_session(const std::string& path,
                                                              std::shared_ptr<const schema_graph> graph) {
    return std::make_unique<sqlite_session>(path, std::move(graph), options_);
}

// ============================================================================
// sqlite_session - open / migrate / close
// ============================================================================

sqlite_session::sqlite_session(const std::string& path, std::shared_ptr<const schema_graph> graph,
                               sqlite_options options)
    : path_(path), graph_(std::move(graph)), options_(options) {
    if (!graph_) {
        throw schema_error("Cannot open a session without a schema graph");
    }
    db_ = std::make_unique<database>(path, options_.read_only ? database::open_mode::read_only
                                                             : database::open_mode::read_write,
                                     options_.busy_timeout_ms);
    if (options_.read_only) {
        verify_tables();
    } else {
        migrate();
    }
    if (is_shared_path(path_)) {
        session_registry::instance().register_session(path_, this);
    }
    LOG_DEBUG("db", "Opened session on %s", path_.c_str());
}

sqlite_session::~sqlite_session() {
    try {
        close();
    } catch (const std::exception& e) {
        LOG_ERROR("db", "Error closing session on %s: %s", path_.c_str(), e.what());
    }
}

void sqlite_session::close() {
    if (!db_) return;
    if (is_shared_path(path_)) {
        session_registry::instance().unregister_session(path_, this);
    }
    if (db_->is_in_transaction()) {
        LOG_WARN("db", "Closing %s with an open transaction, rolling back", path_.c_str());
        db_->rollback();
    }
    pending_changes_.clear();
    pending_index_.clear();
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks_.clear();
    }
    db_.reset();
}

database& sqlite_session::db() const {
    if (!db_) {
        throw storage_error("Session on " + path_ + " is closed");
    }
    return *db_;
}

namespace {

// Compares one entity of the stored snapshot against the registered graph
void check_snapshot_entity(const entity_schema& entity, const nlohmann::json& stored) {
    auto props_it = stored.find("properties");
    if (props_it == stored.end()) return;
    const auto& stored_props = *props_it;
    for (const auto& prop : entity.properties) {
        auto it = stored_props.find(prop.name);
        if (it == stored_props.end()) {
            if (prop.is_primary_key) {
                throw schema_error("Primary key of " + entity.name + " changed to '" + prop.name + "'");
            }
            continue;  // added property
        }
        const auto& was = *it;
        auto stored_type = [&](const char* field) {
            auto type = property_type_from_string(was.value(field, ""));
            if (!type) {
                throw storage_error("Stored schema snapshot names an unknown " + std::string(field) + " '" +
                                    was.value(field, "") + "' for " + entity.name + "." + prop.name);
            }
            return *type;
        };
        bool same_type = stored_type("type") == prop.type;
        if (same_type && prop.type == property_type::list) {
            same_type = stored_type("element") == prop.element_type;
        }
        if (same_type && !prop.target_entity.empty()) {
            same_type = was.value("target", "") == prop.target_entity;
        }
        if (!same_type) {
            throw schema_error("Stored type of " + entity.name + "." + prop.name + " was " +
                               was.value("type", "?") + ", cannot open as " + to_string(prop.type));
        }
        if (was.value("primary_key", false) != prop.is_primary_key) {
            throw schema_error("Primary key of " + entity.name + " changed");
        }
    }
}

std::optional<nlohmann::json> read_snapshot(database& db) {
    if (!db.table_exists("_strata_meta")) return std::nullopt;
    auto rows = db.query("SELECT value FROM _strata_meta WHERE key = 'schema'");
    if (rows.empty()) return std::nullopt;
    auto* text = std::get_if<std::string>(&rows[0]["value"]);
    if (!text) return std::nullopt;
    auto json = nlohmann::json::parse(*text, nullptr, false);
    if (json.is_discarded()) {
        throw storage_error("Stored schema snapshot is not valid JSON");
    }
    return json;
}

void check_snapshot(const schema_graph& graph, const nlohmann::json& snapshot) {
    auto entities = snapshot.find("entities");
    if (entities == snapshot.end()) return;
    for (const auto& entity : graph.entities()) {
        auto it = entities->find(entity.name);
        if (it != entities->end()) {
            check_snapshot_entity(entity, *it);
        }
    }
}

} // namespace

void sqlite_session::migrate() {
    db_transaction tx(*db_);

    db_->execute("CREATE TABLE IF NOT EXISTS _strata_meta (key TEXT PRIMARY KEY, value TEXT NOT NULL)");
    if (auto snapshot = read_snapshot(*db_)) {
        check_snapshot(*graph_, *snapshot);
    }

    for (const auto& entity : graph_->entities()) {
        if (entity.embedded) continue;
        const auto table = database::quote(entity.name);

        if (!db_->table_exists(entity.name)) {
            std::ostringstream sql;
            sql << "CREATE TABLE " << table << " (";
            bool first = true;
            for (const auto& prop : entity.properties) {
                if (!prop.is_stored()) continue;
                if (!first) sql << ", ";
                first = false;
                sql << database::quote(prop.name) << " " << sqlite_adapter::column_type(*graph_, prop);
                if (prop.is_primary_key) {
                    sql << " NOT NULL UNIQUE";
                }
            }
            sql << ")";
            db_->execute(sql.str());
            LOG_INFO("db", "Created table %s", entity.name.c_str());
            continue;
        }

        auto existing = db_->get_table_info(entity.name);
        for (const auto& prop : entity.properties) {
            if (!prop.is_stored()) continue;
            std::string type = sqlite_adapter::column_type(*graph_, prop);
            auto it = existing.find(prop.name);
            if (it == existing.end()) {
                if (prop.is_primary_key) {
                    throw schema_error("Primary key of " + entity.name + " changed to '" + prop.name + "'");
                }
                db_->execute("ALTER TABLE " + table + " ADD COLUMN " + database::quote(prop.name) + " " + type);
                LOG_INFO("db", "Added column %s.%s (%s)", entity.name.c_str(), prop.name.c_str(), type.c_str());
            } else if (it->second != type) {
                throw schema_error("Stored column " + entity.name + "." + prop.name + " is " + it->second +
                                   ", cannot open as " + to_string(prop.type));
            }
        }
    }

    db_->execute("INSERT OR REPLACE INTO _strata_meta (key, value) VALUES ('schema', ?)",
                 {graph_->to_json().dump()});
    tx.commit();
}

void sqlite_session::verify_tables() const {
    if (auto snapshot = read_snapshot(*db_)) {
        check_snapshot(*graph_, *snapshot);
    }
    for (const auto& entity : graph_->entities()) {
        if (entity.embedded) continue;
        if (!db_->table_exists(entity.name)) {
            throw schema_error("Read-only store " + path_ + " has no table for " + entity.name);
        }
        auto existing = db_->get_table_info(entity.name);
        for (const auto& prop : entity.properties) {
            if (prop.is_stored() && existing.find(prop.name) == existing.end()) {
                throw schema_error("Read-only store " + path_ + " has no column " + entity.name + "." + prop.name);
            }
        }
    }
}

// ============================================================================
// Value conversion
// ============================================================================

column_value_t sqlite_session::to_column(const property_descriptor&, const value_t& value) const {
    return std::visit([](auto&& v) -> column_value_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return nullptr;
        else if constexpr (std::is_same_v<T, int64_t>) return v;
        else if constexpr (std::is_same_v<T, double>) return v;
        else if constexpr (std::is_same_v<T, bool>) return static_cast<int64_t>(v ? 1 : 0);
        else if constexpr (std::is_same_v<T, std::string>) return v;
        else if constexpr (std::is_same_v<T, timestamp_t>) return timestamp_to_seconds(v);
        else if constexpr (std::is_same_v<T, binary_t>) return v;
        else if constexpr (std::is_same_v<T, object_id>) return v.to_string();
        else return v.json.dump();
    }, value);
}

value_t sqlite_session::from_column(const property_descriptor& prop, const column_value_t& column) const {
    auto type = prop.type == property_type::link ? graph_->key_type(prop.target_entity) : prop.type;
    return from_column(type, column, prop.name);
}

value_t sqlite_session::from_column(property_type type, const column_value_t& column, const std::string& where) const {
    if (std::holds_alternative<std::nullptr_t>(column)) return nullptr;

    auto* i = std::get_if<int64_t>(&column);
    auto* d = std::get_if<double>(&column);
    auto* s = std::get_if<std::string>(&column);
    auto* b = std::get_if<std::vector<uint8_t>>(&column);

    switch (type) {
        case property_type::integer:
            if (i) return *i;
            break;
        case property_type::boolean:
            if (i) return *i != 0;
            break;
        case property_type::floating:
            if (d) return *d;
            if (i) return static_cast<double>(*i);
            break;
        case property_type::date:
            if (d) return timestamp_from_seconds(*d);
            if (i) return timestamp_from_seconds(static_cast<double>(*i));
            break;
        case property_type::string:
            if (s) return *s;
            break;
        case property_type::object_id:
            if (s) {
                if (auto oid = object_id::parse(*s)) return *oid;
            }
            break;
        case property_type::binary:
            if (b) return *b;
            if (s) return binary_t(s->begin(), s->end());
            break;
        case property_type::list:
        case property_type::embedded:
            if (s) {
                auto json = nlohmann::json::parse(*s, nullptr, false);
                if (!json.is_discarded()) return document(std::move(json));
            }
            break;
        default:
            break;
    }
    throw storage_error("Unexpected stored value for " + where + " (" + to_string(type) + ")");
}

record sqlite_session::to_record(const entity_schema& entity, const database::row_t& row) const {
    record rec;
    for (const auto& prop : entity.properties) {
        if (!prop.is_stored()) continue;
        auto it = row.find(prop.name);
        if (it == row.end()) {
            rec[prop.name] = nullptr;
            continue;
        }
        rec[prop.name] = from_column(prop, it->second);
    }
    return rec;
}

std::string sqlite_session::select_sql(const entity_schema& entity) const {
    std::ostringstream sql;
    sql << "SELECT ";
    bool first = true;
    for (const auto& prop : entity.properties) {
        if (!prop.is_stored()) continue;
        if (!first) sql << ", ";
        first = false;
        sql << database::quote(prop.name);
    }
    sql << " FROM " << database::quote(entity.name);
    return sql.str();
}

// ============================================================================
// Reads
// ============================================================================

std::optional<record> sqlite_session::read_by_key(const entity_schema& entity, const value_t& key) {
    auto* pk = entity.primary_key();
    if (!pk) {
        throw storage_error("Entity " + entity.name + " has no primary key");
    }
    auto rows = db().query(select_sql(entity) + " WHERE " + database::quote(pk->name) + " = ?",
                           {to_column(*pk, key)});
    if (rows.empty()) return std::nullopt;
    return to_record(entity, rows.front());
}

std::string sqlite_session::filter_sql(const entity_schema& entity, const query_ptr& filter,
                                       std::vector<column_value_t>& params) const {
    switch (filter->node) {
        case query_expr::kind::conjunction:
            return "(" + filter_sql(entity, filter->lhs, params) + " AND " + filter_sql(entity, filter->rhs, params) + ")";
        case query_expr::kind::disjunction:
            return "(" + filter_sql(entity, filter->lhs, params) + " OR " + filter_sql(entity, filter->rhs, params) + ")";
        case query_expr::kind::negation:
            // A comparison against NULL is unknown; NOT treats it as false
            return "NOT IFNULL(" + filter_sql(entity, filter->lhs, params) + ", 0)";
        case query_expr::kind::comparison:
            break;
    }

    auto* prop = entity.property(filter->property);
    if (!prop) {
        throw invalid_query_error("Unknown property '" + filter->property + "' on " + entity.name);
    }
    const auto column = database::quote(prop->name);

    if (is_null(filter->operand)) {
        return column + (filter->op == compare_op::eq ? " IS NULL" : " IS NOT NULL");
    }

    params.push_back(to_column(*prop, filter->operand));

    if (filter->op == compare_op::contains) {
        if (prop->type == property_type::list) {
            return "EXISTS (SELECT 1 FROM json_each(" + column + ") WHERE json_each.value = ?)";
        }
        return column + " IS ?";
    }

    switch (filter->op) {
        case compare_op::eq: return column + " IS ?";
        case compare_op::ne: return column + " IS NOT ?";
        case compare_op::lt: return column + " < ?";
        case compare_op::le: return column + " <= ?";
        case compare_op::gt: return column + " > ?";
        case compare_op::ge: return column + " >= ?";
        default: break;
    }
    throw invalid_query_error(std::string("Unsupported operator ") + to_string(filter->op));
}

std::vector<record> sqlite_session::scan(const compiled_query& query) {
    if (!query.entity) {
        throw invalid_query_error("Query has no entity");
    }
    const auto& entity = *query.entity;

    std::vector<column_value_t> params;
    std::string sql = select_sql(entity);
    if (query.filter) {
        sql += " WHERE " + filter_sql(entity, query.filter, params);
    }

    if (query.sort.empty()) {
        sql += " ORDER BY rowid";
    } else {
        sql += " ORDER BY ";
        for (const auto& s : query.sort) {
            sql += database::quote(s.property) + (s.ascending ? " ASC, " : " DESC, ");
        }
        sql += database::quote(entity.primary_key()->name) + " ASC";
    }

    auto rows = db().query(sql, params);
    std::vector<record> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        records.push_back(to_record(entity, row));
    }
    return records;
}

// ============================================================================
// Writes
// ============================================================================

void sqlite_session::begin_tx() {
    if (options_.read_only) {
        throw storage_error("Store " + path_ + " is open read-only");
    }
    db().begin_transaction();
    pending_changes_.clear();
    pending_index_.clear();
}

bool sqlite_session::in_tx() const {
    return db_ && db_->is_in_transaction();
}

void sqlite_session::write_record(const entity_schema& entity, const value_t& key,
                                  const record& fields, write_mode mode) {
    auto* pk = entity.primary_key();
    if (!pk) {
        throw storage_error("Entity " + entity.name + " has no primary key");
    }

    std::vector<std::string> names;
    std::vector<column_value_t> values;
    for (const auto& [name, value] : fields) {
        if (name == pk->name) continue;
        auto* prop = entity.property(name);
        if (!prop) {
            throw invalid_property_error("Unknown property '" + name + "' on " + entity.name);
        }
        if (!prop->is_stored()) continue;
        names.push_back(name);
        values.push_back(to_column(*prop, value));
    }

    if (mode == write_mode::insert) {
        std::ostringstream sql;
        sql << "INSERT INTO " << database::quote(entity.name) << " (" << database::quote(pk->name);
        for (const auto& name : names) sql << ", " << database::quote(name);
        sql << ") VALUES (?";
        for (size_t i = 0; i < names.size(); ++i) sql << ", ?";
        sql << ")";

        values.insert(values.begin(), to_column(*pk, key));
        db().execute(sql.str(), values);

        std::vector<std::string> changed;
        for (const auto& prop : entity.properties) {
            if (prop.is_stored()) changed.push_back(prop.name);
        }
        track(entity, key, change_type::insert, std::move(changed));
        return;
    }

    int changed_rows = 0;
    if (names.empty()) {
        changed_rows = read_by_key(entity, key) ? 1 : 0;
    } else {
        std::ostringstream sql;
        sql << "UPDATE " << database::quote(entity.name) << " SET ";
        for (size_t i = 0; i < names.size(); ++i) {
            if (i) sql << ", ";
            sql << database::quote(names[i]) << " = ?";
        }
        sql << " WHERE " << database::quote(pk->name) << " = ?";
        values.push_back(to_column(*pk, key));
        changed_rows = db().execute(sql.str(), values);
    }

    if (changed_rows == 0) {
        LOG_ERROR("db", "Update of missing record %s %s", entity.name.c_str(), describe(key).c_str());
        throw write_conflict_error("Record " + entity.name + " " + describe(key) + " no longer exists");
    }
    track(entity, key, change_type::update, std::move(names));
}

void sqlite_session::delete_record(const entity_schema& entity, const value_t& key) {
    auto* pk = entity.primary_key();
    if (!pk) {
        throw storage_error("Entity " + entity.name + " has no primary key");
    }
    int changed_rows = db().execute("DELETE FROM " + database::quote(entity.name) + " WHERE " +
                                    database::quote(pk->name) + " = ?", {to_column(*pk, key)});
    if (changed_rows == 0) {
        LOG_WARN("db", "Delete of missing record %s %s", entity.name.c_str(), describe(key).c_str());
        return;
    }
    track(entity, key, change_type::remove, {});
}

void sqlite_session::track(const entity_schema& entity, const value_t& key, change_type op,
                           std::vector<std::string> properties) {
    auto id = change_key(entity.name, key);
    auto it = pending_index_.find(id);
    if (it == pending_index_.end()) {
        pending_index_[id] = pending_changes_.size();
        pending_changes_.push_back({entity.name, key, op, std::move(properties)});
        return;
    }

    auto& existing = pending_changes_[it->second];
    if (op == change_type::remove) {
        if (existing.op == change_type::insert) {
            // Created and deleted in the same transaction: nothing to report
            pending_changes_.erase(pending_changes_.begin() + static_cast<std::ptrdiff_t>(it->second));
            pending_index_.clear();
            for (size_t i = 0; i < pending_changes_.size(); ++i) {
                pending_index_[change_key(pending_changes_[i].entity, pending_changes_[i].key)] = i;
            }
            return;
        }
        existing.op = change_type::remove;
        existing.changed_properties.clear();
        return;
    }

    if (existing.op == change_type::remove) {
        existing.op = change_type::update;  // deleted then re-inserted: replaced
    }
    for (auto& name : properties) {
        if (std::find(existing.changed_properties.begin(), existing.changed_properties.end(), name) ==
            existing.changed_properties.end()) {
            existing.changed_properties.push_back(std::move(name));
        }
    }
}

void sqlite_session::commit_tx() {
    if (!in_tx()) {
        throw storage_error("commit_tx without an open storage transaction");
    }
    db_->commit();

    commit_info info;
    info.changes = std::move(pending_changes_);
    pending_changes_.clear();
    pending_index_.clear();

    LOG_DEBUG("db", "Committed %zu changes on %s", info.changes.size(), path_.c_str());

    deliver(info);

    if (!is_shared_path(path_) || info.changes.empty()) return;

    commit_info external = info;
    external.external = true;
    for (auto* sibling : session_registry::instance().get_sessions(path_)) {
        if (sibling == this) continue;
        try {
            sibling->deliver(external);
        } catch (const std::exception& e) {
            LOG_ERROR("db", "Observer of another session on %s failed: %s", path_.c_str(), e.what());
        }
    }
}

void sqlite_session::rollback_tx() {
    pending_changes_.clear();
    pending_index_.clear();
    if (in_tx()) {
        db_->rollback();
    }
}

uint64_t sqlite_session::on_commit(commit_callback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    auto id = next_callback_id_++;
    callbacks_[id] = std::move(callback);
    return id;
}

void sqlite_session::remove_commit_callback(uint64_t id) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.erase(id);
}

void sqlite_session::deliver(const commit_info& info) {
    std::vector<commit_callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        for (const auto& [_, cb] : callbacks_) callbacks.push_back(cb);
    }
    for (const auto& cb : callbacks) {
        cb(info);
    }
}

} // namespace strata
