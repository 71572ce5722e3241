#pragma once

#include "TestModels.hpp"
#include <functional>
#include <stdexcept>

namespace transaction_tests {

using strata::transaction_state;

// ============================================================================
// hooked_adapter - SQLite sessions with a hook run inside commit_tx()
// ============================================================================

class hooked_session : public strata::storage_session {
public:
    hooked_session(std::unique_ptr<strata::storage_session> inner, std::function<void()>& hook)
        : inner_(std::move(inner)), hook_(hook) {}

    void begin_tx() override { inner_->begin_tx(); }
    void commit_tx() override {
        if (hook_) hook_();
        inner_->commit_tx();
    }
    void rollback_tx() override { inner_->rollback_tx(); }
    bool in_tx() const override { return inner_->in_tx(); }

    std::optional<strata::record> read_by_key(const strata::entity_schema& entity,
                                              const strata::value_t& key) override {
        return inner_->read_by_key(entity, key);
    }
    void write_record(const strata::entity_schema& entity, const strata::value_t& key,
                      const strata::record& fields, strata::write_mode mode) override {
        inner_->write_record(entity, key, fields, mode);
    }
    void delete_record(const strata::entity_schema& entity, const strata::value_t& key) override {
        inner_->delete_record(entity, key);
    }
    std::vector<strata::record> scan(const strata::compiled_query& query) override {
        return inner_->scan(query);
    }

    uint64_t on_commit(strata::commit_callback callback) override { return inner_->on_commit(std::move(callback)); }
    void remove_commit_callback(uint64_t id) override { inner_->remove_commit_callback(id); }

    void close() override { inner_->close(); }
    bool is_open() const override { return inner_->is_open(); }

private:
    std::unique_ptr<strata::storage_session> inner_;
    std::function<void()>& hook_;
};

class hooked_adapter : public strata::storage_adapter {
public:
    std::unique_ptr<strata::storage_session> open_session(const std::string& path,
                                                          std::shared_ptr<const strata::schema_graph> graph) override {
        return std::make_unique<hooked_session>(sqlite_.open_session(path, std::move(graph)), commit_hook);
    }

    std::function<void()> commit_hook;

private:
    strata::sqlite_adapter sqlite_;
};

// ============================================================================
// test_round_trip - committed values read back unchanged
// ============================================================================

void test_round_trip() {
    std::cout << "  test_round_trip..." << std::flush;

    strata::store db(memory_config());

    strata::binary_t avatar = {0x89, 0x50, 0x4e, 0x47};
    auto deadline = strata::timestamp_from_seconds(1700000000.25);

    strata::value_t person_key;
    db.write([&] {
        db.create("List", {{"_id", "L1"}, {"name", "Home"}});
        db.create("Item", {{"_id", "I1"}, {"description", "milk"}, {"listId", "L1"},
                           {"deadline", deadline}, {"priority", int64_t(7)},
                           {"tags", strata::make_list({std::string("dairy")})}});
        auto person = db.create("Person", {{"name", "Ada"}, {"score", 9.5}, {"avatar", avatar},
                                           {"address", strata::document(nlohmann::json{{"street", "Main"}})}});
        person_key = person.key();
    });

    auto item = db.get("Item", std::string("I1"));
    assert(item.has_value());
    assert(item->get<std::string>("description") == "milk");
    assert(item->get<bool>("done") == false);                 // default
    assert(item->get<int64_t>("priority") == 7);
    assert(item->get<strata::timestamp_t>("deadline") == deadline);
    assert(std::get<std::string>(item->get("listId")) == "L1");
    assert(item->get<strata::document>("tags").json == nlohmann::json::array({"dairy"}));

    // Object id keys are generated
    assert(std::holds_alternative<strata::object_id>(person_key));
    assert(!std::get<strata::object_id>(person_key).is_nil());
    auto person = db.get("Person", person_key);
    assert(person.has_value());
    assert(person->get<std::string>("name") == "Ada");
    assert(!person->get_optional<std::string>("email").has_value());
    assert(person->get<double>("score") == 9.5);
    assert(person->get<strata::binary_t>("avatar") == avatar);
    auto address = person->get<strata::document>("address").json;
    assert(address["street"] == "Main");
    assert(address["city"] == "Springfield");

    // Lookup by the string form of an object id
    assert(db.get("Person", std::get<strata::object_id>(person_key).to_string()).has_value());

    // Missing keys are not errors
    assert(!db.get("Item", std::string("nope")).has_value());
    assert(!db.get("Item", nullptr).has_value());
    assert(throws<strata::unknown_entity_error>([&] { db.get("Ghost", std::string("x")); }));

    // values() holds every stored property and no back-links
    auto list_values = db.get("List", std::string("L1"))->values();
    assert(list_values.size() == 2);
    assert(list_values.count("items") == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_no_active_transaction - writes outside a transaction leave the store as is
// ============================================================================

void test_no_active_transaction() {
    std::cout << "  test_no_active_transaction..." << std::flush;

    strata::store db(memory_config());
    seed_home_list(db);

    auto item = db.get("Item", std::string("I1"));
    assert(throws<strata::no_active_transaction_error>([&] { item->set("done", true); }));
    assert(throws<strata::no_active_transaction_error>([&] {
        db.create("List", {{"_id", "L2"}, {"name", "Work"}});
    }));
    assert(throws<strata::no_active_transaction_error>([&] { db.remove(*item); }));

    assert(item->is_valid());
    assert(item->get<bool>("done") == false);
    assert(!db.get("List", std::string("L2")).has_value());
    assert(db.query("Item").size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_state_machine - nesting counter and terminal states
// ============================================================================

void test_state_machine() {
    std::cout << "  test_state_machine..." << std::flush;

    // Transactions only come from begin()
    static_assert(!std::is_constructible_v<strata::transaction, uint64_t>);
    static_assert(!std::is_default_constructible_v<strata::transaction>);

    strata::store db(memory_config());
    assert(!db.in_transaction());

    auto tx = db.begin();
    assert(tx->state() == transaction_state::active);
    assert(tx->depth() == 1);

    auto inner = db.begin();
    assert(inner == tx);
    assert(tx->depth() == 2);

    db.commit(inner);
    assert(tx->state() == transaction_state::active);
    assert(tx->depth() == 1);
    assert(db.in_transaction());

    db.create("List", {{"_id", "L1"}, {"name", "Home"}});
    db.commit(tx);
    assert(tx->state() == transaction_state::committed);
    assert(tx->is_terminal());
    assert(!db.in_transaction());
    assert(db.get("List", std::string("L1")).has_value());

    // Terminal transactions: commit fails, rollback is a no-op
    assert(throws<strata::no_active_transaction_error>([&] { db.commit(tx); }));
    db.rollback(tx);
    assert(tx->state() == transaction_state::committed);
    assert(db.get("List", std::string("L1")).has_value());

    auto next = db.begin();
    assert(next != tx);
    assert(next->id() > tx->id());
    db.rollback(next);
    assert(next->state() == transaction_state::rolled_back);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_rollback - pending writes and created proxies are discarded
// ============================================================================

void test_rollback() {
    std::cout << "  test_rollback..." << std::flush;

    strata::store db(memory_config());
    seed_home_list(db);

    auto tx = db.begin();
    auto list = db.create("List", {{"_id", "L2"}, {"name", "Work"}});
    auto item = db.get("Item", std::string("I1"));
    item->set("description", "oat milk");
    assert(item->get<std::string>("description") == "oat milk");   // read-your-writes
    assert(db.get("List", std::string("L2")).has_value());

    auto home = db.get("List", std::string("L1"));
    db.remove(*home);
    assert(!home->is_valid());
    assert(!db.get("List", std::string("L1")).has_value());

    db.rollback(tx);
    assert(tx->state() == transaction_state::rolled_back);

    assert(!list.is_valid());
    assert(throws<strata::invalid_object_error>([&] { list.get("name"); }));
    assert(!db.get("List", std::string("L2")).has_value());
    assert(item->get<std::string>("description") == "milk");

    // The deleted proxy comes back
    assert(home->is_valid());
    assert(home->get<std::string>("name") == "Home");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_nested_mutator - no commit point of its own
// ============================================================================

void test_nested_mutator() {
    std::cout << "  test_nested_mutator..." << std::flush;

    strata::store db(memory_config());

    auto tx = db.begin();
    auto created = db.mutator([&] {
        return db.create("List", {{"_id", "L1"}, {"name", "Home"}});
    });
    assert(tx->is_active());
    assert(tx->depth() == 1);
    assert(created.is_valid());
    assert(db.get("List", std::string("L1")).has_value());

    db.rollback(tx);
    assert(!created.is_valid());
    assert(!db.get("List", std::string("L1")).has_value());

    // A throwing inner mutator takes the outer transaction down with it
    bool caught = false;
    try {
        db.write([&] {
            db.create("List", {{"_id", "L1"}, {"name", "Home"}});
            db.mutator([&] {
                db.create("List", {{"_id", "L2"}, {"name", "Work"}});
                throw std::runtime_error("Simulated error");
            });
        });
    } catch (const std::runtime_error& e) {
        caught = std::string(e.what()) == "Simulated error";
    }
    assert(caught);
    assert(!db.in_transaction());
    assert(db.query("List").empty());

    // Nested mutators commit once, at the outermost level
    db.write([&] {
        db.mutator([&] { db.create("List", {{"_id", "L1"}, {"name", "Home"}}); });
        db.mutator([&] { db.create("List", {{"_id", "L2"}, {"name", "Work"}}); });
        assert(db.query("List").empty());   // queries see committed state only
    });
    assert(db.query("List").size() == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_write_transaction_guard
// ============================================================================

void test_write_transaction_guard() {
    std::cout << "  test_write_transaction_guard..." << std::flush;

    strata::store db(memory_config());

    {
        strata::write_transaction guard(db.transactions());
        db.create("List", {{"_id", "L1"}, {"name", "Home"}});
        // No commit: rolled back on scope exit
    }
    assert(!db.in_transaction());
    assert(!db.get("List", std::string("L1")).has_value());

    {
        strata::write_transaction guard(db.transactions());
        db.create("List", {{"_id", "L1"}, {"name", "Home"}});
        guard.commit();
        assert(guard.get()->state() == transaction_state::committed);
    }
    assert(db.get("List", std::string("L1")).has_value());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_primary_key_constraints
// ============================================================================

void test_primary_key_constraints() {
    std::cout << "  test_primary_key_constraints..." << std::flush;

    strata::store db(memory_config());
    seed_home_list(db);

    // Against the store
    assert(throws<strata::constraint_violation_error>([&] {
        db.write([&] { db.create("List", {{"_id", "L1"}, {"name", "Again"}}); });
    }));
    assert(!db.in_transaction());

    // Against the pending log
    assert(throws<strata::constraint_violation_error>([&] {
        db.write([&] {
            db.create("List", {{"_id", "L2"}, {"name", "Work"}});
            db.create("List", {{"_id", "L2"}, {"name", "Work again"}});
        });
    }));
    assert(!db.get("List", std::string("L2")).has_value());

    // Missing required values, unknown properties, immutable keys
    db.write([&] {
        assert(throws<strata::constraint_violation_error>([&] { db.create("List", {{"name", "No key"}}); }));
        assert(throws<strata::constraint_violation_error>([&] { db.create("Item", {{"_id", "I9"}}); }));
        assert(throws<strata::invalid_property_error>([&] {
            db.create("List", {{"_id", "L3"}, {"name", "x"}, {"colour", "red"}});
        }));
        assert(throws<strata::invalid_property_error>([&] {
            db.create("List", {{"_id", "L3"}, {"name", int64_t(3)}});
        }));
        assert(throws<strata::invalid_property_error>([&] {
            db.create("List", {{"_id", "L3"}, {"name", "x"}, {"items", nullptr}});
        }));
        assert(throws<strata::unknown_entity_error>([&] { db.create("Address", {{"street", "x"}}); }));

        auto item = db.get("Item", std::string("I1"));
        assert(throws<strata::constraint_violation_error>([&] { item->set("_id", "I2"); }));
        assert(throws<strata::invalid_property_error>([&] { item->set("done", "yes"); }));
        assert(throws<strata::invalid_property_error>([&] { item->set("nope", true); }));
        assert(throws<strata::constraint_violation_error>([&] { item->set("description", nullptr); }));
    });

    // Deleted and created again in one transaction replaces the record
    db.write([&] {
        auto old = db.get("List", std::string("L1"));
        db.remove(*old);
        db.create("List", {{"_id", "L1"}, {"name", "Rebuilt"}});
    });
    assert(db.get("List", std::string("L1"))->get<std::string>("name") == "Rebuilt");
    assert(db.query("List").size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_begin_while_committing
// ============================================================================

void test_begin_while_committing() {
    std::cout << "  test_begin_while_committing..." << std::flush;

    auto adapter = std::make_shared<hooked_adapter>();
    strata::store db(memory_config(), adapter);

    bool rejected = false;
    adapter->commit_hook = [&] {
        rejected = throws<strata::transaction_already_active_error>([&] { db.begin(); });
    };

    db.write([&] { db.create("List", {{"_id", "L1"}, {"name", "Home"}}); });
    assert(rejected);
    assert(db.get("List", std::string("L1")).has_value());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_failed_commit - storage failure restores proxies and the store
// ============================================================================

void test_failed_commit() {
    std::cout << "  test_failed_commit..." << std::flush;

    auto adapter = std::make_shared<hooked_adapter>();
    strata::store db(memory_config(), adapter);
    seed_home_list(db);

    adapter->commit_hook = [] { throw strata::storage_error("disk full"); };

    auto home = db.get("List", std::string("L1"));
    std::optional<strata::object> created;
    auto tx = db.begin();
    created = db.create("List", {{"_id", "L2"}, {"name", "Work"}});
    db.remove(*home);

    assert(throws<strata::storage_error>([&] { db.commit(tx); }));
    assert(tx->state() == transaction_state::failed);
    assert(!db.in_transaction());

    assert(!created->is_valid());
    assert(home->is_valid());
    assert(!db.get("List", std::string("L2")).has_value());
    assert(db.get("List", std::string("L1")).has_value());

    adapter->commit_hook = nullptr;
    db.write([&] { db.create("List", {{"_id", "L2"}, {"name", "Work"}}); });
    assert(db.query("List").size() == 2);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing transactions..." << std::endl;
    test_round_trip();
    test_no_active_transaction();
    test_state_machine();
    test_rollback();
    test_nested_mutator();
    test_write_transaction_guard();
    test_primary_key_constraints();
    test_begin_while_committing();
    test_failed_commit();
}

} // namespace transaction_tests
