#pragma once

#include "TestModels.hpp"

namespace notification_tests {

// ============================================================================
// test_object_observer
// ============================================================================

void test_object_observer() {
    std::cout << "  test_object_observer..." << std::flush;

    strata::store db(memory_config());
    seed_home_list(db);
    db.write([&] { db.create("Item", {{"_id", "I2"}, {"description", "bread"}}); });

    auto item = db.get("Item", std::string("I1"));
    std::vector<strata::object_change> changes;
    auto token = item->observe([&](const strata::object_change& change) { changes.push_back(change); });
    assert(token.is_valid());

    // Several writes to the record in one commit: one callback
    db.write([&] {
        item->set("description", "oat milk");
        item->set("done", true);
        item->set("description", "soy milk");
    });
    assert(changes.size() == 1);
    assert(!changes[0].deleted());
    assert(changes[0].changed("description"));
    assert(changes[0].changed("done"));
    assert(!changes[0].changed("priority"));
    assert(changes[0].changed_properties.size() == 2);

    // Other records do not notify
    db.write([&] { db.get("Item", std::string("I2"))->set("done", true); });
    assert(changes.size() == 1);

    // Empty commits do not notify
    db.write([] {});
    assert(changes.size() == 1);

    db.write([&] { db.remove(*item); });
    assert(changes.size() == 2);
    assert(changes[1].deleted());

    // Observing a dead object fails
    assert(throws<strata::invalid_object_error>([&] { item->observe([](const strata::object_change&) {}); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_unobserve
// ============================================================================

void test_unobserve() {
    std::cout << "  test_unobserve..." << std::flush;

    strata::store db(memory_config());
    seed_home_list(db);

    auto item = db.get("Item", std::string("I1"));
    int calls = 0;
    auto token = item->observe([&](const strata::object_change&) { calls++; });

    db.write([&] { item->set("priority", int64_t(1)); });
    assert(calls == 1);

    token.unregister();
    assert(!token.is_valid());
    token.unregister();   // twice is harmless

    db.write([&] { item->set("priority", int64_t(2)); });
    assert(calls == 1);

    // A token going out of scope unregisters
    {
        auto scoped = item->observe([&](const strata::object_change&) { calls++; });
    }
    db.write([&] { item->set("priority", int64_t(3)); });
    assert(calls == 1);

    // Unregistering a later observer from inside an earlier callback
    int first_calls = 0;
    int second_calls = 0;
    strata::notification_token second;
    auto first = item->observe([&](const strata::object_change&) {
        first_calls++;
        second.unregister();
    });
    second = item->observe([&](const strata::object_change&) { second_calls++; });
    db.write([&] { item->set("priority", int64_t(4)); });
    assert(first_calls == 1);
    assert(second_calls == 0);

    // Moved tokens keep the registration
    auto moved = std::move(first);
    assert(!first.is_valid());
    assert(moved.is_valid());
    db.write([&] { item->set("priority", int64_t(5)); });
    assert(first_calls == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_collection_change_sets
// ============================================================================

void test_collection_change_sets() {
    std::cout << "  test_collection_change_sets..." << std::flush;

    strata::store db(memory_config());
    db.write([&] {
        db.create("Item", {{"_id", "a"}, {"description", "a"}, {"priority", int64_t(1)}});
        db.create("Item", {{"_id", "b"}, {"description", "b"}, {"priority", int64_t(2)}});
        db.create("Item", {{"_id", "c"}, {"description", "c"}, {"priority", int64_t(3)}});
    });

    auto by_priority = db.query("Item", "done == false", {}, {{"priority", true}});
    std::vector<strata::collection_change> changes;
    auto token = by_priority.observe([&](const strata::collection_change& change) { changes.push_back(change); });

    // Modification in place
    db.write([&] { db.get("Item", std::string("b"))->set("description", "bee"); });
    assert(changes.size() == 1);
    assert((changes[0].modifications == std::vector<uint64_t>{1}));
    assert(changes[0].deletions.empty() && changes[0].insertions.empty() && changes[0].moves.empty());

    // Reorder: a jumps to the end
    db.write([&] { db.get("Item", std::string("a"))->set("priority", int64_t(10)); });
    assert(changes.size() == 2);
    assert(changes[1].moves.size() == 1);
    assert((changes[1].moves[0] == strata::collection_change::move{0, 2}));
    assert((changes[1].modifications == std::vector<uint64_t>{2}));

    // Insertion and deletion in one commit: one batched callback
    db.write([&] {
        db.create("Item", {{"_id", "d"}, {"description", "d"}, {"priority", int64_t(0)}});
        db.get("Item", std::string("c"))->set("done", true);
    });
    assert(changes.size() == 3);
    assert((changes[2].insertions == std::vector<uint64_t>{0}));
    assert((changes[2].deletions == std::vector<uint64_t>{1}));
    assert(by_priority.size() == 3);

    // A commit touching the entity but not the membership still notifies
    db.write([&] { db.get("Item", std::string("c"))->set("description", "sea"); });
    assert(changes.size() == 4);
    assert(changes[3].empty());

    // Writes to other entities do not
    db.write([&] { db.create("List", {{"_id", "L1"}, {"name", "Home"}}); });
    assert(changes.size() == 4);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_main_thread_scheduler - callbacks wait for the host loop
// ============================================================================

void test_main_thread_scheduler() {
    std::cout << "  test_main_thread_scheduler..." << std::flush;

    auto sched = std::make_shared<strata::main_thread_scheduler>();
    strata::configuration config(":memory:", sched);
    config.schemas = all_schemas();
    strata::store db(config);
    seed_home_list(db);
    assert(&db.get_scheduler() == sched.get());
    assert(sched->is_on_thread());

    auto open = db.query("Item", "done == false");
    std::vector<strata::collection_change> changes;
    auto token = open.observe([&](const strata::collection_change& change) { changes.push_back(change); });

    db.write([&] { db.get("Item", std::string("I1"))->set("done", true); });
    assert(changes.empty());
    assert(sched->pending_count() == 1);

    // The collection itself is already current
    assert(open.empty());

    assert(sched->process_pending() == 1);
    assert(changes.size() == 1);
    assert((changes[0].deletions == std::vector<uint64_t>{0}));

    // Unregistered before the loop ran: the queued callback is dropped
    db.write([&] { db.get("Item", std::string("I1"))->set("done", false); });
    token.unregister();
    assert(sched->process_pending() == 1);
    assert(changes.size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_commit_from_callback - passes run in order, never nested
// ============================================================================

void test_commit_from_callback() {
    std::cout << "  test_commit_from_callback..." << std::flush;

    strata::store db(memory_config());
    seed_home_list(db);

    auto all_items = db.query("Item");
    std::vector<std::string> events;
    bool in_callback = false;
    bool reentered = false;

    auto token = all_items.observe([&](const strata::collection_change& change) {
        if (in_callback) reentered = true;
        in_callback = true;
        events.push_back("items+" + std::to_string(change.insertions.size()));
        if (events.size() == 1) {
            // Commit from inside the notification pass
            db.write([&] { db.create("Item", {{"_id", "I3"}, {"description", "jam"}}); });
            events.push_back("committed");
        }
        in_callback = false;
    });

    db.write([&] { db.create("Item", {{"_id", "I2"}, {"description", "bread"}}); });

    assert(!reentered);
    assert((events == std::vector<std::string>{"items+1", "committed", "items+1"}));
    assert(all_items.size() == 3);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_observe_released_collection
// ============================================================================

void test_observe_released_collection() {
    std::cout << "  test_observe_released_collection..." << std::flush;

    strata::store db(memory_config());
    auto lists = db.query("List");
    lists.release();
    assert(throws<strata::invalid_object_error>([&] {
        lists.observe([](const strata::collection_change&) {});
    }));

    // A token may outlive its store
    strata::notification_token token;
    {
        strata::store scoped(memory_config());
        seed_home_list(scoped);
        token = scoped.get("Item", std::string("I1"))->observe([](const strata::object_change&) {});
    }
    token.unregister();
    assert(!token.is_valid());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_throwing_observer - one failing callback does not stop the pass
// ============================================================================

void test_throwing_observer() {
    std::cout << "  test_throwing_observer..." << std::flush;

    strata::store db(memory_config());
    seed_home_list(db);

    auto item = db.get("Item", std::string("I1"));
    auto failing = item->observe([](const strata::object_change&) { throw std::runtime_error("observer failed"); });

    auto all_items = db.query("Item");
    int calls = 0;
    auto token = all_items.observe([&](const strata::collection_change&) { calls++; });

    // The write is durable, so the commit reports success
    db.mutator([&] { item->set("description", "oat milk"); });
    assert(calls == 1);
    assert(!db.in_transaction());
    assert(item->get<std::string>("description") == "oat milk");

    db.write([&] { db.create("Item", {{"_id", "I2"}, {"description", "bread"}}); });
    assert(calls == 2);
    assert(all_items.size() == 2);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing notifications..." << std::endl;
    test_object_observer();
    test_unobserve();
    test_collection_change_sets();
    test_main_thread_scheduler();
    test_commit_from_callback();
    test_observe_released_collection();
    test_throwing_observer();
}

} // namespace notification_tests
