#pragma once

#include "TestModels.hpp"

namespace relationship_tests {

inline std::vector<std::string> keys_of(const strata::live_collection& results) {
    std::vector<std::string> keys;
    for (const auto& obj : results.snapshot()) {
        keys.push_back(std::get<std::string>(obj.key()));
    }
    return keys;
}

// ============================================================================
// test_identity_map - one state per record
// ============================================================================

void test_identity_map() {
    std::cout << "  test_identity_map..." << std::flush;

    strata::store db(memory_config());
    seed_home_list(db);

    auto first = db.get("Item", std::string("I1"));
    auto second = db.get("Item", std::string("I1"));
    assert(*first == *second);
    assert(first->state() == second->state());

    auto from_query = db.query("Item").at(0);
    assert(from_query == *first);
    assert(from_query.state() == first->state());

    db.write([&] { first->set("description", "oat milk"); });
    assert(second->get<std::string>("description") == "oat milk");

    // Deleting through one handle invalidates every handle
    db.write([&] { db.remove(*second); });
    assert(!first->is_valid());
    assert(!from_query.is_valid());
    assert(throws<strata::invalid_object_error>([&] { first->get("description"); }));
    assert(throws<strata::invalid_object_error>([&] {
        db.write([&] { first->set("done", true); });
    }));
    assert(throws<strata::invalid_object_error>([&] {
        db.write([&] { db.remove(*first); });
    }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_forward_link
// ============================================================================

void test_forward_link() {
    std::cout << "  test_forward_link..." << std::flush;

    strata::store db(memory_config());
    seed_home_list(db);

    auto item = db.get("Item", std::string("I1"));
    auto list = item->link("listId");
    assert(list.has_value());
    assert(list->get<std::string>("name") == "Home");
    assert(*list == *db.get("List", std::string("L1")));

    // Re-pointing the link is visible inside the transaction and after it
    db.write([&] {
        db.create("List", {{"_id", "L2"}, {"name", "Work"}});
        item->set("listId", "L2");
        assert(item->link("listId")->get<std::string>("name") == "Work");
    });
    assert(std::get<std::string>(item->link("listId")->key()) == "L2");

    // Null link
    db.write([&] { item->set("listId", nullptr); });
    assert(!item->link("listId").has_value());
    assert(strata::is_null(item->get("listId")));

    // Links must name an existing-type key
    assert(throws<strata::invalid_property_error>([&] {
        db.write([&] { item->set("listId", int64_t(4)); });
    }));

    assert(throws<strata::invalid_property_error>([&] { item->link("description"); }));
    assert(throws<strata::invalid_property_error>([&] { item->list("description"); }));
    assert(throws<strata::invalid_property_error>([&] { list->get("items"); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_dangling_link - deleting a link target is not an error
// ============================================================================

void test_dangling_link() {
    std::cout << "  test_dangling_link..." << std::flush;

    strata::store db(memory_config());
    seed_home_list(db);

    auto list = db.get("List", std::string("L1"));
    auto item = db.get("Item", std::string("I1"));
    auto items = list->list("items");
    assert(items.size() == 1);

    std::vector<strata::collection_change> changes;
    auto token = items.observe([&](const strata::collection_change& change) { changes.push_back(change); });

    db.write([&] { db.remove(*list); });

    // The forward link still holds the key but resolves to nothing
    assert(item->is_valid());
    assert(std::get<std::string>(item->get("listId")) == "L1");
    assert(!item->link("listId").has_value());

    // The referencing object left the back-link collection
    assert(changes.size() == 1);
    assert((changes[0].deletions == std::vector<uint64_t>{0}));
    assert(changes[0].collection_root_was_deleted);
    assert(!items.is_valid());

    // No cascade: the item itself is still there
    assert(db.query("Item").size() == 1);

    // A list of links skips dangling keys
    db.write([&] {
        db.create("Board", {{"code", int64_t(1)}, {"title", "Plans"},
                            {"lists", strata::make_list({std::string("L1"), std::string("gone")})}});
    });
    auto board = db.get("Board", int64_t(1));
    assert(board->list("lists").empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_backlinks_follow_writes
// ============================================================================

void test_backlinks_follow_writes() {
    std::cout << "  test_backlinks_follow_writes..." << std::flush;

    strata::store db(memory_config());
    seed_home_list(db);

    db.write([&] {
        db.create("List", {{"_id", "L2"}, {"name", "Work"}});
        db.create("Item", {{"_id", "I2"}, {"description", "bread"}, {"listId", "L1"}});
        db.create("Item", {{"_id", "I3"}, {"description", "report"}, {"listId", "L2"}});
        db.create("Item", {{"_id", "I4"}, {"description", "loose"}});
    });

    auto home = db.get("List", std::string("L1"))->list("items");
    auto work = db.get("List", std::string("L2"))->list("items");
    assert((keys_of(home) == std::vector<std::string>{"I1", "I2"}));
    assert((keys_of(work) == std::vector<std::string>{"I3"}));
    assert(home.entity().name == "Item");

    db.write([&] { db.get("Item", std::string("I2"))->set("listId", "L2"); });
    assert((keys_of(home) == std::vector<std::string>{"I1"}));
    assert((keys_of(work) == std::vector<std::string>{"I2", "I3"}));

    // Back-links are computed, never written
    assert(throws<strata::invalid_property_error>([&] {
        db.write([&] { db.get("List", std::string("L1"))->set("items", nullptr); });
    }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_link_list - list order, duplicates, owner writes
// ============================================================================

void test_link_list() {
    std::cout << "  test_link_list..." << std::flush;

    strata::store db(memory_config());
    db.write([&] {
        db.create("List", {{"_id", "L1"}, {"name", "Home"}});
        db.create("List", {{"_id", "L2"}, {"name", "Work"}});
        db.create("Board", {{"code", int64_t(7)}, {"title", "Week"},
                            {"lists", strata::make_list({std::string("L2"), std::string("L1"),
                                                         std::string("L2"), std::string("Lx")})}});
    });

    auto board = db.get("Board", int64_t(7));
    auto lists = board->list("lists");
    assert((keys_of(lists) == std::vector<std::string>{"L2", "L1", "L2"}));
    assert(lists.at(0) == lists.at(2));

    // Filtering or re-sorting would lose list order
    assert(throws<strata::invalid_query_error>([&] { lists.where("name == 'Home'"); }));
    assert(throws<strata::invalid_query_error>([&] { lists.sorted({{"name", true}}); }));

    std::vector<strata::collection_change> changes;
    auto token = lists.observe([&](const strata::collection_change& change) { changes.push_back(change); });

    // Rewriting the owner's list
    db.write([&] { board->set("lists", strata::make_list({std::string("L1")})); });
    assert(changes.size() == 1);
    assert((changes[0].deletions == std::vector<uint64_t>{0, 2}));
    assert(changes[0].insertions.empty());
    assert((keys_of(lists) == std::vector<std::string>{"L1"}));

    // A member record changing is a modification
    db.write([&] { db.get("List", std::string("L1"))->set("name", "House"); });
    assert(changes.size() == 2);
    assert((changes[1].modifications == std::vector<uint64_t>{0}));

    // Deleting the owner ends the collection
    db.write([&] { db.remove(*board); });
    assert(changes.size() == 3);
    assert(changes[2].collection_root_was_deleted);
    assert((changes[2].deletions == std::vector<uint64_t>{0}));
    assert(!lists.is_valid());
    assert(throws<strata::invalid_object_error>([&] { lists.size(); }));

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing relationships..." << std::endl;
    test_identity_map();
    test_forward_link();
    test_dangling_link();
    test_backlinks_follow_writes();
    test_link_list();
}

} // namespace relationship_tests
