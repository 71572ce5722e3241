#pragma once

#include "TestModels.hpp"

namespace query_tests {

using strata::compare_op;
using strata::parse_query;
using strata::sort_descriptor;

// Item keys of a collection, in collection order
inline std::vector<std::string> keys_of(const strata::live_collection& results) {
    std::vector<std::string> keys;
    for (auto obj : results) {
        keys.push_back(std::get<std::string>(obj.key()));
    }
    return keys;
}

inline void seed_items(strata::store& db) {
    db.write([&] {
        db.create("List", {{"_id", "L1"}, {"name", "Home"}});
        db.create("List", {{"_id", "L2"}, {"name", "Work"}});
        db.create("Item", {{"_id", "a"}, {"description", "milk"}, {"priority", int64_t(2)}, {"listId", "L1"},
                           {"deadline", strata::timestamp_from_seconds(3000)},
                           {"tags", strata::make_list({std::string("dairy"), std::string("cold")})}});
        db.create("Item", {{"_id", "b"}, {"description", "bread"}, {"priority", int64_t(1)}, {"listId", "L1"},
                           {"deadline", strata::timestamp_from_seconds(1000)}});
        db.create("Item", {{"_id", "c"}, {"description", "report"}, {"priority", int64_t(3)}, {"listId", "L2"},
                           {"done", true}});
        db.create("Item", {{"_id", "d"}, {"description", "eggs"}, {"priority", int64_t(2)}, {"listId", "L1"},
                           {"deadline", strata::timestamp_from_seconds(2000)},
                           {"tags", strata::make_list({std::string("cold")})}});
    });
}

// ============================================================================
// test_parse_filters
// ============================================================================

void test_parse_filters() {
    std::cout << "  test_parse_filters..." << std::flush;

    assert(parse_query("") == nullptr);
    assert(parse_query("   ") == nullptr);

    assert(describe(parse_query("done == false and priority > 2")) == "(done == false and priority > 2)");
    assert(describe(parse_query("NOT (a = 1 OR b != 'x')")) == "not (a == 1 or b != 'x')");
    assert(describe(parse_query("a >= -1.5 && !(b <= 3) || c contains \"q\"")) ==
           "((a >= -1.5 and not b <= 3) or c contains 'q')");
    assert(describe(parse_query("deadline == nil")) == "deadline == null");

    auto with_args = parse_query("description == $0 and priority < $1", {std::string("milk"), int64_t(5)});
    assert(with_args->node == strata::query_expr::kind::conjunction);
    assert(with_args->lhs->property == "description");
    assert(std::get<std::string>(with_args->lhs->operand) == "milk");
    assert(with_args->rhs->op == compare_op::lt);
    assert(std::get<int64_t>(with_args->rhs->operand) == 5);

    // Syntax errors
    for (const char* bad : {"done ==", "done false", "(done == true", "done == 'milk", "done == $3",
                            "done ~ 1", "== 1", "done == true extra", "done == $", "a == b"}) {
        assert(throws<strata::invalid_query_error>([&] { parse_query(bad); }));
    }

    // Number literals must convert whole
    for (const char* bad : {"priority == 1.2.3", "priority == 1e", "priority == 1.5e+",
                            "priority == 99999999999999999999999", "priority == $99999999999999999999999"}) {
        assert(throws<strata::invalid_query_error>([&] { parse_query(bad); }));
    }
    assert(std::get<double>(parse_query("priority == 1e3")->operand) == 1000.0);
    assert(std::get<double>(parse_query("priority == -2.5")->operand) == -2.5);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_compile_checks - filters are checked against the schema
// ============================================================================

void test_compile_checks() {
    std::cout << "  test_compile_checks..." << std::flush;

    strata::schema_registry registry;
    auto graph = registry.register_schemas(all_schemas());
    const auto& g = *graph;

    auto compiles = [&](const std::string& entity, const std::string& filter,
                        const std::vector<sort_descriptor>& sort = {}) {
        return !throws<strata::invalid_query_error>([&] { strata::compile_query(g, entity, filter, {}, sort); });
    };

    assert(compiles("Item", "done == false"));
    assert(compiles("Item", "deadline == null"));
    assert(compiles("Item", "deadline != null and priority >= 1"));
    assert(compiles("Item", "tags contains 'cold'"));
    assert(compiles("Item", "listId == 'L1'"));
    assert(compiles("Item", "listId contains 'L1'"));
    assert(compiles("Board", "lists contains 'L1'"));
    assert(compiles("Person", "email == null or score < 10"));

    assert(!compiles("Item", "weight > 3"));                // unknown property
    assert(!compiles("Item", "done > true"));               // booleans are unordered
    assert(!compiles("Item", "description == null"));       // not optional
    assert(!compiles("Item", "deadline > null"));
    assert(!compiles("Item", "tags == 'cold'"));            // lists only take contains
    assert(!compiles("Item", "listId > 'L1'"));
    assert(!compiles("Item", "description contains 'x'"));
    assert(!compiles("Item", "priority == 'high'"));
    assert(!compiles("Board", "lists contains 'L1' and code == 'x'"));
    assert(!compiles("List", "items contains 'I1'"));       // back-links are computed
    assert(!compiles("Person", "address == null"));

    assert(compiles("Item", "", {{"done", true}, {"deadline", false}}));
    assert(!compiles("Item", "", {{"tags", true}}));
    assert(!compiles("Item", "", {{"nope", true}}));

    assert(!compiles("Ghost", ""));
    assert(!compiles("Address", ""));

    // Operands are normalized to the stored representation
    auto q = strata::compile_query(g, "Person", "score > 2");
    assert(std::get<double>(q.filter->operand) == 2.0);

    auto refs = strata::compile_query(g, "Item", "done == false or priority > 1", {},
                                      {{"deadline", true}}).referenced_properties();
    assert((refs == std::vector<std::string>{"deadline", "done", "priority"}));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_query_results - filter, sort, ties and iteration order
// ============================================================================

void test_query_results() {
    std::cout << "  test_query_results..." << std::flush;

    strata::store db(memory_config());
    seed_items(db);

    // Unsorted: store iteration order (insertion order here)
    assert((keys_of(db.query("Item")) == std::vector<std::string>{"a", "b", "c", "d"}));

    auto open = db.query("Item", "done == false");
    assert((keys_of(open) == std::vector<std::string>{"a", "b", "d"}));

    // Ties are broken by primary key ascending
    auto by_priority = db.query("Item", "", {}, {{"priority", false}});
    assert((keys_of(by_priority) == std::vector<std::string>{"c", "a", "d", "b"}));

    auto by_deadline = db.query("Item", "deadline != null", {}, {{"deadline", true}});
    assert((keys_of(by_deadline) == std::vector<std::string>{"b", "d", "a"}));

    auto before = db.query("Item", "deadline < $0", {strata::timestamp_from_seconds(2500)});
    assert(before.size() == 2);

    auto cold = db.query("Item", "tags contains 'cold'", {}, {{"_id", true}});
    assert((keys_of(cold) == std::vector<std::string>{"a", "d"}));

    auto home = db.query("Item", "listId == $0 and not done == true", {std::string("L1")});
    assert(home.size() == 3);

    auto either = db.query("Item", "priority == 3 or description == 'bread'", {}, {{"_id", true}});
    assert((keys_of(either) == std::vector<std::string>{"b", "c"}));

    auto none = db.query("Item", "priority > 100");
    assert(none.empty());
    assert(!none.first().has_value());
    assert(throws<std::out_of_range>([&] { none.at(0); }));

    // first / index_of / snapshot
    assert(std::get<std::string>(by_priority.first()->key()) == "c");
    auto b = db.get("Item", std::string("b"));
    assert(by_priority.index_of(*b) == size_t(3));
    assert(!open.index_of(*db.get("Item", std::string("c"))).has_value());
    assert(by_priority.snapshot().size() == 4);

    // AST form
    auto ast = db.query("Item", strata::query_expr::compare("priority", compare_op::ge, int64_t(2)),
                        {{"_id", true}});
    assert((keys_of(ast) == std::vector<std::string>{"a", "c", "d"}));

    assert(throws<strata::invalid_query_error>([&] { db.query("Ghost"); }));
    assert(throws<strata::invalid_query_error>([&] { db.query("Item", "done ="); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_where_and_sorted
// ============================================================================

void test_where_and_sorted() {
    std::cout << "  test_where_and_sorted..." << std::flush;

    strata::store db(memory_config());
    seed_items(db);

    auto home = db.query("Item", "listId == 'L1'");
    auto urgent = home.where("priority >= 2");
    assert(urgent.size() == 2);

    auto ordered = urgent.sorted({{"deadline", false}});
    assert((keys_of(ordered) == std::vector<std::string>{"a", "d"}));

    // The original collection is untouched
    assert(home.size() == 3);

    // Back-link collections can be refined as well
    auto list = db.get("List", std::string("L1"));
    auto items = list->list("items");
    assert(items.where("description == 'eggs'").size() == 1);
    assert((keys_of(items.sorted({{"priority", true}})) == std::vector<std::string>{"b", "a", "d"}));

    assert(throws<strata::invalid_query_error>([&] { home.where("nope == 1"); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_unobserved_collection_refreshes - stale collections re-run on access
// ============================================================================

void test_unobserved_collection_refreshes() {
    std::cout << "  test_unobserved_collection_refreshes..." << std::flush;

    strata::store db(memory_config());
    seed_items(db);

    auto open = db.query("Item", "done == false", {}, {{"_id", true}});
    assert(open.size() == 3);

    db.write([&] {
        db.get("Item", std::string("a"))->set("done", true);
        db.create("Item", {{"_id", "e"}, {"description", "jam"}, {"listId", "L2"}});
    });

    assert((keys_of(open) == std::vector<std::string>{"b", "d", "e"}));

    // Pending writes never leak into query results
    db.write([&] {
        db.create("Item", {{"_id", "f"}, {"description", "tea"}, {"listId", "L2"}});
        assert(open.size() == 3);
    });
    assert(open.size() == 4);

    open.release();
    assert(!open.is_valid());
    assert(throws<strata::invalid_object_error>([&] { open.size(); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_compute_changes - index sets of a membership diff
// ============================================================================

void test_compute_changes() {
    std::cout << "  test_compute_changes..." << std::flush;

    // Reorder plus one removal, one insertion and one modified survivor
    auto change = strata::compute_changes({"a", "b", "c", "d"}, {"b", "a", "d", "e"}, {"d"});
    assert((change.deletions == std::vector<uint64_t>{2}));
    assert((change.insertions == std::vector<uint64_t>{3}));
    assert((change.modifications == std::vector<uint64_t>{2}));
    assert(change.moves.size() == 1);
    assert((change.moves[0] == strata::collection_change::move{1, 0}));

    // Identical membership
    auto same = strata::compute_changes({"a", "b"}, {"a", "b"}, {});
    assert(same.empty());

    // Modifications only count survivors
    auto touched = strata::compute_changes({"a", "b"}, {"b"}, {"a", "b"});
    assert((touched.deletions == std::vector<uint64_t>{0}));
    assert((touched.modifications == std::vector<uint64_t>{0}));
    assert(touched.moves.empty());

    // Lists may hold a key twice
    auto dup = strata::compute_changes({"x", "y", "x"}, {"x", "x"}, {});
    assert((dup.deletions == std::vector<uint64_t>{1}));
    assert(dup.insertions.empty());
    assert(dup.moves.empty());

    // Full reversal keeps one element in place
    auto reversed = strata::compute_changes({"a", "b", "c"}, {"c", "b", "a"}, {});
    assert(reversed.moves.size() == 2);
    assert(reversed.deletions.empty() && reversed.insertions.empty());

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing queries..." << std::endl;
    test_parse_filters();
    test_compile_checks();
    test_query_results();
    test_where_and_sorted();
    test_unobserved_collection_refreshes();
    test_compute_changes();
}

} // namespace query_tests
