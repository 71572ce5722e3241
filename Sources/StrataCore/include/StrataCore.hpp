#pragma once

// StrataCore - reactive object store over SQLite
//
// Usage:
//   #include <StrataCore.hpp>
//
//   int main() {
//       auto list = strata::entity_builder("List")
//           .primary_key("_id")
//           .property("name", strata::property_type::string)
//           .backlink("items", "Item", "listId");
//       auto item = strata::entity_builder("Item")
//           .primary_key("_id")
//           .property("description", strata::property_type::string)
//           .property("done", strata::property_type::boolean, false)
//           .link("listId", "List");
//
//       strata::store db(strata::configuration(":memory:", {list, item}));
//
//       auto open_items = db.query("Item", "done == false");
//       auto token = open_items.observe([](const strata::collection_change& change) {
//           // deletions / insertions / modifications / moves
//       });
//
//       db.write([&] {
//           db.create("List", {{"_id", "L1"}, {"name", "Groceries"}});
//           db.create("Item", {{"_id", "I1"}, {"description", "Milk"}, {"listId", "L1"}});
//       });
//   }

#include "strata/log.hpp"
#include "strata/types.hpp"
#include "strata/errors.hpp"
#include "strata/schema.hpp"
#include "strata/query.hpp"
#include "strata/storage.hpp"
#include "strata/db.hpp"
#include "strata/sqlite_store.hpp"
#include "strata/scheduler.hpp"
#include "strata/observation.hpp"
#include "strata/object.hpp"
#include "strata/transaction.hpp"
#include "strata/live_collection.hpp"
#include "strata/relationships.hpp"
#include "strata/notification_bus.hpp"
#include "strata/store.hpp"
