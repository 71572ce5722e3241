#include "strata/live_collection.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"
#include "strata/store.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <unordered_map>

namespace strata {

// ============================================================================
// Membership diff
// ============================================================================

namespace {

// Lists of links may hold one key several times; the n-th occurrence of a key
// is matched with the n-th occurrence on the other side
std::vector<std::string> tag_occurrences(const std::vector<std::string>& ids) {
    std::unordered_map<std::string, size_t> seen;
    std::vector<std::string> tagged;
    tagged.reserve(ids.size());
    for (const auto& id : ids) {
        auto n = seen[id]++;
        tagged.push_back(n == 0 ? id : id + '\x1e' + std::to_string(n));
    }
    return tagged;
}

// Positions (into seq) of one longest strictly increasing subsequence
std::vector<size_t> longest_increasing_subsequence(const std::vector<size_t>& seq) {
    std::vector<size_t> tails;                        // index into seq of the tail of each length
    std::vector<size_t> parent(seq.size(), SIZE_MAX);
    for (size_t i = 0; i < seq.size(); ++i) {
        auto pos = std::lower_bound(tails.begin(), tails.end(), seq[i],
                                    [&](size_t tail, size_t value) { return seq[tail] < value; });
        size_t length = static_cast<size_t>(pos - tails.begin());
        if (length > 0) parent[i] = tails[length - 1];
        if (pos == tails.end()) {
            tails.push_back(i);
        } else {
            *pos = i;
        }
    }

    std::vector<size_t> result;
    if (tails.empty()) return result;
    for (size_t i = tails.back(); i != SIZE_MAX; i = parent[i]) {
        result.push_back(i);
    }
    std::reverse(result.begin(), result.end());
    return result;
}

} // namespace

collection_change compute_changes(const std::vector<std::string>& old_ids,
                                  const std::vector<std::string>& new_ids,
                                  const std::set<std::string>& modified_ids) {
    collection_change change;

    auto old_tagged = tag_occurrences(old_ids);
    auto new_tagged = tag_occurrences(new_ids);

    std::unordered_map<std::string, size_t> old_pos;
    for (size_t i = 0; i < old_tagged.size(); ++i) old_pos[old_tagged[i]] = i;
    std::unordered_map<std::string, size_t> new_pos;
    for (size_t j = 0; j < new_tagged.size(); ++j) new_pos[new_tagged[j]] = j;

    for (size_t i = 0; i < old_tagged.size(); ++i) {
        if (new_pos.find(old_tagged[i]) == new_pos.end()) {
            change.deletions.push_back(i);
        }
    }

    // Members present on both sides, in new order
    std::vector<size_t> kept_old;
    std::vector<size_t> kept_new;
    for (size_t j = 0; j < new_tagged.size(); ++j) {
        auto it = old_pos.find(new_tagged[j]);
        if (it == old_pos.end()) {
            change.insertions.push_back(j);
            continue;
        }
        kept_old.push_back(it->second);
        kept_new.push_back(j);
        if (modified_ids.count(new_ids[j])) {
            change.modifications.push_back(j);
        }
    }

    auto stable = longest_increasing_subsequence(kept_old);
    size_t next_stable = 0;
    for (size_t k = 0; k < kept_old.size(); ++k) {
        if (next_stable < stable.size() && stable[next_stable] == k) {
            ++next_stable;
            continue;
        }
        change.moves.push_back({kept_old[k], kept_new[k]});
    }

    return change;
}

// ============================================================================
// collection_state
// ============================================================================

bool collection_state::affected_by(const commit_info& info) const {
    for (const auto& change : info.changes) {
        if (dependencies.count(change.entity)) return true;
        if (root && change.entity == root->name && key_string(change.key) == root_key_id) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// query_engine
// ============================================================================

std::shared_ptr<collection_state> query_engine::track(std::shared_ptr<collection_state> state) {
    sweep();
    collections_.push_back(state);
    return state;
}

void query_engine::sweep() {
    collections_.erase(std::remove_if(collections_.begin(), collections_.end(),
                                      [](const std::weak_ptr<collection_state>& w) { return w.expired(); }),
                       collections_.end());
}

std::shared_ptr<collection_state> query_engine::make_query(compiled_query query) {
    auto state = std::make_shared<collection_state>();
    state->owner = &owner_;
    state->source = collection_state::source_kind::query;
    state->dependencies.insert(query.entity->name);
    state->query = std::move(query);
    LOG_DEBUG("query", "Live query on %s where %s", state->query.entity->name.c_str(),
              describe(state->query.filter).c_str());
    return track(std::move(state));
}

std::shared_ptr<collection_state> query_engine::make_backlink(const object& target, const property_descriptor& backlink) {
    const auto& graph = owner_.graph();
    const auto& source = graph.resolve(backlink.target_entity);

    auto state = std::make_shared<collection_state>();
    state->owner = &owner_;
    state->source = collection_state::source_kind::backlink;
    state->query = compile_query(graph, source.name,
                                 query_expr::compare(backlink.link_property, compare_op::contains, target.key()));
    state->root = &target.schema();
    state->root_key = target.key();
    state->root_key_id = target.state()->key_id;
    state->dependencies.insert(source.name);
    return track(std::move(state));
}

std::shared_ptr<collection_state> query_engine::make_list(const object& list_owner, const property_descriptor& list_property) {
    const auto& graph = owner_.graph();

    auto state = std::make_shared<collection_state>();
    state->owner = &owner_;
    state->source = collection_state::source_kind::list;
    state->root = &list_owner.schema();
    state->root_key = list_owner.key();
    state->root_key_id = list_owner.state()->key_id;
    state->list_property = &list_property;
    state->list_target = &graph.resolve(list_property.target_entity);
    state->dependencies.insert(list_property.target_entity);
    return track(std::move(state));
}

void query_engine::refresh(collection_state& state) {
    if (!state.valid) return;

    std::vector<std::shared_ptr<object_state>> items;
    std::optional<record> root_record;
    if (state.root) {
        root_record = owner_.session().read_by_key(*state.root, state.root_key);
        state.root_deleted = !root_record;
    }

    if (state.root_deleted) {
        // Nothing hangs off a deleted record
    } else if (state.source == collection_state::source_kind::list) {
        auto it = root_record->find(state.list_property->name);
        if (it != root_record->end()) {
            if (auto* keys = std::get_if<document>(&it->second)) {
                items = owner_.resolver().resolve_keys(*state.list_target, keys->json);
            }
        }
    } else {
        const auto& entity = *state.query.entity;
        const auto& pk = entity.primary_key()->name;
        for (const auto& rec : owner_.session().scan(state.query)) {
            auto it = rec.find(pk);
            if (it == rec.end()) continue;
            items.push_back(owner_.stored_proxy(entity, it->second));
        }
    }

    state.item_ids.clear();
    for (const auto& item : items) {
        state.item_ids.push_back(item->key_id);
    }
    state.items = std::move(items);
    state.stale = false;
}

void query_engine::ensure_current(collection_state& state) {
    if (!state.valid) {
        throw invalid_object_error(state.root_deleted ? "Collection root record was deleted"
                                                      : "Collection has been released or its store closed");
    }
    if (state.stale) {
        refresh(state);
    }
}

std::vector<std::pair<std::shared_ptr<collection_state>, collection_change>>
query_engine::on_commit(const commit_info& info) {
    std::vector<std::pair<std::shared_ptr<collection_state>, collection_change>> results;
    sweep();

    // Snapshot first: a refresh can create new proxies but never new collections
    std::vector<std::shared_ptr<collection_state>> live;
    for (const auto& weak : collections_) {
        if (auto state = weak.lock()) {
            if (state->valid) live.push_back(std::move(state));
        }
    }

    for (auto& state : live) {
        if (!state->affected_by(info)) continue;

        if (state->observers == 0) {
            state->stale = true;
            continue;
        }

        const auto& member_entity = state->member_entity().name;
        std::set<std::string> modified;
        for (const auto& change : info.changes) {
            if (change.entity == member_entity && change.op == change_type::update) {
                modified.insert(key_string(change.key));
            }
        }

        bool was_root_deleted = state->root_deleted;
        auto old_ids = state->item_ids;
        refresh(*state);
        auto change = compute_changes(old_ids, state->item_ids, modified);
        if (state->root_deleted && !was_root_deleted) {
            change.collection_root_was_deleted = true;
            state->items.clear();
            state->item_ids.clear();
            state->valid = false;
        }
        results.emplace_back(state, std::move(change));
    }
    return results;
}

void query_engine::release(collection_state& state) {
    state.valid = false;
    state.items.clear();
    state.item_ids.clear();
    collections_.erase(std::remove_if(collections_.begin(), collections_.end(),
                                      [&](const std::weak_ptr<collection_state>& w) {
                                          auto locked = w.lock();
                                          return !locked || locked.get() == &state;
                                      }),
                       collections_.end());
}

void query_engine::invalidate_all() {
    for (const auto& weak : collections_) {
        if (auto state = weak.lock()) {
            state->valid = false;
            state->items.clear();
            state->item_ids.clear();
        }
    }
    collections_.clear();
}

// ============================================================================
// live_collection
// ============================================================================

live_collection::live_collection(std::shared_ptr<collection_state> state) : state_(std::move(state)) {}

collection_state& live_collection::current() const {
    if (!state_ || !state_->valid) {
        throw invalid_object_error("Collection has been released, deleted or its store closed");
    }
    state_->owner->engine().ensure_current(*state_);
    return *state_;
}

size_t live_collection::size() const {
    return current().items.size();
}

object live_collection::at(size_t index) const {
    auto& state = current();
    if (index >= state.items.size()) {
        throw std::out_of_range("Index " + std::to_string(index) + " out of range for collection of size " +
                                std::to_string(state.items.size()));
    }
    return object(state.items[index]);
}

std::optional<object> live_collection::first() const {
    auto& state = current();
    if (state.items.empty()) return std::nullopt;
    return object(state.items.front());
}

std::vector<object> live_collection::snapshot() const {
    auto& state = current();
    std::vector<object> objects;
    objects.reserve(state.items.size());
    for (const auto& item : state.items) {
        objects.emplace_back(item);
    }
    return objects;
}

std::optional<size_t> live_collection::index_of(const object& obj) const {
    auto& state = current();
    if (obj.entity() != state.member_entity().name) return std::nullopt;
    const auto& key_id = obj.state()->key_id;
    for (size_t i = 0; i < state.item_ids.size(); ++i) {
        if (state.item_ids[i] == key_id) return i;
    }
    return std::nullopt;
}

const entity_schema& live_collection::entity() const {
    if (!state_) {
        throw invalid_object_error("Empty collection handle");
    }
    return state_->member_entity();
}

live_collection live_collection::where(const std::string& filter, const std::vector<value_t>& args) const {
    auto& state = current();
    if (state.source == collection_state::source_kind::list) {
        throw invalid_query_error("A list-of-links collection cannot be filtered; query " +
                                  state.member_entity().name + " instead");
    }
    auto extra = parse_query(filter, args);
    auto combined = !state.query.filter ? extra
                  : !extra ? state.query.filter
                  : query_expr::conjunction(state.query.filter, extra);
    auto& owner = *state.owner;
    return live_collection(owner.engine().make_query(
        compile_query(owner.graph(), state.query.entity->name, combined, state.query.sort)));
}

live_collection live_collection::sorted(std::vector<sort_descriptor> sort) const {
    auto& state = current();
    if (state.source == collection_state::source_kind::list) {
        throw invalid_query_error("A list-of-links collection keeps list order and cannot be re-sorted");
    }
    auto& owner = *state.owner;
    return live_collection(owner.engine().make_query(
        compile_query(owner.graph(), state.query.entity->name, state.query.filter, sort)));
}

notification_token live_collection::observe(collection_callback callback) const {
    auto& state = current();
    return state.owner->observe(*this, std::move(callback));
}

void live_collection::release() {
    if (!state_ || !state_->valid) return;
    state_->owner->engine().release(*state_);
}

} // namespace strata
