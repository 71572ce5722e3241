#pragma once

#include "object.hpp"
#include "observation.hpp"
#include "query.hpp"
#include "storage.hpp"
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace strata {

class store;

// ============================================================================
// collection_state - membership shared by the engine and every handle
// ============================================================================

struct collection_state {
    enum class source_kind {
        query,     // query(entity, filter, sort)
        backlink,  // inverse of a forward link, as a query on the source entity
        list       // list-of-links property of one owner record
    };

    store* owner = nullptr;
    source_kind source = source_kind::query;
    compiled_query query;  // query and backlink sources

    // Record the collection hangs off (back-link target, list owner); when it
    // is deleted the collection reports collection_root_was_deleted and dies
    const entity_schema* root = nullptr;
    value_t root_key;
    std::string root_key_id;

    // list source
    const property_descriptor* list_property = nullptr;
    const entity_schema* list_target = nullptr;

    std::vector<std::shared_ptr<object_state>> items;
    std::vector<std::string> item_ids;

    std::set<std::string> dependencies;  // entities whose writes can change membership

    bool stale = true;
    bool valid = true;
    bool root_deleted = false;
    size_t observers = 0;

    /// Entity of the members.
    const entity_schema& member_entity() const { return list_target ? *list_target : *query.entity; }

    bool affected_by(const commit_info& info) const;
};

/// Diff two memberships. deletions are old indices, insertions and
/// modifications new indices; moves are members kept outside the longest
/// stable subsequence. All index lists are ascending.
collection_change compute_changes(const std::vector<std::string>& old_ids,
                                  const std::vector<std::string>& new_ids,
                                  const std::set<std::string>& modified_ids);

// ============================================================================
// query_engine - creates, tracks and refreshes live collections
// ============================================================================

class query_engine {
public:
    explicit query_engine(store& owner) : owner_(owner) {}

    std::shared_ptr<collection_state> make_query(compiled_query query);
    std::shared_ptr<collection_state> make_backlink(const object& target, const property_descriptor& backlink);
    std::shared_ptr<collection_state> make_list(const object& owner, const property_descriptor& list_property);

    /// Re-run the source and replace the membership.
    void refresh(collection_state& state);

    /// Refresh if stale. Throws invalid_object_error for an invalid collection.
    void ensure_current(collection_state& state);

    /// After a commit: observed collections are refreshed and diffed, the rest
    /// only marked stale. Returns the changes of observed collections.
    std::vector<std::pair<std::shared_ptr<collection_state>, collection_change>>
    on_commit(const commit_info& info);

    void release(collection_state& state);
    void invalidate_all();

    size_t tracked() const { return collections_.size(); }

private:
    std::shared_ptr<collection_state> track(std::shared_ptr<collection_state> state);
    void sweep();

    store& owner_;
    std::vector<std::weak_ptr<collection_state>> collections_;
};

// ============================================================================
// live_collection - handle to an ordered, self-updating result set
// ============================================================================

class live_collection {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = object;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = object;

        iterator(const live_collection* owner, size_t index) : owner_(owner), index_(index) {}

        object operator*() const { return owner_->at(index_); }
        iterator& operator++() { ++index_; return *this; }
        iterator operator++(int) { auto tmp = *this; ++index_; return tmp; }
        bool operator==(const iterator& other) const { return owner_ == other.owner_ && index_ == other.index_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        const live_collection* owner_;
        size_t index_;
    };

    explicit live_collection(std::shared_ptr<collection_state> state);

    size_t size() const;
    bool empty() const { return size() == 0; }

    /// Throws std::out_of_range past the end.
    object at(size_t index) const;
    object operator[](size_t index) const { return at(index); }

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, size()); }

    std::optional<object> first() const;
    std::vector<object> snapshot() const;
    std::optional<size_t> index_of(const object& obj) const;

    const entity_schema& entity() const;

    /// A new collection further filtered / re-sorted (query and back-link sources).
    live_collection where(const std::string& filter, const std::vector<value_t>& args = {}) const;
    live_collection sorted(std::vector<sort_descriptor> sort) const;

    notification_token observe(collection_callback callback) const;

    bool is_valid() const noexcept { return state_ && state_->valid; }

    /// Stop tracking; every handle to this collection becomes invalid.
    void release();

    const std::shared_ptr<collection_state>& state() const { return state_; }

private:
    collection_state& current() const;

    std::shared_ptr<collection_state> state_;
};

} // namespace strata
