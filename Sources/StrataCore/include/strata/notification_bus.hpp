#pragma once

#include "live_collection.hpp"
#include "object.hpp"
#include "observation.hpp"
#include "scheduler.hpp"
#include "storage.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>

namespace strata {

class store;

// ============================================================================
// notification_bus - delivers one callback per observed subject per commit
// ============================================================================
//
// Commit infos are queued and drained in order. A pass started from inside an
// observer callback (a nested commit) is queued behind the current one.
// Callbacks are handed to the store's scheduler; a callback whose token was
// dropped before the scheduler ran it is skipped.

class notification_bus {
public:
    notification_bus(store& owner, SharedScheduler sched);

    notification_token observe(const std::shared_ptr<object_state>& state, object_callback callback);
    notification_token observe(const std::shared_ptr<collection_state>& state, collection_callback callback);

    void enqueue(commit_info info);

    /// Process queued commits. Re-entrant calls return immediately; the
    /// outermost call drains whatever they queued.
    void drain();

    /// Drop every registration and queued commit (store close).
    void clear();

private:
    struct object_observer {
        std::weak_ptr<object_state> state;
        std::string identity;
        object_callback callback;
    };

    struct collection_observer {
        std::weak_ptr<collection_state> state;
        collection_callback callback;
    };

    // Shared with tokens (weakly) so a token outliving the store is harmless
    struct registry {
        std::mutex mutex;
        std::map<uint64_t, object_observer> objects;
        std::map<uint64_t, collection_observer> collections;
        uint64_t next_id = 1;
    };

    void process(const commit_info& info);

    store& owner_;
    SharedScheduler scheduler_;
    std::shared_ptr<registry> registry_;
    std::deque<commit_info> queue_;
    bool draining_ = false;
};

} // namespace strata
