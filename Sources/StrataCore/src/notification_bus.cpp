#include "strata/notification_bus.hpp"
#include "strata/log.hpp"
#include "strata/store.hpp"

#include <exception>

namespace strata {

notification_bus::notification_bus(store& owner, SharedScheduler sched)
    : owner_(owner)
    , scheduler_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>())
    , registry_(std::make_shared<registry>()) {}

notification_token notification_bus::observe(const std::shared_ptr<object_state>& state, object_callback callback) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        id = registry_->next_id++;
        registry_->objects[id] = {state, object_registry::identity(state->entity->name, state->key_id),
                                  std::move(callback)};
    }
    LOG_DEBUG("notify", "Observing %s %s (token %llu)", state->entity->name.c_str(), describe(state->key).c_str(),
              static_cast<unsigned long long>(id));

    std::weak_ptr<registry> weak = registry_;
    return notification_token([weak, id] {
        if (auto reg = weak.lock()) {
            std::lock_guard<std::mutex> lock(reg->mutex);
            reg->objects.erase(id);
        }
    });
}

notification_token notification_bus::observe(const std::shared_ptr<collection_state>& state,
                                             collection_callback callback) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        id = registry_->next_id++;
        registry_->collections[id] = {state, std::move(callback)};
        ++state->observers;
    }
    LOG_DEBUG("notify", "Observing collection of %s (token %llu)", state->member_entity().name.c_str(),
              static_cast<unsigned long long>(id));

    std::weak_ptr<registry> weak = registry_;
    std::weak_ptr<collection_state> weak_state = state;
    return notification_token([weak, weak_state, id] {
        auto reg = weak.lock();
        if (!reg) return;
        std::lock_guard<std::mutex> lock(reg->mutex);
        if (reg->collections.erase(id)) {
            if (auto s = weak_state.lock()) {
                if (s->observers > 0) --s->observers;
            }
        }
    });
}

void notification_bus::enqueue(commit_info info) {
    queue_.push_back(std::move(info));
}

void notification_bus::drain() {
    if (draining_) return;
    draining_ = true;
    try {
        while (!queue_.empty()) {
            auto info = std::move(queue_.front());
            queue_.pop_front();
            process(info);
        }
    } catch (...) {
        draining_ = false;
        throw;
    }
    draining_ = false;
}

void notification_bus::process(const commit_info& info) {
    if (info.external) {
        // Another session deleted these records: every proxy to them is dead
        for (const auto& change : info.changes) {
            if (change.op == change_type::remove) {
                owner_.objects().invalidate(change.entity, key_string(change.key));
            }
        }
        owner_.bump_generation();
    }

    auto collection_changes = owner_.engine().on_commit(info);

    std::map<std::string, object_change> object_changes;
    for (const auto& change : info.changes) {
        auto& entry = object_changes[object_registry::identity(change.entity, key_string(change.key))];
        if (change.op == change_type::remove) {
            entry.is_deleted = true;
            entry.changed_properties.clear();
            continue;
        }
        if (entry.is_deleted) continue;
        for (const auto& name : change.changed_properties) {
            if (!entry.changed(name)) entry.changed_properties.push_back(name);
        }
    }

    std::vector<std::function<void()>> calls;
    std::weak_ptr<registry> weak = registry_;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);

        for (const auto& [id, observer] : registry_->objects) {
            auto it = object_changes.find(observer.identity);
            if (it == object_changes.end()) continue;
            calls.push_back([weak, id = id, callback = observer.callback, change = it->second] {
                auto reg = weak.lock();
                if (!reg) return;
                {
                    std::lock_guard<std::mutex> lock(reg->mutex);
                    if (!reg->objects.count(id)) return;
                }
                try {
                    callback(change);
                } catch (const std::exception& e) {
                    LOG_ERROR("notify", "Object observer (token %llu) threw: %s",
                              static_cast<unsigned long long>(id), e.what());
                }
            });
        }

        for (const auto& [id, observer] : registry_->collections) {
            auto state = observer.state.lock();
            if (!state) continue;
            for (const auto& [changed_state, change] : collection_changes) {
                if (changed_state != state) continue;
                calls.push_back([weak, id = id, callback = observer.callback, change = change] {
                    auto reg = weak.lock();
                    if (!reg) return;
                    {
                        std::lock_guard<std::mutex> lock(reg->mutex);
                        if (!reg->collections.count(id)) return;
                    }
                    try {
                        callback(change);
                    } catch (const std::exception& e) {
                        LOG_ERROR("notify", "Collection observer (token %llu) threw: %s",
                                  static_cast<unsigned long long>(id), e.what());
                    }
                });
                break;
            }
        }
    }

    LOG_DEBUG("notify", "Commit pass: %zu changes, %zu callbacks%s", info.changes.size(), calls.size(),
              info.external ? " (external)" : "");
    if (!calls.empty() && !scheduler_->is_on_thread()) {
        LOG_WARN("notify", "Commit pass for %s ran off the scheduler's thread", owner_.config().path.c_str());
    }

    for (auto& call : calls) {
        scheduler_->invoke(std::move(call));
    }
}

void notification_bus::clear() {
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        registry_->objects.clear();
        registry_->collections.clear();
    }
    queue_.clear();
}

} // namespace strata
