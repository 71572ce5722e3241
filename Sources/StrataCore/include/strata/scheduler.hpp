#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

namespace strata {

// ============================================================================
// scheduler - where observer callbacks run
// ============================================================================
//
// The notification bus never calls observers directly: every callback of a
// commit pass is handed to the store's scheduler. immediate_scheduler runs
// them inline at the end of commit(); main_thread_scheduler queues them until
// the host loop calls process_pending().

struct scheduler {
    virtual ~scheduler() = default;

    // Queue or run fn on this scheduler's context. Callable from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // True if the caller is on the thread callbacks are delivered on
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;
};

using SharedScheduler = std::shared_ptr<scheduler>;

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override { return true; }
};

// ============================================================================
// main_thread_scheduler - polled by a host event loop
// ============================================================================
//
// The constructing thread is taken to be the loop thread.

class main_thread_scheduler : public scheduler {
public:
    main_thread_scheduler() : loop_thread_(std::this_thread::get_id()) {}

    void invoke(std::function<void()>&& fn) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push(std::move(fn));
    }

    /// Run everything queued so far, in order. Returns the number of callbacks run.
    /// Work queued by those callbacks waits for the next call.
    size_t process_pending() {
        std::queue<std::function<void()>> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::swap(batch, pending_);
        }
        size_t ran = batch.size();
        while (!batch.empty()) {
            auto fn = std::move(batch.front());
            batch.pop();
            if (fn) fn();
        }
        return ran;
    }

    [[nodiscard]] size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == loop_thread_;
    }

private:
    std::thread::id loop_thread_;
    mutable std::mutex mutex_;
    std::queue<std::function<void()>> pending_;
};

} // namespace strata
