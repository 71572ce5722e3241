#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace strata {

// ============================================================================
// collection_change - one commit's effect on a live collection
// ============================================================================

struct collection_change {
    struct move {
        uint64_t from;  // index in the previous membership
        uint64_t to;    // index in the new membership

        bool operator==(const move& other) const { return from == other.from && to == other.to; }
    };

    /// Previous-membership indices of members that left
    std::vector<uint64_t> deletions;

    /// New-membership indices of members that entered
    std::vector<uint64_t> insertions;

    /// New-membership indices of members whose record the commit wrote
    std::vector<uint64_t> modifications;

    /// Members that stayed but are no longer in their old relative order
    std::vector<move> moves;

    /// The record a back-link or list collection hangs off was deleted; the
    /// collection is dead after this change
    bool collection_root_was_deleted = false;

    [[nodiscard]] bool empty() const noexcept {
        return deletions.empty() && insertions.empty() && modifications.empty() && moves.empty() &&
               !collection_root_was_deleted;
    }
};

// ============================================================================
// object_change - one commit's effect on a single record
// ============================================================================

struct object_change {
    bool is_deleted = false;

    /// Properties the commit wrote, in first-written order (empty on delete)
    std::vector<std::string> changed_properties;

    [[nodiscard]] bool deleted() const noexcept { return is_deleted; }

    [[nodiscard]] bool changed(const std::string& name) const {
        return std::find(changed_properties.begin(), changed_properties.end(), name) != changed_properties.end();
    }
};

using object_callback = std::function<void(const object_change&)>;
using collection_callback = std::function<void(const collection_change&)>;

// ============================================================================
// notification_token - keeps one observation registered (move-only)
// ============================================================================
//
// Dropping the token unregisters. The release hook holds only weak references,
// so a token may outlive the store it came from.

class notification_token {
public:
    notification_token() = default;
    explicit notification_token(std::function<void()> release) : release_(std::move(release)) {}

    ~notification_token() { unregister(); }

    notification_token(const notification_token&) = delete;
    notification_token& operator=(const notification_token&) = delete;

    notification_token(notification_token&& other) noexcept : release_(std::exchange(other.release_, nullptr)) {}

    notification_token& operator=(notification_token&& other) noexcept {
        if (this != &other) {
            unregister();
            release_ = std::exchange(other.release_, nullptr);
        }
        return *this;
    }

    /// Idempotent. Callbacks already handed to a scheduler are skipped.
    void unregister() {
        if (!release_) return;
        auto release = std::exchange(release_, nullptr);
        release();
    }

    [[nodiscard]] bool is_valid() const noexcept { return static_cast<bool>(release_); }

private:
    std::function<void()> release_;
};

} // namespace strata
