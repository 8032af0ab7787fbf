#pragma once

#include <memory>
#include <optional>

#include "sh/content/ContentNode.hpp"
#include "sh/core/Task.hpp"

namespace sh::content {

/**
 * @brief Single-occupancy holder of the active content node.
 *
 * Removal is deferred: QueueRemoval() only marks the occupant, and the node
 * is destroyed and detached by FlushRemovals() at the end of the frame. The
 * returned task resolves once the slot is actually empty.
 */
class ContentSlot {
public:
    ContentSlot() = default;
    ContentSlot(const ContentSlot&) = delete;
    ContentSlot& operator=(const ContentSlot&) = delete;

    bool IsOccupied() const { return static_cast<bool>(m_active); }
    const ContentNodePtr& GetActive() const { return m_active; }

    /**
     * @return false (and leaves the slot untouched) if @p node is null, the
     *         slot is occupied, or a removal is still pending.
     */
    bool Attach(ContentNodePtr node);

    core::Task<void> QueueRemoval();
    bool HasPendingRemoval() const { return m_pendingRemoval.has_value(); }

    void FlushRemovals();
    void UpdateActive(float deltaTime);

private:
    ContentNodePtr m_active;
    std::optional<core::TaskSource<void>> m_pendingRemoval;
};

} // namespace sh::content
