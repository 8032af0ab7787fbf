#include "sh/content/ContentSlot.hpp"

#include "sh/core/Logger.hpp"

namespace sh::content {

bool ContentSlot::Attach(ContentNodePtr node) {
    if (!node) {
        core::Logger::Error("[ContentSlot] Cannot attach a null node");
        return false;
    }
    if (m_active) {
        core::Logger::Error("[ContentSlot] Cannot attach '{}': slot already holds '{}'",
                            node->GetName(), m_active->GetName());
        return false;
    }
    if (m_pendingRemoval) {
        core::Logger::Error("[ContentSlot] Cannot attach '{}' while a removal is pending", node->GetName());
        return false;
    }
    if (node->IsDestroyed()) {
        core::Logger::Error("[ContentSlot] Cannot attach destroyed node '{}'", node->GetName());
        return false;
    }

    m_active = std::move(node);
    m_active->SetAttached(true);
    core::Logger::Debug("[ContentSlot] Attached '{}'", m_active->GetName());
    return true;
}

core::Task<void> ContentSlot::QueueRemoval() {
    if (!m_active) {
        return core::Task<void>::Resolved();
    }
    if (!m_pendingRemoval) {
        m_pendingRemoval.emplace();
        core::Logger::Debug("[ContentSlot] Queued removal of '{}'", m_active->GetName());
    }
    return m_pendingRemoval->GetTask();
}

void ContentSlot::FlushRemovals() {
    if (!m_pendingRemoval) {
        return;
    }

    ContentNodePtr removed = std::move(m_active);
    m_active.reset();
    if (removed) {
        removed->Destroy();
    }

    // Reset before completing so waiters observe an empty slot with nothing pending.
    core::TaskSource<void> source = std::move(*m_pendingRemoval);
    m_pendingRemoval.reset();
    source.Complete();
}

void ContentSlot::UpdateActive(float deltaTime) {
    if (m_active && !m_pendingRemoval) {
        m_active->Update(deltaTime);
    }
}

} // namespace sh::content
