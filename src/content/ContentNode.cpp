#include "sh/content/ContentNode.hpp"

#include "sh/core/Logger.hpp"

namespace sh::content {

std::string_view ToString(HookKind kind) {
    switch (kind) {
        case HookKind::Teardown: return "teardown";
        case HookKind::Setup:    return "setup";
        case HookKind::Start:    return "start";
    }
    return "unknown";
}

ContentNode::ContentNode(std::string name, std::string address)
    : m_name(std::move(name))
    , m_address(std::move(address)) {}

void ContentNode::ClearHook(HookKind kind) {
    switch (kind) {
        case HookKind::Teardown: m_teardown = nullptr; break;
        case HookKind::Setup:    m_setup = nullptr; break;
        case HookKind::Start:    m_start = nullptr; break;
    }
}

bool ContentNode::HasHook(HookKind kind) const {
    switch (kind) {
        case HookKind::Teardown: return static_cast<bool>(m_teardown);
        case HookKind::Setup:    return static_cast<bool>(m_setup);
        case HookKind::Start:    return static_cast<bool>(m_start);
    }
    return false;
}

core::Task<void> ContentNode::InvokeHook(HookKind kind, const ParamList& params) {
    if (!HasHook(kind)) {
        return core::Task<void>::Resolved();
    }

    core::Task<void> task;
    switch (kind) {
        case HookKind::Teardown: task = m_teardown(); break;
        case HookKind::Setup:    task = m_setup(params); break;
        case HookKind::Start:    task = m_start(); break;
    }

    // A hook that hands back an empty task has nothing to wait for.
    if (!task.IsValid()) {
        return core::Task<void>::Resolved();
    }
    return task;
}

void ContentNode::Update(float deltaTime) {
    if (m_destroyed) {
        return;
    }
    m_simulatedTime += deltaTime;
    ++m_updateCount;
    if (m_update) {
        m_update(*this, deltaTime);
    }
}

void ContentNode::Destroy() {
    if (m_destroyed) {
        return;
    }
    if (m_onDestroy) {
        m_onDestroy(*this);
    }
    m_destroyed = true;
    m_attached = false;
    core::Logger::Debug("[ContentNode] '{}' destroyed", m_name);
}

} // namespace sh::content
