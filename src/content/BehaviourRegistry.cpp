#include "sh/content/BehaviourRegistry.hpp"

#include "sh/content/ContentNode.hpp"
#include "sh/core/Logger.hpp"

#include <algorithm>

namespace sh::content {

bool BehaviourRegistry::Register(const std::string& name, Binder binder) {
    if (name.empty() || !binder) {
        core::Logger::Warning("[BehaviourRegistry] Ignoring registration with empty name or binder");
        return false;
    }
    if (m_binders.find(name) != m_binders.end()) {
        core::Logger::Warning("[BehaviourRegistry] Behaviour '{}' already registered", name);
        return false;
    }
    m_binders.emplace(name, std::move(binder));
    return true;
}

bool BehaviourRegistry::Unregister(const std::string& name) {
    return m_binders.erase(name) > 0;
}

bool BehaviourRegistry::IsRegistered(const std::string& name) const {
    return m_binders.find(name) != m_binders.end();
}

bool BehaviourRegistry::Bind(const std::string& name, ContentNode& node) const {
    auto it = m_binders.find(name);
    if (it == m_binders.end()) {
        return false;
    }
    it->second(node);
    return true;
}

std::vector<std::string> BehaviourRegistry::GetRegisteredNames() const {
    std::vector<std::string> names;
    names.reserve(m_binders.size());
    for (const auto& [name, binder] : m_binders) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void BehaviourRegistry::Clear() {
    m_binders.clear();
}

} // namespace sh::content
