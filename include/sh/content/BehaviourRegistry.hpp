#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sh::content {

class ContentNode;

/**
 * @brief Maps behaviour names to functions that install hooks on a node.
 *
 * Content templates refer to behaviours by name; when a template is
 * instantiated the matching binder attaches the teardown/setup/start hooks
 * and update callback that give the content its logic.
 *
 * @example
 * registry.Register("MainMenu", [](ContentNode& node) {
 *     node.SetStartHook([]() { return sh::core::Task<void>::Resolved(); });
 * });
 */
class BehaviourRegistry {
public:
    using Binder = std::function<void(ContentNode&)>;

    /**
     * @return false if @p name is empty, the binder is empty or the name is taken.
     */
    bool Register(const std::string& name, Binder binder);

    bool Unregister(const std::string& name);
    bool IsRegistered(const std::string& name) const;

    /**
     * @brief Apply the named behaviour to @p node.
     * @return false if no behaviour with that name exists.
     */
    bool Bind(const std::string& name, ContentNode& node) const;

    std::vector<std::string> GetRegisteredNames() const;
    void Clear();

private:
    std::unordered_map<std::string, Binder> m_binders;
};

} // namespace sh::content
