#include "sh/transition/Bootstrap.hpp"

#include "sh/content/TransitionTarget.hpp"
#include "sh/core/Error.hpp"
#include "sh/core/Logger.hpp"
#include "sh/transition/TransitionController.hpp"

#include <utility>

namespace sh::transition {

Bootstrap::Bootstrap(TransitionController& controller, std::string initialContent)
    : m_controller(controller)
    , m_initialContent(std::move(initialContent)) {}

core::Task<bool> Bootstrap::Run(content::ContentNodePtr prebuilt) {
    if (prebuilt) {
        core::Logger::Info("[Bootstrap] Starting with prebuilt node '{}'", prebuilt->GetName());
        return m_controller.Transition(content::AlreadyBuilt{std::move(prebuilt)});
    }

    if (m_initialContent.empty()) {
        core::Logger::Error("[Bootstrap] No prebuilt node and no initial content configured");
        return core::Task<bool>::Rejected(std::make_exception_ptr(
            core::Error("Bootstrap has neither a prebuilt node nor bootstrap.initialContent")));
    }

    core::Logger::Info("[Bootstrap] Starting with '{}'", m_initialContent);
    return m_controller.Transition(content::Identifier{m_initialContent});
}

} // namespace sh::transition
