#pragma once

#include <string>

#include "sh/content/ContentNode.hpp"
#include "sh/core/Task.hpp"

namespace sh::transition {

class TransitionController;

/**
 * @brief Issues the first transition of a stage.
 *
 * A prebuilt node (single-content testing) is used as-is; otherwise the
 * configured initial identifier is loaded.
 */
class Bootstrap {
public:
    Bootstrap(TransitionController& controller, std::string initialContent);

    core::Task<bool> Run(content::ContentNodePtr prebuilt = nullptr);

    const std::string& GetInitialContent() const { return m_initialContent; }

private:
    TransitionController& m_controller;
    std::string m_initialContent;
};

} // namespace sh::transition
