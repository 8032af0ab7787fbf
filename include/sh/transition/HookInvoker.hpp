#pragma once

#include "sh/content/ContentNode.hpp"
#include "sh/core/Task.hpp"

namespace sh::transition {

/**
 * @brief Runs an optional lifecycle hook on a content node.
 *
 * A missing node or missing hook yields an already-resolved task. A hook that
 * throws while being invoked yields a failed task carrying that exception, so
 * the caller only ever has to watch one task.
 */
class HookInvoker {
public:
    core::Task<void> Invoke(content::ContentNode* node,
                            content::HookKind kind,
                            const content::ParamList& params = {});
};

} // namespace sh::transition
