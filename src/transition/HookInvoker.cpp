#include "sh/transition/HookInvoker.hpp"

#include "sh/core/Logger.hpp"

#include <exception>

namespace sh::transition {

core::Task<void> HookInvoker::Invoke(content::ContentNode* node,
                                     content::HookKind kind,
                                     const content::ParamList& params) {
    if (!node || !node->HasHook(kind)) {
        return core::Task<void>::Resolved();
    }

    core::Logger::Debug("[HookInvoker] Invoking {} on '{}'", content::ToString(kind), node->GetName());
    try {
        return node->InvokeHook(kind, params);
    } catch (const std::exception& e) {
        core::Logger::Error("[HookInvoker] {} hook on '{}' threw: {}",
                            content::ToString(kind), node->GetName(), e.what());
        return core::Task<void>::Rejected(std::current_exception());
    } catch (...) {
        core::Logger::Error("[HookInvoker] {} hook on '{}' threw a non-standard exception",
                            content::ToString(kind), node->GetName());
        return core::Task<void>::Rejected(std::current_exception());
    }
}

} // namespace sh::transition
