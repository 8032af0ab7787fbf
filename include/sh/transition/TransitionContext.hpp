#pragma once

#include <cstdint>

namespace sh {

namespace core {
class EventBus;
class PauseController;
} // namespace core

namespace content {
class ContentSlot;
class ContentLoader;
} // namespace content

namespace transition {

class HookInvoker;
class TransitionGate;

/**
 * @brief Collaborators a TransitionController drives.
 *
 * Built once by the owner of the stage and handed to the controller by value;
 * every member must outlive the controller.
 */
struct TransitionContext {
    core::EventBus& events;
    core::PauseController& pause;
    content::ContentSlot& slot;
    content::ContentLoader& loader;
    HookInvoker& hooks;
    TransitionGate& gate;
    // Index of the frame being run, or of the last one run between frames.
    const std::uint64_t& frame;
};

} // namespace transition

} // namespace sh
