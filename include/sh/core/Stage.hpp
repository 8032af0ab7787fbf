#pragma once

#include <cstdint>
#include <functional>

#include "sh/content/BehaviourRegistry.hpp"
#include "sh/content/ContentLoader.hpp"
#include "sh/content/ContentSlot.hpp"
#include "sh/core/EventBus.hpp"
#include "sh/core/PauseController.hpp"
#include "sh/transition/Bootstrap.hpp"
#include "sh/transition/HookInvoker.hpp"
#include "sh/transition/TransitionController.hpp"
#include "sh/transition/TransitionGate.hpp"
#include "sh/utils/Config.hpp"

namespace sh::core {

class Stage;

struct StageContext {
    Stage* stage = nullptr;
    std::function<void()> requestExit;
};

using StageFrameCallback = std::function<void(StageContext&, float)>;

/**
 * @brief Owns the transition collaborators and runs the frame loop.
 *
 * One Tick() is one scheduling step: loader poll, transition fade, content
 * update (skipped while paused), controller, then deferred removals.
 */
class Stage {
public:
    explicit Stage(utils::StageConfig config = {});
    ~Stage();

    Stage(const Stage&) = delete;
    Stage& operator=(const Stage&) = delete;

    void Tick(float deltaTime);

    // Ticks with a fixed step until no transition or load is in flight.
    // Returns the number of ticks used (capped at @p maxFrames).
    std::uint64_t RunUntilIdle(float deltaTime, std::uint64_t maxFrames = 10000);

    // Wall-clock loop at stage.frameRate until RequestExit(). Returns the frame count.
    std::uint64_t Run(const StageFrameCallback& onFrame = {});
    void RequestExit() { m_exitRequested = true; }

    core::Task<bool> Transition(content::TransitionTarget target, content::ParamList params = {});
    core::Task<bool> Bootstrap(content::ContentNodePtr prebuilt = nullptr);

    bool IsIdle() const;
    // Ticks started so far; inside a tick this is that tick's index.
    std::uint64_t GetFrameCount() const { return m_frameCount; }

    EventBus& Events() { return m_events; }
    PauseController& Pause() { return m_pause; }
    content::ContentSlot& Slot() { return m_slot; }
    content::BehaviourRegistry& Behaviours() { return m_behaviours; }
    content::ContentLoader& Loader() { return m_loader; }
    transition::TransitionGate& Gate() { return m_gate; }
    transition::TransitionController& Controller() { return m_controller; }
    const utils::StageConfig& GetConfig() const { return m_config; }

private:
    void ApplyLoggingConfig();

    utils::StageConfig m_config;
    std::uint64_t m_frameCount = 0;
    EventBus m_events;
    PauseController m_pause;
    content::ContentSlot m_slot;
    content::BehaviourRegistry m_behaviours;
    content::ContentLoader m_loader;
    transition::TransitionGate m_gate;
    transition::HookInvoker m_hooks;
    transition::TransitionController m_controller;
    transition::Bootstrap m_bootstrap;

    bool m_exitRequested = false;
};

} // namespace sh::core
