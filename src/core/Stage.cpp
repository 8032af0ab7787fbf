#include "sh/core/Stage.hpp"

#include "sh/core/Logger.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace sh::core {

namespace {

transition::TransitionAsset MakeAsset(const utils::TransitionConfig& config) {
    transition::TransitionAsset asset;
    asset.name = config.asset;
    asset.durationSeconds = config.durationSeconds;
    asset.color = config.color;
    return asset;
}

} // namespace

Stage::Stage(utils::StageConfig config)
    : m_config(std::move(config))
    , m_pause(&m_events)
    , m_loader(m_config.loader, m_behaviours)
    , m_gate(MakeAsset(m_config.transition))
    , m_controller(transition::TransitionContext{m_events, m_pause, m_slot, m_loader, m_hooks, m_gate, m_frameCount})
    , m_bootstrap(m_controller, m_config.bootstrap.initialContent) {
    ApplyLoggingConfig();
    core::Logger::Info("[Stage] Ready (content root: {}, transition '{}' {:.2f}s)",
                       m_config.loader.contentRoot.string(), m_config.transition.asset,
                       m_config.transition.durationSeconds);
}

Stage::~Stage() {
    if (m_controller.IsBusy()) {
        core::Logger::Warning("[Stage] Shutting down while a transition is {}",
                              transition::ToString(m_controller.GetPhase()));
    }
}

void Stage::ApplyLoggingConfig() {
    if (m_config.logging.debug) {
        Logger::SetDebugEnabled(true);
    }
    if (!m_config.logging.file.empty()) {
        Logger::SetLogFile(m_config.logging.file);
    }
}

void Stage::Tick(float deltaTime) {
    if (deltaTime < 0.0f) {
        core::Logger::Warning("[Stage] Negative deltaTime ({:.6f}), clamping to 0", deltaTime);
        deltaTime = 0.0f;
    }

    ++m_frameCount;
    m_loader.Poll();
    m_gate.Update(deltaTime);
    if (!m_pause.IsPaused()) {
        m_slot.UpdateActive(deltaTime);
    }
    m_controller.Update();
    m_slot.FlushRemovals();
}

std::uint64_t Stage::RunUntilIdle(float deltaTime, std::uint64_t maxFrames) {
    std::uint64_t frames = 0;
    while (!IsIdle() && frames < maxFrames) {
        Tick(deltaTime);
        ++frames;
    }
    if (!IsIdle()) {
        core::Logger::Warning("[Stage] Still busy after {} frames (phase {})", frames,
                              transition::ToString(m_controller.GetPhase()));
    }
    return frames;
}

std::uint64_t Stage::Run(const StageFrameCallback& onFrame) {
    using Clock = std::chrono::steady_clock;

    const auto frameDuration = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1.0 / m_config.stage.frameRate));

    StageContext context{this, [this]() { RequestExit(); }};

    m_exitRequested = false;
    std::uint64_t frames = 0;
    auto lastTime = Clock::now();

    while (!m_exitRequested) {
        const auto frameStart = Clock::now();
        const float dt = std::chrono::duration<float>(frameStart - lastTime).count();
        lastTime = frameStart;

        Tick(dt);
        if (onFrame) {
            onFrame(context, dt);
        }
        ++frames;

        const auto elapsed = Clock::now() - frameStart;
        if (elapsed < frameDuration) {
            std::this_thread::sleep_for(frameDuration - elapsed);
        }
    }

    core::Logger::Info("[Stage] Loop exited after {} frames", frames);
    return frames;
}

core::Task<bool> Stage::Transition(content::TransitionTarget target, content::ParamList params) {
    return m_controller.Transition(std::move(target), std::move(params));
}

core::Task<bool> Stage::Bootstrap(content::ContentNodePtr prebuilt) {
    return m_bootstrap.Run(std::move(prebuilt));
}

bool Stage::IsIdle() const {
    return !m_controller.IsBusy() && !m_loader.HasPendingLoads();
}

} // namespace sh::core
