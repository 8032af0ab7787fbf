#include "sh/transition/TransitionGate.hpp"

#include "sh/core/Logger.hpp"

#include <algorithm>
#include <utility>

namespace sh::transition {

namespace {

const char* DirectionName(TransitionGate::Direction direction) {
    switch (direction) {
        case TransitionGate::Direction::Out: return "out";
        case TransitionGate::Direction::In:  return "in";
        case TransitionGate::Direction::None: break;
    }
    return "none";
}

} // namespace

TransitionGate::TransitionGate(TransitionAsset asset)
    : m_asset(std::move(asset)) {}

core::Task<void> TransitionGate::PlayOut() {
    return Play(Direction::Out);
}

core::Task<void> TransitionGate::PlayIn() {
    return Play(Direction::In);
}

void TransitionGate::SetAsset(TransitionAsset asset) {
    if (IsPlaying()) {
        Finish();
    }
    m_asset = std::move(asset);
}

core::Task<void> TransitionGate::Play(Direction direction) {
    if (IsPlaying()) {
        core::Logger::Warning("[TransitionGate] '{}' restarted while playing {}, finishing previous run",
                              m_asset.name, DirectionName(m_direction));
        Finish();
    }

    m_direction = direction;
    m_elapsed = 0.0;
    m_coverage = direction == Direction::Out ? 0.0f : 1.0f;
    m_run.emplace();
    core::Task<void> task = m_run->GetTask();

    core::Logger::Debug("[TransitionGate] Playing '{}' {} ({:.2f}s)",
                        m_asset.name, DirectionName(direction), m_asset.durationSeconds);

    if (m_asset.durationSeconds <= 0.0) {
        Finish();
    }
    return task;
}

void TransitionGate::Update(float deltaTime) {
    if (!IsPlaying()) {
        return;
    }

    m_elapsed += std::max(0.0f, deltaTime);
    const double progress = std::clamp(m_elapsed / m_asset.durationSeconds, 0.0, 1.0);
    m_coverage = static_cast<float>(m_direction == Direction::Out ? progress : 1.0 - progress);

    if (progress >= 1.0) {
        Finish();
    }
}

glm::vec4 TransitionGate::GetOverlayColor() const {
    glm::vec4 color = m_asset.color;
    color.a *= m_coverage;
    return color;
}

void TransitionGate::Finish() {
    m_coverage = m_direction == Direction::Out ? 1.0f : 0.0f;
    core::Logger::Debug("[TransitionGate] '{}' {} finished", m_asset.name, DirectionName(m_direction));
    m_direction = Direction::None;
    m_elapsed = 0.0;

    if (m_run) {
        core::TaskSource<void> run = std::move(*m_run);
        m_run.reset();
        run.Complete();
    }
}

} // namespace sh::transition
