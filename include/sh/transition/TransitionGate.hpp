#pragma once

#include <optional>
#include <string>

#include <glm/vec4.hpp>

#include "sh/core/Task.hpp"

namespace sh::transition {

struct TransitionAsset {
    std::string name = "fade";
    double durationSeconds = 0.5;
    glm::vec4 color{0.0f, 0.0f, 0.0f, 1.0f};
};

/**
 * @brief Plays the full-screen transition that hides content swaps.
 *
 * PlayOut() covers the screen (coverage 0 -> 1), PlayIn() uncovers it
 * (1 -> 0). The stage calls Update() every frame whether or not the
 * simulation is paused. Starting a run while another is playing finishes the
 * earlier run first.
 */
class TransitionGate {
public:
    enum class Direction {
        None,
        Out,
        In
    };

    explicit TransitionGate(TransitionAsset asset = {});

    core::Task<void> PlayOut();
    core::Task<void> PlayIn();

    void Update(float deltaTime);

    bool IsPlaying() const { return m_direction != Direction::None; }
    Direction GetDirection() const { return m_direction; }

    // 0 = fully visible content, 1 = fully covered.
    float GetCoverage() const { return m_coverage; }
    glm::vec4 GetOverlayColor() const;

    const TransitionAsset& GetAsset() const { return m_asset; }
    void SetAsset(TransitionAsset asset);

private:
    core::Task<void> Play(Direction direction);
    void Finish();

    TransitionAsset m_asset;
    Direction m_direction = Direction::None;
    double m_elapsed = 0.0;
    float m_coverage = 0.0f;
    std::optional<core::TaskSource<void>> m_run;
};

} // namespace sh::transition
