#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>

#include "sh/content/ContentNode.hpp"
#include "sh/content/TransitionTarget.hpp"
#include "sh/core/Task.hpp"
#include "sh/transition/TransitionContext.hpp"

namespace sh::transition {

enum class TransitionPhase {
    Idle,
    TearingDown,           // waiting on the old node's teardown hook
    FadingOut,
    AwaitingCleanupFrame,  // until the next frame, for final reactions before removal
    AwaitingRemoval,       // waiting for the slot to confirm removal
    Loading,
    SettingUp,
    FadingIn,
    Starting
};

const char* ToString(TransitionPhase phase);

/**
 * @brief Replaces the active content through the fixed transition sequence.
 *
 * teardown -> teardown-done -> fade out -> one frame -> removal -> resolve
 * target -> attach -> setup -> setup-done -> fade in -> unpause -> start ->
 * start-done. Each step waits for the previous one's task; Update() is called
 * once per frame and advances through every step that is already finished.
 *
 * Only one transition may be in flight. A second Transition() call while busy
 * is rejected with core::TransitionBusyError. Load failures and hook failures
 * fail the returned task (core::ContentLoadError / core::HookError) and put the
 * controller back to Idle; the pause flag is left set.
 */
class TransitionController {
public:
    explicit TransitionController(TransitionContext context);

    TransitionController(const TransitionController&) = delete;
    TransitionController& operator=(const TransitionController&) = delete;

    core::Task<bool> Transition(content::TransitionTarget target, content::ParamList params = {});

    void Update();

    bool IsBusy() const { return m_phase != TransitionPhase::Idle; }
    TransitionPhase GetPhase() const { return m_phase; }

    std::uint64_t CompletedCount() const { return m_completedCount; }
    std::uint64_t FailedCount() const { return m_failedCount; }

private:
    // Returns true when the step finished and the next one may run this frame.
    bool Advance();

    void BeginTeardown();
    void BeginLoad();
    void BeginSetup();
    void BeginStart();
    void EnterPhase(TransitionPhase phase);

    void FailHook(content::HookKind kind, std::exception_ptr error);
    void FailLoad(std::exception_ptr error);
    void Fail(std::exception_ptr error);
    void Finish();
    void Reset();

    TransitionContext m_context;
    TransitionPhase m_phase = TransitionPhase::Idle;

    std::optional<content::TransitionTarget> m_target;
    std::string m_targetDescription;
    content::ParamList m_params;
    content::ContentNodePtr m_incoming;

    core::Task<void> m_waitingOn;
    core::Task<content::ContentNodePtr> m_pendingNode;
    std::optional<core::TaskSource<bool>> m_result;

    std::uint64_t m_cleanupFrame = 0;
    bool m_updating = false;
    std::uint64_t m_completedCount = 0;
    std::uint64_t m_failedCount = 0;
};

} // namespace sh::transition
