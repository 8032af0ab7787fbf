#include "sh/transition/TransitionController.hpp"

#include "sh/content/ContentLoader.hpp"
#include "sh/content/ContentSlot.hpp"
#include "sh/core/Error.hpp"
#include "sh/core/EventBus.hpp"
#include "sh/core/Logger.hpp"
#include "sh/core/PauseController.hpp"
#include "sh/core/TransitionEvents.hpp"
#include "sh/transition/HookInvoker.hpp"
#include "sh/transition/TransitionGate.hpp"

#include <utility>

#include <fmt/format.h>

namespace sh::transition {

namespace {

std::string DescribeError(const std::exception_ptr& error) {
    if (!error) {
        return "unknown error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

struct UpdatingScope {
    explicit UpdatingScope(bool& flag) : m_flag(flag) { m_flag = true; }
    ~UpdatingScope() { m_flag = false; }

    UpdatingScope(const UpdatingScope&) = delete;
    UpdatingScope& operator=(const UpdatingScope&) = delete;

    bool& m_flag;
};

} // namespace

const char* ToString(TransitionPhase phase) {
    switch (phase) {
        case TransitionPhase::Idle:                 return "idle";
        case TransitionPhase::TearingDown:          return "tearing-down";
        case TransitionPhase::FadingOut:            return "fading-out";
        case TransitionPhase::AwaitingCleanupFrame: return "awaiting-cleanup-frame";
        case TransitionPhase::AwaitingRemoval:      return "awaiting-removal";
        case TransitionPhase::Loading:              return "loading";
        case TransitionPhase::SettingUp:            return "setting-up";
        case TransitionPhase::FadingIn:             return "fading-in";
        case TransitionPhase::Starting:             return "starting";
    }
    return "unknown";
}

TransitionController::TransitionController(TransitionContext context)
    : m_context(context) {}

core::Task<bool> TransitionController::Transition(content::TransitionTarget target, content::ParamList params) {
    const std::string description = content::Describe(target);
    if (IsBusy()) {
        core::Logger::Warning("[TransitionController] Rejected transition to {}: already {} ({})",
                              description, ToString(m_phase), m_targetDescription);
        return core::Task<bool>::Rejected(std::make_exception_ptr(core::TransitionBusyError(description)));
    }

    core::Logger::Info("[TransitionController] Transition to {} started", description);

    m_target = std::move(target);
    m_targetDescription = description;
    m_params = std::move(params);
    m_result.emplace();
    core::Task<bool> result = m_result->GetTask();

    m_context.pause.SetPaused(true);

    if (m_context.slot.IsOccupied()) {
        BeginTeardown();
    } else {
        core::Logger::Debug("[TransitionController] Slot empty, skipping teardown");
        BeginLoad();
    }

    Update();
    return result;
}

void TransitionController::Update() {
    if (m_updating) {
        return;
    }
    UpdatingScope updating(m_updating);
    try {
        while (IsBusy() && Advance()) {
        }
    } catch (...) {
        Fail(std::current_exception());
    }
}

bool TransitionController::Advance() {
    switch (m_phase) {
        case TransitionPhase::Idle:
            return false;

        case TransitionPhase::TearingDown:
            if (!m_waitingOn.IsReady()) {
                return false;
            }
            if (m_waitingOn.IsFailed()) {
                FailHook(content::HookKind::Teardown, m_waitingOn.Error());
                return false;
            }
            m_context.events.Emit(TransitionEvents::TeardownDone);
            EnterPhase(TransitionPhase::FadingOut);
            m_waitingOn = m_context.gate.PlayOut();
            return true;

        case TransitionPhase::FadingOut:
            if (!m_waitingOn.IsReady()) {
                return false;
            }
            if (m_waitingOn.IsFailed()) {
                Fail(m_waitingOn.Error());
                return false;
            }
            // Yield the rest of this frame.
            EnterPhase(TransitionPhase::AwaitingCleanupFrame);
            m_waitingOn = {};
            m_cleanupFrame = m_context.frame;
            return false;

        case TransitionPhase::AwaitingCleanupFrame:
            if (m_context.frame <= m_cleanupFrame) {
                return false;
            }
            EnterPhase(TransitionPhase::AwaitingRemoval);
            m_waitingOn = m_context.slot.QueueRemoval();
            return true;

        case TransitionPhase::AwaitingRemoval:
            if (!m_waitingOn.IsReady()) {
                return false;
            }
            if (m_waitingOn.IsFailed()) {
                Fail(m_waitingOn.Error());
                return false;
            }
            BeginLoad();
            return true;

        case TransitionPhase::Loading: {
            if (!m_pendingNode.IsReady()) {
                return false;
            }
            if (m_pendingNode.IsFailed()) {
                FailLoad(m_pendingNode.Error());
                return false;
            }
            content::ContentNodePtr node = m_pendingNode.Get();
            m_pendingNode = {};
            if (!m_context.slot.Attach(node)) {
                FailLoad(std::make_exception_ptr(
                    core::ContentLoadError(node ? node->GetAddress() : std::string{},
                                           fmt::format("content slot refused {}", m_targetDescription))));
                return false;
            }
            m_incoming = std::move(node);
            BeginSetup();
            return true;
        }

        case TransitionPhase::SettingUp:
            if (!m_waitingOn.IsReady()) {
                return false;
            }
            if (m_waitingOn.IsFailed()) {
                FailHook(content::HookKind::Setup, m_waitingOn.Error());
                return false;
            }
            m_context.events.Emit(TransitionEvents::SetupDone);
            EnterPhase(TransitionPhase::FadingIn);
            m_waitingOn = m_context.gate.PlayIn();
            return true;

        case TransitionPhase::FadingIn:
            if (!m_waitingOn.IsReady()) {
                return false;
            }
            if (m_waitingOn.IsFailed()) {
                Fail(m_waitingOn.Error());
                return false;
            }
            m_context.pause.SetPaused(false);
            BeginStart();
            return true;

        case TransitionPhase::Starting:
            if (!m_waitingOn.IsReady()) {
                return false;
            }
            if (m_waitingOn.IsFailed()) {
                FailHook(content::HookKind::Start, m_waitingOn.Error());
                return false;
            }
            m_context.events.Emit(TransitionEvents::StartDone);
            Finish();
            return false;
    }
    return false;
}

void TransitionController::BeginTeardown() {
    EnterPhase(TransitionPhase::TearingDown);
    m_waitingOn = m_context.hooks.Invoke(m_context.slot.GetActive().get(), content::HookKind::Teardown);
}

void TransitionController::BeginLoad() {
    EnterPhase(TransitionPhase::Loading);
    try {
        m_pendingNode = m_context.loader.Resolve(*m_target);
    } catch (...) {
        m_pendingNode = core::Task<content::ContentNodePtr>::Rejected(std::current_exception());
    }
}

void TransitionController::BeginSetup() {
    EnterPhase(TransitionPhase::SettingUp);
    m_waitingOn = m_context.hooks.Invoke(m_incoming.get(), content::HookKind::Setup, m_params);
}

void TransitionController::BeginStart() {
    EnterPhase(TransitionPhase::Starting);
    m_waitingOn = m_context.hooks.Invoke(m_incoming.get(), content::HookKind::Start);
}

void TransitionController::EnterPhase(TransitionPhase phase) {
    core::Logger::Debug("[TransitionController] {} -> {}", ToString(m_phase), ToString(phase));
    m_phase = phase;
}

void TransitionController::FailHook(content::HookKind kind, std::exception_ptr error) {
    const std::string nodeName = kind == content::HookKind::Teardown
        ? (m_context.slot.GetActive() ? m_context.slot.GetActive()->GetName() : std::string{})
        : (m_incoming ? m_incoming->GetName() : std::string{});
    Fail(std::make_exception_ptr(core::HookError(content::ToString(kind), nodeName, DescribeError(error))));
}

void TransitionController::FailLoad(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const core::ContentLoadError&) {
        Fail(error);
    } catch (const std::exception& e) {
        Fail(std::make_exception_ptr(core::ContentLoadError(m_targetDescription, e.what())));
    } catch (...) {
        Fail(std::make_exception_ptr(core::ContentLoadError(m_targetDescription, "non-standard exception")));
    }
}

void TransitionController::Fail(std::exception_ptr error) {
    core::Logger::Error("[TransitionController] Transition to {} failed while {}: {}",
                        m_targetDescription, ToString(m_phase), DescribeError(error));
    ++m_failedCount;

    std::optional<core::TaskSource<bool>> result = std::move(m_result);
    Reset();

    m_context.events.Emit(TransitionEvents::TransitionFailed);
    if (result) {
        result->Fail(std::move(error));
    }
}

void TransitionController::Finish() {
    core::Logger::Info("[TransitionController] Transition to {} complete", m_targetDescription);
    ++m_completedCount;

    std::optional<core::TaskSource<bool>> result = std::move(m_result);
    Reset();

    if (result) {
        result->Complete(true);
    }
}

void TransitionController::Reset() {
    EnterPhase(TransitionPhase::Idle);
    m_target.reset();
    m_targetDescription.clear();
    m_params.clear();
    m_incoming.reset();
    m_waitingOn = {};
    m_pendingNode = {};
    m_result.reset();
}

} // namespace sh::transition
