#include "sh/core/PauseController.hpp"

#include "sh/core/EventBus.hpp"
#include "sh/core/Logger.hpp"
#include "sh/core/TransitionEvents.hpp"

namespace sh::core {

PauseController::PauseController(EventBus* events)
    : m_events(events) {}

void PauseController::SetPaused(bool paused) {
    if (m_paused == paused) {
        return;
    }
    m_paused = paused;
    ++m_toggleCount;
    Logger::Debug("[PauseController] Simulation {}", paused ? "paused" : "resumed");

    if (m_events) {
        m_events->Emit(paused ? TransitionEvents::SimulationPaused : TransitionEvents::SimulationResumed);
    }
}

} // namespace sh::core
