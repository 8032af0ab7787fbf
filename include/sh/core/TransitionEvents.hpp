#pragma once

namespace sh {

/**
 * @brief Event names emitted on the stage EventBus.
 *
 * The three hook notifications carry no payload; subscribers query the
 * ContentSlot if they need the node involved.
 */
namespace TransitionEvents {

// Content lifecycle
constexpr const char* TeardownDone = "teardown-done";
constexpr const char* SetupDone = "setup-done";
constexpr const char* StartDone = "start-done";

// Orchestration
constexpr const char* TransitionFailed = "transition.failed";

// Simulation
constexpr const char* SimulationPaused = "simulation.paused";
constexpr const char* SimulationResumed = "simulation.resumed";

} // namespace TransitionEvents

} // namespace sh
