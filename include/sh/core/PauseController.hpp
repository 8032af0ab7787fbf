#pragma once

#include <cstdint>

namespace sh::core {

class EventBus;

// Owner of the simulation pause flag. Emits simulation.paused/resumed on change.
class PauseController {
public:
    explicit PauseController(EventBus* events = nullptr);

    void SetPaused(bool paused);
    bool IsPaused() const { return m_paused; }

    std::uint64_t ToggleCount() const { return m_toggleCount; }

private:
    EventBus* m_events = nullptr;
    bool m_paused = false;
    std::uint64_t m_toggleCount = 0;
};

} // namespace sh::core
