#include "sh/core/EventBus.hpp"

#include "sh/core/Logger.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace sh::core {

namespace {

struct EmitDepthScope {
    explicit EmitDepthScope(int& depth) : m_depth(depth) { ++m_depth; }
    ~EmitDepthScope() { --m_depth; }

    EmitDepthScope(const EmitDepthScope&) = delete;
    EmitDepthScope& operator=(const EmitDepthScope&) = delete;

    int& m_depth;
};

} // namespace

EventBus::SubscriptionHandle::SubscriptionHandle(EventBus* bus, std::string eventName, SubscriptionId id)
    : m_bus(bus)
    , m_eventName(std::move(eventName))
    , m_id(id) {}

EventBus::SubscriptionHandle::SubscriptionHandle(SubscriptionHandle&& other) noexcept
    : m_bus(other.m_bus)
    , m_eventName(std::move(other.m_eventName))
    , m_id(other.m_id) {
    other.Release();
}

EventBus::SubscriptionHandle& EventBus::SubscriptionHandle::operator=(SubscriptionHandle&& other) noexcept {
    if (this != &other) {
        m_bus = other.m_bus;
        m_eventName = std::move(other.m_eventName);
        m_id = other.m_id;
        other.Release();
    }
    return *this;
}

void EventBus::SubscriptionHandle::Reset() {
    if (IsValid()) {
        m_bus->Unsubscribe(m_eventName, m_id);
    }
    Release();
}

void EventBus::SubscriptionHandle::Release() {
    m_bus = nullptr;
    m_eventName.clear();
    m_id = 0;
}

EventBus::ScopedSubscription::ScopedSubscription(SubscriptionHandle handle)
    : m_handle(std::move(handle)) {}

EventBus::ScopedSubscription& EventBus::ScopedSubscription::operator=(ScopedSubscription&& other) noexcept {
    if (this != &other) {
        m_handle.Reset();
        m_handle = std::move(other.m_handle);
    }
    return *this;
}

EventBus::ScopedSubscription::~ScopedSubscription() {
    Reset();
}

void EventBus::ScopedSubscription::Reset() {
    m_handle.Reset();
}

EventBus::SubscriptionHandle EventBus::Subscribe(const std::string& eventName, EventCallback callback) {
    if (!callback) {
        return {};
    }
    const SubscriptionId id = m_nextId++;
    m_callbacks[eventName].push_back(CallbackEntry{ id, std::move(callback), true });
    return SubscriptionHandle(this, eventName, id);
}

void EventBus::Unsubscribe(SubscriptionHandle& handle) {
    handle.Reset();
}

void EventBus::Unsubscribe(const std::string& eventName, SubscriptionId id) {
    if (id == 0) {
        return;
    }
    auto it = m_callbacks.find(eventName);
    if (it == m_callbacks.end()) {
        return;
    }
    for (auto& entry : it->second) {
        if (entry.active && entry.id == id) {
            entry.active = false;
            break;
        }
    }
    CleanupInactive(it->second);
}

void EventBus::Emit(const std::string& eventName) {
    ++m_emitCounts[eventName];

    auto it = m_callbacks.find(eventName);
    if (it == m_callbacks.end()) {
        return;
    }

    {
        EmitDepthScope depth(m_emitDepth);
        // Index-based so callbacks may append to the list while we iterate.
        const std::size_t count = it->second.size();
        for (std::size_t i = 0; i < count; ++i) {
            auto& list = m_callbacks[eventName];
            if (i >= list.size()) {
                break;
            }
            if (!list[i].active || !list[i].callback) {
                continue;
            }
            EventCallback callback = list[i].callback;
            try {
                callback();
            } catch (const std::exception& e) {
                Logger::Error("[EventBus] Subscriber to '{}' threw: {}", eventName, e.what());
            } catch (...) {
                Logger::Error("[EventBus] Subscriber to '{}' threw a non-standard exception", eventName);
            }
        }
    }

    CleanupInactive(m_callbacks[eventName]);
}

std::size_t EventBus::SubscriberCount(const std::string& eventName) const {
    auto it = m_callbacks.find(eventName);
    if (it == m_callbacks.end()) {
        return 0;
    }
    return static_cast<std::size_t>(std::count_if(it->second.begin(), it->second.end(),
                                                  [](const CallbackEntry& entry) { return entry.active; }));
}

std::uint64_t EventBus::EmitCount(const std::string& eventName) const {
    auto it = m_emitCounts.find(eventName);
    return it == m_emitCounts.end() ? 0 : it->second;
}

void EventBus::CleanupInactive(std::vector<CallbackEntry>& list) {
    if (m_emitDepth > 0) {
        return;
    }
    list.erase(std::remove_if(list.begin(), list.end(),
                              [](const CallbackEntry& entry) { return !entry.active || !entry.callback; }),
               list.end());
}

} // namespace sh::core
