#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sh::core {

/**
 * @brief Synchronous named-event broadcaster.
 *
 * Subscribers are invoked in registration order on the emitting thread. There
 * is no buffering: an event emitted with no subscribers is simply dropped.
 * Callbacks may subscribe or unsubscribe while an emit is in flight; new
 * subscribers only see the next emit. A subscriber that throws is logged and
 * the remaining subscribers still run.
 */
class EventBus {
public:
    using EventCallback = std::function<void()>;
    using SubscriptionId = std::uint64_t;

    class SubscriptionHandle {
    public:
        SubscriptionHandle() = default;
        SubscriptionHandle(const SubscriptionHandle&) = delete;
        SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;
        SubscriptionHandle(SubscriptionHandle&& other) noexcept;
        SubscriptionHandle& operator=(SubscriptionHandle&& other) noexcept;
        ~SubscriptionHandle() = default;

        bool IsValid() const { return m_bus != nullptr && m_id != 0; }
        explicit operator bool() const { return IsValid(); }
        SubscriptionId Id() const { return m_id; }
        const std::string& EventName() const { return m_eventName; }

        // Unsubscribes from the owning bus.
        void Reset();

    private:
        friend class EventBus;
        SubscriptionHandle(EventBus* bus, std::string eventName, SubscriptionId id);
        void Release();

        EventBus* m_bus = nullptr;
        std::string m_eventName;
        SubscriptionId m_id = 0;
    };

    // Unsubscribes automatically when it goes out of scope.
    class ScopedSubscription {
    public:
        ScopedSubscription() = default;
        explicit ScopedSubscription(SubscriptionHandle handle);
        ScopedSubscription(const ScopedSubscription&) = delete;
        ScopedSubscription& operator=(const ScopedSubscription&) = delete;
        ScopedSubscription(ScopedSubscription&& other) noexcept = default;
        ScopedSubscription& operator=(ScopedSubscription&& other) noexcept;
        ~ScopedSubscription();

        bool IsValid() const { return m_handle.IsValid(); }
        explicit operator bool() const { return IsValid(); }
        void Reset();

    private:
        SubscriptionHandle m_handle;
    };

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionHandle Subscribe(const std::string& eventName, EventCallback callback);
    void Unsubscribe(SubscriptionHandle& handle);
    void Unsubscribe(const std::string& eventName, SubscriptionId id);

    void Emit(const std::string& eventName);

    std::size_t SubscriberCount(const std::string& eventName) const;
    std::uint64_t EmitCount(const std::string& eventName) const;

private:
    struct CallbackEntry {
        SubscriptionId id = 0;
        EventCallback callback;
        bool active = true;
    };

    void CleanupInactive(std::vector<CallbackEntry>& list);

    std::unordered_map<std::string, std::vector<CallbackEntry>> m_callbacks;
    std::unordered_map<std::string, std::uint64_t> m_emitCounts;
    SubscriptionId m_nextId = 1;
    int m_emitDepth = 0;
};

} // namespace sh::core
