#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "sh/core/Task.hpp"

namespace sh::content {

enum class HookKind {
    Teardown,
    Setup,
    Start
};

std::string_view ToString(HookKind kind);

using ParamList = std::vector<nlohmann::json>;

class ContentSlot;

/**
 * @brief A unit of active content (a screen, menu or level).
 *
 * Each lifecycle hook is independently optional. Hooks return a Task so they
 * can run for any number of frames (driving a loading screen, waiting on
 * input); the transition pipeline waits on that task before moving on.
 */
class ContentNode {
public:
    using TeardownHook = std::function<core::Task<void>()>;
    using SetupHook = std::function<core::Task<void>(const ParamList&)>;
    using StartHook = std::function<core::Task<void>()>;
    using UpdateCallback = std::function<void(ContentNode&, float)>;
    using DestroyCallback = std::function<void(ContentNode&)>;

    explicit ContentNode(std::string name, std::string address = {});
    ~ContentNode() = default;

    ContentNode(const ContentNode&) = delete;
    ContentNode& operator=(const ContentNode&) = delete;

    const std::string& GetName() const { return m_name; }
    const std::string& GetAddress() const { return m_address; }

    nlohmann::json& Properties() { return m_properties; }
    const nlohmann::json& Properties() const { return m_properties; }

    // Hooks
    void SetTeardownHook(TeardownHook hook) { m_teardown = std::move(hook); }
    void SetSetupHook(SetupHook hook) { m_setup = std::move(hook); }
    void SetStartHook(StartHook hook) { m_start = std::move(hook); }
    void ClearHook(HookKind kind);

    bool HasHook(HookKind kind) const;

    /**
     * @brief Run a hook. An absent hook returns an already-resolved task.
     *
     * Exceptions thrown by the hook propagate to the caller.
     */
    core::Task<void> InvokeHook(HookKind kind, const ParamList& params);

    // Per-frame simulation
    void SetUpdateCallback(UpdateCallback callback) { m_update = std::move(callback); }
    void Update(float deltaTime);
    float GetSimulatedTime() const { return m_simulatedTime; }
    std::uint64_t GetUpdateCount() const { return m_updateCount; }

    // Removal
    void SetDestroyCallback(DestroyCallback callback) { m_onDestroy = std::move(callback); }
    bool IsAttached() const { return m_attached; }
    bool IsDestroyed() const { return m_destroyed; }

private:
    friend class ContentSlot;

    void SetAttached(bool attached) { m_attached = attached; }
    void Destroy();

    std::string m_name;
    std::string m_address;
    nlohmann::json m_properties = nlohmann::json::object();

    TeardownHook m_teardown;
    SetupHook m_setup;
    StartHook m_start;
    UpdateCallback m_update;
    DestroyCallback m_onDestroy;

    float m_simulatedTime = 0.0f;
    std::uint64_t m_updateCount = 0;
    bool m_attached = false;
    bool m_destroyed = false;
};

using ContentNodePtr = std::shared_ptr<ContentNode>;

} // namespace sh::content
