#pragma once

#include <cstddef>
#include <filesystem>
#include <future>
#include <string>
#include <unordered_map>
#include <vector>

#include "sh/content/ContentNode.hpp"
#include "sh/content/ContentTemplate.hpp"
#include "sh/content/TransitionTarget.hpp"
#include "sh/core/Task.hpp"
#include "sh/utils/Config.hpp"
#include "sh/utils/ThreadPool.hpp"

namespace sh::content {

class BehaviourRegistry;

enum class LoadStatus {
    InvalidResource,  // never requested
    InProgress,
    Loaded,
    Failed
};

const char* ToString(LoadStatus status);

/**
 * @brief Turns a TransitionTarget into an instantiated ContentNode.
 *
 * Identifier targets are decoded on a worker pool; Poll() must be called once
 * per frame from the thread that owns the stage to instantiate finished loads
 * and resolve their tasks. Failures resolve the task with a
 * core::ContentLoadError; nothing is ever partially attached.
 */
class ContentLoader {
public:
    ContentLoader(utils::LoaderConfig config, const BehaviourRegistry& behaviours);
    ~ContentLoader();

    ContentLoader(const ContentLoader&) = delete;
    ContentLoader& operator=(const ContentLoader&) = delete;

    core::Task<ContentNodePtr> Resolve(const TransitionTarget& target);

    void Poll();

    // Address convention
    bool IsFullyQualified(const std::string& identifier) const;
    std::string ResolveAddress(const std::string& identifier) const;
    std::filesystem::path AddressToPath(const std::string& address) const;

    LoadStatus GetStatus(const std::string& address) const;
    std::size_t PendingLoadCount() const { return m_pending.size(); }
    bool HasPendingLoads() const { return !m_pending.empty(); }

    std::size_t CachedTemplateCount() const { return m_cache.size(); }
    void ClearCache();

    const utils::LoaderConfig& GetConfig() const { return m_config; }

private:
    struct PendingLoad {
        std::string address;
        std::future<ContentTemplatePtr> decode;
        std::vector<core::TaskSource<ContentNodePtr>> waiters;
    };

    core::Task<ContentNodePtr> ResolveIdentifier(const std::string& identifier);
    core::Task<ContentNodePtr> InstantiateNow(const ContentTemplate& resource);
    void FinishLoad(PendingLoad& load);

    utils::LoaderConfig m_config;
    const BehaviourRegistry& m_behaviours;
    utils::ThreadPool m_workers;
    std::vector<PendingLoad> m_pending;
    std::unordered_map<std::string, ContentTemplatePtr> m_cache;
    std::unordered_map<std::string, LoadStatus> m_status;
};

} // namespace sh::content
