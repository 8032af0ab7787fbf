#include "sh/content/ContentLoader.hpp"

#include "sh/content/BehaviourRegistry.hpp"
#include "sh/core/Error.hpp"
#include "sh/core/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

#include <fmt/format.h>

namespace sh::content {

const char* ToString(LoadStatus status) {
    switch (status) {
        case LoadStatus::InvalidResource: return "invalid";
        case LoadStatus::InProgress:      return "in-progress";
        case LoadStatus::Loaded:          return "loaded";
        case LoadStatus::Failed:          return "failed";
    }
    return "unknown";
}

ContentLoader::ContentLoader(utils::LoaderConfig config, const BehaviourRegistry& behaviours)
    : m_config(std::move(config))
    , m_behaviours(behaviours)
    , m_workers(static_cast<std::size_t>(std::max(1, m_config.workerThreads)), "content-decode") {}

ContentLoader::~ContentLoader() {
    m_workers.Shutdown();
    for (auto& load : m_pending) {
        for (auto& waiter : load.waiters) {
            waiter.Fail(std::make_exception_ptr(
                core::ContentLoadError(load.address, "loader destroyed before the load finished")));
        }
    }
}

core::Task<ContentNodePtr> ContentLoader::Resolve(const TransitionTarget& target) {
    return std::visit(Overloaded{
        [](const AlreadyBuilt& built) -> core::Task<ContentNodePtr> {
            if (!built.node) {
                return core::Task<ContentNodePtr>::Rejected(std::make_exception_ptr(
                    core::ContentLoadError("<already-built>", "target holds no node")));
            }
            return core::Task<ContentNodePtr>::Resolved(built.node);
        },
        [this](const Identifier& identifier) {
            return ResolveIdentifier(identifier.id);
        },
        [this](const Template& tmpl) -> core::Task<ContentNodePtr> {
            if (!tmpl.resource) {
                return core::Task<ContentNodePtr>::Rejected(std::make_exception_ptr(
                    core::ContentLoadError("<template>", "target holds no template")));
            }
            return InstantiateNow(*tmpl.resource);
        },
    }, target);
}

bool ContentLoader::IsFullyQualified(const std::string& identifier) const {
    return identifier.rfind(m_config.scheme, 0) == 0;
}

std::string ContentLoader::ResolveAddress(const std::string& identifier) const {
    if (IsFullyQualified(identifier)) {
        return identifier;
    }
    return fmt::format("{}/{}/{}", m_config.baseAddress, identifier, m_config.entryName);
}

std::filesystem::path ContentLoader::AddressToPath(const std::string& address) const {
    std::string relative = IsFullyQualified(address) ? address.substr(m_config.scheme.size()) : address;
    while (!relative.empty() && relative.front() == '/') {
        relative.erase(relative.begin());
    }
    return (m_config.contentRoot / std::filesystem::path(relative)).lexically_normal();
}

LoadStatus ContentLoader::GetStatus(const std::string& address) const {
    auto it = m_status.find(address);
    return it == m_status.end() ? LoadStatus::InvalidResource : it->second;
}

void ContentLoader::ClearCache() {
    m_cache.clear();
}

core::Task<ContentNodePtr> ContentLoader::ResolveIdentifier(const std::string& identifier) {
    if (identifier.empty()) {
        return core::Task<ContentNodePtr>::Rejected(std::make_exception_ptr(
            core::ContentLoadError("<empty>", "identifier must not be empty")));
    }

    const std::string address = ResolveAddress(identifier);

    if (m_config.cacheTemplates) {
        auto cached = m_cache.find(address);
        if (cached != m_cache.end()) {
            core::Logger::Debug("[ContentLoader] Cache hit for '{}'", address);
            return InstantiateNow(*cached->second);
        }
    }

    core::TaskSource<ContentNodePtr> waiter;
    core::Task<ContentNodePtr> task = waiter.GetTask();

    auto inFlight = std::find_if(m_pending.begin(), m_pending.end(),
                                 [&address](const PendingLoad& load) { return load.address == address; });
    if (inFlight != m_pending.end()) {
        inFlight->waiters.push_back(std::move(waiter));
        return task;
    }

    const std::filesystem::path path = AddressToPath(address);
    core::Logger::Info("[ContentLoader] Loading '{}' from {}", address, path.string());

    PendingLoad load;
    load.address = address;
    load.decode = m_workers.Submit([path, address]() { return ContentTemplate::FromFile(path, address); });
    load.waiters.push_back(std::move(waiter));
    m_pending.push_back(std::move(load));
    m_status[address] = LoadStatus::InProgress;
    return task;
}

core::Task<ContentNodePtr> ContentLoader::InstantiateNow(const ContentTemplate& resource) {
    try {
        return core::Task<ContentNodePtr>::Resolved(resource.Instantiate(m_behaviours));
    } catch (const core::ContentLoadError&) {
        return core::Task<ContentNodePtr>::Rejected(std::current_exception());
    } catch (const std::exception& e) {
        const std::string address = resource.GetSourceAddress().empty() ? resource.GetName()
                                                                        : resource.GetSourceAddress();
        return core::Task<ContentNodePtr>::Rejected(std::make_exception_ptr(
            core::ContentLoadError(address, fmt::format("behaviour binding threw: {}", e.what()))));
    }
}

void ContentLoader::Poll() {
    // Finished loads are moved out first: resolving a waiter may start new loads.
    std::vector<PendingLoad> finished;
    for (auto it = m_pending.begin(); it != m_pending.end();) {
        if (it->decode.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            finished.push_back(std::move(*it));
            it = m_pending.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& load : finished) {
        FinishLoad(load);
    }
}

void ContentLoader::FinishLoad(PendingLoad& load) {
    ContentTemplatePtr resource;
    std::exception_ptr error;
    try {
        resource = load.decode.get();
    } catch (const core::ContentLoadError& e) {
        core::Logger::Error("[ContentLoader] Failed to load '{}': {}", load.address, e.details());
        error = std::current_exception();
    } catch (const std::exception& e) {
        core::Logger::Error("[ContentLoader] Failed to load '{}': {}", load.address, e.what());
        error = std::make_exception_ptr(core::ContentLoadError(load.address, e.what()));
    }

    if (error) {
        m_status[load.address] = LoadStatus::Failed;
        for (auto& waiter : load.waiters) {
            waiter.Fail(error);
        }
        return;
    }

    m_status[load.address] = LoadStatus::Loaded;
    if (m_config.cacheTemplates) {
        m_cache[load.address] = resource;
    }
    core::Logger::Debug("[ContentLoader] Decoded '{}' ({} waiter(s))", load.address, load.waiters.size());

    for (auto& waiter : load.waiters) {
        core::Task<ContentNodePtr> instance = InstantiateNow(*resource);
        if (instance.IsFailed()) {
            m_status[load.address] = LoadStatus::Failed;
            core::Logger::Error("[ContentLoader] Failed to instantiate '{}'", load.address);
            waiter.Fail(instance.Error());
        } else {
            waiter.Complete(instance.Get());
        }
    }
}

} // namespace sh::content
