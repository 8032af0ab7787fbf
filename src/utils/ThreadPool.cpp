#include "sh/utils/ThreadPool.hpp"

#include "sh/core/Logger.hpp"

namespace sh::utils {

ThreadPool::ThreadPool(std::size_t threadCount, std::string name)
    : m_name(std::move(name)) {
    if (threadCount == 0) {
        threadCount = 1;
    }
    m_workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        m_workers.emplace_back([this]() { WorkerLoop(); });
    }
    core::Logger::Debug("[ThreadPool] '{}' started with {} thread(s)", m_name, threadCount);
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

std::size_t ThreadPool::PendingTaskCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping && m_workers.empty()) {
            return;
        }
        m_stopping = true;
    }
    m_condition.notify_all();
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait(lock, [this]() { return m_stopping || !m_tasks.empty(); });
            if (m_stopping && m_tasks.empty()) {
                return;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop();
        }
        // packaged_task captures exceptions into the future.
        task();
    }
}

} // namespace sh::utils
