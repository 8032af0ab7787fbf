#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace sh::utils {

class ThreadPool {
public:
    explicit ThreadPool(std::size_t threadCount = 1, std::string name = "worker");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t ThreadCount() const { return m_workers.size(); }
    std::size_t PendingTaskCount() const;
    const std::string& GetName() const { return m_name; }

    // Drains queued work and joins the workers. Further Submit calls throw.
    void Shutdown();

    template <typename Func, typename... Args>
    auto Submit(Func&& func, Args&&... args)
        -> std::future<std::invoke_result_t<std::decay_t<Func>, std::decay_t<Args>...>> {
        using ResultType = std::invoke_result_t<std::decay_t<Func>, std::decay_t<Args>...>;

        auto task = std::make_shared<std::packaged_task<ResultType()>>(
            [func = std::forward<Func>(func),
             bound = std::make_tuple(std::forward<Args>(args)...)]() mutable -> ResultType {
                return std::apply(func, std::move(bound));
            });

        std::future<ResultType> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                throw std::runtime_error("ThreadPool::Submit on stopped pool '" + m_name + "'");
            }
            m_tasks.emplace([task]() { (*task)(); });
        }
        m_condition.notify_one();
        return future;
    }

private:
    void WorkerLoop();

    std::string m_name;
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    bool m_stopping = false;
};

} // namespace sh::utils
