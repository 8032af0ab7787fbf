#pragma once

#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace sh::core {

enum class TaskStatus {
    Pending,
    Completed,
    Failed
};

template <typename T>
class TaskSource;

namespace detail {

template <typename T>
using TaskValue = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

template <typename T>
struct TaskState {
    mutable std::mutex mutex;
    TaskStatus status = TaskStatus::Pending;
    std::optional<TaskValue<T>> value;
    std::exception_ptr error;
};

} // namespace detail

/**
 * @brief Handle on the eventual result of an asynchronous operation.
 *
 * A Task never blocks. Consumers poll `IsReady()` once per frame and read the
 * result with `Get()`, which rethrows the stored exception on failure. A
 * default-constructed Task is invalid and reports itself as pending.
 */
template <typename T = void>
class Task {
public:
    using ValueType = detail::TaskValue<T>;

    Task() = default;

    static Task Resolved(ValueType value = ValueType{}) {
        auto state = std::make_shared<detail::TaskState<T>>();
        state->status = TaskStatus::Completed;
        state->value.emplace(std::move(value));
        return Task(std::move(state));
    }

    static Task Rejected(std::exception_ptr error) {
        auto state = std::make_shared<detail::TaskState<T>>();
        state->status = TaskStatus::Failed;
        state->error = std::move(error);
        return Task(std::move(state));
    }

    bool IsValid() const { return static_cast<bool>(m_state); }

    TaskStatus Status() const {
        if (!m_state) {
            return TaskStatus::Pending;
        }
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->status;
    }

    bool IsReady() const { return Status() != TaskStatus::Pending; }
    bool IsCompleted() const { return Status() == TaskStatus::Completed; }
    bool IsFailed() const { return Status() == TaskStatus::Failed; }

    std::exception_ptr Error() const {
        if (!m_state) {
            return nullptr;
        }
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->error;
    }

    T Get() const {
        if (!m_state) {
            throw std::logic_error("Task::Get on an invalid task");
        }
        std::unique_lock<std::mutex> lock(m_state->mutex);
        switch (m_state->status) {
            case TaskStatus::Pending:
                throw std::logic_error("Task::Get on a pending task");
            case TaskStatus::Failed: {
                std::exception_ptr error = m_state->error;
                lock.unlock();
                std::rethrow_exception(error);
            }
            case TaskStatus::Completed:
                break;
        }
        if constexpr (std::is_void_v<T>) {
            return;
        } else {
            return *m_state->value;
        }
    }

private:
    friend class TaskSource<T>;

    explicit Task(std::shared_ptr<detail::TaskState<T>> state)
        : m_state(std::move(state)) {}

    std::shared_ptr<detail::TaskState<T>> m_state;
};

/**
 * @brief Producer side of a Task. The first Complete/Fail wins.
 */
template <typename T = void>
class TaskSource {
public:
    using ValueType = detail::TaskValue<T>;

    TaskSource()
        : m_state(std::make_shared<detail::TaskState<T>>()) {}

    Task<T> GetTask() const { return Task<T>(m_state); }

    bool Complete(ValueType value = ValueType{}) {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->status != TaskStatus::Pending) {
            return false;
        }
        m_state->value.emplace(std::move(value));
        m_state->status = TaskStatus::Completed;
        return true;
    }

    bool Fail(std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->status != TaskStatus::Pending) {
            return false;
        }
        m_state->error = std::move(error);
        m_state->status = TaskStatus::Failed;
        return true;
    }

    bool IsPending() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->status == TaskStatus::Pending;
    }

private:
    std::shared_ptr<detail::TaskState<T>> m_state;
};

} // namespace sh::core
