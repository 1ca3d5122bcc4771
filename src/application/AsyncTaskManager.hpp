/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <algorithm>
#include <iostream>
#include <thread>

namespace bidlens::application {

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id = 0;
    std::string description;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Fire-and-forget background execution with unified status tracking.
 *
 * Tasks run on detached threads. The bookkeeping lives in a shared block so a
 * task may outlive the manager without touching freed memory.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() : m_shared(std::make_shared<Shared>()) {}

    /** @brief Submits a new task. The callable receives the status as first argument. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_shared->mutex);
            m_shared->active.push_back(status);
        }

        std::thread([shared = m_shared, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
                std::cerr << "[AsyncTaskManager] Task '" << status->description << "' failed: " << e.what() << std::endl;
            }
            status->isCompleted = true;
            CleanupCompletedTasks(*shared);
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() const {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        return m_shared->active;
    }

    /** @brief Blocks until no task is active or the timeout expires. */
    bool WaitForIdle(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(m_shared->mutex);
        return m_shared->idle.wait_for(lock, timeout, [this] { return m_shared->active.empty(); });
    }

private:
    struct Shared {
        mutable std::mutex mutex;
        std::condition_variable idle;
        std::vector<std::shared_ptr<TaskStatus>> active;
    };

    static void CleanupCompletedTasks(Shared& shared) {
        {
            std::lock_guard<std::mutex> lock(shared.mutex);
            shared.active.erase(
                std::remove_if(shared.active.begin(), shared.active.end(),
                    [](const auto& s) { return s->isCompleted.load(); }),
                shared.active.end()
            );
        }
        shared.idle.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::shared_ptr<Shared> m_shared;
};

} // namespace bidlens::application
