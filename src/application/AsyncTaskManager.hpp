/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <algorithm>
#include <iostream>
#include <thread>

namespace orion::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Projection
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Fire-and-forget execution with unified status tracking.
 *
 * Task failures are recorded and logged, never rethrown to the submitter.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        WaitForIdle();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Submits a new task; f receives the task status as first argument. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
            m_running++;
        }

        std::thread([this, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
            } catch (...) {
                status->failed = true;
                status->errorMessage = "Unknown error during task execution.";
            }
            if (status->failed) {
                std::cerr << "[AsyncTaskManager] Task failed (" << status->description << "): "
                          << status->errorMessage << std::endl;
            }
            status->isCompleted = true;
            finishTask();
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Returns running tasks and completed ones not yet cleaned up. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Blocks until every submitted task has finished. */
    void WaitForIdle() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idle.wait(lock, [this] { return m_running == 0; });
    }

    /** @brief Forgets completed tasks, failed ones included. */
    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
    }

private:
    void finishTask() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_running--;
        m_idle.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
    std::condition_variable m_idle;
    int m_running = 0;
};

} // namespace orion::application
