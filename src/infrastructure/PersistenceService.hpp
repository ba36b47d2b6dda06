/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <future>
#include <thread>
#include <atomic>

namespace orion::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
    std::promise<void> done;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * All writes pass through a single serialized queue; each one is written to a
 * temporary file and renamed over the target.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues a write and returns a future that completes when it is on disk.
     *
     * The future rethrows domain::StorageError if the write failed.
     */
    std::future<void> saveText(const std::string& filename, const std::string& content);

    /** @brief Writes and waits. @throws domain::StorageError on failure. */
    void saveTextSync(const std::string& filename, const std::string& content);

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     * @throws domain::StorageError
     */
    void performAtomicWrite(const SaveTask& task);

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace orion::infrastructure
