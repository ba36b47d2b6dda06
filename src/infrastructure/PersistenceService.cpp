/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/GraphErrors.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace orion::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

std::future<void> PersistenceService::saveText(const std::string& filename, const std::string& content) {
    SaveTask task;
    task.filename = filename;
    task.content = content;
    std::future<void> done = task.done.get_future();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            throw domain::StorageError::transactionFailed("write " + filename, "persistence service stopped");
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
    return done;
}

void PersistenceService::saveTextSync(const std::string& filename, const std::string& content) {
    saveText(filename, content).get();
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            if (m_queue.empty()) {
                continue;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        // Process outside lock
        try {
            performAtomicWrite(task);
            task.done.set_value();
        } catch (const std::exception& e) {
            std::cerr << "[PersistenceService] " << e.what() << std::endl;
            task.done.set_exception(std::current_exception());
        }
    }
}

void PersistenceService::performAtomicWrite(const SaveTask& task) {
    fs::path finalPath = task.filename;

    // Unique temp path per operation: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw domain::StorageError::transactionFailed("create directories for " + task.filename, ec.message());
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            throw domain::StorageError::transactionFailed("write " + task.filename, "cannot open temp file");
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::StorageError::transactionFailed("write " + task.filename, "write failed");
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw domain::StorageError::transactionFailed("rename " + task.filename, ec.message());
    }
}

} // namespace orion::infrastructure
