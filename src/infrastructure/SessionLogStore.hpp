/**
 * @file SessionLogStore.hpp
 * @brief Capped per-session result history with serialized, atomic file writes.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/FrameResult.hpp"

namespace bidlens::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class SessionLogStore
 * @brief Keeps the most recent results of every session, newest first.
 *
 * Each append enqueues a snapshot of the session's history for a background
 * thread that writes `<directory>/<session>.json` via temp file + rename.
 * An empty directory keeps everything in memory.
 */
class SessionLogStore {
public:
    explicit SessionLogStore(const std::string& directory = "", std::size_t capacity = 50);
    ~SessionLogStore();

    SessionLogStore(const SessionLogStore&) = delete;
    SessionLogStore& operator=(const SessionLogStore&) = delete;

    /** @brief Records a result under result.sessionId, pruning the oldest beyond capacity. */
    void append(const domain::FrameResult& result);

    /** @brief History newest first, or nullopt for an unknown session. */
    std::optional<std::vector<nlohmann::json>> history(const std::string& sessionId) const;

    std::vector<std::string> sessions() const;

    /** @brief Reads previously written session files from the directory. */
    void loadExisting();

    /** @brief Stops the worker thread after all pending writes are done. */
    void stop();

    std::size_t capacity() const { return m_capacity; }

private:
    void workerLoop();
    void performAtomicWrite(const SaveTask& task);
    std::string pathFor(const std::string& sessionId) const;

    std::string m_directory;
    std::size_t m_capacity;

    std::map<std::string, std::deque<nlohmann::json>> m_sessions;
    mutable std::mutex m_sessionsMutex;

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace bidlens::infrastructure
