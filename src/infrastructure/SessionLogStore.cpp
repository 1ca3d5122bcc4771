/**
 * @file SessionLogStore.cpp
 * @brief Implementation of SessionLogStore.
 */

#include "infrastructure/SessionLogStore.hpp"
#include "infrastructure/ResultJson.hpp"
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace bidlens::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

SessionLogStore::SessionLogStore(const std::string& directory, std::size_t capacity)
    : m_directory(directory), m_capacity(capacity == 0 ? 1 : capacity), m_running(true) {
    m_worker = std::thread(&SessionLogStore::workerLoop, this);
}

SessionLogStore::~SessionLogStore() {
    stop();
}

void SessionLogStore::stop() {
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

std::string SessionLogStore::pathFor(const std::string& sessionId) const {
    std::string safe;
    safe.reserve(sessionId.size());
    for (char ch : sessionId) {
        unsigned char c = static_cast<unsigned char>(ch);
        safe.push_back(std::isalnum(c) || ch == '-' || ch == '_' ? ch : '_');
    }
    return (fs::path(m_directory) / (safe + ".json")).string();
}

void SessionLogStore::append(const domain::FrameResult& result) {
    json entry = result;
    std::string content;
    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        auto& entries = m_sessions[result.sessionId];
        entries.push_front(std::move(entry));
        while (entries.size() > m_capacity) {
            entries.pop_back();
        }
        if (!m_directory.empty()) {
            json doc = {
                {"session_id", result.sessionId},
                {"results", json::array()}
            };
            for (const auto& e : entries) doc["results"].push_back(e);
            content = doc.dump(2);
        }
    }

    if (content.empty()) return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_queue.push(SaveTask{pathFor(result.sessionId), std::move(content)});
    }
    m_cv.notify_one();
}

std::optional<std::vector<json>> SessionLogStore::history(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) return std::nullopt;
    return std::vector<json>(it->second.begin(), it->second.end());
}

std::vector<std::string> SessionLogStore::sessions() const {
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    std::vector<std::string> ids;
    for (const auto& [id, entries] : m_sessions) {
        ids.push_back(id);
    }
    return ids;
}

void SessionLogStore::loadExisting() {
    if (m_directory.empty() || !fs::exists(m_directory)) return;

    std::size_t loaded = 0;
    for (const auto& file : fs::directory_iterator(m_directory)) {
        if (!file.is_regular_file() || file.path().extension() != ".json") continue;
        try {
            std::ifstream f(file.path());
            json doc = json::parse(f);
            const std::string id = doc.value("session_id", file.path().stem().string());
            std::deque<json> entries;
            if (doc.contains("results") && doc["results"].is_array()) {
                for (const auto& e : doc["results"]) {
                    if (entries.size() >= m_capacity) break;
                    entries.push_back(e);
                }
            }
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            m_sessions[id] = std::move(entries);
            ++loaded;
        } catch (const std::exception& e) {
            std::cerr << "[SessionLogStore] Skipping unreadable " << file.path() << ": " << e.what() << std::endl;
        }
    }
    if (loaded > 0) {
        std::cout << "[SessionLogStore] Loaded " << loaded << " session log(s)." << std::endl;
    }
}

void SessionLogStore::workerLoop() {
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

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        performAtomicWrite(task);
    }
}

void SessionLogStore::performAtomicWrite(const SaveTask& task) {
    fs::path finalPath = task.filename;
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[SessionLogStore] Error creating directories: " << e.what() << std::endl;
        return;
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[SessionLogStore] Failed to open temp file: " << tempPath << std::endl;
            return;
        }
        ofs << task.content;
        if (ofs.fail()) {
            std::cerr << "[SessionLogStore] Write failed: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[SessionLogStore] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
    }
}

} // namespace bidlens::infrastructure
