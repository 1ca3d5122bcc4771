/**
 * @file PriceCache.cpp
 * @brief Implementation of PriceCache.
 */

#include "infrastructure/PriceCache.hpp"
#include "infrastructure/ResultJson.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace bidlens::infrastructure {

PriceCache::PriceCache(const std::string& cacheFile, std::chrono::hours ttl)
    : m_cacheFile(cacheFile), m_ttl(ttl) {}

std::int64_t PriceCache::NowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool PriceCache::isFresh(const domain::PriceSnapshot& snapshot, std::int64_t nowSeconds) const {
    const std::int64_t ttlSeconds = std::chrono::duration_cast<std::chrono::seconds>(m_ttl).count();
    return nowSeconds - snapshot.cachedAt < ttlSeconds;
}

std::optional<domain::PriceSnapshot> PriceCache::get(const std::string& key, std::int64_t nowSeconds) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it != m_entries.end() && isFresh(it->second, nowSeconds)) {
        return it->second;
    }
    return std::nullopt;
}

void PriceCache::put(const std::string& key, const domain::PriceSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[key] = snapshot;
}

std::size_t PriceCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void PriceCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

void PriceCache::persist() const {
    if (m_cacheFile.empty()) return;

    json j = json::object();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [key, snapshot] : m_entries) {
            j[key] = snapshot;
        }
    }

    fs::path finalPath = m_cacheFile;
    fs::path tempPath = finalPath;
    tempPath += ".tmp";
    try {
        if (finalPath.has_parent_path()) {
            fs::create_directories(finalPath.parent_path());
        }
        {
            std::ofstream ofs(tempPath);
            if (!ofs.is_open()) {
                std::cerr << "[PriceCache] Failed to open temp file: " << tempPath << std::endl;
                return;
            }
            ofs << j.dump(2);
        }
        fs::rename(tempPath, finalPath);
    } catch (const std::exception& e) {
        std::cerr << "[PriceCache] Persist failed: " << e.what() << std::endl;
    }
}

void PriceCache::load() {
    if (m_cacheFile.empty() || !fs::exists(m_cacheFile)) return;

    try {
        std::ifstream f(m_cacheFile);
        if (!f.is_open()) return;

        json j = json::parse(f);
        const std::int64_t now = NowSeconds();
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
        for (auto it = j.begin(); it != j.end(); ++it) {
            auto snapshot = it.value().get<domain::PriceSnapshot>();
            if (isFresh(snapshot, now)) {
                m_entries[it.key()] = snapshot;
            }
        }
        std::cout << "[PriceCache] Loaded " << m_entries.size() << " cached price snapshot(s)." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[PriceCache] Error reading " << m_cacheFile << ": " << e.what() << std::endl;
    }
}

} // namespace bidlens::infrastructure
