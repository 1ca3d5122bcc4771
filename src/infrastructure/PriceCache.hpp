/**
 * @file PriceCache.hpp
 * @brief Persistent cache of price snapshots keyed by identity hash.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "domain/PriceSnapshot.hpp"

namespace bidlens::infrastructure {

/**
 * @class PriceCache
 * @brief Avoids repeating marketplace searches for an item already priced.
 *
 * Entries older than the TTL are treated as absent. All access goes through
 * one mutex. An empty file path keeps the cache in memory only.
 */
class PriceCache {
public:
    explicit PriceCache(const std::string& cacheFile = "", std::chrono::hours ttl = std::chrono::hours(12));

    /** @brief Returns a fresh entry. @param nowSeconds Unix time used for the expiry check. */
    std::optional<domain::PriceSnapshot> get(const std::string& key, std::int64_t nowSeconds) const;
    std::optional<domain::PriceSnapshot> get(const std::string& key) const { return get(key, NowSeconds()); }

    /** @brief Stores a snapshot; its cachedAt decides expiry. */
    void put(const std::string& key, const domain::PriceSnapshot& snapshot);

    std::size_t size() const;
    void clear();

    /** @brief Writes all entries to the cache file (temp file + rename). */
    void persist() const;

    /** @brief Loads the cache file, dropping expired entries. */
    void load();

    std::chrono::hours ttl() const { return m_ttl; }

    static std::int64_t NowSeconds();

private:
    bool isFresh(const domain::PriceSnapshot& snapshot, std::int64_t nowSeconds) const;

    std::string m_cacheFile;
    std::chrono::hours m_ttl;
    std::map<std::string, domain::PriceSnapshot> m_entries;
    mutable std::mutex m_mutex;
};

} // namespace bidlens::infrastructure
