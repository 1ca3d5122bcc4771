/**
 * @file PriceResolver.hpp
 * @brief Identity -> market price distribution, with caching and noise filtering.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/AdvisoryService.hpp"
#include "domain/CardIdentity.hpp"
#include "domain/PriceSnapshot.hpp"
#include "domain/SoldListingSearch.hpp"
#include "infrastructure/PriceCache.hpp"

namespace bidlens::application {

struct PriceResolverOptions {
    double fuzzyThreshold = 0.7;     ///< Minimum token-set ratio between a title and the query.
    std::size_t maxQueryLength = 60; ///< Hard cap for model-compacted queries.
};

/**
 * @class PriceResolver
 * @brief Cache lookup, query construction, search, one broadened retry, fuzzy filter, statistics.
 *
 * Search failures are logged and treated as zero results but are not cached;
 * a successful search with no sales is cached like any other snapshot. The
 * miss path is serialized so concurrent calls for one identity produce a
 * single search.
 */
class PriceResolver {
public:
    /**
     * @param cache Shared snapshot cache.
     * @param search Marketplace backend; null when no credentials were configured.
     * @param advisory Optional model used to compact queries.
     */
    PriceResolver(std::shared_ptr<infrastructure::PriceCache> cache,
                  std::shared_ptr<domain::SoldListingSearch> search,
                  std::shared_ptr<domain::AdvisoryService> advisory = nullptr,
                  PriceResolverOptions options = {});

    domain::PriceSnapshot resolve(const domain::CardIdentity& identity);

    /** @brief Compacted query when the model is available, plain concatenation otherwise. */
    std::string buildQuery(const domain::CardAttributes& attributes);

    bool hasSearch() const { return m_search != nullptr; }

    /** @brief Stable cache key over name, year, set, grade and item number. */
    static std::string CacheKey(const domain::CardAttributes& attributes);

    /** @brief "name year set #item grade", skipping empty fields. */
    static std::string PlainQuery(const domain::CardAttributes& attributes);

    /** @brief Keeps listings whose title is similar enough to the query. */
    static std::vector<domain::PriceComparable> FilterByTitle(const std::vector<domain::PriceComparable>& listings,
                                                              const std::string& query,
                                                              double threshold,
                                                              bool& applied);

private:
    /// nullopt when the backend threw.
    std::optional<std::vector<domain::PriceComparable>> searchSafely(const std::string& query);
    std::string compactQuery(const domain::CardAttributes& attributes);

    std::shared_ptr<infrastructure::PriceCache> m_cache;
    std::shared_ptr<domain::SoldListingSearch> m_search;
    std::shared_ptr<domain::AdvisoryService> m_advisory;
    PriceResolverOptions m_options;
    std::mutex m_missMutex;
};

} // namespace bidlens::application
