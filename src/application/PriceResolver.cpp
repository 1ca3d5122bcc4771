/**
 * @file PriceResolver.cpp
 * @brief Implementation of the PriceResolver class.
 */
#include "application/PriceResolver.hpp"
#include "domain/PriceStatistics.hpp"
#include "domain/TitleSimilarity.hpp"
#include "infrastructure/ResultJson.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace bidlens::application {

namespace {

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n\"'`");
    if (begin == std::string::npos) return {};
    const auto end = value.find_last_not_of(" \t\r\n\"'`");
    return value.substr(begin, end - begin + 1);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Cuts at the last space that fits, so no word is split.
std::string TruncateAtWord(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) return text;
    std::string cut = text.substr(0, limit);
    const auto lastSpace = cut.find_last_of(' ');
    if (lastSpace != std::string::npos && lastSpace > 0) {
        cut = cut.substr(0, lastSpace);
    }
    return Trim(cut);
}

// 64-bit FNV-1a, fixed so persisted keys survive rebuilds.
std::uint64_t Fnv1a(const std::string& text) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace

PriceResolver::PriceResolver(std::shared_ptr<infrastructure::PriceCache> cache,
                             std::shared_ptr<domain::SoldListingSearch> search,
                             std::shared_ptr<domain::AdvisoryService> advisory,
                             PriceResolverOptions options)
    : m_cache(std::move(cache))
    , m_search(std::move(search))
    , m_advisory(std::move(advisory))
    , m_options(options) {
    if (!m_cache) {
        m_cache = std::make_shared<infrastructure::PriceCache>();
    }
    if (!m_search) {
        std::cerr << "[PriceResolver] No sold-listing search configured. Market data disabled." << std::endl;
    }
}

std::string PriceResolver::CacheKey(const domain::CardAttributes& attributes) {
    domain::CardAttributes normalized;
    normalized.name = ToLower(Trim(attributes.name));
    normalized.year = Trim(attributes.year);
    normalized.setName = ToLower(Trim(attributes.setName));
    normalized.grade = ToLower(Trim(attributes.grade));
    normalized.itemNumber = ToLower(Trim(attributes.itemNumber));
    const std::string canonical = infrastructure::IdentityKeyJson(normalized).dump();
    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << Fnv1a(canonical);
    return out.str();
}

std::string PriceResolver::PlainQuery(const domain::CardAttributes& attributes) {
    std::string query;
    auto append = [&query](const std::string& part) {
        if (part.empty()) return;
        if (!query.empty()) query += " ";
        query += part;
    };
    append(attributes.name);
    append(attributes.year);
    append(attributes.setName);
    if (!attributes.itemNumber.empty()) append("#" + attributes.itemNumber);
    append(attributes.grade);
    return query;
}

std::string PriceResolver::compactQuery(const domain::CardAttributes& attributes) {
    if (!m_advisory || !m_advisory->isAvailable()) return {};

    std::optional<std::string> reply;
    try {
        reply = m_advisory->compactQuery(infrastructure::IdentityKeyJson(attributes).dump());
    } catch (const std::exception& e) {
        std::cerr << "[PriceResolver] Query compaction failed: " << e.what() << std::endl;
        return {};
    }
    if (!reply) return {};

    std::string line = *reply;
    const auto newline = line.find('\n');
    if (newline != std::string::npos) line = line.substr(0, newline);
    return TruncateAtWord(Trim(line), m_options.maxQueryLength);
}

std::string PriceResolver::buildQuery(const domain::CardAttributes& attributes) {
    std::string compacted = compactQuery(attributes);
    if (!compacted.empty()) return compacted;
    return PlainQuery(attributes);
}

std::optional<std::vector<domain::PriceComparable>> PriceResolver::searchSafely(const std::string& query) {
    if (query.empty()) return std::vector<domain::PriceComparable>{};
    try {
        return m_search->search(query);
    } catch (const std::exception& e) {
        std::cerr << "[PriceResolver] Search failed for '" << query << "': " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<domain::PriceComparable> PriceResolver::FilterByTitle(const std::vector<domain::PriceComparable>& listings,
                                                                  const std::string& query,
                                                                  double threshold,
                                                                  bool& applied) {
    std::vector<domain::PriceComparable> kept;
    for (const auto& listing : listings) {
        if (domain::TitleSimilarity::TokenSetRatio(listing.title, query) >= threshold) {
            kept.push_back(listing);
        }
    }
    // Filtering everything away would turn a noisy result into "no data".
    applied = !kept.empty();
    return applied ? kept : listings;
}

domain::PriceSnapshot PriceResolver::resolve(const domain::CardIdentity& identity) {
    if (!identity.isResolved()) return {};

    const domain::CardAttributes& attributes = identity.attributes;
    const std::string key = CacheKey(attributes);
    if (auto cached = m_cache->get(key)) {
        return *cached;
    }

    if (!m_search) {
        domain::PriceSnapshot empty;
        empty.query = PlainQuery(attributes);
        return empty;
    }

    std::lock_guard<std::mutex> lock(m_missMutex);
    // Another caller may have filled the entry while this one waited.
    if (auto cached = m_cache->get(key)) {
        return *cached;
    }

    std::string query = buildQuery(attributes);
    auto found = searchSafely(query);
    bool searchFailed = !found;
    std::vector<domain::PriceComparable> listings = found ? std::move(*found) : std::vector<domain::PriceComparable>{};
    bool broadened = false;

    if (listings.empty() && (!attributes.grade.empty() || !attributes.itemNumber.empty())) {
        domain::CardAttributes broader = attributes;
        broader.grade.clear();
        broader.gradingCompany.clear();
        broader.itemNumber.clear();
        const std::string broaderQuery = buildQuery(broader);
        std::cout << "[PriceResolver] No sales for '" << query << "', retrying with '" << broaderQuery << "'" << std::endl;
        auto broaderFound = searchSafely(broaderQuery);
        if (!broaderFound) {
            searchFailed = true;
        } else if (!broaderFound->empty()) {
            listings = std::move(*broaderFound);
            query = broaderQuery;
            broadened = true;
        }
    }

    if (listings.empty()) {
        domain::PriceSnapshot empty;
        empty.query = query;
        // A failed search is retried on a later frame; a genuine "no sales" answer is cached.
        if (!searchFailed) {
            empty.cachedAt = infrastructure::PriceCache::NowSeconds();
            m_cache->put(key, empty);
            m_cache->persist();
        }
        return empty;
    }

    bool filtered = false;
    auto kept = FilterByTitle(listings, query, m_options.fuzzyThreshold, filtered);
    if (!filtered) {
        std::cout << "[PriceResolver] Fuzzy filter would drop all " << listings.size()
                  << " listing(s) for '" << query << "'. Using unfiltered results." << std::endl;
    }

    domain::PriceSnapshot snapshot = domain::PriceStatistics::ComputeSnapshot(kept, query);
    snapshot.filtered = filtered;
    snapshot.broadened = broadened;
    snapshot.cachedAt = infrastructure::PriceCache::NowSeconds();

    m_cache->put(key, snapshot);
    m_cache->persist();
    return snapshot;
}

} // namespace bidlens::application
