/**
 * @file PriceSnapshot.hpp
 * @brief Historical sale comparables and their aggregate statistics.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace bidlens::domain {

/**
 * @struct PriceComparable
 * @brief One historical sale.
 */
struct PriceComparable {
    double price = 0.0;
    std::string title;
    std::string saleDate; ///< ISO-8601, may be empty.
};

/**
 * @struct PriceSnapshot
 * @brief Aggregate over the comparables found for one query.
 *
 * count == 0 means "no data": every statistic is zero and callers must never
 * read it as "the item is worth nothing".
 */
struct PriceSnapshot {
    int count = 0;
    std::vector<double> prices; ///< Ten most recent prices, sorted ascending.
    double mean = 0.0;
    double median = 0.0;
    double min = 0.0;
    double max = 0.0;
    double standardDeviation = 0.0; ///< Population standard deviation.
    std::string query;
    std::int64_t cachedAt = 0;      ///< Unix seconds when computed.
    bool filtered = false;          ///< Fuzzy filter applied and kept at least one listing.
    bool broadened = false;         ///< Data came from the retry without grade/item number.

    bool hasData() const { return count > 0; }
};

} // namespace bidlens::domain
