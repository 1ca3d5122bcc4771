/**
 * @file PriceStatistics.hpp
 * @brief Aggregates sale comparables into a PriceSnapshot.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/PriceSnapshot.hpp"

namespace bidlens::domain {

class PriceStatistics {
public:
    /// Number of most recent sales kept in PriceSnapshot::prices.
    static constexpr std::size_t kRecentSampleSize = 10;

    /**
     * @brief Builds statistics over all comparables.
     * @param comparables Sales in search order (most recent first). Non-positive prices are ignored.
     * @param query Query that produced the sales.
     * @return Snapshot; count == 0 with zeroed statistics when nothing usable was found.
     */
    static PriceSnapshot ComputeSnapshot(const std::vector<PriceComparable>& comparables, const std::string& query);
};

} // namespace bidlens::domain
