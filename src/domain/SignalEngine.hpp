/**
 * @file SignalEngine.hpp
 * @brief Converts market data and the current bid into a gated recommendation.
 */

#pragma once
#include <map>
#include <string>
#include "domain/CardIdentity.hpp"
#include "domain/PriceSnapshot.hpp"
#include "domain/Signal.hpp"

namespace bidlens::domain {

/**
 * @class SignalEngine
 * @brief Gray-zone gates followed by ROI thresholds.
 *
 * Gates run in a fixed order and the first failure short-circuits to
 * INSUFFICIENT_DATA / GRAY:
 * 1. no name, 2. no bid, 3. no market data, 4. too few comparables.
 */
class SignalEngine {
public:
    explicit SignalEngine(int minimumComparables = 3);

    SignalResult score(const CardIdentity& identity, double currentBid, const PriceSnapshot& snapshot) const;

    /** @brief Value multiplier for a grade string; 1.0 for ungraded or unknown grades. */
    static double GradeMultiplier(const std::string& grade);

    int minimumComparables() const { return m_minimumComparables; }

private:
    static std::vector<std::string> keyFactors(const CardIdentity& identity, int comparables, double roiPercent);

    int m_minimumComparables;
};

} // namespace bidlens::domain
