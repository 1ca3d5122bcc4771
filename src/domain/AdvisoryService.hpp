/**
 * @file AdvisoryService.hpp
 * @brief Interface for the optional language-model collaborator.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/CardIdentity.hpp"
#include "domain/PriceSnapshot.hpp"

namespace bidlens::domain {

/**
 * @struct DealAdvice
 * @brief Structured narrative recommendation produced by the advisory model.
 */
struct DealAdvice {
    std::string recommendation; ///< BUY / PASS / WATCH as written by the model.
    std::string confidence;     ///< high / medium / low.
    double fairValueMin = 0.0;
    double fairValueMax = 0.0;
    std::string dealQuality;
    double maxBidSuggestion = 0.0;
    std::string reasoning;
    std::vector<std::string> riskFactors;
    std::string upsidePotential;
    std::string rawText;        ///< Full reply; the only content when it was not JSON.

    /** @brief One-line summary for status displays. */
    std::string summary() const {
        if (recommendation.empty()) return rawText;
        std::string out = recommendation;
        if (!confidence.empty()) out += " (" + confidence + ")";
        if (!reasoning.empty()) out += ": " + reasoning;
        return out;
    }
};

/**
 * @class AdvisoryService
 * @brief Abstract interface for query compaction and deal commentary.
 *
 * Both operations are optional: an unavailable service must make every call
 * return std::nullopt so callers fall back without blocking the pipeline.
 */
class AdvisoryService {
public:
    virtual ~AdvisoryService() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /** @brief True when the backing model was reachable at startup. */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Compacts an identity into a short marketplace search query.
     * @param identityJson JSON object with name/year/set/grade/item_number keys.
     * @return Query text, or nullopt when the model is unavailable or failed.
     */
    virtual std::optional<std::string> compactQuery(const std::string& identityJson) = 0;

    /**
     * @brief Produces a narrative recommendation for the current bid.
     * @param identity Resolved identity.
     * @param currentBid Current auction price.
     * @param snapshot Market data to ground the answer in (may be empty).
     */
    virtual std::optional<DealAdvice> advise(const CardIdentity& identity,
                                             double currentBid,
                                             const PriceSnapshot& snapshot) = 0;
};

} // namespace bidlens::domain
