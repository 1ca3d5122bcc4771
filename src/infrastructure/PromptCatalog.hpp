/**
 * @file PromptCatalog.hpp
 * @brief Central storage for advisory model prompts.
 */

#pragma once

#include <string>
#include "domain/CardIdentity.hpp"
#include "domain/PriceSnapshot.hpp"

namespace bidlens::infrastructure {

class PromptCatalog {
public:
    /** @brief System prompt for turning an identity JSON into a short marketplace query. */
    static std::string GetQueryCompactionPrompt(std::size_t maxLength);

    /** @brief System prompt for the structured deal recommendation. */
    static std::string GetDealAdvisorPrompt();

    /** @brief User prompt carrying the item, the bid and the market data. */
    static std::string BuildDealPrompt(const domain::CardIdentity& identity,
                                       double currentBid,
                                       const domain::PriceSnapshot& snapshot);
};

} // namespace bidlens::infrastructure
