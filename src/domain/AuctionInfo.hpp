/**
 * @file AuctionInfo.hpp
 * @brief State of the live auction panel (bid, timer).
 */

#pragma once
#include <string>

namespace bidlens::domain {

/**
 * @struct AuctionInfo
 * @brief Parsed from the price/timer region of the stream overlay.
 */
struct AuctionInfo {
    double currentBid = 0.0;
    std::string timeRemaining;
    int bidCount = 0;
    std::string bidSource; ///< "ocr", "audio" or empty when no bid was seen.

    bool hasActiveBid() const { return currentBid > 0.0; }
};

} // namespace bidlens::domain
