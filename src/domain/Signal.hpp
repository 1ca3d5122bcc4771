/**
 * @file Signal.hpp
 * @brief Buy/pass recommendation value objects.
 */

#pragma once
#include <string>
#include <vector>

namespace bidlens::domain {

/**
 * @enum Recommendation
 * @brief Closed set of deal recommendations.
 */
enum class Recommendation {
    StrongBuy,
    Buy,
    WeakBuy,
    Watch,
    Pass,
    InsufficientData
};

/**
 * @enum SignalColor
 * @brief Traffic-light shown to the viewer.
 */
enum class SignalColor {
    Green,
    Yellow,
    Red,
    Gray
};

inline SignalColor ColorFor(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::StrongBuy:
        case Recommendation::Buy:
            return SignalColor::Green;
        case Recommendation::WeakBuy:
        case Recommendation::Watch:
            return SignalColor::Yellow;
        case Recommendation::Pass:
            return SignalColor::Red;
        case Recommendation::InsufficientData:
            break;
    }
    return SignalColor::Gray;
}

inline const char* RecommendationToString(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::StrongBuy: return "STRONG_BUY";
        case Recommendation::Buy: return "BUY";
        case Recommendation::WeakBuy: return "WEAK_BUY";
        case Recommendation::Watch: return "WATCH";
        case Recommendation::Pass: return "PASS";
        case Recommendation::InsufficientData: break;
    }
    return "INSUFFICIENT_DATA";
}

inline const char* SignalColorToString(SignalColor color) {
    switch (color) {
        case SignalColor::Green: return "GREEN";
        case SignalColor::Yellow: return "YELLOW";
        case SignalColor::Red: return "RED";
        case SignalColor::Gray: break;
    }
    return "GRAY";
}

struct FairValueRange {
    double min = 0.0;
    double max = 0.0;
    double estimated = 0.0;
};

/**
 * @struct SignalResult
 * @brief Output of the SignalEngine for one frame. Never stored as mutable state.
 */
struct SignalResult {
    Recommendation recommendation = Recommendation::InsufficientData;
    SignalColor color = SignalColor::Gray;
    std::string reason;          ///< Set when a gray gate fired.
    FairValueRange fairValue;
    double roiPercent = 0.0;
    double confidence = 0.0;
    double suggestedMaxBid = 0.0;
    int comparableCount = 0;
    std::vector<std::string> keyFactors;

    static SignalResult Insufficient(const std::string& why, int comparables = 0) {
        SignalResult result;
        result.reason = why;
        result.comparableCount = comparables;
        return result;
    }
};

} // namespace bidlens::domain
