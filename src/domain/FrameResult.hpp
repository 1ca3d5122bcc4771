/**
 * @file FrameResult.hpp
 * @brief Per-frame result bundle and the sink interface that consumes it.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "domain/AuctionInfo.hpp"
#include "domain/CardIdentity.hpp"
#include "domain/MediaSource.hpp"
#include "domain/PriceSnapshot.hpp"
#include "domain/Signal.hpp"
#include "domain/Transcript.hpp"

namespace bidlens::domain {

/**
 * @struct FrameResult
 * @brief Everything the viewer needs about one processed frame.
 */
struct FrameResult {
    std::uint64_t frameIndex = 0;
    std::string sessionId;
    std::string timestamp;          ///< ISO-8601 wall clock.
    CardIdentity identity;
    AuctionInfo auction;
    PriceSnapshot snapshot;
    SignalResult signal;
    std::optional<std::string> advisoryText;
    AudioStatus audio;
    double detectionConfidence = 0.0;
    std::string ocrText;
};

/**
 * @class ResultSink
 * @brief Transport for per-frame output (console, HTTP, ...).
 */
class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual void publishResult(const FrameResult& result) = 0;

    /** @brief Status line for the viewer ("Scanning for items...", errors). */
    virtual void publishStatus(const std::string& message, std::uint64_t frameIndex) = 0;

    /** @brief Every captured frame, processed or not. */
    virtual void publishPreview(const Frame& frame) { (void)frame; }
};

} // namespace bidlens::domain
