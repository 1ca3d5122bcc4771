/**
 * @file SessionContext.hpp
 * @brief Per-session mutable state handed to the frame orchestrator.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "application/PriceResolver.hpp"
#include "domain/ContinuityTracker.hpp"

namespace bidlens::application {

/**
 * @struct SessionContext
 * @brief Continuity slot, resolver (and its cache) and the session id.
 *
 * Outlives orchestrator restarts, so stop/start keeps both the cache and the
 * last identified item.
 */
struct SessionContext {
    SessionContext(std::string id,
                   std::shared_ptr<PriceResolver> priceResolver,
                   std::chrono::milliseconds continuityTtl = std::chrono::seconds(30))
        : sessionId(std::move(id))
        , continuity(continuityTtl)
        , resolver(std::move(priceResolver)) {}

    std::string sessionId;
    domain::ContinuityTracker continuity;
    std::shared_ptr<PriceResolver> resolver;
};

} // namespace bidlens::application
