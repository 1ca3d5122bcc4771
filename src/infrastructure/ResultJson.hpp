/**
 * @file ResultJson.hpp
 * @brief nlohmann::json conversions for the domain value objects.
 *
 * Declared in the domain namespace so ADL finds them from `json j = value;`.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/AdvisoryService.hpp"
#include "domain/AuctionInfo.hpp"
#include "domain/CardIdentity.hpp"
#include "domain/FrameResult.hpp"
#include "domain/PriceSnapshot.hpp"
#include "domain/Signal.hpp"
#include "domain/Transcript.hpp"

namespace bidlens::domain {

void to_json(nlohmann::json& j, const CardAttributes& attributes);
void to_json(nlohmann::json& j, const CardIdentity& identity);
void to_json(nlohmann::json& j, const SpokenAttributes& attributes);
void to_json(nlohmann::json& j, const AudioStatus& status);
void to_json(nlohmann::json& j, const AuctionInfo& auction);
void to_json(nlohmann::json& j, const SignalResult& signal);
void to_json(nlohmann::json& j, const DealAdvice& advice);
void to_json(nlohmann::json& j, const FrameResult& result);

/// Snapshots round-trip through the price cache file.
void to_json(nlohmann::json& j, const PriceSnapshot& snapshot);
void from_json(const nlohmann::json& j, PriceSnapshot& snapshot);

} // namespace bidlens::domain

namespace bidlens::infrastructure {

/** @brief Compact search-key object: only non-empty name/year/set/grade/item_number. */
nlohmann::json IdentityKeyJson(const domain::CardAttributes& attributes);

} // namespace bidlens::infrastructure
