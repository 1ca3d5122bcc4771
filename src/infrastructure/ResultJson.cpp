#include "infrastructure/ResultJson.hpp"

using json = nlohmann::json;

namespace bidlens::domain {

namespace {

json OptionalString(const std::string& value) {
    return value.empty() ? json(nullptr) : json(value);
}

} // namespace

void to_json(json& j, const CardAttributes& attributes) {
    j = json{
        {"name", OptionalString(attributes.name)},
        {"year", OptionalString(attributes.year)},
        {"set", OptionalString(attributes.setName)},
        {"item_number", OptionalString(attributes.itemNumber)},
        {"grade", OptionalString(attributes.grade)},
        {"grading_company", OptionalString(attributes.gradingCompany)},
        {"rookie", attributes.rookie}
    };
}

void to_json(json& j, const CardIdentity& identity) {
    j = identity.attributes;
    j["confidence"] = identity.confidence;
    j["audio_confidence"] = identity.audioConfidence;
    j["ocr_engine"] = identity.ocrEngine;
    j["carried_over"] = identity.carriedOver;
    j["provenance"] = {
        {"name", FieldSourceToString(identity.provenance.name)},
        {"year", FieldSourceToString(identity.provenance.year)},
        {"set", FieldSourceToString(identity.provenance.setName)},
        {"item_number", FieldSourceToString(identity.provenance.itemNumber)},
        {"grade", FieldSourceToString(identity.provenance.grade)},
        {"rookie", FieldSourceToString(identity.provenance.rookie)}
    };
}

void to_json(json& j, const SpokenAttributes& attributes) {
    j = json{
        {"grade", OptionalString(attributes.grade)},
        {"grading_company", OptionalString(attributes.gradingCompany)},
        {"year", OptionalString(attributes.year)},
        {"set", OptionalString(attributes.setName)},
        {"rookie", attributes.rookie},
        {"spoken_price", attributes.spokenPrice ? json(*attributes.spokenPrice) : json(nullptr)}
    };
}

void to_json(json& j, const AudioStatus& status) {
    j = json{
        {"transcript", status.latest.text},
        {"attributes", status.latest.attributes},
        {"confidence", status.latest.confidence},
        {"active", status.active},
        {"available", status.available}
    };
}

void to_json(json& j, const AuctionInfo& auction) {
    j = json{
        {"current_bid", auction.currentBid},
        {"time_remaining", OptionalString(auction.timeRemaining)},
        {"bid_count", auction.bidCount},
        {"bid_source", OptionalString(auction.bidSource)}
    };
}

void to_json(json& j, const PriceSnapshot& snapshot) {
    j = json{
        {"count", snapshot.count},
        {"prices", snapshot.prices},
        {"mean", snapshot.mean},
        {"median", snapshot.median},
        {"min", snapshot.min},
        {"max", snapshot.max},
        {"std_dev", snapshot.standardDeviation},
        {"query", snapshot.query},
        {"cached_at", snapshot.cachedAt},
        {"filtered", snapshot.filtered},
        {"broadened", snapshot.broadened}
    };
}

void from_json(const json& j, PriceSnapshot& snapshot) {
    snapshot = PriceSnapshot{};
    snapshot.count = j.value("count", 0);
    if (j.contains("prices") && j["prices"].is_array()) {
        snapshot.prices = j["prices"].get<std::vector<double>>();
    }
    snapshot.mean = j.value("mean", 0.0);
    snapshot.median = j.value("median", 0.0);
    snapshot.min = j.value("min", 0.0);
    snapshot.max = j.value("max", 0.0);
    snapshot.standardDeviation = j.value("std_dev", 0.0);
    snapshot.query = j.value("query", std::string());
    snapshot.cachedAt = j.value("cached_at", static_cast<std::int64_t>(0));
    snapshot.filtered = j.value("filtered", false);
    snapshot.broadened = j.value("broadened", false);
}

void to_json(json& j, const SignalResult& signal) {
    j = json{
        {"recommendation", RecommendationToString(signal.recommendation)},
        {"signal", SignalColorToString(signal.color)},
        {"reason", OptionalString(signal.reason)},
        {"fair_value", {
            {"min", signal.fairValue.min},
            {"max", signal.fairValue.max},
            {"estimated", signal.fairValue.estimated}
        }},
        {"roi_percent", signal.roiPercent},
        {"confidence", signal.confidence},
        {"suggested_max_bid", signal.suggestedMaxBid},
        {"comparable_count", signal.comparableCount},
        {"key_factors", signal.keyFactors}
    };
}

void to_json(json& j, const DealAdvice& advice) {
    j = json{
        {"recommendation", advice.recommendation},
        {"confidence", advice.confidence},
        {"fair_value_min", advice.fairValueMin},
        {"fair_value_max", advice.fairValueMax},
        {"deal_quality", advice.dealQuality},
        {"max_bid_suggestion", advice.maxBidSuggestion},
        {"reasoning", advice.reasoning},
        {"risk_factors", advice.riskFactors},
        {"upside_potential", advice.upsidePotential}
    };
}

void to_json(json& j, const FrameResult& result) {
    j = json{
        {"frame_index", result.frameIndex},
        {"session_id", result.sessionId},
        {"timestamp", result.timestamp},
        {"identity", result.identity},
        {"auction", result.auction},
        {"price_snapshot", result.snapshot},
        {"signal", result.signal},
        {"advisory", result.advisoryText ? json(*result.advisoryText) : json(nullptr)},
        {"audio", result.audio},
        {"detection_confidence", result.detectionConfidence},
        {"ocr_text", result.ocrText}
    };
}

} // namespace bidlens::domain

namespace bidlens::infrastructure {

json IdentityKeyJson(const domain::CardAttributes& attributes) {
    json j = json::object();
    if (!attributes.name.empty()) j["name"] = attributes.name;
    if (!attributes.year.empty()) j["year"] = attributes.year;
    if (!attributes.setName.empty()) j["set"] = attributes.setName;
    if (!attributes.grade.empty()) j["grade"] = attributes.grade;
    if (!attributes.itemNumber.empty()) j["item_number"] = attributes.itemNumber;
    return j;
}

} // namespace bidlens::infrastructure
