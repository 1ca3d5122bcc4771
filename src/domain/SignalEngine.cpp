#include "domain/SignalEngine.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <regex>

namespace bidlens::domain {

namespace {

// Sample size below which ROI thresholds widen.
constexpr int kThinSampleSize = 6;
constexpr int kFullConfidenceSampleSize = 10;
constexpr double kMaxBidSafetyFactor = 0.8;
constexpr double kSingleSampleSpread = 0.2;

const std::map<std::string, double> kGradeMultipliers = {
    {"PSA 10", 2.5}, {"PSA 9", 1.8}, {"PSA 8", 1.3}, {"PSA 7", 1.0}, {"PSA 6", 0.7},
    {"BGS 9.5", 2.2}, {"BGS 9", 1.6}, {"BGS 8.5", 1.2}, {"BGS 8", 1.0},
    {"SGC 10", 2.0}, {"SGC 9", 1.5}, {"SGC 8", 1.1}
};

struct Threshold {
    double normal;
    double thin;
    Recommendation recommendation;
    double baseConfidence;
};

const Threshold kThresholds[] = {
    {30.0, 35.0, Recommendation::StrongBuy, 0.9},
    {15.0, 20.0, Recommendation::Buy, 0.7},
    {5.0, 5.0, Recommendation::WeakBuy, 0.5},
    {-10.0, -15.0, Recommendation::Watch, 0.3},
};
constexpr double kPassConfidence = 0.8;

std::string NormalizeGrade(const std::string& grade) {
    static const std::regex gradeRe(R"(^\s*(PSA|BGS|SGC)\s*(\d{1,2}(?:\.\d)?)\s*$)", std::regex::icase);
    std::smatch match;
    if (!std::regex_match(grade, match, gradeRe)) return {};
    std::string company = match[1].str();
    std::transform(company.begin(), company.end(), company.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return company + " " + match[2].str();
}

double SampleStdDev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) return 0.0;
    double sumSq = 0.0;
    for (double v : values) sumSq += (v - mean) * (v - mean);
    return std::sqrt(sumSq / static_cast<double>(values.size() - 1));
}

} // namespace

SignalEngine::SignalEngine(int minimumComparables)
    : m_minimumComparables(std::max(1, minimumComparables)) {}

double SignalEngine::GradeMultiplier(const std::string& grade) {
    auto it = kGradeMultipliers.find(NormalizeGrade(grade));
    return it != kGradeMultipliers.end() ? it->second : 1.0;
}

SignalResult SignalEngine::score(const CardIdentity& identity, double currentBid, const PriceSnapshot& snapshot) const {
    if (!identity.isResolved()) {
        return SignalResult::Insufficient("item not identified");
    }
    if (currentBid <= 0.0) {
        return SignalResult::Insufficient("no active bid detected", snapshot.count);
    }
    if (snapshot.count == 0 || snapshot.prices.empty()) {
        return SignalResult::Insufficient("no market data");
    }
    if (snapshot.count < m_minimumComparables) {
        return SignalResult::Insufficient("only " + std::to_string(snapshot.count) +
                                          " comparable sale(s), need " + std::to_string(m_minimumComparables),
                                          snapshot.count);
    }

    SignalResult result;
    result.comparableCount = snapshot.count;

    const std::vector<double>& recent = snapshot.prices;
    const double recentMean = std::accumulate(recent.begin(), recent.end(), 0.0) / static_cast<double>(recent.size());
    const double spread = recent.size() > 1 ? SampleStdDev(recent, recentMean) : recentMean * kSingleSampleSpread;
    const double multiplier = GradeMultiplier(identity.attributes.grade);

    result.fairValue.estimated = recentMean * multiplier;
    result.fairValue.min = std::max(0.0, (recentMean - spread) * multiplier);
    result.fairValue.max = (recentMean + spread) * multiplier;
    result.roiPercent = (result.fairValue.estimated - currentBid) / currentBid * 100.0;

    const bool thin = snapshot.count < kThinSampleSize;
    result.recommendation = Recommendation::Pass;
    double baseConfidence = kPassConfidence;
    for (const auto& threshold : kThresholds) {
        if (result.roiPercent >= (thin ? threshold.thin : threshold.normal)) {
            result.recommendation = threshold.recommendation;
            baseConfidence = threshold.baseConfidence;
            break;
        }
    }

    result.color = ColorFor(result.recommendation);
    const double dataQuality = std::min(1.0, static_cast<double>(snapshot.count) / kFullConfidenceSampleSize);
    result.confidence = baseConfidence * dataQuality;
    result.suggestedMaxBid = result.fairValue.estimated * kMaxBidSafetyFactor;
    result.keyFactors = keyFactors(identity, snapshot.count, result.roiPercent);
    return result;
}

std::vector<std::string> SignalEngine::keyFactors(const CardIdentity& identity, int comparables, double roiPercent) {
    std::vector<std::string> factors;

    if (comparables >= 10) {
        factors.push_back("Strong market data available");
    } else if (comparables >= 5) {
        factors.push_back("Moderate market data available");
    } else {
        factors.push_back("Limited market data - higher risk");
    }

    if (roiPercent > 25.0) {
        factors.push_back("Excellent profit potential");
    } else if (roiPercent > 10.0) {
        factors.push_back("Good profit potential");
    } else if (roiPercent > 0.0) {
        factors.push_back("Modest profit potential");
    } else {
        factors.push_back("Currently above market value");
    }

    const std::string grade = NormalizeGrade(identity.attributes.grade);
    if (grade == "PSA 10" || grade == "BGS 9.5") {
        factors.push_back("Premium grade - strong demand");
    } else if (grade == "PSA 9" || grade == "BGS 9") {
        factors.push_back("High grade - good demand");
    } else if (!identity.attributes.grade.empty()) {
        factors.push_back("Graded card - " + identity.attributes.grade);
    } else {
        factors.push_back("Ungraded - condition risk");
    }

    if (identity.attributes.rookie) {
        factors.push_back("Rookie card - higher collectibility");
    }
    return factors;
}

} // namespace bidlens::domain
