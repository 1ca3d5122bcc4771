#include "infrastructure/ConsoleResultSink.hpp"
#include <iomanip>
#include <sstream>

namespace bidlens::infrastructure {

std::string ConsoleResultSink::FormatResult(const domain::FrameResult& result) {
    const auto& signal = result.signal;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "[Frame " << result.frameIndex << "] " << result.identity.describe();
    if (result.identity.carriedOver) ss << " (carried over)";
    ss << " | bid $" << result.auction.currentBid;
    if (!result.auction.bidSource.empty()) ss << " (" << result.auction.bidSource << ")";
    ss << " | " << domain::RecommendationToString(signal.recommendation)
       << " " << domain::SignalColorToString(signal.color);

    if (signal.recommendation == domain::Recommendation::InsufficientData) {
        ss << " - " << signal.reason;
    } else {
        ss << " | fair $" << signal.fairValue.estimated
           << " | ROI " << std::setprecision(1) << signal.roiPercent << "%"
           << " | conf " << std::setprecision(0) << signal.confidence * 100.0 << "%"
           << " | max bid $" << std::setprecision(2) << signal.suggestedMaxBid;
    }
    ss << " | " << result.snapshot.count << " comps";
    return ss.str();
}

void ConsoleResultSink::publishResult(const domain::FrameResult& result) {
    std::string line = FormatResult(result);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << line << std::endl;
    if (result.advisoryText) {
        m_out << "[Advisor] " << *result.advisoryText << std::endl;
    }
}

void ConsoleResultSink::publishStatus(const std::string& message, std::uint64_t frameIndex) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << "[Status " << frameIndex << "] " << message << std::endl;
}

} // namespace bidlens::infrastructure
