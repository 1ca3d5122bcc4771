#include "infrastructure/PromptCatalog.hpp"
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

namespace bidlens::infrastructure {

std::string PromptCatalog::GetQueryCompactionPrompt(std::size_t maxLength) {
    return
        "You write search queries for sold listings of graded sports trading cards.\n"
        "You receive a JSON object with some of: name, year, set, grade, item_number.\n\n"
        "RULES:\n"
        "1. Answer with the query only: one line, no quotes, no explanation.\n"
        "2. At most " + std::to_string(maxLength) + " characters.\n"
        "3. Keep, in this priority: name, year, set, grade. Add the item number only if it fits.\n"
        "4. Never invent a field that is not in the input.\n\n"
        "EXAMPLE:\n"
        "{\"name\":\"Mike Trout\",\"year\":\"2023\",\"set\":\"Topps Chrome\",\"grade\":\"PSA 10\"}\n"
        "Mike Trout 2023 Topps Chrome PSA 10";
}

std::string PromptCatalog::GetDealAdvisorPrompt() {
    return
        "You are an auction advisor for sports trading cards. Evaluate whether the current bid is a good deal.\n"
        "Base the answer only on the market data provided. If there is little or no data, say so and lower your confidence.\n\n"
        "Reply with a single JSON object and nothing else:\n"
        "{\n"
        "  \"recommendation\": \"BUY|PASS|WATCH\",\n"
        "  \"confidence\": \"high|medium|low\",\n"
        "  \"fair_value_range\": {\"min\": 0, \"max\": 0},\n"
        "  \"deal_quality\": \"excellent|good|fair|poor\",\n"
        "  \"max_bid_suggestion\": 0,\n"
        "  \"reasoning\": \"one or two sentences\",\n"
        "  \"risk_factors\": [\"...\"],\n"
        "  \"upside_potential\": \"percentage upside if applicable\"\n"
        "}";
}

std::string PromptCatalog::BuildDealPrompt(const domain::CardIdentity& identity,
                                           double currentBid,
                                           const domain::PriceSnapshot& snapshot) {
    nlohmann::json market = {
        {"sales_count", snapshot.count},
        {"recent_prices", snapshot.prices},
        {"mean", snapshot.mean},
        {"median", snapshot.median},
        {"min", snapshot.min},
        {"max", snapshot.max}
    };

    const auto& attrs = identity.attributes;
    std::ostringstream ss;
    ss << "Card: " << identity.describe() << "\n";
    ss << "Grade: " << (attrs.grade.empty() ? "ungraded or unknown" : attrs.grade) << "\n";
    if (attrs.rookie) ss << "Rookie card\n";
    ss << "Current bid: $" << std::fixed << std::setprecision(2) << currentBid << "\n";
    ss << "Market data: " << market.dump(2) << "\n";
    return ss.str();
}

} // namespace bidlens::infrastructure
