/**
 * @file OllamaAdvisor.cpp
 * @brief Implementation of the OllamaAdvisor class.
 */
#include "infrastructure/OllamaAdvisor.hpp"
#include "infrastructure/ModelSelector.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace bidlens::infrastructure {

namespace {

constexpr int kCompactionTimeoutSeconds = 10;
constexpr int kAdviceTimeoutSeconds = 60;

// Models write numbers as 42, "42" or "$42.00".
double NumberOr(const json& value, double fallback) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        std::string text;
        for (char c : value.get<std::string>()) {
            if ((c >= '0' && c <= '9') || c == '.') text.push_back(c);
        }
        try {
            if (!text.empty()) return std::stod(text);
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

std::string StringOr(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

} // namespace

OllamaAdvisor::OllamaAdvisor(const std::string& host, int port, const std::string& preferredModel, std::size_t maxQueryLength)
    : m_client(host, port), m_model(preferredModel), m_maxQueryLength(maxQueryLength) {}

void OllamaAdvisor::initialize() {
    auto models = m_client.getAvailableModels();
    if (models.empty()) {
        std::cerr << "[OllamaAdvisor] No models at " << m_client.host() << ":" << m_client.port()
                  << ". Is Ollama running? Advisory disabled." << std::endl;
        m_available = false;
        return;
    }

    std::string selected = ModelSelector::SelectBest(models, model());
    {
        std::lock_guard<std::mutex> lock(m_modelMutex);
        m_model = selected;
    }
    m_available = true;
    std::cout << "[OllamaAdvisor] Using model: " << selected << std::endl;
}

std::string OllamaAdvisor::model() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

std::optional<std::string> OllamaAdvisor::compactQuery(const std::string& identityJson) {
    if (!isAvailable()) return std::nullopt;
    return m_client.generate(model(), PromptCatalog::GetQueryCompactionPrompt(m_maxQueryLength),
                             identityJson, false, kCompactionTimeoutSeconds);
}

std::optional<domain::DealAdvice> OllamaAdvisor::advise(const domain::CardIdentity& identity,
                                                        double currentBid,
                                                        const domain::PriceSnapshot& snapshot) {
    if (!isAvailable()) return std::nullopt;
    auto reply = m_client.generate(model(), PromptCatalog::GetDealAdvisorPrompt(),
                                   PromptCatalog::BuildDealPrompt(identity, currentBid, snapshot),
                                   true, kAdviceTimeoutSeconds);
    if (!reply) return std::nullopt;
    return ParseAdvice(*reply);
}

domain::DealAdvice OllamaAdvisor::ParseAdvice(const std::string& reply) {
    domain::DealAdvice advice;
    advice.rawText = reply;

    const auto start = reply.find('{');
    const auto end = reply.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end <= start) {
        return advice;
    }

    try {
        json j = json::parse(reply.substr(start, end - start + 1));
        if (!j.is_object()) return advice;

        advice.recommendation = StringOr(j, "recommendation");
        advice.confidence = StringOr(j, "confidence");
        advice.dealQuality = StringOr(j, "deal_quality");
        advice.reasoning = StringOr(j, "reasoning");
        advice.upsidePotential = StringOr(j, "upside_potential");
        if (j.contains("max_bid_suggestion")) {
            advice.maxBidSuggestion = NumberOr(j["max_bid_suggestion"], 0.0);
        }
        if (j.contains("fair_value_range") && j["fair_value_range"].is_object()) {
            const json& range = j["fair_value_range"];
            if (range.contains("min")) advice.fairValueMin = NumberOr(range["min"], 0.0);
            if (range.contains("max")) advice.fairValueMax = NumberOr(range["max"], 0.0);
        }
        if (j.contains("risk_factors") && j["risk_factors"].is_array()) {
            for (const auto& risk : j["risk_factors"]) {
                if (risk.is_string()) advice.riskFactors.push_back(risk.get<std::string>());
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[OllamaAdvisor] Reply was not valid JSON: " << e.what() << std::endl;
        domain::DealAdvice textOnly;
        textOnly.rawText = reply;
        return textOnly;
    }
    return advice;
}

} // namespace bidlens::infrastructure
