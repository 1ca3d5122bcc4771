#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace bidlens::infrastructure {

using json = nlohmann::json;

namespace {
// Deterministic sampling.
constexpr double kTemperature = 0.0;
constexpr double kTopP = 1.0;
constexpr int kSeed = 42;
constexpr int kConnectTimeoutSeconds = 5;
}

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::string OllamaClient::BuildGenerateRequest(const std::string& model,
                                               const std::string& system,
                                               const std::string& prompt,
                                               bool forceJson) {
    json request = {
        {"model", model},
        {"system", system},
        {"prompt", prompt},
        {"stream", false},
        {"options", {{"temperature", kTemperature}, {"top_p", kTopP}, {"seed", kSeed}}}
    };
    if (forceJson) request["format"] = "json";
    return request.dump();
}

std::optional<std::string> OllamaClient::ParseGenerateResponse(const std::string& body) {
    try {
        const json reply = json::parse(body);
        auto it = reply.find("response");
        if (it != reply.end() && it->is_string()) return it->get<std::string>();
        std::cerr << "[OllamaClient] Reply has no 'response' field." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] Unparsable reply: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::ParseModelList(const std::string& body) {
    std::vector<std::string> models;
    try {
        const json tags = json::parse(body);
        auto list = tags.find("models");
        if (list == tags.end() || !list->is_array()) return models;
        for (const auto& entry : *list) {
            auto name = entry.find("name");
            if (name != entry.end() && name->is_string()) models.push_back(name->get<std::string>());
        }
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] Unparsable model list: " << e.what() << std::endl;
    }
    return models;
}

std::optional<std::string> OllamaClient::generate(const std::string& model,
                                                  const std::string& system,
                                                  const std::string& prompt,
                                                  bool forceJson,
                                                  int readTimeoutSeconds) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(readTimeoutSeconds);

    auto res = cli.Post("/api/generate", BuildGenerateRequest(model, system, prompt, forceJson), "application/json");
    if (!res) {
        std::cerr << "[OllamaClient] Connection to " << m_host << ":" << m_port << " failed: "
                  << httplib::to_string(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] /api/generate returned HTTP " << res->status << std::endl;
        return std::nullopt;
    }
    return ParseGenerateResponse(res->body);
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(kConnectTimeoutSeconds);

    auto res = cli.Get("/api/tags");
    if (!res || res->status != 200) return {};
    return ParseModelList(res->body);
}

} // namespace bidlens::infrastructure
