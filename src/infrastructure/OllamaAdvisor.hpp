/**
 * @file OllamaAdvisor.hpp
 * @brief AdvisoryService backed by a local Ollama server.
 */

#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include "domain/AdvisoryService.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace bidlens::infrastructure {

/**
 * @class OllamaAdvisor
 * @brief Implements AdvisoryService using the Ollama REST API.
 */
class OllamaAdvisor : public domain::AdvisoryService {
public:
    /**
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param preferredModel Kept when the server has it.
     * @param maxQueryLength Limit given to the compaction prompt.
     */
    OllamaAdvisor(const std::string& host = "localhost",
                  int port = 11434,
                  const std::string& preferredModel = "qwen2.5:7b",
                  std::size_t maxQueryLength = 60);

    /** @brief Lists server models once and picks one. Unreachable server => unavailable. */
    void initialize() override;

    bool isAvailable() const override { return m_available.load(); }

    std::optional<std::string> compactQuery(const std::string& identityJson) override;

    std::optional<domain::DealAdvice> advise(const domain::CardIdentity& identity,
                                             double currentBid,
                                             const domain::PriceSnapshot& snapshot) override;

    /** @brief Parses the JSON object between the first '{' and the last '}'; raw text otherwise. */
    static domain::DealAdvice ParseAdvice(const std::string& reply);

    std::string model() const;

private:
    OllamaClient m_client;
    std::string m_model;
    std::size_t m_maxQueryLength;
    std::atomic<bool> m_available{false};
    mutable std::mutex m_modelMutex;
};

} // namespace bidlens::infrastructure
