/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace bidlens::infrastructure {

/**
 * @class OllamaClient
 * @brief Non-streaming /api/generate and /api/tags with deterministic sampling.
 *
 * Never throws: transport, HTTP and parse failures are logged and reported
 * as nullopt or an empty model list.
 */
class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /**
     * @brief Sends a POST request to /api/generate.
     * @param readTimeoutSeconds Upper bound for the model reply.
     * @return The "response" field, or nullopt on transport/HTTP/parse failure.
     */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& system,
                                        const std::string& prompt,
                                        bool forceJson = false,
                                        int readTimeoutSeconds = 30);

    /** @brief Fetches available models from /api/tags. Empty when the server is unreachable. */
    std::vector<std::string> getAvailableModels();

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

    /** @brief Request body for /api/generate. */
    static std::string BuildGenerateRequest(const std::string& model,
                                            const std::string& system,
                                            const std::string& prompt,
                                            bool forceJson);

    static std::optional<std::string> ParseGenerateResponse(const std::string& body);
    static std::vector<std::string> ParseModelList(const std::string& body);

private:
    std::string m_host;
    int m_port;
};

} // namespace bidlens::infrastructure
