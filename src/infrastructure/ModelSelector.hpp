/**
 * @file ModelSelector.hpp
 * @brief Utility for selecting the advisory model from what the server has pulled.
 */

#pragma once
#include <string>
#include <vector>

namespace bidlens::infrastructure {

/**
 * @class ModelSelector
 * @brief Separates model selection policy from adapter I/O.
 */
class ModelSelector {
public:
    /**
     * @brief Keeps the configured model when present, otherwise the first priority match.
     * @return Empty when the server reports no models at all.
     */
    static std::string SelectBest(const std::vector<std::string>& availableModels,
                                  const std::string& preferred) {
        if (availableModels.empty()) {
            return {};
        }

        for (const auto& model : availableModels) {
            if (model == preferred) {
                return preferred;
            }
        }

        // Preference order when the configured model is missing.
        const std::vector<std::string> priorities = {
            "qwen2.5:7b",
            "qwen2.5",
            "llama3.1",
            "llama3",
            "mistral",
            "gemma"
        };

        for (const auto& priority : priorities) {
            for (const auto& model : availableModels) {
                if (model.find(priority) != std::string::npos) {
                    return model;
                }
            }
        }

        return availableModels[0];
    }
};

} // namespace bidlens::infrastructure
