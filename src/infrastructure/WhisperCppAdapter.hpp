#pragma once

#include "domain/SpeechToTextEngine.hpp"
#include <mutex>
#include <string>

struct whisper_context;

namespace bidlens::infrastructure {

/**
 * @class WhisperCppAdapter
 * @brief In-process whisper.cpp inference on live audio chunks.
 *
 * One context is loaded once; inference is serialized by a mutex.
 */
class WhisperCppAdapter : public domain::SpeechToTextEngine {
public:
    WhisperCppAdapter(const std::string& modelPath, const std::string& language = "en");
    ~WhisperCppAdapter() override;

    WhisperCppAdapter(const WhisperCppAdapter&) = delete;
    WhisperCppAdapter& operator=(const WhisperCppAdapter&) = delete;

    std::string name() const override { return "whisper.cpp"; }
    bool load(std::string& errorMsg) override;
    std::optional<std::string> transcribe(const std::vector<float>& pcmf32) override;

private:
    std::string m_modelPath;
    std::string m_language;
    whisper_context* m_ctx = nullptr;
    std::mutex m_mutex;
};

} // namespace bidlens::infrastructure
