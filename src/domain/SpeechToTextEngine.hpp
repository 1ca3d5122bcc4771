/**
 * @file SpeechToTextEngine.hpp
 * @brief Interface for audio-to-text transcription.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace bidlens::domain {

/**
 * @class SpeechToTextEngine
 * @brief Abstract interface for services that convert PCM audio to text.
 */
class SpeechToTextEngine {
public:
    virtual ~SpeechToTextEngine() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Loads the model. Called once at startup.
     * @param errorMsg Populated on failure.
     * @return True when the engine can transcribe.
     */
    virtual bool load(std::string& errorMsg) = 0;

    /**
     * @brief Transcribes one chunk of 16 kHz mono float samples.
     * @return Transcript text, or nullopt on inference failure.
     */
    virtual std::optional<std::string> transcribe(const std::vector<float>& pcmf32) = 0;
};

} // namespace bidlens::domain
