#pragma once

#include <string>
#include <vector>

namespace bidlens::infrastructure {

/**
 * @brief Decoding helpers producing the 16 kHz mono float format speech engines expect.
 */
class AudioUtils {
public:
    static constexpr int kSampleRate = 16000;

    /**
     * @brief Converts any ffmpeg-readable audio file to 16kHz mono WAV.
     * @param inputPath Path to source file.
     * @param outputPath Populated with a temp file path.
     * @param error Populated on failure.
     */
    static bool ConvertAudioToWav(const std::string& inputPath, std::string& outputPath, std::string& error);

    /**
     * @brief Loads a WAV file and converts it to 16kHz float32 mono.
     * @param fname Path to WAV file.
     * @param pcmf32 Resulting samples.
     * @param error Populated on failure.
     */
    static bool LoadAudioSDL(const std::string& fname, std::vector<float>& pcmf32, std::string& error);

    /** @brief LoadAudioSDL for .wav, ffmpeg conversion first for anything else. */
    static bool LoadAudioFile(const std::string& path, std::vector<float>& pcmf32, std::string& error);

    static std::size_t SamplesFor(double seconds) {
        return seconds <= 0.0 ? 0 : static_cast<std::size_t>(seconds * kSampleRate);
    }
};

} // namespace bidlens::infrastructure
