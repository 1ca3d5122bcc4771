/**
 * @file SdlAudioSource.hpp
 * @brief Microphone / loopback capture through SDL2 queued audio.
 */

#pragma once

#include <SDL.h>
#include <atomic>
#include <string>
#include "domain/MediaSource.hpp"

namespace bidlens::infrastructure {

class SdlAudioSource : public domain::AudioSource {
public:
    /** @param deviceName SDL capture device name; empty picks the system default. */
    explicit SdlAudioSource(std::string deviceName = "");
    ~SdlAudioSource() override;

    SdlAudioSource(const SdlAudioSource&) = delete;
    SdlAudioSource& operator=(const SdlAudioSource&) = delete;

    bool open() override;
    bool readChunk(std::vector<float>& samples, double seconds) override;
    void interrupt() override;

private:
    void close();

    std::string m_deviceName;
    SDL_AudioDeviceID m_device = 0;
    bool m_sdlInitialized = false;
    std::atomic<bool> m_interrupted{false};
};

} // namespace bidlens::infrastructure
