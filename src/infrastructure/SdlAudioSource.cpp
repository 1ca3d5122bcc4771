#include "infrastructure/SdlAudioSource.hpp"
#include "infrastructure/AudioUtils.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace bidlens::infrastructure {

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds(20);
}

SdlAudioSource::SdlAudioSource(std::string deviceName)
    : m_deviceName(std::move(deviceName)) {}

SdlAudioSource::~SdlAudioSource() {
    close();
}

bool SdlAudioSource::open() {
    m_interrupted = false;
    if (m_device != 0) return true;

    if (!m_sdlInitialized) {
        if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
            std::cerr << "[SdlAudioSource] SDL audio init failed: " << SDL_GetError() << std::endl;
            return false;
        }
        m_sdlInitialized = true;
    }

    SDL_AudioSpec want;
    SDL_AudioSpec have;
    SDL_zero(want);
    SDL_zero(have);
    want.freq = AudioUtils::kSampleRate;
    want.format = AUDIO_F32SYS;
    want.channels = 1;
    want.samples = 1024;
    want.callback = nullptr;

    const char* device = m_deviceName.empty() ? nullptr : m_deviceName.c_str();
    m_device = SDL_OpenAudioDevice(device, 1, &want, &have, 0);
    if (m_device == 0) {
        std::cerr << "[SdlAudioSource] Could not open capture device '"
                  << (device ? device : "default") << "': " << SDL_GetError() << std::endl;
        return false;
    }

    SDL_PauseAudioDevice(m_device, 0);
    std::cout << "[SdlAudioSource] Capturing at " << have.freq << " Hz from "
              << (device ? device : "default device") << std::endl;
    return true;
}

bool SdlAudioSource::readChunk(std::vector<float>& samples, double seconds) {
    if (m_device == 0) return false;

    const std::size_t wanted = AudioUtils::SamplesFor(seconds);
    samples.assign(wanted, 0.0f);
    std::size_t filled = 0;

    while (filled < wanted) {
        if (m_interrupted) return false;

        const Uint32 queuedBytes = SDL_GetQueuedAudioSize(m_device);
        if (queuedBytes < sizeof(float)) {
            std::this_thread::sleep_for(kPollInterval);
            continue;
        }

        const std::size_t missingBytes = (wanted - filled) * sizeof(float);
        const Uint32 request = static_cast<Uint32>(std::min<std::size_t>(queuedBytes, missingBytes));
        const Uint32 got = SDL_DequeueAudio(m_device, samples.data() + filled, request);
        filled += got / sizeof(float);
    }
    return true;
}

void SdlAudioSource::interrupt() {
    m_interrupted = true;
}

void SdlAudioSource::close() {
    if (m_device != 0) {
        SDL_CloseAudioDevice(m_device);
        m_device = 0;
    }
    if (m_sdlInitialized) {
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_sdlInitialized = false;
    }
}

} // namespace bidlens::infrastructure
