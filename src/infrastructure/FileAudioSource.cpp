#include "infrastructure/FileAudioSource.hpp"
#include "infrastructure/AudioUtils.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace bidlens::infrastructure {

FileAudioSource::FileAudioSource(std::string path, bool realTime)
    : m_path(std::move(path)), m_realTime(realTime) {}

bool FileAudioSource::open() {
    m_interrupted = false;
    m_position = 0;

    std::string error;
    if (!AudioUtils::LoadAudioFile(m_path, m_pcm, error)) {
        std::cerr << "[FileAudioSource] " << error << std::endl;
        return false;
    }
    std::cout << "[FileAudioSource] Loaded " << m_pcm.size() / AudioUtils::kSampleRate
              << "s of audio from " << m_path << std::endl;
    return true;
}

bool FileAudioSource::readChunk(std::vector<float>& samples, double seconds) {
    if (m_interrupted || m_position >= m_pcm.size()) return false;

    const std::size_t wanted = std::max<std::size_t>(1, AudioUtils::SamplesFor(seconds));
    const std::size_t count = std::min(wanted, m_pcm.size() - m_position);
    samples.assign(m_pcm.begin() + static_cast<std::ptrdiff_t>(m_position),
                   m_pcm.begin() + static_cast<std::ptrdiff_t>(m_position + count));
    m_position += count;

    if (m_realTime) {
        const auto duration = std::chrono::milliseconds(count * 1000 / AudioUtils::kSampleRate);
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_cv.wait_for(lock, duration, [this] { return m_interrupted.load(); })) {
            return false;
        }
    }
    return true;
}

void FileAudioSource::interrupt() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_interrupted = true;
    }
    m_cv.notify_all();
}

} // namespace bidlens::infrastructure
