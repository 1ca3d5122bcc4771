/**
 * @file FileAudioSource.hpp
 * @brief Replays a recorded audio file as if it were live.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include "domain/MediaSource.hpp"

namespace bidlens::infrastructure {

/**
 * @class FileAudioSource
 * @brief Decodes the whole file on open() and hands out chunks, optionally paced at real time.
 */
class FileAudioSource : public domain::AudioSource {
public:
    explicit FileAudioSource(std::string path, bool realTime = true);

    bool open() override;
    bool readChunk(std::vector<float>& samples, double seconds) override;
    void interrupt() override;

private:
    std::string m_path;
    bool m_realTime;
    std::vector<float> m_pcm;
    std::size_t m_position = 0;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool> m_interrupted{false};
};

} // namespace bidlens::infrastructure
