/**
 * @file SpeechTranscriber.hpp
 * @brief Continuous auctioneer transcription running beside the frame loop.
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "application/DropOldestQueue.hpp"
#include "domain/MediaSource.hpp"
#include "domain/SpeechToTextEngine.hpp"
#include "domain/Transcript.hpp"

namespace bidlens::application {

struct SpeechTranscriberOptions {
    double chunkSeconds = 7.0;
    std::size_t queueCapacity = 4;
};

/**
 * @class SpeechTranscriber
 * @brief Capture thread -> bounded drop-oldest queue -> transcription thread.
 *
 * Consumers only ever call getLatest(), which never blocks on inference.
 * Without a loaded engine every call is a no-op.
 */
class SpeechTranscriber {
public:
    SpeechTranscriber(std::vector<std::unique_ptr<domain::SpeechToTextEngine>> engines,
                      std::unique_ptr<domain::AudioSource> source,
                      SpeechTranscriberOptions options = {});
    ~SpeechTranscriber();

    SpeechTranscriber(const SpeechTranscriber&) = delete;
    SpeechTranscriber& operator=(const SpeechTranscriber&) = delete;

    /** @brief Loads the first engine that succeeds. Logged once. */
    bool initialize();

    bool isAvailable() const { return m_engine != nullptr; }
    bool isActive() const { return m_active.load(); }

    /** @brief Starts capture and transcription threads. False when unavailable or already running. */
    bool start();

    /** @brief Interrupts capture and joins both threads. Safe to call repeatedly. */
    void stop();

    domain::AudioStatus getLatest() const;

    /**
     * @brief Queues one chunk for transcription.
     * @return True when an older pending chunk was dropped.
     */
    bool submitChunk(std::vector<float> samples);

    /** @brief Transcribes and parses one chunk on the calling thread. */
    domain::Transcript transcribeChunk(const std::vector<float>& samples);

    std::size_t droppedChunks() const { return m_queue.droppedCount(); }
    std::size_t pendingChunks() const { return m_queue.size(); }

private:
    void captureLoop();
    void transcriptionLoop();
    void publish(const domain::Transcript& transcript);

    std::vector<std::unique_ptr<domain::SpeechToTextEngine>> m_engines;
    domain::SpeechToTextEngine* m_engine = nullptr;
    std::unique_ptr<domain::AudioSource> m_source;
    SpeechTranscriberOptions m_options;

    DropOldestQueue<std::vector<float>> m_queue;
    std::thread m_captureThread;
    std::thread m_transcriptionThread;
    std::atomic<bool> m_active{false};
    std::mutex m_lifecycleMutex;

    domain::Transcript m_latest;
    mutable std::mutex m_latestMutex;
};

} // namespace bidlens::application
