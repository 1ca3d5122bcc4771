/**
 * @file SpeechTranscriber.cpp
 * @brief Implementation of the SpeechTranscriber class.
 */
#include "application/SpeechTranscriber.hpp"
#include "domain/AttributeParser.hpp"

#include <chrono>
#include <iostream>

namespace bidlens::application {

namespace {
constexpr std::chrono::milliseconds kQueuePollInterval(200);
}

SpeechTranscriber::SpeechTranscriber(std::vector<std::unique_ptr<domain::SpeechToTextEngine>> engines,
                                     std::unique_ptr<domain::AudioSource> source,
                                     SpeechTranscriberOptions options)
    : m_engines(std::move(engines))
    , m_source(std::move(source))
    , m_options(options)
    , m_queue(options.queueCapacity) {}

SpeechTranscriber::~SpeechTranscriber() {
    stop();
}

bool SpeechTranscriber::initialize() {
    m_engine = nullptr;
    for (auto& engine : m_engines) {
        if (!engine) continue;
        std::string error;
        if (engine->load(error)) {
            m_engine = engine.get();
            std::cout << "[SpeechTranscriber] Speech model loaded: " << m_engine->name() << std::endl;
            return true;
        }
        std::cerr << "[SpeechTranscriber] " << engine->name() << " unavailable: " << error << std::endl;
    }
    std::cerr << "[SpeechTranscriber] No speech engine loaded. Audio channel disabled." << std::endl;
    return false;
}

bool SpeechTranscriber::start() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (!m_engine || m_active) return false;

    // Threads left over from a source that ended on its own.
    if (m_captureThread.joinable()) m_captureThread.join();
    if (m_transcriptionThread.joinable()) m_transcriptionThread.join();

    m_queue.reset();
    if (m_source && !m_source->open()) {
        std::cerr << "[SpeechTranscriber] Audio source failed to open. Audio channel idle." << std::endl;
        return false;
    }

    m_active = true;
    if (m_source) {
        m_captureThread = std::thread(&SpeechTranscriber::captureLoop, this);
    }
    m_transcriptionThread = std::thread(&SpeechTranscriber::transcriptionLoop, this);
    std::cout << "[SpeechTranscriber] Started (" << m_options.chunkSeconds << "s chunks)." << std::endl;
    return true;
}

void SpeechTranscriber::stop() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (!m_captureThread.joinable() && !m_transcriptionThread.joinable()) {
        m_active = false;
        return;
    }

    m_active = false;
    if (m_source) m_source->interrupt();
    m_queue.close();

    if (m_captureThread.joinable()) m_captureThread.join();
    if (m_transcriptionThread.joinable()) m_transcriptionThread.join();
    std::cout << "[SpeechTranscriber] Stopped." << std::endl;
}

domain::AudioStatus SpeechTranscriber::getLatest() const {
    domain::AudioStatus status;
    status.available = m_engine != nullptr;
    status.active = status.available && m_active.load();
    std::lock_guard<std::mutex> lock(m_latestMutex);
    status.latest = m_latest;
    return status;
}

bool SpeechTranscriber::submitChunk(std::vector<float> samples) {
    if (!m_engine) return false;
    return m_queue.push(std::move(samples));
}

domain::Transcript SpeechTranscriber::transcribeChunk(const std::vector<float>& samples) {
    domain::Transcript transcript;
    if (!m_engine || samples.empty()) return transcript;

    std::optional<std::string> text;
    try {
        text = m_engine->transcribe(samples);
    } catch (const std::exception& e) {
        std::cerr << "[SpeechTranscriber] Transcription failed: " << e.what() << std::endl;
        return transcript;
    }
    if (!text) return transcript;

    transcript.text = *text;
    transcript.attributes = domain::AttributeParser::ParseSpokenAttributes(transcript.text);
    transcript.confidence = domain::AttributeParser::ScoreSpokenConfidence(transcript.attributes);
    return transcript;
}

void SpeechTranscriber::publish(const domain::Transcript& transcript) {
    std::lock_guard<std::mutex> lock(m_latestMutex);
    m_latest = transcript;
}

void SpeechTranscriber::captureLoop() {
    std::vector<float> chunk;
    while (m_active) {
        chunk.clear();
        if (!m_source->readChunk(chunk, m_options.chunkSeconds)) {
            if (m_active) {
                std::cout << "[SpeechTranscriber] Audio source ended." << std::endl;
                // Let the transcription thread drain what is queued, then wind down.
                m_queue.close();
            }
            break;
        }
        if (m_queue.push(std::move(chunk))) {
            std::cout << "[SpeechTranscriber] Transcription behind, dropped oldest chunk." << std::endl;
        }
        chunk = std::vector<float>();
    }
}

void SpeechTranscriber::transcriptionLoop() {
    while (m_active) {
        auto chunk = m_queue.pop(kQueuePollInterval);
        if (!chunk) {
            if (m_queue.closed()) break;
            continue;
        }
        domain::Transcript transcript = transcribeChunk(*chunk);
        if (m_active && !transcript.text.empty()) {
            publish(transcript);
        }
    }

    if (m_active.exchange(false)) {
        publish(domain::Transcript{});
        std::cout << "[SpeechTranscriber] Audio channel inactive." << std::endl;
    }
}

} // namespace bidlens::application
