/**
 * @file FrameOrchestrator.hpp
 * @brief Per-frame state machine: recognize, fuse, carry over, price, score, publish.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/AsyncTaskManager.hpp"
#include "application/SessionContext.hpp"
#include "application/SpeechTranscriber.hpp"
#include "application/TextRecognizer.hpp"
#include "domain/AdvisoryService.hpp"
#include "domain/FrameResult.hpp"
#include "domain/MediaSource.hpp"
#include "domain/SignalEngine.hpp"
#include "infrastructure/SessionLogStore.hpp"

namespace bidlens::application {

struct OrchestratorOptions {
    double targetFps = 5.0;
    int processEveryNFrames = 3;
    int statusEveryNProcessed = 30; ///< Scanning status cadence while nothing is identified.
    std::chrono::milliseconds readRetryDelay{200}; ///< Pause after a dropped frame on a live source.
};

/**
 * @class FrameOrchestrator
 * @brief Drives one auction stream. Every stage runs sequentially inside a frame.
 *
 * Collaborators other than the session and the recognizer are optional:
 * without a transcriber the audio channel reads as silent, without an
 * advisory service no advisory text is attached, without a log store nothing
 * is recorded.
 */
class FrameOrchestrator {
public:
    FrameOrchestrator(SessionContext& session,
                      TextRecognizer& recognizer,
                      domain::SignalEngine signalEngine,
                      OrchestratorOptions options = {});

    void setTranscriber(SpeechTranscriber* transcriber) { m_transcriber = transcriber; }
    void setAdvisory(std::shared_ptr<domain::AdvisoryService> advisory, std::shared_ptr<AsyncTaskManager> tasks);
    void setSessionLog(std::shared_ptr<infrastructure::SessionLogStore> log) { m_sessionLog = std::move(log); }
    void addSink(std::shared_ptr<domain::ResultSink> sink);

    /**
     * @brief Reads frames until a recorded source is exhausted or stop() is called.
     *
     * A live source that fails to deliver a frame is retried after
     * readRetryDelay; only stop() ends a live session.
     * @return Number of frames processed.
     */
    std::uint64_t run(domain::FrameSource& source);

    /**
     * @brief Runs the full pipeline for one frame and publishes the outcome.
     * @return The published result; nullopt when only a status (or nothing) was published.
     */
    std::optional<domain::FrameResult> processFrame(const domain::Frame& frame);

    /** @brief Ends run(), wakes the throttle, stops audio capture and suppresses in-flight output. */
    void stop();

    /** @brief Re-arms a stopped orchestrator; run() returns immediately while stopped. */
    void reset();

    bool isRunning() const { return m_running.load(); }

    std::optional<domain::FrameResult> latestResult() const;
    std::string lastStatus() const;

    const SessionContext& session() const { return m_session; }

private:
    struct AdviceRequest {
        domain::CardIdentity identity;
        double bid = 0.0;
        domain::PriceSnapshot snapshot;
        std::string key;
    };

    /// At most one request runs; a newer key waits in `pending`, replacing any older one.
    struct AdviceSlot {
        std::mutex mutex;
        std::string key;
        std::optional<std::string> text;
        bool inFlight = false;
        std::optional<AdviceRequest> pending;
    };

    void publishStatus(const std::string& message, std::uint64_t frameIndex);
    void publishPreview(const domain::Frame& frame);
    void requestAdvice(const domain::CardIdentity& identity, double bid, const domain::PriceSnapshot& snapshot);
    std::optional<std::string> currentAdvice(const domain::CardIdentity& identity, double bid) const;
    bool waitForNextFrame(std::chrono::steady_clock::time_point deadline);
    std::vector<std::shared_ptr<domain::ResultSink>> sinks() const;

    static void RunAdvice(std::shared_ptr<AdviceSlot> slot,
                          std::shared_ptr<domain::AdvisoryService> advisory,
                          AdviceRequest request);

    static std::string AdviceKey(const domain::CardIdentity& identity, double bid);
    static std::string IsoTimestamp();

    SessionContext& m_session;
    TextRecognizer& m_recognizer;
    domain::SignalEngine m_signalEngine;
    OrchestratorOptions m_options;

    SpeechTranscriber* m_transcriber = nullptr;
    std::shared_ptr<domain::AdvisoryService> m_advisory;
    std::shared_ptr<AsyncTaskManager> m_tasks;
    std::shared_ptr<infrastructure::SessionLogStore> m_sessionLog;
    std::shared_ptr<AdviceSlot> m_advice;

    std::vector<std::shared_ptr<domain::ResultSink>> m_sinks;
    mutable std::mutex m_sinksMutex;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
    std::mutex m_throttleMutex;
    std::condition_variable m_throttleCv;

    std::uint64_t m_nextFrameIndex = 0;
    std::uint64_t m_processedCount = 0;

    std::optional<domain::FrameResult> m_latest;
    std::string m_lastStatus;
    mutable std::mutex m_stateMutex;
};

} // namespace bidlens::application
