/**
 * @file FrameOrchestrator.cpp
 * @brief Implementation of the FrameOrchestrator class.
 */
#include "application/FrameOrchestrator.hpp"
#include "domain/AttributeParser.hpp"
#include "domain/IdentityFuser.hpp"

#include <ctime>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace bidlens::application {

namespace {

constexpr std::size_t kStatusOcrPreview = 100;

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

FrameOrchestrator::FrameOrchestrator(SessionContext& session,
                                     TextRecognizer& recognizer,
                                     domain::SignalEngine signalEngine,
                                     OrchestratorOptions options)
    : m_session(session)
    , m_recognizer(recognizer)
    , m_signalEngine(signalEngine)
    , m_options(options)
    , m_advice(std::make_shared<AdviceSlot>()) {
    if (m_options.processEveryNFrames < 1) m_options.processEveryNFrames = 1;
}

void FrameOrchestrator::setAdvisory(std::shared_ptr<domain::AdvisoryService> advisory,
                                    std::shared_ptr<AsyncTaskManager> tasks) {
    m_advisory = std::move(advisory);
    m_tasks = std::move(tasks);
}

void FrameOrchestrator::addSink(std::shared_ptr<domain::ResultSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(m_sinksMutex);
    m_sinks.push_back(std::move(sink));
}

std::vector<std::shared_ptr<domain::ResultSink>> FrameOrchestrator::sinks() const {
    std::lock_guard<std::mutex> lock(m_sinksMutex);
    return m_sinks;
}

std::string FrameOrchestrator::IsoTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::tm tm = ToUtcTime(now);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string FrameOrchestrator::AdviceKey(const domain::CardIdentity& identity, double bid) {
    std::ostringstream ss;
    ss << identity.attributes.name << "|" << identity.attributes.grade << "|" << std::fixed << std::setprecision(2) << bid;
    return ss.str();
}

std::uint64_t FrameOrchestrator::run(domain::FrameSource& source) {
    if (m_stopRequested) return 0;
    m_running = true;
    if (m_transcriber && m_transcriber->isAvailable()) {
        m_transcriber->start();
    }
    std::cout << "[FrameOrchestrator] Session " << m_session.sessionId << " started." << std::endl;

    using Clock = std::chrono::steady_clock;
    const auto interval = m_options.targetFps > 0.0
        ? std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / m_options.targetFps))
        : Clock::duration::zero();
    auto deadline = Clock::now();
    std::uint64_t processed = 0;

    int droppedInRow = 0;

    while (!m_stopRequested) {
        domain::Frame frame;
        bool ok = false;
        std::string error;
        try {
            ok = source.read(frame);
        } catch (const std::exception& e) {
            error = e.what();
        }
        if (!ok) {
            if (!source.isLive()) {
                if (error.empty()) {
                    std::cout << "[FrameOrchestrator] Frame source exhausted." << std::endl;
                } else {
                    std::cerr << "[FrameOrchestrator] Capture failed: " << error << std::endl;
                    publishStatus("Capture error: " + error, m_nextFrameIndex);
                }
                break;
            }
            if (m_stopRequested) break;
            // Report once per outage, then keep polling the stream.
            if (droppedInRow++ == 0) {
                std::cerr << "[FrameOrchestrator] Frame dropped" << (error.empty() ? std::string() : ": " + error) << std::endl;
                publishStatus(error.empty() ? std::string("Frame dropped, waiting for the stream...")
                                            : "Capture error: " + error + ". Retrying...",
                              m_nextFrameIndex);
            }
            if (!waitForNextFrame(Clock::now() + m_options.readRetryDelay)) break;
            deadline = Clock::now();
            continue;
        }
        if (droppedInRow > 0) {
            std::cout << "[FrameOrchestrator] Capture recovered after " << droppedInRow << " failed read(s)." << std::endl;
            droppedInRow = 0;
        }

        frame.index = m_nextFrameIndex++;
        publishPreview(frame);

        if (frame.index % static_cast<std::uint64_t>(m_options.processEveryNFrames) == 0) {
            try {
                processFrame(frame);
                ++processed;
            } catch (const std::exception& e) {
                std::cerr << "[FrameOrchestrator] Frame " << frame.index << " failed: " << e.what() << std::endl;
                publishStatus(std::string("Error processing frame: ") + e.what(), frame.index);
            }
        }

        deadline += interval;
        const auto now = Clock::now();
        // Never try to catch up after a slow frame.
        if (deadline < now) deadline = now;
        if (!waitForNextFrame(deadline)) break;
    }

    if (m_transcriber) {
        m_transcriber->stop();
    }
    m_running = false;
    std::cout << "[FrameOrchestrator] Session " << m_session.sessionId << " stopped after "
              << processed << " processed frame(s)." << std::endl;
    return processed;
}

bool FrameOrchestrator::waitForNextFrame(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(m_throttleMutex);
    m_throttleCv.wait_until(lock, deadline, [this] { return m_stopRequested.load(); });
    return !m_stopRequested;
}

void FrameOrchestrator::reset() {
    std::lock_guard<std::mutex> lock(m_throttleMutex);
    m_stopRequested = false;
}

void FrameOrchestrator::stop() {
    {
        std::lock_guard<std::mutex> lock(m_throttleMutex);
        m_stopRequested = true;
    }
    m_throttleCv.notify_all();
    if (m_transcriber) {
        m_transcriber->stop();
    }
}

std::optional<domain::FrameResult> FrameOrchestrator::processFrame(const domain::Frame& frame) {
    auto recognition = std::async(std::launch::async, [this, image = frame.image] {
        return m_recognizer.recognize(image);
    });
    const domain::RecognizedText text = recognition.get();
    if (m_stopRequested) return std::nullopt;

    const domain::AudioStatus audio = m_transcriber ? m_transcriber->getLatest() : domain::AudioStatus{};
    const domain::SpokenAttributes& spoken = audio.latest.attributes;

    const domain::CardIdentity textIdentity =
        domain::IdentityFuser::FromText(text.attributes, text.confidence, text.engine);
    const domain::CardIdentity fused =
        domain::IdentityFuser::Fuse(textIdentity, spoken, text.confidence, audio.latest.confidence);
    const domain::CardIdentity identity = m_session.continuity.update(fused, frame.capturedAt);

    domain::AuctionInfo auction = domain::AttributeParser::ParseAuctionInfo(text.priceText);
    if (!auction.hasActiveBid() && spoken.spokenPrice && *spoken.spokenPrice > 0.0) {
        auction.currentBid = *spoken.spokenPrice;
        auction.bidSource = "audio";
    }

    const std::uint64_t processedIndex = ++m_processedCount;
    if (!identity.isResolved()) {
        if (m_stopRequested) return std::nullopt;
        if (m_options.statusEveryNProcessed > 0 &&
            (processedIndex - 1) % static_cast<std::uint64_t>(m_options.statusEveryNProcessed) == 0) {
            std::string ocr = text.combinedText();
            if (ocr.size() > kStatusOcrPreview) ocr = ocr.substr(0, kStatusOcrPreview) + "...";
            publishStatus("Scanning for items... OCR: " + (ocr.empty() ? std::string("(no text)") : ocr), frame.index);
        }
        return std::nullopt;
    }

    const domain::PriceSnapshot snapshot =
        m_session.resolver ? m_session.resolver->resolve(identity) : domain::PriceSnapshot{};
    const domain::SignalResult signal = m_signalEngine.score(identity, auction.currentBid, snapshot);
    requestAdvice(identity, auction.currentBid, snapshot);

    domain::FrameResult result;
    result.frameIndex = frame.index;
    result.sessionId = m_session.sessionId;
    result.timestamp = IsoTimestamp();
    result.identity = identity;
    result.auction = auction;
    result.snapshot = snapshot;
    result.signal = signal;
    result.advisoryText = currentAdvice(identity, auction.currentBid);
    result.audio = audio;
    result.detectionConfidence = domain::AttributeParser::DetectionConfidence(identity.attributes, auction);
    result.ocrText = text.combinedText();

    if (m_stopRequested) return std::nullopt;

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_latest = result;
    }
    for (const auto& sink : sinks()) {
        try {
            sink->publishResult(result);
        } catch (const std::exception& e) {
            std::cerr << "[FrameOrchestrator] Sink failed: " << e.what() << std::endl;
        }
    }
    if (m_sessionLog) {
        m_sessionLog->append(result);
    }
    return result;
}

void FrameOrchestrator::publishStatus(const std::string& message, std::uint64_t frameIndex) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_lastStatus = message;
    }
    for (const auto& sink : sinks()) {
        try {
            sink->publishStatus(message, frameIndex);
        } catch (const std::exception& e) {
            std::cerr << "[FrameOrchestrator] Sink failed: " << e.what() << std::endl;
        }
    }
}

void FrameOrchestrator::publishPreview(const domain::Frame& frame) {
    for (const auto& sink : sinks()) {
        try {
            sink->publishPreview(frame);
        } catch (const std::exception& e) {
            std::cerr << "[FrameOrchestrator] Preview sink failed: " << e.what() << std::endl;
        }
    }
}

void FrameOrchestrator::requestAdvice(const domain::CardIdentity& identity,
                                      double bid,
                                      const domain::PriceSnapshot& snapshot) {
    if (!m_advisory || !m_tasks || bid <= 0.0 || !m_advisory->isAvailable()) return;

    AdviceRequest request{identity, bid, snapshot, AdviceKey(identity, bid)};
    {
        std::lock_guard<std::mutex> lock(m_advice->mutex);
        if (m_advice->key == request.key) return;
        m_advice->key = request.key;
        m_advice->text.reset();
        if (m_advice->inFlight) {
            m_advice->pending = std::move(request);
            return;
        }
        m_advice->inFlight = true;
    }

    m_tasks->SubmitTask("advisory for " + identity.describe(),
        [slot = m_advice, advisory = m_advisory, request = std::move(request)](std::shared_ptr<TaskStatus>) mutable {
            RunAdvice(slot, advisory, std::move(request));
        });
}

void FrameOrchestrator::RunAdvice(std::shared_ptr<AdviceSlot> slot,
                                  std::shared_ptr<domain::AdvisoryService> advisory,
                                  AdviceRequest request) {
    while (true) {
        std::optional<domain::DealAdvice> advice;
        try {
            advice = advisory->advise(request.identity, request.bid, request.snapshot);
        } catch (const std::exception& e) {
            std::cerr << "[FrameOrchestrator] Advisory failed: " << e.what() << std::endl;
        }

        std::lock_guard<std::mutex> lock(slot->mutex);
        if (advice && slot->key == request.key) {
            slot->text = advice->summary();
        }
        if (!slot->pending) {
            slot->inFlight = false;
            return;
        }
        request = std::move(*slot->pending);
        slot->pending.reset();
    }
}

std::optional<std::string> FrameOrchestrator::currentAdvice(const domain::CardIdentity& identity, double bid) const {
    std::lock_guard<std::mutex> lock(m_advice->mutex);
    if (m_advice->key != AdviceKey(identity, bid)) return std::nullopt;
    return m_advice->text;
}

std::optional<domain::FrameResult> FrameOrchestrator::latestResult() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_latest;
}

std::string FrameOrchestrator::lastStatus() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_lastStatus;
}

} // namespace bidlens::application
