#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/FrameOrchestrator.hpp"
#include "application/PriceResolver.hpp"
#include "application/SessionContext.hpp"
#include "application/TextRecognizer.hpp"
#include "infrastructure/PriceCache.hpp"
#include "infrastructure/SessionLogStore.hpp"
#include "test/TestDoubles.hpp"

using namespace bidlens;
using application::FrameOrchestrator;
using application::OrchestratorOptions;
using application::PriceResolver;
using application::SessionContext;
using application::TextRecognizer;
using application::TextRecognizerOptions;
using domain::Recommendation;
using domain::SignalColor;

namespace {

const std::vector<domain::TextFragment> kTroutOverlay = {
    {"2023 Topps Mike Trout PSA 10 #27", 0.9},
    {"Current Bid $40", 0.9}
};

/// One recognizer + session + orchestrator wired to fakes.
struct Harness {
    explicit Harness(std::vector<domain::TextFragment> fragments, OrchestratorOptions options = {})
        : search(std::make_shared<test::FakeSoldListingSearch>())
        , sink(std::make_shared<test::RecordingSink>())
        , log(std::make_shared<infrastructure::SessionLogStore>())
        , recognizer(Engines(std::move(fragments)), SingleRegion())
        , session("test-session", std::make_shared<PriceResolver>(std::make_shared<infrastructure::PriceCache>(), search))
        , orchestrator(session, recognizer, domain::SignalEngine(), options) {
        recognizer.initialize();
        orchestrator.addSink(sink);
        orchestrator.setSessionLog(log);
    }

    static std::vector<std::unique_ptr<domain::TextRecognitionEngine>> Engines(std::vector<domain::TextFragment> fragments) {
        std::vector<std::unique_ptr<domain::TextRecognitionEngine>> engines;
        engines.push_back(std::make_unique<test::FakeTextEngine>(std::move(fragments)));
        return engines;
    }

    static TextRecognizerOptions SingleRegion() {
        TextRecognizerOptions options;
        options.dualRegion = false;
        options.preprocess = false;
        return options;
    }

    static domain::Frame MakeFrame(std::uint64_t index) {
        domain::Frame frame;
        frame.image = cv::Mat(100, 160, CV_8UC3, cv::Scalar(255, 255, 255));
        frame.index = index;
        return frame;
    }

    std::shared_ptr<test::FakeSoldListingSearch> search;
    std::shared_ptr<test::RecordingSink> sink;
    std::shared_ptr<infrastructure::SessionLogStore> log;
    TextRecognizer recognizer;
    SessionContext session;
    FrameOrchestrator orchestrator;
};

OrchestratorOptions Unthrottled() {
    OrchestratorOptions options;
    options.targetFps = 0.0;
    options.processEveryNFrames = 1;
    return options;
}

void TestScoredFrame() {
    std::cout << "[Test] Identified frame is priced, scored, published and logged..." << std::endl;
    Harness h(kTroutOverlay);
    h.search->answerAll(test::Comparables(std::vector<double>(12, 20.0)));

    auto result = h.orchestrator.processFrame(Harness::MakeFrame(7));
    assert(result);
    assert(result->frameIndex == 7);
    assert(result->sessionId == "test-session");
    assert(!result->timestamp.empty());
    assert(result->identity.attributes.name == "Mike Trout");
    assert(result->auction.currentBid == 40.0);
    assert(result->auction.bidSource == "ocr");
    assert(result->snapshot.count == 12);
    // 20 * 2.5 (PSA 10) = 50 fair value against a 40 bid.
    assert(result->signal.recommendation == Recommendation::Buy);
    assert(result->signal.color == SignalColor::Green);
    assert(result->signal.roiPercent == 25.0);
    assert(!result->advisoryText);

    assert(h.sink->resultCount() == 1);
    assert(h.orchestrator.latestResult()->frameIndex == 7);
    auto history = h.log->history("test-session");
    assert(history && history->size() == 1);
    assert((*history)[0]["frame_index"] == 7);
    assert((*history)[0]["signal"]["signal"] == "GREEN");
    std::cout << "[PASS] Identified frame is priced, scored, published and logged" << std::endl;
}

void TestSearchFailureIsGray() {
    std::cout << "[Test] Search failure reads as no market data..." << std::endl;
    Harness h(kTroutOverlay);
    h.search->throwOnSearch = true;

    auto result = h.orchestrator.processFrame(Harness::MakeFrame(0));
    assert(result);
    assert(result->snapshot.count == 0);
    assert(result->signal.recommendation == Recommendation::InsufficientData);
    assert(result->signal.color == SignalColor::Gray);
    assert(result->signal.reason == "no market data");
    assert(h.sink->resultCount() == 1);
    std::cout << "[PASS] Search failure reads as no market data" << std::endl;
}

void TestCarryOverWhenOverlayDisappears() {
    std::cout << "[Test] The last item is carried over a blank frame..." << std::endl;
    auto engine = std::make_unique<test::FakeTextEngine>(kTroutOverlay);
    test::FakeTextEngine* raw = engine.get();
    Harness h({});
    std::vector<std::unique_ptr<domain::TextRecognitionEngine>> engines;
    engines.push_back(std::move(engine));
    TextRecognizer recognizer(std::move(engines), Harness::SingleRegion());
    recognizer.initialize();
    FrameOrchestrator orchestrator(h.session, recognizer, domain::SignalEngine());
    orchestrator.addSink(h.sink);
    h.search->answerAll(test::Comparables({20, 20, 20}));

    assert(orchestrator.processFrame(Harness::MakeFrame(0)));
    raw->setFragments({{"Current Bid $45", 0.9}});
    auto carried = orchestrator.processFrame(Harness::MakeFrame(1));
    assert(carried);
    assert(carried->identity.carriedOver);
    assert(carried->identity.attributes.name == "Mike Trout");
    assert(carried->auction.currentBid == 45.0);
    // Second frame hit the price cache.
    assert(h.search->callCount() == 1);
    std::cout << "[PASS] The last item is carried over a blank frame" << std::endl;
}

void TestStoppedPublishesNothing() {
    std::cout << "[Test] A stopped orchestrator publishes nothing..." << std::endl;
    Harness h(kTroutOverlay, Unthrottled());
    h.orchestrator.stop();

    assert(!h.orchestrator.processFrame(Harness::MakeFrame(0)));
    test::FakeFrameSource source(5);
    assert(h.orchestrator.run(source) == 0);
    assert(h.sink->resultCount() == 0);
    assert(h.sink->previews.empty());
    assert(!h.log->history("test-session"));

    h.orchestrator.reset();
    test::FakeFrameSource again(3);
    assert(h.orchestrator.run(again) == 3);
    assert(!h.orchestrator.isRunning());
    assert(h.sink->resultCount() == 3);
    assert((h.sink->previews == std::vector<std::uint64_t>{0, 1, 2}));
    std::cout << "[PASS] A stopped orchestrator publishes nothing" << std::endl;
}

void TestFrameSkipAndPreviewIndices() {
    std::cout << "[Test] Every frame is previewed, every Nth processed..." << std::endl;
    OrchestratorOptions options = Unthrottled();
    options.processEveryNFrames = 3;
    Harness h(kTroutOverlay, options);

    test::FakeFrameSource source(7);
    assert(h.orchestrator.run(source) == 3);
    assert((h.sink->previews == std::vector<std::uint64_t>{0, 1, 2, 3, 4, 5, 6}));
    assert(h.sink->results.size() == 3);
    assert(h.sink->results[0].frameIndex == 0);
    assert(h.sink->results[1].frameIndex == 3);
    assert(h.sink->results[2].frameIndex == 6);
    std::cout << "[PASS] Every frame is previewed, every Nth processed" << std::endl;
}

void TestScanningStatusCadence() {
    std::cout << "[Test] Scanning status is throttled while nothing is identified..." << std::endl;
    Harness h({{"Current Bid $5", 0.8}}, Unthrottled());

    test::FakeFrameSource source(61);
    assert(h.orchestrator.run(source) == 61);
    assert(h.sink->resultCount() == 0);
    assert(h.sink->statuses.size() == 3);
    assert(h.sink->statuses[0].first == 0);
    assert(h.sink->statuses[1].first == 30);
    assert(h.sink->statuses[2].first == 60);
    assert(h.sink->statuses[0].second == "Scanning for items... OCR: Current Bid $5");
    assert(h.orchestrator.lastStatus() == h.sink->statuses[2].second);
    assert(h.search->callCount() == 0);
    std::cout << "[PASS] Scanning status is throttled while nothing is identified" << std::endl;
}

void TestAdvisoryAttachedOnLaterFrame() {
    std::cout << "[Test] Advisory runs in the background and is attached once ready..." << std::endl;
    Harness h(kTroutOverlay);
    h.search->answerAll(test::Comparables(std::vector<double>(12, 20.0)));
    auto advisory = std::make_shared<test::FakeAdvisory>();
    auto tasks = std::make_shared<application::AsyncTaskManager>();
    h.orchestrator.setAdvisory(advisory, tasks);

    auto first = h.orchestrator.processFrame(Harness::MakeFrame(0));
    assert(first);
    assert(tasks->WaitForIdle(std::chrono::seconds(5)));

    auto second = h.orchestrator.processFrame(Harness::MakeFrame(1));
    assert(second && second->advisoryText);
    assert(second->advisoryText->find("BUY") != std::string::npos);
    // Same item and bid: no second request.
    assert(advisory->adviceCalls == 1);
    std::cout << "[PASS] Advisory runs in the background and is attached once ready" << std::endl;
}

void TestLiveSourceSurvivesDroppedFrames() {
    std::cout << "[Test] A live source keeps running through dropped frames..." << std::endl;
    OrchestratorOptions options = Unthrottled();
    options.readRetryDelay = std::chrono::milliseconds(1);
    Harness h(kTroutOverlay, options);
    h.search->answerAll(test::Comparables({20, 20, 20}));

    // Attempt 2 returns no frame, attempt 3 throws, then the stream recovers.
    test::FlakyLiveSource source(3, {2}, {3});
    source.onDrained = [&h] { h.orchestrator.stop(); };

    assert(h.orchestrator.run(source) == 3);
    assert(source.attempts == 6);
    assert((h.sink->previews == std::vector<std::uint64_t>{0, 1, 2}));
    assert(h.sink->resultCount() == 3);
    // One status for the outage, not one per failed read.
    assert(h.sink->statuses.size() == 1);
    assert(h.sink->statuses[0].first == 1);
    assert(h.sink->statuses[0].second == "Frame dropped, waiting for the stream...");
    std::cout << "[PASS] A live source keeps running through dropped frames" << std::endl;
}

void TestOneAdvisoryRequestAtATime() {
    std::cout << "[Test] Bid changes queue behind a single advisory request..." << std::endl;
    auto engine = std::make_unique<test::FakeTextEngine>(kTroutOverlay);
    test::FakeTextEngine* raw = engine.get();
    Harness h({});
    std::vector<std::unique_ptr<domain::TextRecognitionEngine>> engines;
    engines.push_back(std::move(engine));
    TextRecognizer recognizer(std::move(engines), Harness::SingleRegion());
    recognizer.initialize();
    FrameOrchestrator orchestrator(h.session, recognizer, domain::SignalEngine());
    h.search->answerAll(test::Comparables(std::vector<double>(12, 20.0)));

    auto advisory = std::make_shared<test::FakeAdvisory>();
    advisory->delay = std::chrono::milliseconds(300);
    auto tasks = std::make_shared<application::AsyncTaskManager>();
    orchestrator.setAdvisory(advisory, tasks);

    for (int bid = 40; bid <= 44; ++bid) {
        raw->setFragments({{"2023 Topps Mike Trout PSA 10 #27", 0.9},
                           {"Current Bid $" + std::to_string(bid), 0.9}});
        assert(orchestrator.processFrame(Harness::MakeFrame(static_cast<std::uint64_t>(bid))));
        assert(tasks->GetActiveTasks().size() <= 1);
    }
    assert(tasks->WaitForIdle(std::chrono::seconds(5)));

    // The first request and the newest bid; the ones in between were superseded.
    assert(advisory->adviceCalls == 2);
    assert(advisory->lastBid.load() == 44.0);
    auto latest = orchestrator.processFrame(Harness::MakeFrame(45));
    assert(latest && latest->advisoryText);
    assert(advisory->adviceCalls == 2);
    std::cout << "[PASS] Bid changes queue behind a single advisory request" << std::endl;
}

} // namespace

int main() {
    TestScoredFrame();
    TestSearchFailureIsGray();
    TestCarryOverWhenOverlayDisappears();
    TestStoppedPublishesNothing();
    TestFrameSkipAndPreviewIndices();
    TestScanningStatusCadence();
    TestAdvisoryAttachedOnLaterFrame();
    TestLiveSourceSurvivesDroppedFrames();
    TestOneAdvisoryRequestAtATime();
    std::cout << "[PASS] FrameOrchestratorTest" << std::endl;
    return 0;
}
