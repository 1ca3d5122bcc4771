#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <opencv2/core.hpp>
#include "infrastructure/ConsoleResultSink.hpp"
#include "infrastructure/HttpResultServer.hpp"
#include "infrastructure/SessionLogStore.hpp"

using namespace bidlens;
using infrastructure::AnalysisControl;
using infrastructure::ConsoleResultSink;
using infrastructure::HttpResultServer;
using infrastructure::SessionLogStore;

namespace {

domain::FrameResult BuyResult() {
    domain::FrameResult result;
    result.frameIndex = 42;
    result.sessionId = "live";
    result.identity.attributes.name = "Mike Trout";
    result.identity.attributes.year = "2023";
    result.identity.attributes.setName = "Topps";
    result.identity.attributes.itemNumber = "27";
    result.identity.attributes.grade = "PSA 10";
    result.auction.currentBid = 40.0;
    result.auction.bidSource = "ocr";
    result.snapshot.count = 12;
    result.signal.recommendation = domain::Recommendation::Buy;
    result.signal.color = domain::SignalColor::Green;
    result.signal.fairValue.estimated = 50.0;
    result.signal.roiPercent = 25.0;
    result.signal.confidence = 0.7;
    result.signal.suggestedMaxBid = 42.5;
    return result;
}

void TestConsoleFormat() {
    std::cout << "[Test] Console line format..." << std::endl;
    assert(ConsoleResultSink::FormatResult(BuyResult()) ==
           "[Frame 42] Mike Trout 2023 Topps #27 PSA 10 | bid $40.00 (ocr) | BUY GREEN"
           " | fair $50.00 | ROI 25.0% | conf 70% | max bid $42.50 | 12 comps");

    domain::FrameResult gray;
    gray.frameIndex = 3;
    gray.identity.attributes.name = "Mike Trout";
    gray.identity.carriedOver = true;
    gray.signal = domain::SignalResult::Insufficient("no active bid detected");
    assert(ConsoleResultSink::FormatResult(gray) ==
           "[Frame 3] Mike Trout (carried over) | bid $0.00 | INSUFFICIENT_DATA GRAY - no active bid detected | 0 comps");

    std::ostringstream out;
    ConsoleResultSink sink(out);
    auto withAdvice = BuyResult();
    withAdvice.advisoryText = "BUY (high)";
    sink.publishResult(withAdvice);
    sink.publishStatus("Scanning for items...", 7);
    const std::string text = out.str();
    assert(text.find("[Advisor] BUY (high)\n") != std::string::npos);
    assert(text.find("[Status 7] Scanning for items...\n") != std::string::npos);
    std::cout << "[PASS] Console line format" << std::endl;
}

void TestHttpBodies() {
    std::cout << "[Test] HTTP response bodies..." << std::endl;
    auto log = std::make_shared<SessionLogStore>();
    AnalysisControl control;
    control.isRunning = [] { return true; };
    HttpResultServer server("127.0.0.1", 0, log, control);

    assert(!server.latestBody());
    assert(!server.previewJpeg());
    assert(!server.historyJson("live"));

    server.publishResult(BuyResult());
    log->append(BuyResult());
    auto latest = nlohmann::json::parse(*server.latestBody());
    assert(latest["frame_index"] == 42);
    assert(latest["signal"]["recommendation"] == "BUY");
    assert(latest["advisory"].is_null());

    auto history = server.historyJson("live");
    assert(history);
    assert((*history)["session_id"] == "live");
    assert((*history)["count"] == 1);
    assert((*history)["results"][0]["auction"]["current_bid"] == 40.0);

    server.publishStatus("Scanning for items...", 9);
    domain::Frame frame;
    frame.index = 11;
    frame.image = cv::Mat(48, 64, CV_8UC3, cv::Scalar(0, 128, 255));
    server.publishPreview(frame);

    auto status = server.statusJson();
    assert(status["message"] == "Scanning for items...");
    assert(status["frame_index"] == 9);
    assert(status["preview_frame_index"] == 11);
    assert(status["running"] == true);
    assert(status["audio"]["available"] == false);

    auto jpeg = server.previewJpeg();
    assert(jpeg && jpeg->size() > 4);
    // JPEG SOI marker.
    assert((*jpeg)[0] == 0xFF && (*jpeg)[1] == 0xD8);
    std::cout << "[PASS] HTTP response bodies" << std::endl;
}

} // namespace

int main() {
    TestConsoleFormat();
    TestHttpBodies();
    std::cout << "[PASS] ResultSinkTest" << std::endl;
    return 0;
}
