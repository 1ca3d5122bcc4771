#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <opencv2/core.hpp>
#include "application/TextRecognizer.hpp"
#include "test/TestDoubles.hpp"

using namespace bidlens;
using application::TextRecognizer;
using application::TextRecognizerOptions;
using test::FakeTextEngine;

namespace {

cv::Mat BlankFrame() {
    return cv::Mat(100, 160, CV_8UC3, cv::Scalar(255, 255, 255));
}

std::vector<std::unique_ptr<domain::TextRecognitionEngine>> Chain(std::unique_ptr<FakeTextEngine> a,
                                                                  std::unique_ptr<FakeTextEngine> b = nullptr) {
    std::vector<std::unique_ptr<domain::TextRecognitionEngine>> engines;
    engines.push_back(std::move(a));
    if (b) engines.push_back(std::move(b));
    return engines;
}

void TestDualRegion() {
    std::cout << "[Test] Title and price regions are read separately..." << std::endl;
    auto engine = std::make_unique<FakeTextEngine>();
    // 100-row frame: top 40% is the title overlay, bottom 30% the bid and timer.
    engine->whenRows(40, {{"2023 Topps Chrome", 0.9}, {"Mike Trout PSA 10 #27", 0.8}});
    engine->whenRows(30, {{"Current Bid $45", 0.7}, {"   ", 0.5}, {"0:12", 1.5}});
    FakeTextEngine* raw = engine.get();

    TextRecognizerOptions options;
    options.preprocess = false;
    TextRecognizer recognizer(Chain(std::move(engine)), options);
    assert(recognizer.initialize());

    auto result = recognizer.recognize(BlankFrame());
    assert(raw->calls == 2);
    assert(result.engine == "fake-ocr");
    assert(result.titleText == "2023 Topps Chrome Mike Trout PSA 10 #27");
    assert(result.priceText == "Current Bid $45 0:12");
    assert(result.fragments.size() == 4);
    assert(result.combinedText() == "2023 Topps Chrome Mike Trout PSA 10 #27 Current Bid $45 0:12");
    // Blank fragment dropped, 1.5 clamped to 1.0.
    assert(std::abs(result.confidence - 0.85) < 1e-9);
    assert(result.attributes.name == "Mike Trout");
    assert(result.attributes.grade == "PSA 10");
    assert(result.attributes.itemNumber == "27");
    std::cout << "[PASS] Title and price regions are read separately" << std::endl;
}

void TestSingleRegion() {
    std::cout << "[Test] Single-region mode reads the whole frame once..." << std::endl;
    auto engine = std::make_unique<FakeTextEngine>(std::vector<domain::TextFragment>{{"2021 Bowman Julio Rodriguez", 0.6}});
    FakeTextEngine* raw = engine.get();

    TextRecognizerOptions options;
    options.dualRegion = false;
    options.preprocess = false;
    TextRecognizer recognizer(Chain(std::move(engine)), options);
    recognizer.initialize();

    auto result = recognizer.recognize(BlankFrame());
    assert(raw->calls == 1);
    assert(result.titleText == result.priceText);
    assert(result.titleText == "2021 Bowman Julio Rodriguez");
    assert(std::abs(result.confidence - 0.6) < 1e-9);
    std::cout << "[PASS] Single-region mode reads the whole frame once" << std::endl;
}

void TestEngineFailureIsEmpty() {
    std::cout << "[Test] A throwing engine yields an empty result..." << std::endl;
    auto engine = std::make_unique<FakeTextEngine>(std::vector<domain::TextFragment>{{"Mike Trout", 0.9}});
    engine->throwOnRecognize = true;
    TextRecognizer recognizer(Chain(std::move(engine)));
    recognizer.initialize();

    auto result = recognizer.recognize(BlankFrame());
    assert(result.empty());
    assert(result.confidence == 0.0);
    assert(result.attributes.name.empty());
    assert(result.engine == "fake-ocr");

    assert(recognizer.recognize(cv::Mat()).empty());
    std::cout << "[PASS] A throwing engine yields an empty result" << std::endl;
}

void TestEngineSelection() {
    std::cout << "[Test] Unavailable engines are skipped in rank order..." << std::endl;
    auto first = std::make_unique<FakeTextEngine>(std::vector<domain::TextFragment>{{"first", 0.9}}, false);
    auto second = std::make_unique<FakeTextEngine>(std::vector<domain::TextFragment>{{"second", 0.9}});
    FakeTextEngine* rawFirst = first.get();

    TextRecognizerOptions options;
    options.dualRegion = false;
    options.preprocess = false;
    TextRecognizer recognizer(Chain(std::move(first), std::move(second)), options);
    assert(recognizer.engineName() == "none");
    assert(recognizer.initialize());

    auto result = recognizer.recognize(BlankFrame());
    assert(result.titleText == "second");
    assert(rawFirst->calls == 0);

    TextRecognizer nothing(Chain(std::make_unique<FakeTextEngine>(std::vector<domain::TextFragment>{}, false)));
    assert(!nothing.initialize());
    assert(nothing.engineName() == "none");
    auto none = nothing.recognize(BlankFrame());
    assert(none.empty());
    assert(none.engine == "none");
    std::cout << "[PASS] Unavailable engines are skipped in rank order" << std::endl;
}

} // namespace

int main() {
    TestDualRegion();
    TestSingleRegion();
    TestEngineFailureIsEmpty();
    TestEngineSelection();
    std::cout << "[PASS] TextRecognizerTest" << std::endl;
    return 0;
}
