#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include "application/SpeechTranscriber.hpp"
#include "test/TestDoubles.hpp"

using namespace bidlens;
using application::SpeechTranscriber;
using application::SpeechTranscriberOptions;
using test::FakeAudioSource;
using test::FakeSpeechEngine;

namespace {

std::vector<std::unique_ptr<domain::SpeechToTextEngine>> Engines(std::unique_ptr<FakeSpeechEngine> engine) {
    std::vector<std::unique_ptr<domain::SpeechToTextEngine>> engines;
    engines.push_back(std::move(engine));
    return engines;
}

void TestUnavailableIsNoOp() {
    std::cout << "[Test] Without a model every call is a no-op..." << std::endl;
    SpeechTranscriber transcriber(Engines(std::make_unique<FakeSpeechEngine>("psa 10", false)),
                                  std::make_unique<FakeAudioSource>(3));
    assert(!transcriber.initialize());
    assert(!transcriber.isAvailable());
    assert(!transcriber.start());
    assert(!transcriber.isActive());
    assert(!transcriber.submitChunk(std::vector<float>(16000, 0.1f)));
    assert(transcriber.pendingChunks() == 0);
    assert(transcriber.transcribeChunk(std::vector<float>(16000, 0.1f)).text.empty());

    auto status = transcriber.getLatest();
    assert(!status.available);
    assert(!status.active);
    assert(status.latest.text.empty());
    transcriber.stop();
    std::cout << "[PASS] Without a model every call is a no-op" << std::endl;
}

void TestTranscribeChunkParses() {
    std::cout << "[Test] One chunk is transcribed and parsed..." << std::endl;
    auto engine = std::make_unique<FakeSpeechEngine>("beautiful 2019 prizm rookie psa 9 we are at 45 dollars");
    FakeSpeechEngine* raw = engine.get();
    SpeechTranscriber transcriber(Engines(std::move(engine)), nullptr);
    assert(transcriber.initialize());

    auto transcript = transcriber.transcribeChunk(std::vector<float>(800, 0.2f));
    assert(raw->calls == 1);
    assert(raw->lastSize == 800);
    assert(transcript.attributes.grade == "PSA 9");
    assert(transcript.attributes.year == "2019");
    assert(transcript.attributes.rookie);
    assert(transcript.attributes.spokenPrice && *transcript.attributes.spokenPrice == 45.0);
    assert(transcript.confidence > 0.9);

    assert(transcriber.transcribeChunk({}).text.empty());
    assert(raw->calls == 1);
    std::cout << "[PASS] One chunk is transcribed and parsed" << std::endl;
}

void TestQueueDropsOldest() {
    std::cout << "[Test] A full queue drops the oldest chunk..." << std::endl;
    SpeechTranscriberOptions options;
    options.queueCapacity = 4;
    SpeechTranscriber transcriber(Engines(std::make_unique<FakeSpeechEngine>("x")), nullptr, options);
    assert(transcriber.initialize());

    for (int i = 0; i < 4; ++i) {
        assert(!transcriber.submitChunk(std::vector<float>(10, static_cast<float>(i))));
    }
    assert(transcriber.submitChunk(std::vector<float>(10, 4.0f)));
    assert(transcriber.submitChunk(std::vector<float>(10, 5.0f)));
    assert(transcriber.pendingChunks() == 4);
    assert(transcriber.droppedChunks() == 2);
    std::cout << "[PASS] A full queue drops the oldest chunk" << std::endl;
}

void TestBackgroundPipeline() {
    std::cout << "[Test] Capture and transcription threads publish the latest transcript..." << std::endl;
    auto engine = std::make_unique<FakeSpeechEngine>("psa 10 gem mint at 120 dollars", true, std::chrono::milliseconds(5));
    auto source = std::make_unique<FakeAudioSource>(3);
    FakeAudioSource* rawSource = source.get();

    SpeechTranscriber transcriber(Engines(std::move(engine)), std::move(source));
    assert(transcriber.initialize());
    assert(transcriber.start());
    assert(!transcriber.start());
    assert(rawSource->opened);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (transcriber.getLatest().latest.text.empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    auto status = transcriber.getLatest();
    assert(status.available);
    assert(status.active);
    assert(status.latest.attributes.grade == "PSA 10");
    assert(status.latest.attributes.spokenPrice && *status.latest.attributes.spokenPrice == 120.0);

    transcriber.stop();
    assert(!transcriber.isActive());
    assert(!transcriber.getLatest().active);
    transcriber.stop();
    std::cout << "[PASS] Capture and transcription threads publish the latest transcript" << std::endl;
}

void TestEndedSourceGoesInactive() {
    std::cout << "[Test] A replayed source that ends leaves the channel inactive..." << std::endl;
    auto engine = std::make_unique<FakeSpeechEngine>("psa 9 going at 80", true);
    FakeSpeechEngine* rawEngine = engine.get();
    auto source = std::make_unique<FakeAudioSource>(2, 1600, true);

    SpeechTranscriber transcriber(Engines(std::move(engine)), std::move(source));
    assert(transcriber.initialize());
    assert(transcriber.start());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (transcriber.isActive() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(!transcriber.isActive());
    assert(rawEngine->calls == 2);
    auto status = transcriber.getLatest();
    assert(status.available);
    assert(!status.active);
    assert(status.latest.text.empty());
    assert(status.latest.attributes.empty());

    // Restarting after a natural end reuses the threads cleanly.
    assert(transcriber.start());
    deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (transcriber.isActive() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(!transcriber.isActive());
    transcriber.stop();
    std::cout << "[PASS] A replayed source that ends leaves the channel inactive" << std::endl;
}

} // namespace

int main() {
    TestUnavailableIsNoOp();
    TestTranscribeChunkParses();
    TestQueueDropsOldest();
    TestBackgroundPipeline();
    TestEndedSourceGoesInactive();
    std::cout << "[PASS] SpeechTranscriberTest" << std::endl;
    return 0;
}
