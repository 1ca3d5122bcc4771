#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/SessionLogStore.hpp"

using namespace bidlens;
using infrastructure::SessionLogStore;
namespace fs = std::filesystem;

namespace {

domain::FrameResult ResultFor(const std::string& session, std::uint64_t frame) {
    domain::FrameResult result;
    result.sessionId = session;
    result.frameIndex = frame;
    result.identity.attributes.name = "Mike Trout";
    return result;
}

void TestCapAndOrder() {
    std::cout << "[Test] History is capped and newest first..." << std::endl;
    SessionLogStore store("", 3);
    for (std::uint64_t i = 0; i < 5; ++i) {
        store.append(ResultFor("auction-a", i));
    }
    store.append(ResultFor("auction-b", 99));

    auto history = store.history("auction-a");
    assert(history);
    assert(history->size() == 3);
    assert((*history)[0]["frame_index"] == 4);
    assert((*history)[1]["frame_index"] == 3);
    assert((*history)[2]["frame_index"] == 2);
    assert((*history)[0]["identity"]["name"] == "Mike Trout");

    assert(store.history("auction-b")->size() == 1);
    assert(!store.history("never-seen"));
    assert(store.sessions().size() == 2);
    std::cout << "[PASS] History is capped and newest first" << std::endl;
}

void TestDefaultCapacity() {
    std::cout << "[Test] Default capacity keeps 50 results..." << std::endl;
    SessionLogStore store;
    for (std::uint64_t i = 0; i < 60; ++i) {
        store.append(ResultFor("long", i));
    }
    auto history = store.history("long");
    assert(history->size() == 50);
    assert(history->back()["frame_index"] == 10);
    std::cout << "[PASS] Default capacity keeps 50 results" << std::endl;
}

void TestPersistAndReload() {
    std::cout << "[Test] Session files survive a restart..." << std::endl;
    fs::path dir = fs::temp_directory_path() / "bidlens_session_log_test";
    fs::remove_all(dir);

    {
        SessionLogStore store(dir.string(), 10);
        store.append(ResultFor("stream/1", 1));
        store.append(ResultFor("stream/1", 2));
        store.stop();
    }

    fs::path file = dir / "stream_1.json";
    assert(fs::exists(file));
    std::ifstream f(file);
    nlohmann::json doc = nlohmann::json::parse(f);
    assert(doc["session_id"] == "stream/1");
    assert(doc["results"].size() == 2);

    SessionLogStore reloaded(dir.string(), 10);
    reloaded.loadExisting();
    auto history = reloaded.history("stream/1");
    assert(history && history->size() == 2);
    assert((*history)[0]["frame_index"] == 2);
    reloaded.stop();

    fs::remove_all(dir);
    std::cout << "[PASS] Session files survive a restart" << std::endl;
}

} // namespace

int main() {
    TestCapAndOrder();
    TestDefaultCapacity();
    TestPersistAndReload();
    std::cout << "[PASS] SessionLogStoreTest" << std::endl;
    return 0;
}
