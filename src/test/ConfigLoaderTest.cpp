#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "infrastructure/ConfigLoader.hpp"

using namespace bidlens::infrastructure;
namespace fs = std::filesystem;

namespace {

void ClearEnvironment() {
    for (const char* name : {"EBAY_APP_ID", "CAPTURE_FPS", "PROCESS_EVERY_N_FRAMES", "BIDLENS_WHISPER_MODEL",
                             "OLLAMA_HOST", "OLLAMA_PORT", "BIDLENS_SOURCE"}) {
        unsetenv(name);
    }
}

fs::path WriteSettings(const std::string& content) {
    fs::path path = fs::temp_directory_path() / "bidlens_config_test.json";
    std::ofstream out(path);
    out << content;
    return path;
}

void TestDefaults() {
    std::cout << "[Test] Missing settings file keeps defaults..." << std::endl;
    ClearEnvironment();
    AppConfig config = ConfigLoader::Load("/nonexistent/settings.json");
    assert(config.source == "0");
    assert(config.targetFps == 5.0);
    assert(config.processEveryNFrames == 3);
    assert(config.dualRegion);
    assert(config.audioQueueCapacity == 4);
    assert(config.cacheTtlHours == 12);
    assert(config.fuzzyThreshold == 0.7);
    assert(config.serverPort == 8765);
    assert(config.ebayAppId.empty());
    // Paths are filled in from the user directories.
    assert(!config.whisperModel.empty());
    assert(!config.cacheFile.empty());
    assert(!config.sessionLogDir.empty());
    std::cout << "[PASS] Missing settings file keeps defaults" << std::endl;
}

void TestSections() {
    std::cout << "[Test] Sections of settings.json are applied..." << std::endl;
    ClearEnvironment();
    fs::path path = WriteSettings(R"({
        "capture": {"source": 2, "fps": 10, "region": {"x": 5, "y": 6, "width": 640, "height": 360}},
        "ocr": {"dual_region": false, "language": "eng+spa"},
        "audio": {"enabled": false, "chunk_seconds": 5.5},
        "pricing": {"ebay_app_id": "file-app", "cache_ttl_hours": 6, "cache_file": "/tmp/prices.json"},
        "ollama": {"port": 12000},
        "server": {"port": 9000, "session_log_capacity": 20}
    })");

    AppConfig config = ConfigLoader::Load(path.string());
    assert(config.source == "2");
    assert(config.targetFps == 10.0);
    assert(config.region.x == 5 && config.region.width == 640 && config.region.height == 360);
    assert(!config.dualRegion);
    assert(config.tesseractLanguage == "eng+spa");
    assert(!config.audioEnabled);
    assert(config.audioChunkSeconds == 5.5);
    assert(config.ebayAppId == "file-app");
    assert(config.cacheTtlHours == 6);
    assert(config.cacheFile == "/tmp/prices.json");
    assert(config.ollamaPort == 12000);
    assert(config.serverPort == 9000);
    assert(config.sessionLogCapacity == 20);
    fs::remove(path);
    std::cout << "[PASS] Sections of settings.json are applied" << std::endl;
}

void TestEnvironmentOverrides() {
    std::cout << "[Test] Environment overrides the file, invalid values are ignored..." << std::endl;
    ClearEnvironment();
    fs::path path = WriteSettings(R"({"capture": {"fps": 10}, "pricing": {"ebay_app_id": "file-app"}})");
    setenv("EBAY_APP_ID", "env-app", 1);
    setenv("CAPTURE_FPS", "fast", 1);
    setenv("PROCESS_EVERY_N_FRAMES", "2", 1);
    setenv("BIDLENS_SOURCE", "rtmp://example/live", 1);

    AppConfig config = ConfigLoader::Load(path.string());
    assert(config.ebayAppId == "env-app");
    assert(config.targetFps == 10.0);
    assert(config.processEveryNFrames == 2);
    assert(config.source == "rtmp://example/live");

    ClearEnvironment();
    fs::remove(path);
    std::cout << "[PASS] Environment overrides the file, invalid values are ignored" << std::endl;
}

void TestMalformedFile() {
    std::cout << "[Test] Malformed JSON falls back to defaults..." << std::endl;
    ClearEnvironment();
    fs::path path = WriteSettings("{ not json");
    AppConfig config = ConfigLoader::Load(path.string());
    assert(config.targetFps == 5.0);
    assert(config.serverEnabled);
    fs::remove(path);
    std::cout << "[PASS] Malformed JSON falls back to defaults" << std::endl;
}

} // namespace

int main() {
    TestDefaults();
    TestSections();
    TestEnvironmentOverrides();
    TestMalformedFile();
    std::cout << "[PASS] ConfigLoaderTest" << std::endl;
    return 0;
}
