/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <optional>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace bidlens::infrastructure {

using json = nlohmann::json;

namespace {

const json& Section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    return (it != root.end() && it->is_object()) ? *it : empty;
}

std::optional<std::string> Env(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) return std::string(value);
    return std::nullopt;
}

template <typename T, typename Parse>
void Override(const char* name, T& target, Parse parse) {
    auto value = Env(name);
    if (!value) return;
    try {
        target = parse(*value);
        std::cout << "[ConfigLoader] " << name << " overrides settings.json" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid " << name << "='" << *value << "': " << e.what() << std::endl;
    }
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    AppConfig config;

    if (!path.empty() && std::filesystem::exists(path)) {
        try {
            std::ifstream f(path);
            json j;
            f >> j;

            const json& capture = Section(j, "capture");
            if (capture.contains("source")) {
                const json& source = capture["source"];
                config.source = source.is_number() ? std::to_string(source.get<int>()) : source.get<std::string>();
            }
            config.targetFps = capture.value("fps", config.targetFps);
            config.processEveryNFrames = capture.value("process_every_n_frames", config.processEveryNFrames);
            config.statusEveryNProcessed = capture.value("status_every_n_processed", config.statusEveryNProcessed);
            const json& region = Section(capture, "region");
            config.region.x = region.value("x", 0);
            config.region.y = region.value("y", 0);
            config.region.width = region.value("width", 0);
            config.region.height = region.value("height", 0);

            const json& ocr = Section(j, "ocr");
            config.dualRegion = ocr.value("dual_region", config.dualRegion);
            config.titleFraction = ocr.value("title_fraction", config.titleFraction);
            config.priceFraction = ocr.value("price_fraction", config.priceFraction);
            config.preprocess = ocr.value("preprocess", config.preprocess);
            config.tesseractLanguage = ocr.value("language", config.tesseractLanguage);
            config.tessdataPath = ocr.value("tessdata_path", config.tessdataPath);

            const json& audio = Section(j, "audio");
            config.audioEnabled = audio.value("enabled", config.audioEnabled);
            config.audioDevice = audio.value("device", config.audioDevice);
            config.audioFile = audio.value("file", config.audioFile);
            config.audioChunkSeconds = audio.value("chunk_seconds", config.audioChunkSeconds);
            config.audioQueueCapacity = audio.value("queue_capacity", config.audioQueueCapacity);
            config.whisperModel = audio.value("whisper_model", config.whisperModel);
            config.whisperLanguage = audio.value("language", config.whisperLanguage);

            const json& pricing = Section(j, "pricing");
            config.ebayAppId = pricing.value("ebay_app_id", config.ebayAppId);
            config.ebayHost = pricing.value("ebay_host", config.ebayHost);
            config.ebayCategoryId = pricing.value("category_id", config.ebayCategoryId);
            config.ebayEntriesPerPage = pricing.value("entries_per_page", config.ebayEntriesPerPage);
            config.cacheTtlHours = pricing.value("cache_ttl_hours", config.cacheTtlHours);
            config.cacheFile = pricing.value("cache_file", config.cacheFile);
            config.fuzzyThreshold = pricing.value("fuzzy_threshold", config.fuzzyThreshold);
            config.minimumComparables = pricing.value("minimum_comparables", config.minimumComparables);
            config.continuityTtlSeconds = pricing.value("continuity_ttl_seconds", config.continuityTtlSeconds);

            const json& ollama = Section(j, "ollama");
            config.ollamaEnabled = ollama.value("enabled", config.ollamaEnabled);
            config.ollamaHost = ollama.value("host", config.ollamaHost);
            config.ollamaPort = ollama.value("port", config.ollamaPort);
            config.ollamaModel = ollama.value("model", config.ollamaModel);

            const json& server = Section(j, "server");
            config.serverEnabled = server.value("enabled", config.serverEnabled);
            config.serverHost = server.value("host", config.serverHost);
            config.serverPort = server.value("port", config.serverPort);
            config.sessionLogDir = server.value("session_log_dir", config.sessionLogDir);
            config.sessionLogCapacity = server.value("session_log_capacity", config.sessionLogCapacity);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
        }
    }

    ApplyEnvironment(config);
    ApplyDefaultPaths(config);
    return config;
}

void ConfigLoader::ApplyEnvironment(AppConfig& config) {
    auto asString = [](const std::string& v) { return v; };
    auto asDouble = [](const std::string& v) { return std::stod(v); };
    auto asInt = [](const std::string& v) { return std::stoi(v); };

    Override("EBAY_APP_ID", config.ebayAppId, asString);
    Override("CAPTURE_FPS", config.targetFps, asDouble);
    Override("PROCESS_EVERY_N_FRAMES", config.processEveryNFrames, asInt);
    Override("BIDLENS_WHISPER_MODEL", config.whisperModel, asString);
    Override("OLLAMA_HOST", config.ollamaHost, asString);
    Override("OLLAMA_PORT", config.ollamaPort, asInt);
    Override("BIDLENS_SOURCE", config.source, asString);
}

void ConfigLoader::ApplyDefaultPaths(AppConfig& config) {
    if (config.whisperModel.empty()) {
        config.whisperModel = (PathUtils::GetModelsDir() / "ggml-base.en.bin").string();
    }
    if (config.cacheFile.empty()) {
        config.cacheFile = (PathUtils::GetAppCacheDir() / "price_cache.json").string();
    }
    if (config.sessionLogDir.empty()) {
        config.sessionLogDir = PathUtils::GetSessionsDir().string();
    }
}

} // namespace bidlens::infrastructure
