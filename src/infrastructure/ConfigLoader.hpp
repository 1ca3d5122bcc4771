/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json + environment).
 *
 * Every key is optional. Missing keys keep the defaults below, and a small set
 * of environment variables overrides the file for container and CI use.
 */

#pragma once

#include <cstddef>
#include <string>

namespace bidlens::infrastructure {

struct CaptureRegion {
    int x = 0;
    int y = 0;
    int width = 0;  ///< 0 means full frame.
    int height = 0;
};

/**
 * @struct AppConfig
 * @brief Flattened view of settings.json.
 */
struct AppConfig {
    // capture
    std::string source = "0";           ///< Device index, stream URL or video file.
    CaptureRegion region;
    double targetFps = 5.0;
    int processEveryNFrames = 3;
    int statusEveryNProcessed = 30;

    // text recognition
    bool dualRegion = true;
    double titleFraction = 0.4;
    double priceFraction = 0.3;
    bool preprocess = true;
    std::string tesseractLanguage = "eng";
    std::string tessdataPath;           ///< Empty lets Tesseract use its default.

    // audio
    bool audioEnabled = true;
    std::string audioDevice;            ///< SDL capture device name; empty = system default.
    std::string audioFile;              ///< WAV (or ffmpeg-convertible) replay instead of a device.
    double audioChunkSeconds = 7.0;
    std::size_t audioQueueCapacity = 4;
    std::string whisperModel;           ///< ggml model path.
    std::string whisperLanguage = "en";

    // pricing
    std::string ebayAppId;
    std::string ebayHost = "svcs.ebay.com";
    std::string ebayCategoryId = "212";
    int ebayEntriesPerPage = 25;
    int cacheTtlHours = 12;
    std::string cacheFile;
    double fuzzyThreshold = 0.7;
    int minimumComparables = 3;
    int continuityTtlSeconds = 30;

    // advisory
    bool ollamaEnabled = true;
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string ollamaModel = "qwen2.5:7b";

    // output
    bool serverEnabled = true;
    std::string serverHost = "0.0.0.0";
    int serverPort = 8765;
    std::string sessionLogDir;
    std::size_t sessionLogCapacity = 50;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json (if present) and applies environment overrides.
     * @param path Path to settings.json; may not exist.
     * @return Populated configuration. Parse errors are logged and defaults kept.
     */
    static AppConfig Load(const std::string& path);

    /** @brief Applies EBAY_APP_ID, CAPTURE_FPS, PROCESS_EVERY_N_FRAMES, BIDLENS_WHISPER_MODEL, OLLAMA_HOST, OLLAMA_PORT, BIDLENS_SOURCE. */
    static void ApplyEnvironment(AppConfig& config);

    /** @brief Fills empty path settings with XDG-based defaults. */
    static void ApplyDefaultPaths(AppConfig& config);
};

} // namespace bidlens::infrastructure
