/**
 * @file BidLensApp.cpp
 * @brief Implementation of the BidLensApp class.
 */
#include "app/BidLensApp.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <sstream>

#include "infrastructure/ConsoleResultSink.hpp"
#include "infrastructure/EbaySoldListingSearch.hpp"
#include "infrastructure/FileAudioSource.hpp"
#include "infrastructure/OllamaAdvisor.hpp"
#include "infrastructure/OpenCvFrameSource.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PlaceholderTextEngine.hpp"
#include "infrastructure/SdlAudioSource.hpp"
#include "infrastructure/TesseractCliEngine.hpp"
#include "infrastructure/TesseractEngine.hpp"
#include "infrastructure/WhisperCppAdapter.hpp"

namespace bidlens::app {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void HandleSignal(int) {
    g_interrupted = 1;
}

std::string DefaultSessionId() {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "session-" + std::to_string(seconds);
}

std::string DefaultConfigPath() {
    if (std::filesystem::exists("settings.json")) {
        return "settings.json";
    }
    return infrastructure::PathUtils::GetDefaultSettingsPath().string();
}

} // namespace

BidLensApp::~BidLensApp() {
    Shutdown();
}

std::string BidLensApp::Usage() {
    return
        "Usage: bidlens [options]\n"
        "  --config <path>            settings.json to load\n"
        "  --source <device|url|file> video source (device index, stream URL or video file)\n"
        "  --audio <device|file>      SDL capture device name or audio file to replay\n"
        "  --session <id>             session id for the result history\n"
        "  --no-server                do not start the HTTP server\n"
        "  --no-audio                 disable speech transcription\n"
        "  --help                     show this message\n";
}

std::optional<CommandLine> BidLensApp::ParseArgs(int argc, char** argv, std::string& error) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](const char* option) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                error = std::string(option) + " requires a value";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            cli.showHelp = true;
        } else if (arg == "--no-server") {
            cli.noServer = true;
        } else if (arg == "--no-audio") {
            cli.noAudio = true;
        } else if (arg == "--config") {
            auto v = value("--config");
            if (!v) return std::nullopt;
            cli.configPath = *v;
        } else if (arg == "--source") {
            cli.source = value("--source");
            if (!cli.source) return std::nullopt;
        } else if (arg == "--audio") {
            cli.audio = value("--audio");
            if (!cli.audio) return std::nullopt;
        } else if (arg == "--session") {
            cli.sessionId = value("--session");
            if (!cli.sessionId) return std::nullopt;
        } else {
            error = "Unknown option: " + arg;
            return std::nullopt;
        }
    }
    return cli;
}

void BidLensApp::ApplyCommandLine(const CommandLine& cli, infrastructure::AppConfig& config) {
    if (cli.source) config.source = *cli.source;
    if (cli.audio) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(*cli.audio, ec)) {
            config.audioFile = *cli.audio;
        } else {
            config.audioDevice = *cli.audio;
            config.audioFile.clear();
        }
    }
    if (cli.noAudio) config.audioEnabled = false;
    if (cli.noServer) config.serverEnabled = false;
}

bool BidLensApp::Init(const CommandLine& cli) {
    m_config = infrastructure::ConfigLoader::Load(cli.configPath.empty() ? DefaultConfigPath() : cli.configPath);
    ApplyCommandLine(cli, m_config);

    // Dependency Injection / Composition Root
    auto& services = m_services;
    services.taskManager = std::make_shared<application::AsyncTaskManager>();

    services.priceCache = std::make_shared<infrastructure::PriceCache>(
        m_config.cacheFile, std::chrono::hours(m_config.cacheTtlHours));
    services.priceCache->load();

    services.sessionLog = std::make_shared<infrastructure::SessionLogStore>(
        m_config.sessionLogDir, m_config.sessionLogCapacity);
    services.sessionLog->loadExisting();

    if (m_config.ollamaEnabled) {
        auto advisor = std::make_shared<infrastructure::OllamaAdvisor>(
            m_config.ollamaHost, m_config.ollamaPort, m_config.ollamaModel);
        advisor->initialize();
        if (advisor->isAvailable()) {
            services.advisory = advisor;
        }
    }

    std::shared_ptr<domain::SoldListingSearch> search;
    if (!m_config.ebayAppId.empty()) {
        infrastructure::EbaySearchOptions ebay;
        ebay.appId = m_config.ebayAppId;
        ebay.host = m_config.ebayHost;
        ebay.categoryId = m_config.ebayCategoryId;
        ebay.entriesPerPage = m_config.ebayEntriesPerPage;
        search = std::make_shared<infrastructure::EbaySoldListingSearch>(ebay);
    }

    application::PriceResolverOptions resolverOptions;
    resolverOptions.fuzzyThreshold = m_config.fuzzyThreshold;
    services.priceResolver = std::make_shared<application::PriceResolver>(
        services.priceCache, search, services.advisory, resolverOptions);

    std::vector<std::unique_ptr<domain::TextRecognitionEngine>> ocrEngines;
    ocrEngines.push_back(std::make_unique<infrastructure::TesseractEngine>(m_config.tesseractLanguage, m_config.tessdataPath));
    ocrEngines.push_back(std::make_unique<infrastructure::TesseractCliEngine>(m_config.tesseractLanguage));
    ocrEngines.push_back(std::make_unique<infrastructure::PlaceholderTextEngine>());

    application::TextRecognizerOptions ocrOptions;
    ocrOptions.dualRegion = m_config.dualRegion;
    ocrOptions.titleFraction = m_config.titleFraction;
    ocrOptions.priceFraction = m_config.priceFraction;
    ocrOptions.preprocess = m_config.preprocess;
    services.textRecognizer = std::make_unique<application::TextRecognizer>(std::move(ocrEngines), ocrOptions);
    services.textRecognizer->initialize();

    if (m_config.audioEnabled) {
        std::vector<std::unique_ptr<domain::SpeechToTextEngine>> speechEngines;
        speechEngines.push_back(std::make_unique<infrastructure::WhisperCppAdapter>(m_config.whisperModel, m_config.whisperLanguage));

        std::unique_ptr<domain::AudioSource> audioSource;
        if (!m_config.audioFile.empty()) {
            audioSource = std::make_unique<infrastructure::FileAudioSource>(m_config.audioFile);
        } else {
            audioSource = std::make_unique<infrastructure::SdlAudioSource>(m_config.audioDevice);
        }

        application::SpeechTranscriberOptions speechOptions;
        speechOptions.chunkSeconds = m_config.audioChunkSeconds;
        speechOptions.queueCapacity = m_config.audioQueueCapacity;
        services.speechTranscriber = std::make_unique<application::SpeechTranscriber>(
            std::move(speechEngines), std::move(audioSource), speechOptions);
        services.speechTranscriber->initialize();
    } else {
        std::cout << "[BidLensApp] Audio disabled." << std::endl;
    }

    services.session = std::make_unique<application::SessionContext>(
        cli.sessionId ? *cli.sessionId : DefaultSessionId(),
        services.priceResolver,
        std::chrono::seconds(m_config.continuityTtlSeconds));

    application::OrchestratorOptions orchestratorOptions;
    orchestratorOptions.targetFps = m_config.targetFps;
    orchestratorOptions.processEveryNFrames = m_config.processEveryNFrames;
    orchestratorOptions.statusEveryNProcessed = m_config.statusEveryNProcessed;
    services.orchestrator = std::make_unique<application::FrameOrchestrator>(
        *services.session, *services.textRecognizer,
        domain::SignalEngine(m_config.minimumComparables), orchestratorOptions);
    services.orchestrator->setTranscriber(services.speechTranscriber.get());
    services.orchestrator->setAdvisory(services.advisory, services.taskManager);
    services.orchestrator->setSessionLog(services.sessionLog);
    services.orchestrator->addSink(std::make_shared<infrastructure::ConsoleResultSink>());

    if (m_config.serverEnabled) {
        infrastructure::AnalysisControl control;
        control.start = [this]() { return StartAnalysis(); };
        control.stop = [this]() { return StopAnalysis(); };
        control.isRunning = [this]() { return m_analysisActive.load(); };
        control.audioStatus = [this]() {
            return m_services.speechTranscriber ? m_services.speechTranscriber->getLatest() : domain::AudioStatus{};
        };
        m_server = std::make_shared<infrastructure::HttpResultServer>(
            m_config.serverHost, m_config.serverPort, services.sessionLog, control);
        if (!m_server->start()) {
            return false;
        }
        services.orchestrator->addSink(m_server);
    }

    std::cout << "[BidLensApp] Session " << services.session->sessionId
              << ", OCR engine: " << services.textRecognizer->engineName()
              << ", pricing: " << (search ? "eBay" : "disabled (no EBAY_APP_ID)")
              << ", advisory: " << (services.advisory ? "ollama" : "disabled") << std::endl;
    return true;
}

bool BidLensApp::StartAnalysis() {
    std::lock_guard<std::mutex> lock(m_analysisMutex);
    if (m_analysisActive) return false;
    if (m_analysisThread.joinable()) {
        m_analysisThread.join();
    }

    m_services.orchestrator->reset();
    m_analysisActive = true;
    m_analysisThread = std::thread(&BidLensApp::AnalysisThread, this);
    return true;
}

bool BidLensApp::StopAnalysis() {
    std::lock_guard<std::mutex> lock(m_analysisMutex);
    if (!m_services.orchestrator) return false;
    const bool wasActive = m_analysisActive.load();
    m_services.orchestrator->stop();
    if (m_analysisThread.joinable()) {
        m_analysisThread.join();
    }
    return wasActive;
}

void BidLensApp::AnalysisThread() {
    cv::Rect region(m_config.region.x, m_config.region.y, m_config.region.width, m_config.region.height);
    infrastructure::OpenCvFrameSource source(m_config.source, m_config.targetFps, region);
    if (!source.open()) {
        std::cerr << "[BidLensApp] Analysis not started: video source unavailable." << std::endl;
        m_analysisActive = false;
        return;
    }

    std::uint64_t processed = m_services.orchestrator->run(source);
    std::cout << "[BidLensApp] Analysis ended after " << processed << " processed frames." << std::endl;
    m_services.priceCache->persist();
    m_analysisActive = false;
}

void BidLensApp::Shutdown() {
    if (m_services.orchestrator) {
        StopAnalysis();
    }
    if (m_server) {
        m_server->stop();
    }
    if (m_services.taskManager) {
        m_services.taskManager->WaitForIdle(std::chrono::seconds(5));
    }
    if (m_services.priceCache) {
        m_services.priceCache->persist();
    }
    if (m_services.sessionLog) {
        m_services.sessionLog->stop();
    }
}

int BidLensApp::Run(int argc, char** argv) {
    std::string error;
    auto cli = ParseArgs(argc, argv, error);
    if (!cli) {
        std::cerr << "[BidLensApp] " << error << "\n" << Usage();
        return 2;
    }
    if (cli->showHelp) {
        std::cout << Usage();
        return 0;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (!Init(*cli)) {
        Shutdown();
        return 1;
    }

    if (!StartAnalysis()) {
        std::cerr << "[BidLensApp] Could not start analysis." << std::endl;
    }

    // With a server the process stays up for /api/analysis/start; without one it ends with the source.
    while (!g_interrupted) {
        if (!m_server && !m_analysisActive) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[BidLensApp] Shutting down..." << std::endl;
    Shutdown();
    return 0;
}

} // namespace bidlens::app
