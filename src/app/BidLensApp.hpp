/**
 * @file BidLensApp.hpp
 * @brief Main application class for BidLens.
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/HttpResultServer.hpp"

namespace bidlens::app {

/**
 * @struct CommandLine
 * @brief Parsed command line. Unset optionals keep the configured value.
 */
struct CommandLine {
    std::string configPath;
    std::optional<std::string> source;
    std::optional<std::string> audio;
    std::optional<std::string> sessionId;
    bool noServer = false;
    bool noAudio = false;
    bool showHelp = false;
};

/**
 * @class BidLensApp
 * @brief Composition root and process lifecycle.
 *
 * Wires configuration, engines, resolver, orchestrator and sinks, then keeps
 * the process alive while the analysis loop or the HTTP server is running.
 */
class BidLensApp {
public:
    ~BidLensApp();

    /**
     * @brief Parses arguments, initializes and blocks until interrupted or the source ends.
     * @return Process exit code.
     */
    int Run(int argc, char** argv);

    /**
     * @brief Parses `--config --source --audio --session --no-server --no-audio --help`.
     * @return nullopt with error populated on unknown or incomplete options.
     */
    static std::optional<CommandLine> ParseArgs(int argc, char** argv, std::string& error);

    static std::string Usage();

    /** @brief Applies command-line overrides on top of the loaded configuration. */
    static void ApplyCommandLine(const CommandLine& cli, infrastructure::AppConfig& config);

private:
    bool Init(const CommandLine& cli);
    void Shutdown();

    bool StartAnalysis();
    bool StopAnalysis();
    void AnalysisThread();

    infrastructure::AppConfig m_config;
    application::AppServices m_services;
    std::shared_ptr<infrastructure::HttpResultServer> m_server;

    std::thread m_analysisThread;
    std::atomic<bool> m_analysisActive{false};
    std::mutex m_analysisMutex;
};

} // namespace bidlens::app
