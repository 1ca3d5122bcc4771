/**
 * @file HttpResultServer.hpp
 * @brief Result sink that exposes the live analysis over a small REST API.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/FrameResult.hpp"
#include "infrastructure/SessionLogStore.hpp"

namespace httplib {
class Server;
}

namespace bidlens::infrastructure {

/**
 * @struct AnalysisControl
 * @brief Hooks into the composition root for the start/stop endpoints.
 */
struct AnalysisControl {
    std::function<bool()> start;
    std::function<bool()> stop;
    std::function<bool()> isRunning;
    std::function<domain::AudioStatus()> audioStatus;
};

/**
 * @class HttpResultServer
 * @brief cpp-httplib server on its own thread.
 *
 * Endpoints:
 * - GET  /api/health
 * - GET  /api/latest                  (204 until the first result)
 * - GET  /api/status
 * - GET  /api/preview.jpg             (204 until the first frame)
 * - GET  /api/session/<id>/history    (404 for unknown sessions)
 * - POST /api/analysis/start
 * - POST /api/analysis/stop
 */
class HttpResultServer : public domain::ResultSink {
public:
    HttpResultServer(std::string host, int port,
                     std::shared_ptr<SessionLogStore> sessionLog,
                     AnalysisControl control = {});
    ~HttpResultServer() override;

    HttpResultServer(const HttpResultServer&) = delete;
    HttpResultServer& operator=(const HttpResultServer&) = delete;

    /** @brief Binds and starts listening in the background. False when the port cannot be bound. */
    bool start();
    void stop();
    bool isListening() const { return m_listening.load(); }

    void publishResult(const domain::FrameResult& result) override;
    void publishStatus(const std::string& message, std::uint64_t frameIndex) override;
    void publishPreview(const domain::Frame& frame) override;

    // Response bodies, also used directly by tests.
    std::optional<std::string> latestBody() const;
    nlohmann::json statusJson() const;
    std::optional<nlohmann::json> historyJson(const std::string& sessionId) const;
    std::optional<std::vector<std::uint8_t>> previewJpeg() const;

private:
    void registerRoutes();

    std::string m_host;
    int m_port;
    std::shared_ptr<SessionLogStore> m_sessionLog;
    AnalysisControl m_control;

    std::unique_ptr<httplib::Server> m_server;
    std::thread m_thread;
    std::atomic<bool> m_listening{false};

    mutable std::mutex m_mutex;
    std::optional<std::string> m_latest;
    std::string m_status;
    std::uint64_t m_statusFrame = 0;
    std::vector<std::uint8_t> m_preview;
    std::uint64_t m_previewFrame = 0;
};

} // namespace bidlens::infrastructure
