/**
 * @file HttpResultServer.cpp
 * @brief Implementation of the HttpResultServer class.
 */
#include "infrastructure/HttpResultServer.hpp"
#include "infrastructure/ResultJson.hpp"
#include <httplib.h>
#include <opencv2/imgcodecs.hpp>
#include <iostream>

using json = nlohmann::json;

namespace bidlens::infrastructure {

namespace {
constexpr int kPreviewJpegQuality = 70;
constexpr const char* kJson = "application/json";
}

HttpResultServer::HttpResultServer(std::string host, int port,
                                   std::shared_ptr<SessionLogStore> sessionLog,
                                   AnalysisControl control)
    : m_host(std::move(host))
    , m_port(port)
    , m_sessionLog(std::move(sessionLog))
    , m_control(std::move(control))
    , m_server(std::make_unique<httplib::Server>())
{
    registerRoutes();
}

HttpResultServer::~HttpResultServer() {
    stop();
}

void HttpResultServer::registerRoutes() {
    m_server->Get("/api/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(json{{"status", "healthy"}}.dump(), kJson);
    });

    m_server->Get("/api/latest", [this](const httplib::Request&, httplib::Response& res) {
        auto body = latestBody();
        if (!body) {
            res.status = 204;
            return;
        }
        res.set_content(*body, kJson);
    });

    m_server->Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(statusJson().dump(), kJson);
    });

    m_server->Get("/api/preview.jpg", [this](const httplib::Request&, httplib::Response& res) {
        auto jpeg = previewJpeg();
        if (!jpeg) {
            res.status = 204;
            return;
        }
        res.set_content(std::string(jpeg->begin(), jpeg->end()), "image/jpeg");
    });

    m_server->Get(R"(/api/session/([^/]+)/history)", [this](const httplib::Request& req, httplib::Response& res) {
        auto doc = historyJson(req.matches[1]);
        if (!doc) {
            res.status = 404;
            res.set_content(json{{"error", "unknown session"}}.dump(), kJson);
            return;
        }
        res.set_content(doc->dump(), kJson);
    });

    m_server->Post("/api/analysis/start", [this](const httplib::Request&, httplib::Response& res) {
        bool started = m_control.start && m_control.start();
        res.set_content(json{{"started", started}}.dump(), kJson);
    });

    m_server->Post("/api/analysis/stop", [this](const httplib::Request&, httplib::Response& res) {
        bool stopped = m_control.stop && m_control.stop();
        res.set_content(json{{"stopped", stopped}}.dump(), kJson);
    });
}

bool HttpResultServer::start() {
    if (m_listening) return true;
    if (!m_server->bind_to_port(m_host, m_port)) {
        std::cerr << "[HttpResultServer] Could not bind " << m_host << ":" << m_port << std::endl;
        return false;
    }

    m_listening = true;
    m_thread = std::thread([this]() {
        m_server->listen_after_bind();
        m_listening = false;
    });
    std::cout << "[HttpResultServer] Listening on http://" << m_host << ":" << m_port << std::endl;
    return true;
}

void HttpResultServer::stop() {
    if (m_server) {
        m_server->stop();
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_listening = false;
}

void HttpResultServer::publishResult(const domain::FrameResult& result) {
    json j = result;
    std::string body = j.dump();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_latest = std::move(body);
}

void HttpResultServer::publishStatus(const std::string& message, std::uint64_t frameIndex) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_status = message;
    m_statusFrame = frameIndex;
}

void HttpResultServer::publishPreview(const domain::Frame& frame) {
    if (frame.image.empty()) return;

    std::vector<std::uint8_t> jpeg;
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, kPreviewJpegQuality};
    if (!cv::imencode(".jpg", frame.image, jpeg, params)) {
        std::cerr << "[HttpResultServer] JPEG encoding failed for frame " << frame.index << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_preview = std::move(jpeg);
    m_previewFrame = frame.index;
}

std::optional<std::string> HttpResultServer::latestBody() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_latest;
}

json HttpResultServer::statusJson() const {
    json j;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        j["message"] = m_status;
        j["frame_index"] = m_statusFrame;
        j["preview_frame_index"] = m_previewFrame;
    }
    j["running"] = m_control.isRunning ? m_control.isRunning() : false;
    j["audio"] = m_control.audioStatus ? m_control.audioStatus() : domain::AudioStatus{};
    return j;
}

std::optional<json> HttpResultServer::historyJson(const std::string& sessionId) const {
    if (!m_sessionLog) return std::nullopt;
    auto results = m_sessionLog->history(sessionId);
    if (!results) return std::nullopt;

    return json{
        {"session_id", sessionId},
        {"count", results->size()},
        {"results", *results}
    };
}

std::optional<std::vector<std::uint8_t>> HttpResultServer::previewJpeg() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_preview.empty()) return std::nullopt;
    return m_preview;
}

} // namespace bidlens::infrastructure
