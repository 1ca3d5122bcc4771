#include "infrastructure/OpenCvFrameSource.hpp"
#include "infrastructure/ImagePreprocessor.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace bidlens::infrastructure {

namespace {
constexpr double kDefaultVideoFps = 25.0;
constexpr int kReopenAfterFailedReads = 25;
}

OpenCvFrameSource::OpenCvFrameSource(std::string source, double targetFps, cv::Rect region)
    : m_source(std::move(source))
    , m_targetFps(targetFps > 0.0 ? targetFps : 5.0)
    , m_region(region)
{
}

OpenCvFrameSource::~OpenCvFrameSource() {
    close();
}

bool OpenCvFrameSource::IsDeviceIndex(const std::string& source) {
    return !source.empty() &&
           std::all_of(source.begin(), source.end(), [](unsigned char c) { return std::isdigit(c); });
}

int OpenCvFrameSource::FrameSkipFor(double sourceFps, double targetFps) {
    if (sourceFps <= 0.0) sourceFps = kDefaultVideoFps;
    if (targetFps <= 0.0) return 1;
    return std::max(1, static_cast<int>(sourceFps / targetFps));
}

bool OpenCvFrameSource::open() {
    if (m_capture.isOpened()) return true;

    if (IsDeviceIndex(m_source)) {
        m_isFile = false;
        m_capture.open(std::stoi(m_source));
    } else {
        std::error_code ec;
        m_isFile = std::filesystem::is_regular_file(m_source, ec);
        m_capture.open(m_source);
    }

    if (!m_capture.isOpened()) {
        std::cerr << "[OpenCvFrameSource] Cannot open video source: " << m_source << std::endl;
        return false;
    }

    m_sourceFps = m_capture.get(cv::CAP_PROP_FPS);
    m_frameSkip = m_isFile ? FrameSkipFor(m_sourceFps, m_targetFps) : 1;
    m_nextIndex = 0;

    std::cout << "[OpenCvFrameSource] Opened " << m_source
              << (m_isFile ? " (file replay, skip " + std::to_string(m_frameSkip) + ")" : std::string())
              << std::endl;
    return true;
}

void OpenCvFrameSource::close() {
    if (m_capture.isOpened()) {
        m_capture.release();
    }
}

bool OpenCvFrameSource::read(domain::Frame& out) {
    if (!m_isFile && m_failedReads >= kReopenAfterFailedReads) {
        std::cerr << "[OpenCvFrameSource] " << m_failedReads << " failed reads, reopening " << m_source << std::endl;
        m_failedReads = 0;
        close();
        if (!open()) return false;
    }
    if (!m_capture.isOpened()) {
        ++m_failedReads;
        return false;
    }

    for (int i = 1; i < m_frameSkip; ++i) {
        if (!m_capture.grab()) return false;
    }

    cv::Mat image;
    if (!m_capture.read(image) || image.empty()) {
        ++m_failedReads;
        return false;
    }
    m_failedReads = 0;

    out.image = ImagePreprocessor::Crop(image, m_region);
    out.index = m_nextIndex++;
    out.capturedAt = std::chrono::steady_clock::now();
    return true;
}

} // namespace bidlens::infrastructure
