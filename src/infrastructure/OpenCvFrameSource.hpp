/**
 * @file OpenCvFrameSource.hpp
 * @brief FrameSource over cv::VideoCapture (camera / capture card, stream URL or recorded file).
 */

#pragma once

#include <cstdint>
#include <string>
#include <opencv2/videoio.hpp>
#include "domain/MediaSource.hpp"

namespace bidlens::infrastructure {

/**
 * @class OpenCvFrameSource
 * @brief Reads BGR frames and crops them to the configured capture region.
 *
 * A purely numeric source is a device index. Recorded files are replayed
 * with frame skipping so that roughly targetFps frames per second of video
 * time reach the pipeline.
 */
class OpenCvFrameSource : public domain::FrameSource {
public:
    OpenCvFrameSource(std::string source, double targetFps = 5.0, cv::Rect region = cv::Rect());
    ~OpenCvFrameSource() override;

    OpenCvFrameSource(const OpenCvFrameSource&) = delete;
    OpenCvFrameSource& operator=(const OpenCvFrameSource&) = delete;

    bool open();
    void close();
    bool isOpened() const { return m_capture.isOpened(); }

    /** @brief On a live source, reopens the capture after a run of failed reads. */
    bool read(domain::Frame& out) override;
    bool isLive() const override { return !m_isFile; }

    bool isFile() const { return m_isFile; }
    double sourceFps() const { return m_sourceFps; }
    int frameSkip() const { return m_frameSkip; }

    static bool IsDeviceIndex(const std::string& source);

    /** @brief Frames to advance per delivered frame; at least 1. Unknown source FPS counts as 25. */
    static int FrameSkipFor(double sourceFps, double targetFps);

private:
    std::string m_source;
    double m_targetFps;
    cv::Rect m_region;
    cv::VideoCapture m_capture;
    bool m_isFile = false;
    double m_sourceFps = 0.0;
    int m_frameSkip = 1;
    std::uint64_t m_nextIndex = 0;
    int m_failedReads = 0;
};

} // namespace bidlens::infrastructure
