/**
 * @file MediaSource.hpp
 * @brief Frame and audio supplier interfaces.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>

namespace bidlens::domain {

/**
 * @struct Frame
 * @brief One captured video frame.
 */
struct Frame {
    cv::Mat image;                 ///< BGR, 8 bits per channel.
    std::uint64_t index = 0;       ///< Monotonic per source.
    std::chrono::steady_clock::time_point capturedAt = std::chrono::steady_clock::now();
};

/**
 * @class FrameSource
 * @brief Yields frames at a bounded rate.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * @brief Reads the next frame.
     * @return False when no frame is available. For a live source that is a
     *         dropped frame, for a recorded one the end of the stream.
     */
    virtual bool read(Frame& out) = 0;

    /** @brief True for cameras and network streams, where a failed read is transient. */
    virtual bool isLive() const { return false; }
};

/**
 * @class AudioSource
 * @brief Yields fixed-duration buffers of 16 kHz mono float samples.
 */
class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual bool open() = 0;

    /**
     * @brief Blocks until a full chunk is recorded.
     * @return False when interrupted, exhausted or on device error.
     */
    virtual bool readChunk(std::vector<float>& samples, double seconds) = 0;

    /** @brief Makes a blocked readChunk() return promptly. */
    virtual void interrupt() = 0;
};

} // namespace bidlens::domain
