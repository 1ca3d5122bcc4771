/**
 * @file ImagePreprocessor.hpp
 * @brief OpenCV helpers that prepare overlay regions for OCR.
 */

#pragma once

#include <opencv2/core.hpp>

namespace bidlens::infrastructure {

class ImagePreprocessor {
public:
    /**
     * @brief Grayscale, adaptive Gaussian threshold (block 11, C 2), 3x3 median blur.
     * @param image BGR, BGRA or single channel 8-bit image.
     * @return Binarized single-channel image; empty when the input is empty.
     */
    static cv::Mat PrepareForOcr(const cv::Mat& image);

    /** @brief Top fraction of the image (title overlay). */
    static cv::Mat TopRegion(const cv::Mat& image, double fraction);

    /** @brief Bottom fraction of the image (price/timer overlay). */
    static cv::Mat BottomRegion(const cv::Mat& image, double fraction);

    /** @brief Crops to a rectangle clipped to the image bounds; the whole image when the rectangle is empty. */
    static cv::Mat Crop(const cv::Mat& image, const cv::Rect& region);
};

} // namespace bidlens::infrastructure
