#include "infrastructure/ImagePreprocessor.hpp"
#include <algorithm>
#include <opencv2/imgproc.hpp>

namespace bidlens::infrastructure {

namespace {
constexpr int kThresholdBlockSize = 11;
constexpr double kThresholdOffset = 2.0;
constexpr int kMedianKernel = 3;

int RowsFor(const cv::Mat& image, double fraction) {
    const double clamped = std::max(0.0, std::min(1.0, fraction));
    return std::max(1, static_cast<int>(image.rows * clamped));
}
}

cv::Mat ImagePreprocessor::PrepareForOcr(const cv::Mat& image) {
    if (image.empty()) return {};

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image;
    }

    cv::Mat binary;
    cv::adaptiveThreshold(gray, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY,
                          kThresholdBlockSize, kThresholdOffset);

    cv::Mat denoised;
    cv::medianBlur(binary, denoised, kMedianKernel);
    return denoised;
}

cv::Mat ImagePreprocessor::TopRegion(const cv::Mat& image, double fraction) {
    if (image.empty()) return {};
    return image(cv::Rect(0, 0, image.cols, RowsFor(image, fraction)));
}

cv::Mat ImagePreprocessor::BottomRegion(const cv::Mat& image, double fraction) {
    if (image.empty()) return {};
    const int rows = RowsFor(image, fraction);
    return image(cv::Rect(0, image.rows - rows, image.cols, rows));
}

cv::Mat ImagePreprocessor::Crop(const cv::Mat& image, const cv::Rect& region) {
    if (image.empty() || region.area() <= 0) return image;
    const cv::Rect clipped = region & cv::Rect(0, 0, image.cols, image.rows);
    if (clipped.area() <= 0) return image;
    return image(clipped);
}

} // namespace bidlens::infrastructure
