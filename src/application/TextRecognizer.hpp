/**
 * @file TextRecognizer.hpp
 * @brief Runs the selected OCR engine over a frame and parses item attributes.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "domain/RecognizedText.hpp"
#include "domain/TextRecognitionEngine.hpp"

namespace bidlens::application {

struct TextRecognizerOptions {
    bool dualRegion = true;
    double titleFraction = 0.4;  ///< Top share of the frame holding the title overlay.
    double priceFraction = 0.3;  ///< Bottom share holding bid and timer.
    bool preprocess = true;
};

/**
 * @class TextRecognizer
 * @brief Ranked engine chain; the first available engine is selected once and reused.
 *
 * recognize() never throws. Engine or OpenCV failures produce an empty,
 * zero-confidence result.
 */
class TextRecognizer {
public:
    TextRecognizer(std::vector<std::unique_ptr<domain::TextRecognitionEngine>> engines,
                   TextRecognizerOptions options = {});

    /** @brief Probes the engines in rank order. Returns false when none is usable. */
    bool initialize();

    domain::RecognizedText recognize(const cv::Mat& image);

    /** @brief Name of the selected engine, "none" before initialize() or when nothing is available. */
    std::string engineName() const;

    const TextRecognizerOptions& options() const { return m_options; }

private:
    std::vector<domain::TextFragment> recognizeRegion(const cv::Mat& region);
    static std::string JoinFragments(const std::vector<domain::TextFragment>& fragments);

    std::vector<std::unique_ptr<domain::TextRecognitionEngine>> m_engines;
    domain::TextRecognitionEngine* m_selected = nullptr;
    TextRecognizerOptions m_options;
};

} // namespace bidlens::application
