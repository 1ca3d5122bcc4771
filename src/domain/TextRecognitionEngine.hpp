/**
 * @file TextRecognitionEngine.hpp
 * @brief Interface for OCR engines in the recognizer fallback chain.
 */

#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "domain/RecognizedText.hpp"

namespace bidlens::domain {

/**
 * @class TextRecognitionEngine
 * @brief One OCR implementation. Engines may throw; the TextRecognizer contains it.
 */
class TextRecognitionEngine {
public:
    virtual ~TextRecognitionEngine() = default;

    /** @brief Short identifier reported in every result ("tesseract", "tesseract-cli", ...). */
    virtual std::string name() const = 0;

    /** @brief Probed once at startup to rank the chain. */
    virtual bool isAvailable() = 0;

    /**
     * @brief Recognizes text in an already pre-processed region.
     * @param image 8-bit grayscale or BGR image.
     * @return Fragments with confidence in [0, 1].
     */
    virtual std::vector<TextFragment> recognize(const cv::Mat& image) = 0;
};

} // namespace bidlens::domain
