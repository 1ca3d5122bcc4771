/**
 * @file TesseractEngine.hpp
 * @brief In-process OCR through the Tesseract C++ API.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "domain/TextRecognitionEngine.hpp"

namespace tesseract {
class TessBaseAPI;
}

namespace bidlens::infrastructure {

/**
 * @class TesseractEngine
 * @brief Line-level recognition. One API handle, calls serialized.
 */
class TesseractEngine : public domain::TextRecognitionEngine {
public:
    /**
     * @param language Traineddata name ("eng").
     * @param tessdataPath Directory holding traineddata; empty uses the library default.
     */
    explicit TesseractEngine(std::string language = "eng", std::string tessdataPath = "");
    ~TesseractEngine() override;

    std::string name() const override { return "tesseract"; }

    /** @brief Initializes the API on first call. */
    bool isAvailable() override;

    std::vector<domain::TextFragment> recognize(const cv::Mat& image) override;

private:
    bool ensureInitialized();

    std::string m_language;
    std::string m_tessdataPath;
    std::unique_ptr<tesseract::TessBaseAPI> m_api;
    bool m_initAttempted = false;
    std::mutex m_mutex;
};

} // namespace bidlens::infrastructure
