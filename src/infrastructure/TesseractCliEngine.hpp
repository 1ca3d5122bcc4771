/**
 * @file TesseractCliEngine.hpp
 * @brief OCR fallback that shells out to the tesseract binary.
 */

#pragma once

#include <string>
#include "domain/TextRecognitionEngine.hpp"

namespace bidlens::infrastructure {

class TesseractCliEngine : public domain::TextRecognitionEngine {
public:
    explicit TesseractCliEngine(std::string language = "eng");

    std::string name() const override { return "tesseract-cli"; }
    bool isAvailable() override;
    std::vector<domain::TextFragment> recognize(const cv::Mat& image) override;

    /**
     * @brief Groups word rows of `tesseract ... tsv` output into line fragments.
     *
     * Words with negative confidence are skipped. Line confidence is the
     * mean word confidence scaled to [0, 1].
     */
    static std::vector<domain::TextFragment> ParseTsv(const std::string& tsv);

private:
    std::string m_language;
};

} // namespace bidlens::infrastructure
