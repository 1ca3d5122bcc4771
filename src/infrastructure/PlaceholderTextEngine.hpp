/**
 * @file PlaceholderTextEngine.hpp
 * @brief Last link of the OCR chain: canned text so the pipeline stays demonstrable.
 */

#pragma once

#include "domain/TextRecognitionEngine.hpp"

namespace bidlens::infrastructure {

class PlaceholderTextEngine : public domain::TextRecognitionEngine {
public:
    std::string name() const override { return "placeholder"; }
    bool isAvailable() override { return true; }

    std::vector<domain::TextFragment> recognize(const cv::Mat&) override {
        return {
            {"2023", 0.95},
            {"Topps", 0.90},
            {"Mike Trout", 0.88},
            {"PSA 10", 0.92},
            {"#27", 0.85}
        };
    }
};

} // namespace bidlens::infrastructure
