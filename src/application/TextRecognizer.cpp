/**
 * @file TextRecognizer.cpp
 * @brief Implementation of the TextRecognizer class.
 */
#include "application/TextRecognizer.hpp"
#include "domain/AttributeParser.hpp"
#include "infrastructure/ImagePreprocessor.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <numeric>

namespace bidlens::application {

using infrastructure::ImagePreprocessor;

TextRecognizer::TextRecognizer(std::vector<std::unique_ptr<domain::TextRecognitionEngine>> engines,
                               TextRecognizerOptions options)
    : m_engines(std::move(engines)), m_options(options) {}

bool TextRecognizer::initialize() {
    m_selected = nullptr;
    for (auto& engine : m_engines) {
        if (!engine) continue;
        bool available = false;
        try {
            available = engine->isAvailable();
        } catch (const std::exception& e) {
            std::cerr << "[TextRecognizer] Probe of '" << engine->name() << "' failed: " << e.what() << std::endl;
        }
        if (available) {
            m_selected = engine.get();
            std::cout << "[TextRecognizer] Using OCR engine: " << m_selected->name() << std::endl;
            return true;
        }
        std::cout << "[TextRecognizer] Engine unavailable: " << engine->name() << std::endl;
    }
    std::cerr << "[TextRecognizer] No OCR engine available. Text channel disabled." << std::endl;
    return false;
}

std::string TextRecognizer::engineName() const {
    return m_selected ? m_selected->name() : "none";
}

std::vector<domain::TextFragment> TextRecognizer::recognizeRegion(const cv::Mat& region) {
    if (region.empty()) return {};
    cv::Mat input = m_options.preprocess ? ImagePreprocessor::PrepareForOcr(region) : region;

    std::vector<domain::TextFragment> fragments;
    for (auto& fragment : m_selected->recognize(input)) {
        if (fragment.text.find_first_not_of(" \t\r\n") == std::string::npos) continue;
        fragment.confidence = std::max(0.0, std::min(1.0, fragment.confidence));
        fragments.push_back(std::move(fragment));
    }
    return fragments;
}

std::string TextRecognizer::JoinFragments(const std::vector<domain::TextFragment>& fragments) {
    std::string out;
    for (const auto& fragment : fragments) {
        if (!out.empty()) out += " ";
        out += fragment.text;
    }
    return out;
}

domain::RecognizedText TextRecognizer::recognize(const cv::Mat& image) {
    domain::RecognizedText result;
    result.engine = engineName();
    if (!m_selected || image.empty()) {
        return result;
    }

    try {
        if (m_options.dualRegion) {
            cv::Mat title = ImagePreprocessor::TopRegion(image, m_options.titleFraction);
            cv::Mat price = ImagePreprocessor::BottomRegion(image, m_options.priceFraction);

            auto titleFuture = std::async(std::launch::async, [this, title] { return recognizeRegion(title); });
            auto priceFuture = std::async(std::launch::async, [this, price] { return recognizeRegion(price); });
            auto titleFragments = titleFuture.get();
            auto priceFragments = priceFuture.get();

            result.titleText = JoinFragments(titleFragments);
            result.priceText = JoinFragments(priceFragments);
            result.fragments = std::move(titleFragments);
            result.fragments.insert(result.fragments.end(), priceFragments.begin(), priceFragments.end());
        } else {
            result.fragments = recognizeRegion(image);
            result.titleText = JoinFragments(result.fragments);
            result.priceText = result.titleText;
        }
    } catch (const std::exception& e) {
        std::cerr << "[TextRecognizer] Recognition failed: " << e.what() << std::endl;
        domain::RecognizedText empty;
        empty.engine = result.engine;
        return empty;
    }

    if (!result.fragments.empty()) {
        const double total = std::accumulate(result.fragments.begin(), result.fragments.end(), 0.0,
            [](double sum, const domain::TextFragment& f) { return sum + f.confidence; });
        result.confidence = total / static_cast<double>(result.fragments.size());
    }
    result.attributes = domain::AttributeParser::ParseCardAttributes(result.combinedText());
    return result;
}

} // namespace bidlens::application
