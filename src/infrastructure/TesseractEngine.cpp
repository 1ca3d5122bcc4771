#include "infrastructure/TesseractEngine.hpp"
#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace bidlens::infrastructure {

TesseractEngine::TesseractEngine(std::string language, std::string tessdataPath)
    : m_language(std::move(language)), m_tessdataPath(std::move(tessdataPath)) {}

TesseractEngine::~TesseractEngine() {
    if (m_api) {
        m_api->End();
    }
}

bool TesseractEngine::ensureInitialized() {
    if (m_api) return true;
    if (m_initAttempted) return false;
    m_initAttempted = true;

    auto api = std::make_unique<tesseract::TessBaseAPI>();
    const char* datapath = m_tessdataPath.empty() ? nullptr : m_tessdataPath.c_str();
    if (api->Init(datapath, m_language.c_str(), tesseract::OEM_DEFAULT) != 0) {
        std::cerr << "[TesseractEngine] Init failed for language '" << m_language << "'" << std::endl;
        return false;
    }
    api->SetPageSegMode(tesseract::PSM_AUTO);
    m_api = std::move(api);
    return true;
}

bool TesseractEngine::isAvailable() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return ensureInitialized();
}

std::vector<domain::TextFragment> TesseractEngine::recognize(const cv::Mat& image) {
    std::vector<domain::TextFragment> fragments;
    if (image.empty()) return fragments;

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image.isContinuous() ? image : image.clone();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureInitialized()) {
        throw std::runtime_error("tesseract is not initialized");
    }

    m_api->SetImage(gray.data, gray.cols, gray.rows, 1, static_cast<int>(gray.step));
    if (m_api->Recognize(nullptr) != 0) {
        m_api->Clear();
        throw std::runtime_error("tesseract recognition failed");
    }

    std::unique_ptr<tesseract::ResultIterator> it(m_api->GetIterator());
    const tesseract::PageIteratorLevel level = tesseract::RIL_TEXTLINE;
    if (it) {
        do {
            char* raw = it->GetUTF8Text(level);
            if (!raw) continue;
            std::string text(raw);
            delete[] raw;

            const auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) continue;
            const auto last = text.find_last_not_of(" \t\r\n");

            domain::TextFragment fragment;
            fragment.text = text.substr(first, last - first + 1);
            fragment.confidence = std::clamp(it->Confidence(level) / 100.0, 0.0, 1.0);
            fragments.push_back(std::move(fragment));
        } while (it->Next(level));
    }

    m_api->Clear();
    return fragments;
}

} // namespace bidlens::infrastructure
