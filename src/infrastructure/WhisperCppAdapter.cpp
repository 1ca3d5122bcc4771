/**
 * @file WhisperCppAdapter.cpp
 * @brief Implementation of the WhisperCppAdapter class.
 */
#include "infrastructure/WhisperCppAdapter.hpp"
#include "whisper.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <thread>

namespace bidlens::infrastructure {

WhisperCppAdapter::WhisperCppAdapter(const std::string& modelPath, const std::string& language)
    : m_modelPath(modelPath)
    , m_language(language.empty() ? "en" : language)
{
}

WhisperCppAdapter::~WhisperCppAdapter() {
    if (m_ctx) {
        whisper_free(m_ctx);
    }
}

bool WhisperCppAdapter::load(std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_ctx) return true;

    std::error_code ec;
    if (m_modelPath.empty() || !std::filesystem::exists(m_modelPath, ec)) {
        errorMsg = "Whisper model not found at: " + m_modelPath + ". Download a ggml model (e.g. ggml-base.en.bin).";
        return false;
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    m_ctx = whisper_init_from_file_with_params(m_modelPath.c_str(), cparams);
    if (!m_ctx) {
        errorMsg = "Failed to initialize whisper context from " + m_modelPath;
        return false;
    }

    std::cout << "[WhisperCppAdapter] Loaded " << m_modelPath << std::endl;
    return true;
}

std::optional<std::string> WhisperCppAdapter::transcribe(const std::vector<float>& pcmf32) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_ctx || pcmf32.empty()) return std::nullopt;

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.single_segment = false;
    wparams.no_context = true;
    wparams.language = m_language.c_str();
    wparams.n_threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));

    if (whisper_full(m_ctx, wparams, pcmf32.data(), static_cast<int>(pcmf32.size())) != 0) {
        std::cerr << "[WhisperCppAdapter] Inference failed." << std::endl;
        return std::nullopt;
    }

    std::string result;
    const int nSegments = whisper_full_n_segments(m_ctx);
    for (int i = 0; i < nSegments; ++i) {
        const char* text = whisper_full_get_segment_text(m_ctx, i);
        if (!text) continue;
        if (!result.empty()) result += " ";
        result += text;
    }

    const auto first = result.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::string();
    const auto last = result.find_last_not_of(" \t\r\n");
    return result.substr(first, last - first + 1);
}

} // namespace bidlens::infrastructure
