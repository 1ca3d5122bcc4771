/**
 * @file RecognizedText.hpp
 * @brief Output contract of the text recognition channel.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/CardIdentity.hpp"

namespace bidlens::domain {

/**
 * @struct TextFragment
 * @brief One recognized piece of text with its engine confidence in [0, 1].
 */
struct TextFragment {
    std::string text;
    double confidence = 0.0;
};

/**
 * @struct RecognizedText
 * @brief Per-frame recognition result. Lives for one frame only.
 */
struct RecognizedText {
    std::vector<TextFragment> fragments;
    CardAttributes attributes;
    double confidence = 0.0;      ///< Mean fragment confidence, 0 when empty.
    std::string engine = "none";  ///< Engine that produced the fragments.
    std::string titleText;        ///< Concatenated text of the title region.
    std::string priceText;        ///< Concatenated text of the price/timer region.

    bool empty() const { return fragments.empty(); }

    std::string combinedText() const {
        std::string out;
        for (const auto& fragment : fragments) {
            if (!out.empty()) out += " ";
            out += fragment.text;
        }
        return out;
    }
};

} // namespace bidlens::domain
