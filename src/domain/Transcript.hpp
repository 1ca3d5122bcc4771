/**
 * @file Transcript.hpp
 * @brief Output contract of the speech transcription channel.
 */

#pragma once
#include <optional>
#include <string>

namespace bidlens::domain {

/**
 * @struct SpokenAttributes
 * @brief Attributes an auctioneer typically says out loud.
 *
 * Audio never carries a reliable name or item number, so those are absent here.
 */
struct SpokenAttributes {
    std::string grade;
    std::string gradingCompany;
    std::string year;
    std::string setName;
    bool rookie = false;
    std::optional<double> spokenPrice;

    bool empty() const {
        return grade.empty() && year.empty() && setName.empty() && !rookie && !spokenPrice;
    }
};

/**
 * @struct Transcript
 * @brief Result of one audio chunk; superseded by the next chunk.
 */
struct Transcript {
    std::string text;
    SpokenAttributes attributes;
    double confidence = 0.0;
};

/**
 * @struct AudioStatus
 * @brief Snapshot returned by SpeechTranscriber::getLatest().
 */
struct AudioStatus {
    Transcript latest;
    bool active = false;    ///< Capture running with a loaded model.
    bool available = false; ///< A speech model loaded at startup.
};

} // namespace bidlens::domain
