/**
 * @file CardIdentity.hpp
 * @brief Domain entities describing the item currently on the auction block.
 */

#pragma once
#include <string>

namespace bidlens::domain {

/**
 * @enum FieldSource
 * @brief Which identification channel contributed a field.
 */
enum class FieldSource {
    None,
    Text,  ///< On-screen text recognition.
    Audio  ///< Auctioneer speech.
};

inline const char* FieldSourceToString(FieldSource source) {
    switch (source) {
        case FieldSource::Text: return "text";
        case FieldSource::Audio: return "audio";
        case FieldSource::None: break;
    }
    return "none";
}

/**
 * @struct CardAttributes
 * @brief Best-effort parse of an item description. Empty strings mean "not found".
 */
struct CardAttributes {
    std::string name;
    std::string year;
    std::string setName;
    std::string itemNumber;
    std::string grade;          ///< e.g. "PSA 10"
    std::string gradingCompany; ///< e.g. "PSA"
    bool rookie = false;
};

/**
 * @struct Provenance
 * @brief Per-field record of the channel a value came from.
 */
struct Provenance {
    FieldSource name = FieldSource::None;
    FieldSource year = FieldSource::None;
    FieldSource setName = FieldSource::None;
    FieldSource itemNumber = FieldSource::None;
    FieldSource grade = FieldSource::None;
    FieldSource rookie = FieldSource::None;
};

/**
 * @struct CardIdentity
 * @brief The fused, current best guess of the auctioned item.
 *
 * Only the IdentityFuser and ContinuityTracker produce these; everything
 * downstream treats them as read-only values.
 */
struct CardIdentity {
    CardAttributes attributes;
    Provenance provenance;
    double confidence = 0.0;      ///< Combined confidence in [0, 1].
    double audioConfidence = 0.0; ///< Audio confidence used during fusion.
    std::string ocrEngine = "unknown";
    bool carriedOver = false;     ///< True when substituted from the continuity slot.

    /** @brief A non-empty name is the precondition for pricing and scoring. */
    bool isResolved() const { return !attributes.name.empty(); }

    /** @brief Human readable one-liner, e.g. "Mike Trout 2023 Topps #27 PSA 10". */
    std::string describe() const {
        std::string out = attributes.name;
        auto append = [&out](const std::string& part) {
            if (part.empty()) return;
            if (!out.empty()) out += " ";
            out += part;
        };
        append(attributes.year);
        append(attributes.setName);
        if (!attributes.itemNumber.empty()) append("#" + attributes.itemNumber);
        append(attributes.grade);
        return out;
    }
};

} // namespace bidlens::domain
