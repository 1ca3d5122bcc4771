/**
 * @file IdentityFuser.hpp
 * @brief Confidence-weighted fusion of the text and audio identification channels.
 */

#pragma once
#include "domain/CardIdentity.hpp"
#include "domain/Transcript.hpp"

namespace bidlens::domain {

/**
 * @class IdentityFuser
 * @brief Stateless single-pass fusion. Same inputs always give the same output.
 *
 * Grade, year, set and rookie are fusible. Name and item number always come
 * from the text channel.
 */
class IdentityFuser {
public:
    /**
     * @param textIdentity Identity built from recognized text.
     * @param audio Attributes parsed from the latest transcript.
     * @param textConfidence Recognizer confidence in [0, 1].
     * @param audioConfidence Transcriber confidence in [0, 1]; 0 disables audio entirely.
     */
    static CardIdentity Fuse(const CardIdentity& textIdentity,
                             const SpokenAttributes& audio,
                             double textConfidence,
                             double audioConfidence);

    /** @brief Wraps a text-only parse into an identity with text provenance. */
    static CardIdentity FromText(const CardAttributes& attributes, double textConfidence, const std::string& engine);
};

} // namespace bidlens::domain
