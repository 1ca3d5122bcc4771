/**
 * @file ContinuityTracker.hpp
 * @brief Bridges short identification gaps between frames.
 */

#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include "domain/CardIdentity.hpp"

namespace bidlens::domain {

/**
 * @class ContinuityTracker
 * @brief Single-slot memory of the last resolved identity, subject to a TTL.
 *
 * A transient OCR miss (motion blur, an overlay) must not reset pricing for an
 * item that is still on the block.
 */
class ContinuityTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ContinuityTracker(std::chrono::milliseconds ttl = std::chrono::seconds(30));

    /**
     * @brief Records a resolved identity or substitutes the stored one.
     * @param current Identity fused from the current frame.
     * @param now Frame time.
     * @return The identity downstream stages should use for this frame.
     */
    CardIdentity update(const CardIdentity& current, Clock::time_point now);

    /** @brief Last stored identity regardless of age. */
    std::optional<CardIdentity> lastResolved() const;

    void clear();

    std::chrono::milliseconds ttl() const { return m_ttl; }

private:
    std::chrono::milliseconds m_ttl;
    std::optional<CardIdentity> m_stored;
    Clock::time_point m_storedAt{};
    mutable std::mutex m_mutex;
};

} // namespace bidlens::domain
