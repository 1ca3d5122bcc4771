#include "domain/ContinuityTracker.hpp"

namespace bidlens::domain {

ContinuityTracker::ContinuityTracker(std::chrono::milliseconds ttl) : m_ttl(ttl) {}

CardIdentity ContinuityTracker::update(const CardIdentity& current, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (current.isResolved()) {
        m_stored = current;
        m_stored->carriedOver = false;
        m_storedAt = now;
        return current;
    }

    if (m_stored && now - m_storedAt < m_ttl) {
        CardIdentity substitute = *m_stored;
        substitute.carriedOver = true;
        return substitute;
    }
    return current;
}

std::optional<CardIdentity> ContinuityTracker::lastResolved() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stored;
}

void ContinuityTracker::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stored.reset();
}

} // namespace bidlens::domain
