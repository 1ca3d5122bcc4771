#include <cassert>
#include <chrono>
#include <iostream>
#include "domain/ContinuityTracker.hpp"

using namespace bidlens::domain;
using namespace std::chrono_literals;

namespace {

CardIdentity Named(const std::string& name) {
    CardIdentity identity;
    identity.attributes.name = name;
    identity.attributes.grade = "PSA 10";
    identity.confidence = 0.8;
    return identity;
}

void TestSubstitutesWithinTtl() {
    std::cout << "[Test] Unresolved frame within TTL reuses last identity..." << std::endl;
    ContinuityTracker tracker(30s);
    const auto t0 = ContinuityTracker::Clock::now();

    auto first = tracker.update(Named("Mike Trout"), t0);
    assert(!first.carriedOver);

    auto carried = tracker.update(CardIdentity{}, t0 + 10s);
    assert(carried.attributes.name == "Mike Trout");
    assert(carried.carriedOver);

    // Substitution does not refresh the timestamp.
    auto stillCarried = tracker.update(CardIdentity{}, t0 + 29s);
    assert(stillCarried.carriedOver);
    std::cout << "[PASS] Unresolved frame within TTL reuses last identity" << std::endl;
}

void TestExpiresAtTtl() {
    std::cout << "[Test] Stale identity is never substituted..." << std::endl;
    ContinuityTracker tracker(30s);
    const auto t0 = ContinuityTracker::Clock::now();
    tracker.update(Named("Mike Trout"), t0);

    auto atTtl = tracker.update(CardIdentity{}, t0 + 30s);
    assert(!atTtl.isResolved());
    assert(!atTtl.carriedOver);

    auto later = tracker.update(CardIdentity{}, t0 + 5min);
    assert(!later.isResolved());
    assert(tracker.lastResolved().has_value());
    std::cout << "[PASS] Stale identity is never substituted" << std::endl;
}

void TestNewIdentityReplaces() {
    std::cout << "[Test] New resolved identity replaces the slot..." << std::endl;
    ContinuityTracker tracker(30s);
    const auto t0 = ContinuityTracker::Clock::now();
    tracker.update(Named("Mike Trout"), t0);
    auto next = tracker.update(Named("Shohei Ohtani"), t0 + 40s);
    assert(next.attributes.name == "Shohei Ohtani");

    auto carried = tracker.update(CardIdentity{}, t0 + 45s);
    assert(carried.attributes.name == "Shohei Ohtani");

    tracker.clear();
    assert(!tracker.lastResolved().has_value());
    assert(!tracker.update(CardIdentity{}, t0 + 46s).isResolved());
    std::cout << "[PASS] New resolved identity replaces the slot" << std::endl;
}

} // namespace

int main() {
    TestSubstitutesWithinTtl();
    TestExpiresAtTtl();
    TestNewIdentityReplaces();
    std::cout << "[PASS] ContinuityTrackerTest" << std::endl;
    return 0;
}
