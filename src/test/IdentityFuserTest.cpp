#include <cassert>
#include <cmath>
#include <iostream>
#include "domain/IdentityFuser.hpp"

using namespace bidlens::domain;

namespace {

bool Near(double a, double b) { return std::fabs(a - b) < 1e-9; }

CardIdentity TextIdentity(const std::string& grade, double confidence) {
    CardAttributes attrs;
    attrs.name = "Mike Trout";
    attrs.year = "2023";
    attrs.setName = "Topps";
    attrs.grade = grade;
    attrs.gradingCompany = grade.empty() ? "" : "PSA";
    return IdentityFuser::FromText(attrs, confidence, "fake-ocr");
}

void TestAudioWinsWhenMoreConfident() {
    std::cout << "[Test] Confident audio overrides text grade..." << std::endl;
    SpokenAttributes spoken;
    spoken.grade = "PSA 9";
    spoken.gradingCompany = "PSA";

    auto fused = IdentityFuser::Fuse(TextIdentity("PSA 10", 0.3), spoken, 0.3, 0.8);
    assert(fused.attributes.grade == "PSA 9");
    assert(fused.provenance.grade == FieldSource::Audio);
    assert(fused.attributes.name == "Mike Trout");
    assert(fused.provenance.name == FieldSource::Text);
    assert(fused.confidence >= 0.0 && fused.confidence <= 1.0);
    // t*(1-w) + a*w with w = a/(t+a)
    const double w = 0.8 / 1.1;
    assert(Near(fused.confidence, 0.3 * (1.0 - w) + 0.8 * w));
    std::cout << "[PASS] Confident audio overrides text grade" << std::endl;
}

void TestTextWinsWhenMoreConfident() {
    std::cout << "[Test] Confident text keeps its fields, audio fills gaps..." << std::endl;
    SpokenAttributes spoken;
    spoken.grade = "PSA 9";
    spoken.gradingCompany = "PSA";
    spoken.rookie = true;

    auto text = TextIdentity("PSA 10", 0.9);
    text.attributes.year.clear();
    text.provenance.year = FieldSource::None;
    spoken.year = "2011";

    auto fused = IdentityFuser::Fuse(text, spoken, 0.9, 0.4);
    assert(fused.attributes.grade == "PSA 10");
    assert(fused.provenance.grade == FieldSource::Text);
    assert(fused.attributes.year == "2011");
    assert(fused.provenance.year == FieldSource::Audio);
    assert(fused.attributes.rookie);
    assert(fused.provenance.rookie == FieldSource::Audio);
    std::cout << "[PASS] Confident text keeps its fields, audio fills gaps" << std::endl;
}

void TestSilentAudioIsIgnored() {
    std::cout << "[Test] Zero audio confidence leaves text untouched..." << std::endl;
    SpokenAttributes spoken;
    spoken.grade = "PSA 8";
    spoken.year = "1999";

    auto text = TextIdentity("", 0.6);
    auto fused = IdentityFuser::Fuse(text, spoken, 0.6, 0.0);
    assert(fused.attributes.grade.empty());
    assert(fused.attributes.year == "2023");
    assert(Near(fused.confidence, 0.6));

    auto bothZero = IdentityFuser::Fuse(TextIdentity("", 0.0), spoken, 0.0, 0.0);
    assert(Near(bothZero.confidence, 0.0));
    assert(bothZero.attributes.grade.empty());
    std::cout << "[PASS] Zero audio confidence leaves text untouched" << std::endl;
}

void TestConfidenceClamped() {
    std::cout << "[Test] Out of range confidences are clamped..." << std::endl;
    SpokenAttributes spoken;
    spoken.grade = "PSA 9";
    auto fused = IdentityFuser::Fuse(TextIdentity("PSA 10", 1.5), spoken, 1.5, 3.0);
    assert(fused.confidence >= 0.0 && fused.confidence <= 1.0);
    assert(Near(fused.audioConfidence, 1.0));
    std::cout << "[PASS] Out of range confidences are clamped" << std::endl;
}

} // namespace

int main() {
    TestAudioWinsWhenMoreConfident();
    TestTextWinsWhenMoreConfident();
    TestSilentAudioIsIgnored();
    TestConfidenceClamped();
    std::cout << "[PASS] IdentityFuserTest" << std::endl;
    return 0;
}
