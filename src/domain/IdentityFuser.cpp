#include "domain/IdentityFuser.hpp"
#include <algorithm>

namespace bidlens::domain {

namespace {

double Clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

void FuseField(std::string& textValue, FieldSource& source, const std::string& audioValue, bool audioWins) {
    if (audioValue.empty()) return;
    if (textValue.empty() || audioWins) {
        textValue = audioValue;
        source = FieldSource::Audio;
    }
}

} // namespace

CardIdentity IdentityFuser::FromText(const CardAttributes& attributes, double textConfidence, const std::string& engine) {
    CardIdentity identity;
    identity.attributes = attributes;
    identity.confidence = Clamp01(textConfidence);
    identity.ocrEngine = engine;

    auto mark = [](const std::string& value) { return value.empty() ? FieldSource::None : FieldSource::Text; };
    identity.provenance.name = mark(attributes.name);
    identity.provenance.year = mark(attributes.year);
    identity.provenance.setName = mark(attributes.setName);
    identity.provenance.itemNumber = mark(attributes.itemNumber);
    identity.provenance.grade = mark(attributes.grade);
    identity.provenance.rookie = attributes.rookie ? FieldSource::Text : FieldSource::None;
    return identity;
}

CardIdentity IdentityFuser::Fuse(const CardIdentity& textIdentity,
                                 const SpokenAttributes& audio,
                                 double textConfidence,
                                 double audioConfidence) {
    CardIdentity fused = textIdentity;
    const double t = Clamp01(textConfidence);
    const double a = Clamp01(audioConfidence);
    fused.audioConfidence = a;

    // No audio weight at all (also covers both channels at zero).
    if (a <= 0.0) {
        fused.confidence = Clamp01(textIdentity.confidence);
        return fused;
    }

    const double audioWeight = a / (t + a);
    const bool audioWins = audioWeight > 0.5;

    CardAttributes& attrs = fused.attributes;
    Provenance& prov = fused.provenance;

    const std::string previousGrade = attrs.grade;
    FuseField(attrs.grade, prov.grade, audio.grade, audioWins);
    if (attrs.grade != previousGrade) {
        attrs.gradingCompany = audio.gradingCompany;
    }
    FuseField(attrs.year, prov.year, audio.year, audioWins);
    FuseField(attrs.setName, prov.setName, audio.setName, audioWins);

    // Rookie only has a "value" when the flag is set.
    if (audio.rookie && !attrs.rookie) {
        attrs.rookie = true;
        prov.rookie = FieldSource::Audio;
    }

    fused.confidence = Clamp01(t * (1.0 - audioWeight) + a * audioWeight);
    return fused;
}

} // namespace bidlens::domain
