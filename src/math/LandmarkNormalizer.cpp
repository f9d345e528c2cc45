#include "math/LandmarkNormalizer.hpp"
#include <algorithm>
#include <cmath>

namespace math {

core::FeatureVector LandmarkNormalizer::normalize(const core::HandLandmarkSet& hand) {
    core::FeatureVector out(core::HAND_FEATURE_LENGTH, 0.0f);
    if (!hand.isComplete()) {
        return out;
    }

    using LI = LandmarkIndices;
    const auto& wrist = hand.landmarks[LI::WRIST];
    const auto& middleMcp = hand.landmarks[LI::MIDDLE_MCP];

    float dx = wrist.x - middleMcp.x;
    float dy = wrist.y - middleMcp.y;
    float dz = wrist.z - middleMcp.z;
    float span = std::sqrt(dx * dx + dy * dy + dz * dz);
    if (span < MIN_SPAN) span = 1.0f;

    for (size_t i = 0; i < core::HAND_LANDMARK_COUNT; ++i) {
        const auto& lm = hand.landmarks[i];
        out[i * 3 + 0] = (lm.x - wrist.x) / span;
        out[i * 3 + 1] = (lm.y - wrist.y) / span;
        out[i * 3 + 2] = (lm.z - wrist.z) / span;
    }
    return out;
}

core::FeatureVector LandmarkNormalizer::mirror(const core::FeatureVector& features) {
    core::FeatureVector out = features;
    for (size_t i = 0; i < out.size(); i += 3) {
        out[i] = -out[i];
    }
    return out;
}

core::FeatureVector LandmarkNormalizer::concatSlots(const core::FeatureVector& slot1,
                                                    const core::FeatureVector& slot2) {
    core::FeatureVector out(core::QUERY_FEATURE_LENGTH, 0.0f);
    if (slot1.size() == core::HAND_FEATURE_LENGTH) {
        std::copy(slot1.begin(), slot1.end(), out.begin());
    }
    if (slot2.size() == core::HAND_FEATURE_LENGTH) {
        std::copy(slot2.begin(), slot2.end(), out.begin() + core::HAND_FEATURE_LENGTH);
    }
    return out;
}

LandmarkNormalizer::QueryFeatures LandmarkNormalizer::buildFeatures(
    const std::vector<core::HandLandmarkSet>& hands) {

    QueryFeatures result;
    std::vector<const core::HandLandmarkSet*> complete;
    for (const auto& hand : hands) {
        if (hand.isComplete()) complete.push_back(&hand);
    }
    result.numHands = static_cast<int>(complete.size());
    if (complete.empty()) {
        return result;
    }

    core::FeatureVector h1(core::HAND_FEATURE_LENGTH, 0.0f);
    core::FeatureVector h2(core::HAND_FEATURE_LENGTH, 0.0f);
    bool h1Set = false;
    bool h2Set = false;

    for (const auto* hand : complete) {
        core::FeatureVector normalized = normalize(*hand);
        if (result.primary.empty()) result.primary = normalized;

        // Explicit handedness always wins its slot, even if already filled
        if (hand->handedness == core::Handedness::Left) {
            h1 = std::move(normalized);
            h1Set = true;
        } else if (hand->handedness == core::Handedness::Right) {
            h2 = std::move(normalized);
            h2Set = true;
        } else if (!h1Set) {
            h1 = std::move(normalized);
            h1Set = true;
        } else if (!h2Set) {
            h2 = std::move(normalized);
            h2Set = true;
        }
    }

    result.features = concatSlots(h1, h2);
    return result;
}

} // namespace math
