#pragma once

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "core/Types.hpp"
#include "math/LandmarkNormalizer.hpp"

// Shared fixtures for the standalone test executables

inline void print_test_result(const std::string& test_name, bool success) {
    std::cout << (success ? "[PASS] " : "[FAIL] ") << test_name << std::endl;
}

inline bool near(float a, float b, float tolerance = 1e-4f) {
    return std::fabs(a - b) <= tolerance;
}

/**
 * Synthetic hand shape. Wrist at the origin and middle MCP 0.1 below it, so
 * the normalized span is exactly 0.1; `variant` changes every other landmark.
 */
inline core::HandLandmarkSet makeHand(int variant,
                                      core::Handedness handedness = core::Handedness::Unknown,
                                      float offsetX = 0.0f, float offsetY = 0.0f, float scale = 1.0f) {
    core::HandLandmarkSet hand;
    hand.handedness = handedness;
    hand.landmarks.resize(core::HAND_LANDMARK_COUNT);
    for (size_t i = 0; i < core::HAND_LANDMARK_COUNT; ++i) {
        core::Landmark lm;
        if (i == 0) {
            lm = {0.0f, 0.0f, 0.0f};
        } else if (i == 9) {
            lm = {0.0f, -0.1f, 0.0f};
        } else {
            const float fi = static_cast<float>(i);
            const float fv = static_cast<float>(variant);
            lm.x = 0.08f * std::sin(fi * 0.9f + fv * 1.7f);
            lm.y = 0.08f * std::cos(fi * 0.6f + fv * 2.3f);
            lm.z = 0.02f * std::sin(fi + fv);
        }
        hand.landmarks[i] = {lm.x * scale + offsetX, lm.y * scale + offsetY, lm.z * scale};
    }
    return hand;
}

inline core::FeatureVector twoHandFeatures(int leftVariant, int rightVariant) {
    return math::LandmarkNormalizer::concatSlots(
        math::LandmarkNormalizer::normalize(makeHand(leftVariant)),
        math::LandmarkNormalizer::normalize(makeHand(rightVariant)));
}

/**
 * `count` samples jittered by a few thousandths around `center`.
 */
inline std::vector<core::ReferenceSample> cluster(const std::string& label,
                                                  const core::FeatureVector& center,
                                                  int count = 3) {
    std::vector<core::ReferenceSample> rows;
    for (int i = 0; i < count; ++i) {
        core::ReferenceSample sample{label, center};
        sample.features[static_cast<size_t>(i) % sample.features.size()] += 0.001f * static_cast<float>(i);
        rows.push_back(sample);
    }
    return rows;
}

inline int summarize(const std::string& suite, const std::vector<bool>& results) {
    int passed = 0;
    for (bool ok : results) passed += ok ? 1 : 0;
    const int total = static_cast<int>(results.size());
    std::cout << "\n=====================================" << std::endl;
    std::cout << suite << ": " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "=====================================" << std::endl;
    return passed == total ? 0 : 1;
}
