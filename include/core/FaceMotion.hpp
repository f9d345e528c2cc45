#pragma once

#include "core/Types.hpp"
#include <optional>
#include <vector>

namespace core {

/**
 * Head pose hints from a face mesh (MediaPipe Face Landmarker, 468+ points).
 * Used by the host to aim cosmetic effects; not part of classification.
 */
struct FaceMotion {
    struct Anchor {
        float x = 0.5f;   // Mirrored for a selfie view, clamped [0.04, 0.96]
        float y = 0.5f;   // Clamped [0.1, 0.9]
    };

    Anchor anchor;
    float yaw = 0.0f;     // [-1, 1]
    float pitch = 0.0f;   // [-1, 1]

    struct LandmarkIndices {
        static constexpr int NOSE = 1;
        static constexpr int MOUTH_UPPER = 13;
        static constexpr int MOUTH_LOWER = 14;
        static constexpr int LEFT_EYE = 33;
        static constexpr int RIGHT_EYE = 263;
    };

    static constexpr size_t MIN_LANDMARKS = 264;
};

/**
 * Mouth-centred anchor plus yaw/pitch estimates.
 * @return nullopt when fewer than 264 landmarks are supplied
 */
[[nodiscard]] std::optional<FaceMotion> computeFaceMotion(const std::vector<Landmark>& landmarks);

} // namespace core
