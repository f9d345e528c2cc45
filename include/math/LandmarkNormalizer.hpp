#pragma once

#include "core/Types.hpp"

namespace math {

/**
 * Landmark normalization for the sign classifier.
 *
 * Feature layout per hand: [x0, y0, z0, x1, y1, z1, ... x20, y20, z20]
 * with the wrist (landmark 0) at the origin and all coordinates divided by
 * the wrist -> middle MCP (landmark 9) span.
 */
class LandmarkNormalizer {
public:
    struct LandmarkIndices {
        static constexpr int WRIST = 0;
        static constexpr int MIDDLE_MCP = 9;
    };

    // Spans below this are treated as a collapsed hand (divisor 1)
    static constexpr float MIN_SPAN = 1e-4f;

    struct QueryFeatures {
        core::FeatureVector features;   // 126 floats, or empty when no complete hand
        core::FeatureVector primary;    // First complete hand, normalized (63 floats)
        int numHands = 0;               // Complete hands only
    };

    /**
     * Translation- and scale-invariant 63-vector for one hand.
     * Degenerate input (< 21 landmarks) yields 63 zeros.
     */
    [[nodiscard]] static core::FeatureVector normalize(const core::HandLandmarkSet& hand);

    /**
     * Negate the x component of every 3-tuple (simulates the opposite hand).
     * mirror(mirror(v)) == v.
     */
    [[nodiscard]] static core::FeatureVector mirror(const core::FeatureVector& features);

    /**
     * Concatenate two 63-vectors into a 126 query; an empty slot is zero-filled.
     */
    [[nodiscard]] static core::FeatureVector concatSlots(const core::FeatureVector& slot1,
                                                         const core::FeatureVector& slot2);

    /**
     * Build the two-slot query from all detected hands.
     * Left -> slot 1, Right -> slot 2, unknown handedness fills the first free slot.
     * Hands with fewer than 21 landmarks are ignored.
     */
    [[nodiscard]] static QueryFeatures buildFeatures(const std::vector<core::HandLandmarkSet>& hands);
};

} // namespace math
