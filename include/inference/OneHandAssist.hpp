#pragma once

#include "core/Types.hpp"
#include "inference/KnnClassifier.hpp"
#include <vector>

namespace inference {

/**
 * One-hand assist: when only one hand is tracked, try the hand in both
 * query slots, plain and mirrored, and keep the most useful prediction.
 *
 * Selection order (deterministic):
 *  1. non-idle beats idle
 *  2. higher confidence
 *  3. lower distance (confidences equal within CONFIDENCE_TIE_EPS)
 *  4. earlier candidate
 */
class OneHandAssist {
public:
    static constexpr float CONFIDENCE_TIE_EPS = 1e-9f;

    /**
     * Candidate 126-vectors: [base, hand|0, 0|hand, mirror|0, 0|mirror],
     * de-duplicated by value. A hand that is not 63 floats yields [base].
     */
    [[nodiscard]] static std::vector<core::FeatureVector> expand(const core::FeatureVector& base,
                                                                 const core::FeatureVector& hand);

    /**
     * Pick the best prediction. Empty input returns idle.
     */
    [[nodiscard]] static core::Prediction selectBest(const std::vector<core::Prediction>& predictions);

    /**
     * Classify every candidate and return the selected prediction.
     */
    [[nodiscard]] static core::Prediction predict(const KnnClassifier& classifier,
                                                  const core::FeatureVector& base,
                                                  const core::FeatureVector& hand);

private:
    [[nodiscard]] static bool isBetter(const core::Prediction& candidate, const core::Prediction& best);
    [[nodiscard]] static std::string dedupKey(const core::FeatureVector& features);
};

} // namespace inference
