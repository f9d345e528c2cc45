#include "inference/OneHandAssist.hpp"
#include "math/LandmarkNormalizer.hpp"

#include <cmath>
#include <cstdio>
#include <set>
#include <string>

namespace inference {

std::string OneHandAssist::dedupKey(const core::FeatureVector& features) {
    // Six decimals is well below landmark noise; "-0.000000" is folded to "0.000000"
    std::string key;
    key.reserve(features.size() * 10);
    char buf[32];
    for (float value : features) {
        double v = std::isfinite(value) ? static_cast<double>(value) : 0.0;
        if (std::fabs(v) < 5e-7) v = 0.0;
        std::snprintf(buf, sizeof(buf), "%.6f|", v);
        key += buf;
    }
    return key;
}

std::vector<core::FeatureVector> OneHandAssist::expand(const core::FeatureVector& base,
                                                       const core::FeatureVector& hand) {
    if (hand.size() != core::HAND_FEATURE_LENGTH) {
        return {base};
    }

    const core::FeatureVector empty;
    const core::FeatureVector mirrored = math::LandmarkNormalizer::mirror(hand);

    std::vector<core::FeatureVector> variants;
    variants.reserve(5);
    variants.push_back(base);
    variants.push_back(math::LandmarkNormalizer::concatSlots(hand, empty));
    variants.push_back(math::LandmarkNormalizer::concatSlots(empty, hand));
    variants.push_back(math::LandmarkNormalizer::concatSlots(mirrored, empty));
    variants.push_back(math::LandmarkNormalizer::concatSlots(empty, mirrored));

    std::set<std::string> seen;
    std::vector<core::FeatureVector> deduped;
    for (auto& candidate : variants) {
        if (seen.insert(dedupKey(candidate)).second) {
            deduped.push_back(std::move(candidate));
        }
    }
    return deduped;
}

bool OneHandAssist::isBetter(const core::Prediction& candidate, const core::Prediction& best) {
    const bool candidateIdle = candidate.isIdle();
    const bool bestIdle = best.isIdle();

    if (bestIdle != candidateIdle) {
        return bestIdle;
    }
    if (candidate.confidence > best.confidence + CONFIDENCE_TIE_EPS) {
        return true;
    }
    if (std::fabs(candidate.confidence - best.confidence) <= CONFIDENCE_TIE_EPS) {
        return candidate.distance < best.distance;
    }
    return false;
}

core::Prediction OneHandAssist::selectBest(const std::vector<core::Prediction>& predictions) {
    if (predictions.empty()) {
        return core::Prediction{};
    }

    core::Prediction best = predictions.front();
    for (size_t i = 1; i < predictions.size(); ++i) {
        if (isBetter(predictions[i], best)) {
            best = predictions[i];
        }
    }
    return best;
}

core::Prediction OneHandAssist::predict(const KnnClassifier& classifier,
                                        const core::FeatureVector& base,
                                        const core::FeatureVector& hand) {
    std::vector<core::Prediction> predictions;
    for (const auto& candidate : expand(base, hand)) {
        predictions.push_back(classifier.predict(candidate));
    }
    return selectBest(predictions);
}

} // namespace inference
