#include "inference/KnnClassifier.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace inference {

namespace {
constexpr float WEIGHT_EPSILON = 1e-6f;
constexpr float MIN_DECAY = 0.1f;
}

KnnClassifier::KnnClassifier(const core::ReferenceSet& references)
    : KnnClassifier(references, Config{}) {
}

KnnClassifier::KnnClassifier(const core::ReferenceSet& references, const Config& config)
    : config_(config) {
    config_.k = std::max(1, config_.k);
    config_.decay = std::max(MIN_DECAY, config_.decay);
    config_.idleDistance = std::max(MIN_DECAY, config_.idleDistance);

    for (const auto& [label, rows] : references) {
        if (rows.empty()) continue;

        size_t labelIndex = labels_.size();
        labels_.push_back(label);

        for (const auto& row : rows) {
            if (row.features.size() != core::QUERY_FEATURE_LENGTH) {
                throw std::invalid_argument("KnnClassifier: sample for '" + label + "' has " +
                                            std::to_string(row.features.size()) +
                                            " features, expected " +
                                            std::to_string(core::QUERY_FEATURE_LENGTH));
            }
            samples_.push_back({labelIndex, row.features});
        }
    }

    if (samples_.empty()) {
        throw std::invalid_argument("KnnClassifier: reference set is empty");
    }

    core::Logger::info("KnnClassifier: ", samples_.size(), " samples, ", labels_.size(),
                       " labels, k=", config_.k, " decay=", config_.decay);
}

bool KnnClassifier::hasLabel(const std::string& label) const {
    return std::find(labels_.begin(), labels_.end(), label) != labels_.end();
}

float KnnClassifier::euclidean(const core::FeatureVector& a, const core::FeatureVector& b) {
    float sum = 0.0f;
    const size_t len = std::min(a.size(), b.size());
    for (size_t i = 0; i < len; ++i) {
        float diff = a[i] - b[i];
        sum += diff * diff;
    }
    return std::sqrt(sum);
}

core::Prediction KnnClassifier::predict(const core::FeatureVector& query) const {
    core::Prediction idle;
    if (query.size() != core::QUERY_FEATURE_LENGTH) {
        return idle;
    }

    std::vector<Neighbor> neighbors;
    neighbors.reserve(samples_.size());
    for (size_t i = 0; i < samples_.size(); ++i) {
        neighbors.push_back({samples_[i].labelIndex, euclidean(query, samples_[i].features), i});
    }

    const size_t k = std::min(static_cast<size_t>(config_.k), neighbors.size());
    std::partial_sort(neighbors.begin(), neighbors.begin() + static_cast<std::ptrdiff_t>(k), neighbors.end(),
                      [](const Neighbor& a, const Neighbor& b) {
                          if (a.distance != b.distance) return a.distance < b.distance;
                          return a.order < b.order;
                      });

    const float minDist = neighbors[0].distance;
    if (!std::isfinite(minDist) || minDist > config_.idleDistance) {
        idle.distance = minDist;
        return idle;
    }

    // Inverse-distance weighted vote among the k nearest
    struct Score {
        float weight = 0.0f;
        float distSum = 0.0f;
        float nearest = std::numeric_limits<float>::infinity();
        int hits = 0;
    };
    std::vector<Score> scores(labels_.size());
    for (size_t i = 0; i < k; ++i) {
        const auto& n = neighbors[i];
        auto& score = scores[n.labelIndex];
        score.weight += 1.0f / (n.distance + WEIGHT_EPSILON);
        score.distSum += n.distance;
        score.nearest = std::min(score.nearest, n.distance);
        score.hits++;
    }

    // Label order of the nearest neighbour first, so ties resolve toward it
    size_t best = neighbors[0].labelIndex;
    float bestAvg = scores[best].distSum / static_cast<float>(scores[best].hits);
    for (size_t i = 0; i < scores.size(); ++i) {
        const auto& score = scores[i];
        if (score.hits == 0 || i == best) continue;
        float avg = score.distSum / static_cast<float>(score.hits);
        if (score.weight > scores[best].weight ||
            (score.weight == scores[best].weight && avg < bestAvg)) {
            best = i;
            bestAvg = avg;
        }
    }

    core::Prediction result;
    result.label = labels_[best];
    result.confidence = std::clamp(std::exp(-bestAvg / config_.decay), 0.0f, 1.0f);
    result.distance = scores[best].nearest;
    return result;
}

} // namespace inference
