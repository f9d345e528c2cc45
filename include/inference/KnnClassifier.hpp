#pragma once

#include "core/Types.hpp"
#include <vector>

namespace inference {

/**
 * Brute-force k-nearest-neighbour sign classifier.
 *
 * Reference sets are small (hundreds to low thousands of rows), so every
 * query scans all samples. The instance is immutable after construction;
 * rebuild it when the reference set changes.
 */
class KnnClassifier {
public:
    struct Config {
        int k = core::KNN_DEFAULT_K;
        float decay = core::KNN_DEFAULT_THRESHOLD;        // confidence = exp(-distance / decay)
        float idleDistance = core::KNN_DEFAULT_THRESHOLD; // Nearest match beyond this -> idle
    };

    /**
     * @throws std::invalid_argument if the set is empty or a sample is not 126 floats
     */
    explicit KnnClassifier(const core::ReferenceSet& references);
    KnnClassifier(const core::ReferenceSet& references, const Config& config);

    /**
     * Classify a 126-float query.
     * Wrong-sized queries return idle with infinite distance.
     */
    [[nodiscard]] core::Prediction predict(const core::FeatureVector& query) const;

    [[nodiscard]] size_t sampleCount() const { return samples_.size(); }
    [[nodiscard]] const std::vector<std::string>& labels() const { return labels_; }
    [[nodiscard]] bool hasLabel(const std::string& label) const;
    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct Row {
        size_t labelIndex;
        core::FeatureVector features;
    };

    struct Neighbor {
        size_t labelIndex;
        float distance;
        size_t order;   // Insertion order, keeps ties deterministic
    };

    Config config_;
    std::vector<std::string> labels_;
    std::vector<Row> samples_;

    [[nodiscard]] static float euclidean(const core::FeatureVector& a, const core::FeatureVector& b);
};

} // namespace inference
