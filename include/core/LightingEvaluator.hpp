#pragma once

#include "core/Types.hpp"
#include <opencv2/core.hpp>
#include <cstdint>

namespace core {

/**
 * Ambient lighting check on a small RGBA sample of the camera frame.
 *
 * Luma: 0.2126 R + 0.7152 G + 0.0722 B, sampled every `stride` pixels on
 * both axes. "contrast" is the population standard deviation of luma.
 * Thresholds come from the active CalibrationProfile and are strict:
 * mean == lightingMin is still Good.
 */
class LightingEvaluator {
public:
    explicit LightingEvaluator(int64_t intervalMs = LIGHTING_INTERVAL_MS);

    /**
     * Evaluate an RGBA buffer (width * height * 4 bytes).
     * Empty buffer or non-positive size -> {0, 0, LowLight}.
     */
    [[nodiscard]] static LightingStats evaluate(const uint8_t* rgba, int width, int height,
                                                const CalibrationProfile& profile);

    /**
     * Downscale a camera frame (8-bit BGR, BGRA or gray) to 96x72 and evaluate it.
     * Other formats report {0, 0, LowLight}.
     */
    [[nodiscard]] static LightingStats evaluate(const cv::Mat& bgrFrame, const CalibrationProfile& profile);

    /**
     * Classify precomputed stats against the profile thresholds.
     */
    [[nodiscard]] static LightingStatus classify(float mean, float contrast, const CalibrationProfile& profile);

    [[nodiscard]] static int sampleStride(int width, int height);

    /**
     * Re-evaluate if the interval has elapsed, otherwise keep the cached stats.
     * @return true if the stats were refreshed
     */
    bool update(const cv::Mat& bgrFrame, const CalibrationProfile& profile, int64_t nowMs);

    [[nodiscard]] const LightingStats& stats() const { return stats_; }
    [[nodiscard]] bool hasStats() const { return lastEvalMs_ >= 0; }

    // Feed stats computed elsewhere (e.g. by the host's own sampler)
    void setStats(const LightingStats& stats, int64_t nowMs);

    void reset();

private:
    int64_t intervalMs_;
    int64_t lastEvalMs_ = -1;
    LightingStats stats_;
};

} // namespace core
