#pragma once

#include "core/Types.hpp"
#include <deque>
#include <string>
#include <vector>

namespace core {

/**
 * Derives a CalibrationProfile from a burst of lighting/confidence samples.
 *
 * Statistics (all over the captured samples):
 *   bMed   = upper median brightness        (0 -> 100)
 *   cMed   = upper median contrast          (0 -> 30)
 *   conf30 = 30th percentile of confidences > 0 (none -> default 0.45)
 *
 *   lightingMin         = clamp(bMed * 0.55, 25, 120)
 *   lightingMax         = clamp(bMed * 1.45, 120, 245)
 *   lightingMinContrast = clamp(cMed * 0.65, 10, 80)
 *   voteMinConfidence   = clamp(conf30 * 0.9, 0.2, 0.9)
 *   voteRequiredHits    = clamp(2, 2, voteWindowSize)
 */
class CalibrationEngine {
public:
    struct Range {
        float min;
        float max;
    };

    static constexpr Range LIGHTING_MIN_RANGE{25.0f, 120.0f};
    static constexpr Range LIGHTING_MAX_RANGE{120.0f, 245.0f};
    static constexpr Range MIN_CONTRAST_RANGE{10.0f, 80.0f};
    static constexpr Range VOTE_CONFIDENCE_RANGE{0.2f, 0.9f};
    static constexpr int MIN_REQUIRED_HITS = 2;

    static constexpr float LIGHTING_MIN_FACTOR = 0.55f;
    static constexpr float LIGHTING_MAX_FACTOR = 1.45f;
    static constexpr float CONTRAST_FACTOR = 0.65f;
    static constexpr float CONFIDENCE_FACTOR = 0.9f;
    static constexpr float CONFIDENCE_PERCENTILE = 30.0f;

    /**
     * Build a profile. Zero samples -> defaults stamped with `updatedAt`.
     * @throws std::invalid_argument if voteWindowSize < 2
     */
    [[nodiscard]] static CalibrationProfile finalize(const std::vector<CalibrationSample>& samples,
                                                     int voteWindowSize,
                                                     const std::string& updatedAt);

    // Same, stamped with the current UTC time
    [[nodiscard]] static CalibrationProfile finalize(const std::vector<CalibrationSample>& samples,
                                                     int voteWindowSize);

    /**
     * Clamp every field into its valid range (used when loading stored profiles).
     */
    [[nodiscard]] static CalibrationProfile sanitize(const CalibrationProfile& profile, int voteWindowSize);

    /**
     * Reject out-of-range fields instead of clamping.
     * @throws std::invalid_argument naming the first offending field
     */
    static void validate(const CalibrationProfile& profile, int voteWindowSize);

    [[nodiscard]] static std::string nowIso8601();
};

/**
 * One timed calibration capture.
 *
 * Buffers up to maxSamples (oldest dropped), finishes once duration has
 * elapsed with at least minSamples, or unconditionally after
 * duration * timeoutFactor.
 */
class CalibrationSession {
public:
    struct Config {
        float durationS = CALIBRATION_DURATION_S;
        float timeoutFactor = CALIBRATION_TIMEOUT_FACTOR;
        size_t minSamples = CALIBRATION_MIN_SAMPLES;
        size_t maxSamples = CALIBRATION_MAX_SAMPLES;
        int voteWindowSize = VOTE_WINDOW_SIZE;
    };

    CalibrationSession();
    explicit CalibrationSession(const Config& config);

    void start(int64_t nowMs);

    /**
     * Record one tick. Confidence is kept only for a non-idle raw label with
     * confidence > 0.
     */
    void addSample(const LightingStats& lighting, const std::string& rawLabel, float rawConfidence);

    [[nodiscard]] bool isRunning() const { return startMs_ >= 0 && !finished_; }
    [[nodiscard]] bool isComplete(int64_t nowMs) const;
    [[nodiscard]] float secondsLeft(int64_t nowMs) const;
    [[nodiscard]] size_t sampleCount() const { return samples_.size(); }

    /**
     * Finish the session and derive the profile. The session stops accepting samples.
     */
    CalibrationProfile finalize();

    void reset();

private:
    Config config_;
    std::deque<CalibrationSample> samples_;
    int64_t startMs_ = -1;
    bool finished_ = false;

    [[nodiscard]] float elapsedSeconds(int64_t nowMs) const;
};

} // namespace core
