#pragma once

#include "core/Types.hpp"
#include <deque>
#include <string>

namespace core {

using VoteWindow = std::deque<VoteEntry>;

struct VoteParams {
    int windowSize = VOTE_WINDOW_SIZE;
    int64_t ttlMs = VOTE_TTL_MS;
    int requiredHits = 2;
    float minConfidence = GAME_MIN_CONFIDENCE;
};

struct VoteResult {
    VoteWindow nextWindow;
    std::string label = IDLE_LABEL;
    float confidence = 0.0f;
    int hits = 0;
};

/**
 * Time-windowed majority vote over raw per-frame predictions.
 *
 * 1. Expire entries with nowMs - t > ttlMs
 * 2. Insert {label, confidence, nowMs} unless !allowed, idle, or below minConfidence
 * 3. Keep only the newest windowSize entries
 * 4. Majority label with hits >= requiredHits is stable; its confidence is the
 *    AVERAGE confidence of the matching entries. Otherwise idle / 0.
 *
 * Deterministic and side-effect free.
 * @throws std::invalid_argument if windowSize < 1 or requiredHits < 1
 */
[[nodiscard]] VoteResult applyTemporalVote(const VoteWindow& window,
                                           const std::string& rawLabel,
                                           float rawConfidence,
                                           int64_t nowMs,
                                           bool allowed,
                                           const VoteParams& params);

/**
 * Session owner of one vote window.
 *
 * Adds an occlusion grace period on top of applyTemporalVote: when a frame is
 * rejected (not allowed / idle) and nothing is stable, the last stable label
 * is re-reported for up to graceMs with decaying confidence and hits = 0.
 */
class TemporalVoteEngine {
public:
    struct Config {
        VoteParams params;
        int64_t graceMs = OCCLUSION_GRACE_MS;              // 0 disables the hold-over
        float graceDecay = OCCLUSION_CONFIDENCE_DECAY;     // Per 1/30 s, clamped [0.5, 0.99]
    };

    TemporalVoteEngine();
    explicit TemporalVoteEngine(const Config& config);

    VoteResult vote(const std::string& rawLabel, float rawConfidence, int64_t nowMs, bool allowed);

    // Thresholds may change between sessions (new calibration profile)
    void setParams(const VoteParams& params);

    [[nodiscard]] const VoteWindow& window() const { return window_; }
    [[nodiscard]] const Config& config() const { return config_; }

    // Drop pending votes but keep the stable hold-over
    void clearWindow() { window_.clear(); }

    void reset();

private:
    struct StableState {
        std::string label = IDLE_LABEL;
        float confidence = 0.0f;
        int64_t timestampMs = -1;
    };

    Config config_;
    VoteWindow window_;
    StableState lastStable_;
};

} // namespace core
