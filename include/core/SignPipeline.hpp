#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "core/Types.hpp"
#include "core/CalibrationEngine.hpp"
#include "core/FaceMotion.hpp"
#include "core/LightingEvaluator.hpp"
#include "core/SequenceMatcher.hpp"
#include "core/TemporalVote.hpp"
#include "inference/KnnClassifier.hpp"

namespace core {

/**
 * Per-tick sign recognition pipeline.
 *
 * landmarks → normalize → classify (one-hand assist when needed)
 *           → temporal vote (lighting/hand-count gated) → sequence matcher
 *
 * Single-threaded: the host calls tick() once per detection period
 * (~70 ms) and updateLighting() whenever it has a camera frame. All mutable
 * session state (vote window, calibration buffer, sequence progress) lives
 * here and is reset by startRun()/startCalibration()/restart().
 */
class SignPipeline {
public:
    enum class Mode {
        Play = 0,
        Calibration = 1
    };

    enum class TickEvent {
        None = 0,
        StepAccepted = 1,
        SequenceCompleted = 2,
        CalibrationCompleted = 3
    };

    struct Config {
        inference::KnnClassifier::Config knn;
        TemporalVoteEngine::Config vote;               // requiredHits/minConfidence come from the profile
        int64_t cooldownMs = SIGN_ACCEPT_COOLDOWN_MS;
        int64_t lightingIntervalMs = LIGHTING_INTERVAL_MS;
        bool assistEnabled = true;                     // Allow one-hand assist after a confirmed one-hand match
        bool requireGoodLighting = true;               // Gate votes on LightingStatus::Good
        std::optional<float> voteMinConfidence;        // Overrides profile.voteMinConfidence when set
        CalibrationSession::Config calibration;
    };

    struct TickResult {
        int64_t timestampMs = 0;
        int handCount = 0;

        std::string rawLabel = IDLE_LABEL;
        float rawConfidence = 0.0f;
        float rawDistance = 0.0f;

        std::string stableLabel = IDLE_LABEL;
        float stableConfidence = 0.0f;
        int hits = 0;

        LightingStats lighting;
        bool lightingEvaluated = false;   // False until a frame or external stats were seen
        bool needsBothHands = false;   // One hand visible while two are required
        bool classifierReady = false;

        size_t step = 0;
        size_t sequenceLength = 0;
        int landed = 0;
        SequenceMatcher::Phase phase = SequenceMatcher::Phase::Idle;
        TickEvent event = TickEvent::None;

        std::optional<FaceMotion> face;
    };

    SignPipeline(const Config& config, const CalibrationProfile& profile);
    ~SignPipeline();

    SignPipeline(const SignPipeline&) = delete;
    SignPipeline& operator=(const SignPipeline&) = delete;

    /**
     * Rebuild the classifier. Returns false (and keeps no classifier) if the
     * set is rejected; ready() additionally requires every label of the
     * active sequence.
     */
    bool setReferenceSet(const ReferenceSet& references);

    /**
     * Swap thresholds (profile is sanitized against the vote window size).
     */
    void setProfile(const CalibrationProfile& profile);

    void startRun(const std::vector<std::string>& sequence);
    void startCalibration(int64_t nowMs);
    void restart(int64_t nowMs);

    /**
     * Throttled lighting evaluation on a BGR camera frame.
     */
    void updateLighting(const cv::Mat& bgrFrame, int64_t nowMs);
    void setLighting(const LightingStats& stats, int64_t nowMs);

    /**
     * Process one detection tick. Never throws; missing classifier or hands
     * degrade to idle.
     */
    TickResult tick(const HandFrame& frame);

    [[nodiscard]] bool ready() const;
    [[nodiscard]] std::vector<std::string> missingLabels() const;

    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] const CalibrationProfile& profile() const { return profile_; }
    [[nodiscard]] const SequenceMatcher& matcher() const { return matcher_; }
    [[nodiscard]] const TemporalVoteEngine& voteEngine() const { return voteEngine_; }

    // Finalized profile of the last completed calibration session
    [[nodiscard]] const std::optional<CalibrationProfile>& calibrationResult() const { return calibrationResult_; }

    [[nodiscard]] static const char* getEventName(TickEvent event);

private:
    Config config_;
    CalibrationProfile profile_;
    Mode mode_ = Mode::Play;

    std::unique_ptr<inference::KnnClassifier> classifier_;
    std::vector<std::string> classifierLabels_;
    TemporalVoteEngine voteEngine_;
    LightingEvaluator lighting_;
    SequenceMatcher matcher_;
    CalibrationSession calibration_;
    std::optional<CalibrationProfile> calibrationResult_;

    uint64_t tickCount_ = 0;

    [[nodiscard]] float effectiveMinConfidence() const;
    [[nodiscard]] VoteParams voteParams() const;
    [[nodiscard]] bool lightingPass() const;
    void fillProgress(TickResult& result) const;
    void finishCalibration(TickResult& result);
};

} // namespace core
