#pragma once

#include "core/Types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace core {

/**
 * Progress state machine over an ordered sign sequence.
 *
 * Phases: Idle (pre-run) → Active → Completed
 *
 * A step is accepted when:
 * - the stable label (or the raw label at a relaxed confidence floor)
 *   matches the expected sign after label normalization
 * - the accept cooldown has elapsed since the previous step
 * - the run is Active and the step is in bounds
 *
 * Completed runs ignore further input until start()/restart().
 */
class SequenceMatcher {
public:
    enum class Phase {
        Idle = 0,
        Active = 1,
        Completed = 2
    };

    enum class MatchEvent {
        None = 0,
        StepAccepted = 1,
        SequenceCompleted = 2
    };

    struct State {
        std::vector<std::string> sequence;   // Normalized labels
        size_t step = 0;
        int landed = 0;
        int64_t lastAcceptedMs = -1;         // -1: nothing accepted yet this run
        int assistUnlockedStep = -1;         // One-hand assist unlock for this step index
        Phase phase = Phase::Idle;
    };

    using TransitionCallback = std::function<void(Phase from, Phase to)>;
    using StepCallback = std::function<void(size_t step, const std::string& sign)>;

    explicit SequenceMatcher(int64_t cooldownMs = SIGN_ACCEPT_COOLDOWN_MS);

    /**
     * Load a sequence and enter Active. An empty sequence completes immediately.
     */
    void start(const std::vector<std::string>& sequence);

    /**
     * Reset step/landed/assist state and re-enter Active with the same sequence.
     */
    void restart();

    /**
     * Back to Idle; the sequence is kept.
     */
    void stop();

    /**
     * Feed one tick of classifier output.
     */
    MatchEvent consume(const std::string& stableLabel,
                       float stableConfidence,
                       const std::string& rawLabel,
                       float rawConfidence,
                       int64_t nowMs,
                       float voteMinConfidence);

    /**
     * One-hand path: a raw match for the current step unlocks assist mode
     * for that step. @return true if this call unlocked it
     */
    bool noteOneHandMatch(const std::string& rawLabel, float rawConfidence, float voteMinConfidence);

    [[nodiscard]] bool assistUnlocked() const;

    /**
     * stable == target, or raw == target with rawConfidence >= max(0.30, voteMinConfidence - 0.10).
     * An idle/empty target never matches.
     */
    [[nodiscard]] static bool signsMatch(const std::string& stableLabel,
                                         const std::string& targetLabel,
                                         const std::string& rawLabel,
                                         float rawConfidence,
                                         float voteMinConfidence);

    [[nodiscard]] const State& state() const { return state_; }
    [[nodiscard]] Phase phase() const { return state_.phase; }
    [[nodiscard]] size_t currentStep() const { return state_.step; }
    [[nodiscard]] int landed() const { return state_.landed; }
    [[nodiscard]] size_t length() const { return state_.sequence.size(); }

    // Expected sign for the current step, or "" when out of range
    [[nodiscard]] std::string expectedSign() const;

    [[nodiscard]] static const char* getPhaseName(Phase phase);

    void setTransitionCallback(TransitionCallback callback) { transitionCallback_ = std::move(callback); }
    void setStepCallback(StepCallback callback) { stepCallback_ = std::move(callback); }

private:
    int64_t cooldownMs_;
    State state_;

    TransitionCallback transitionCallback_;
    StepCallback stepCallback_;

    void transitionTo(Phase newPhase);
};

} // namespace core
