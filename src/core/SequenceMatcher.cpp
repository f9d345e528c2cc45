#include "core/SequenceMatcher.hpp"
#include "core/Logger.hpp"
#include "core/SignLabels.hpp"

#include <algorithm>

namespace core {

SequenceMatcher::SequenceMatcher(int64_t cooldownMs)
    : cooldownMs_(std::max<int64_t>(0, cooldownMs)) {
}

const char* SequenceMatcher::getPhaseName(Phase phase) {
    switch (phase) {
        case Phase::Idle:      return "IDLE";
        case Phase::Active:    return "ACTIVE";
        case Phase::Completed: return "COMPLETED";
        default: return "IDLE";
    }
}

void SequenceMatcher::start(const std::vector<std::string>& sequence) {
    state_.sequence.clear();
    for (const auto& sign : sequence) {
        state_.sequence.push_back(normalizeLabel(sign));
    }
    restart();
}

void SequenceMatcher::restart() {
    state_.step = 0;
    state_.landed = 0;
    state_.lastAcceptedMs = -1;
    state_.assistUnlockedStep = -1;

    transitionTo(Phase::Active);
    if (state_.sequence.empty()) {
        transitionTo(Phase::Completed);
    }
}

void SequenceMatcher::stop() {
    transitionTo(Phase::Idle);
}

std::string SequenceMatcher::expectedSign() const {
    return state_.step < state_.sequence.size() ? state_.sequence[state_.step] : std::string();
}

bool SequenceMatcher::signsMatch(const std::string& stableLabel,
                                 const std::string& targetLabel,
                                 const std::string& rawLabel,
                                 float rawConfidence,
                                 float voteMinConfidence) {
    const std::string target = normalizeLabel(targetLabel);
    if (target.empty() || target == IDLE_LABEL) return false;

    if (normalizeLabel(stableLabel) == target) return true;

    if (normalizeLabel(rawLabel) != target) return false;
    const float minConf = std::max(RAW_MATCH_CONFIDENCE_FLOOR, voteMinConfidence - RAW_MATCH_CONFIDENCE_MARGIN);
    return rawConfidence >= minConf;
}

bool SequenceMatcher::assistUnlocked() const {
    return state_.phase == Phase::Active &&
           state_.assistUnlockedStep == static_cast<int>(state_.step);
}

bool SequenceMatcher::noteOneHandMatch(const std::string& rawLabel, float rawConfidence,
                                       float voteMinConfidence) {
    if (state_.phase != Phase::Active || assistUnlocked()) return false;

    const std::string expected = expectedSign();
    if (expected.empty()) return false;
    if (!signsMatch(rawLabel, expected, rawLabel, rawConfidence, voteMinConfidence)) return false;

    state_.assistUnlockedStep = static_cast<int>(state_.step);
    Logger::info("SequenceMatcher: one-hand assist unlocked for step ", state_.step + 1,
                 " (", expected, ")");
    return true;
}

SequenceMatcher::MatchEvent SequenceMatcher::consume(const std::string& stableLabel,
                                                     float stableConfidence,
                                                     const std::string& rawLabel,
                                                     float rawConfidence,
                                                     int64_t nowMs,
                                                     float voteMinConfidence) {
    if (state_.phase != Phase::Active) return MatchEvent::None;
    if (isIdleLabel(stableLabel)) return MatchEvent::None;
    if (state_.lastAcceptedMs >= 0 && nowMs - state_.lastAcceptedMs < cooldownMs_) return MatchEvent::None;
    if (state_.step >= state_.sequence.size()) return MatchEvent::None;

    const std::string expected = state_.sequence[state_.step];
    if (!signsMatch(stableLabel, expected, rawLabel, rawConfidence, voteMinConfidence)) {
        return MatchEvent::None;
    }

    const size_t accepted = state_.step;
    state_.lastAcceptedMs = nowMs;
    state_.step++;
    state_.landed++;
    state_.assistUnlockedStep = -1;

    Logger::info("SequenceMatcher: step ", state_.step, "/", state_.sequence.size(),
                 " ", expected, " (conf=", stableConfidence, ")");

    if (stepCallback_) {
        stepCallback_(accepted, expected);
    }

    if (state_.step >= state_.sequence.size()) {
        transitionTo(Phase::Completed);
        return MatchEvent::SequenceCompleted;
    }
    return MatchEvent::StepAccepted;
}

void SequenceMatcher::transitionTo(Phase newPhase) {
    Phase oldPhase = state_.phase;
    state_.phase = newPhase;
    if (oldPhase == newPhase) return;

    Logger::info("SequenceMatcher: ", getPhaseName(oldPhase), " → ", getPhaseName(newPhase));

    if (transitionCallback_) {
        transitionCallback_(oldPhase, newPhase);
    }
}

} // namespace core
