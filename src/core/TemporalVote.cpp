#include "core/TemporalVote.hpp"
#include "core/SignLabels.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace core {

namespace {

constexpr double FRAME_MS_30FPS = 1000.0 / 30.0;

void checkParams(const VoteParams& params) {
    if (params.windowSize < 1) {
        throw std::invalid_argument("TemporalVote: windowSize must be >= 1");
    }
    if (params.requiredHits < 1) {
        throw std::invalid_argument("TemporalVote: requiredHits must be >= 1");
    }
}

} // namespace

VoteResult applyTemporalVote(const VoteWindow& window,
                             const std::string& rawLabel,
                             float rawConfidence,
                             int64_t nowMs,
                             bool allowed,
                             const VoteParams& params) {
    checkParams(params);

    VoteResult result;
    for (const auto& entry : window) {
        if (nowMs - entry.timestampMs <= params.ttlMs) {
            result.nextWindow.push_back(entry);
        }
    }

    const std::string label = normalizeLabel(rawLabel);
    const bool accepted = allowed && !label.empty() && label != IDLE_LABEL &&
                          rawConfidence >= params.minConfidence;
    if (accepted) {
        result.nextWindow.push_back({label, std::max(0.0f, rawConfidence), nowMs});
        while (result.nextWindow.size() > static_cast<size_t>(params.windowSize)) {
            result.nextWindow.pop_front();
        }
    }

    // Tally in first-seen order so ties stay deterministic
    struct Tally {
        std::string label;
        int hits = 0;
        float confSum = 0.0f;
    };
    std::vector<Tally> tallies;
    for (const auto& entry : result.nextWindow) {
        auto it = std::find_if(tallies.begin(), tallies.end(),
                               [&](const Tally& t) { return t.label == entry.label; });
        if (it == tallies.end()) {
            tallies.push_back({entry.label, 1, entry.confidence});
        } else {
            it->hits++;
            it->confSum += entry.confidence;
        }
    }

    const Tally* best = nullptr;
    float bestAvg = 0.0f;
    for (const auto& tally : tallies) {
        float avg = tally.confSum / static_cast<float>(tally.hits);
        if (!best || tally.hits > best->hits || (tally.hits == best->hits && avg > bestAvg)) {
            best = &tally;
            bestAvg = avg;
        }
    }

    if (!best) {
        return result;
    }

    result.hits = best->hits;
    if (best->hits >= params.requiredHits) {
        result.label = best->label;
        result.confidence = bestAvg;
    }
    return result;
}

TemporalVoteEngine::TemporalVoteEngine()
    : TemporalVoteEngine(Config{}) {
}

TemporalVoteEngine::TemporalVoteEngine(const Config& config)
    : config_(config) {
    checkParams(config_.params);
    config_.graceMs = std::max<int64_t>(0, config_.graceMs);
    config_.graceDecay = std::clamp(config_.graceDecay, 0.5f, 0.99f);
}

void TemporalVoteEngine::setParams(const VoteParams& params) {
    checkParams(params);
    config_.params = params;
    while (window_.size() > static_cast<size_t>(params.windowSize)) {
        window_.pop_front();
    }
}

void TemporalVoteEngine::reset() {
    window_.clear();
    lastStable_ = StableState{};
}

VoteResult TemporalVoteEngine::vote(const std::string& rawLabel, float rawConfidence,
                                    int64_t nowMs, bool allowed) {
    VoteResult result = applyTemporalVote(window_, rawLabel, rawConfidence, nowMs, allowed, config_.params);
    window_ = result.nextWindow;

    if (result.label != IDLE_LABEL) {
        lastStable_ = {result.label, result.confidence, nowMs};
        return result;
    }

    const bool invalidFrame = !allowed || isIdleLabel(rawLabel);
    if (!invalidFrame || config_.graceMs == 0 || lastStable_.timestampMs < 0 ||
        lastStable_.label == IDLE_LABEL) {
        return result;
    }

    const int64_t elapsed = std::max<int64_t>(0, nowMs - lastStable_.timestampMs);
    if (elapsed > config_.graceMs) {
        return result;
    }

    const double frames = std::max(1.0, static_cast<double>(elapsed) / FRAME_MS_30FPS);
    result.label = lastStable_.label;
    result.confidence = static_cast<float>(lastStable_.confidence * std::pow(config_.graceDecay, frames));
    result.hits = 0;
    return result;
}

} // namespace core
