#include "core/SignPipeline.hpp"
#include "core/Logger.hpp"
#include "core/SignLabels.hpp"
#include "inference/OneHandAssist.hpp"
#include "math/LandmarkNormalizer.hpp"

#include <algorithm>
#include <stdexcept>

namespace core {

namespace {
constexpr uint64_t DEBUG_LOG_EVERY = 60;   // ~4 s at 70 ms ticks
}

SignPipeline::SignPipeline(const Config& config, const CalibrationProfile& profile)
    : config_(config),
      voteEngine_(config.vote),
      lighting_(config.lightingIntervalMs),
      matcher_(config.cooldownMs),
      calibration_(config.calibration) {
    setProfile(profile);
}

SignPipeline::~SignPipeline() = default;

const char* SignPipeline::getEventName(TickEvent event) {
    switch (event) {
        case TickEvent::None:                 return "none";
        case TickEvent::StepAccepted:         return "step";
        case TickEvent::SequenceCompleted:    return "sequence_complete";
        case TickEvent::CalibrationCompleted: return "calibration_complete";
        default: return "none";
    }
}

bool SignPipeline::setReferenceSet(const ReferenceSet& references) {
    try {
        auto classifier = std::make_unique<inference::KnnClassifier>(references, config_.knn);
        classifierLabels_ = classifier->labels();
        classifier_ = std::move(classifier);
    } catch (const std::invalid_argument& e) {
        Logger::error("SignPipeline: classifier rejected reference set: ", e.what());
        classifier_.reset();
        classifierLabels_.clear();
        return false;
    }

    auto missing = missingLabels();
    if (!missing.empty()) {
        std::string list;
        for (const auto& label : missing) list += (list.empty() ? "" : ", ") + label;
        Logger::warn("SignPipeline: classifier missing labels for active sequence: ", list);
    }
    return true;
}

void SignPipeline::setProfile(const CalibrationProfile& profile) {
    profile_ = CalibrationEngine::sanitize(profile, config_.vote.params.windowSize);
    voteEngine_.setParams(voteParams());
    voteEngine_.clearWindow();
}

float SignPipeline::effectiveMinConfidence() const {
    return config_.voteMinConfidence.value_or(profile_.voteMinConfidence);
}

VoteParams SignPipeline::voteParams() const {
    VoteParams params = config_.vote.params;
    params.requiredHits = std::clamp(profile_.voteRequiredHits, 1, params.windowSize);
    params.minConfidence = effectiveMinConfidence();
    return params;
}

std::vector<std::string> SignPipeline::missingLabels() const {
    std::vector<std::string> missing;
    for (const auto& label : requiredLabels(matcher_.state().sequence)) {
        if (std::find(classifierLabels_.begin(), classifierLabels_.end(), label) == classifierLabels_.end()) {
            missing.push_back(label);
        }
    }
    return missing;
}

bool SignPipeline::ready() const {
    return classifier_ != nullptr && missingLabels().empty();
}

void SignPipeline::startRun(const std::vector<std::string>& sequence) {
    mode_ = Mode::Play;
    voteEngine_.reset();
    calibration_.reset();
    matcher_.start(sequence);
    Logger::info("SignPipeline: run started (", sequence.size(), " signs)");
}

void SignPipeline::startCalibration(int64_t nowMs) {
    mode_ = Mode::Calibration;
    voteEngine_.reset();
    matcher_.stop();
    calibrationResult_.reset();
    calibration_.start(nowMs);
}

void SignPipeline::restart(int64_t nowMs) {
    voteEngine_.reset();
    if (mode_ == Mode::Calibration) {
        startCalibration(nowMs);
    } else {
        matcher_.restart();
    }
}

void SignPipeline::updateLighting(const cv::Mat& bgrFrame, int64_t nowMs) {
    lighting_.update(bgrFrame, profile_, nowMs);
}

void SignPipeline::setLighting(const LightingStats& stats, int64_t nowMs) {
    LightingStats classified = stats;
    classified.status = LightingEvaluator::classify(stats.mean, stats.contrast, profile_);
    lighting_.setStats(classified, nowMs);
}

bool SignPipeline::lightingPass() const {
    if (!config_.requireGoodLighting || !lighting_.hasStats()) return true;
    return lighting_.stats().status == LightingStatus::Good;
}

void SignPipeline::fillProgress(TickResult& result) const {
    result.step = matcher_.currentStep();
    result.sequenceLength = matcher_.length();
    result.landed = matcher_.landed();
    result.phase = matcher_.phase();
}

void SignPipeline::finishCalibration(TickResult& result) {
    calibrationResult_ = calibration_.finalize();
    mode_ = Mode::Play;
    result.event = TickEvent::CalibrationCompleted;
    Logger::info("SignPipeline: calibration complete");
}

SignPipeline::TickResult SignPipeline::tick(const HandFrame& frame) {
    TickResult result;
    result.timestampMs = frame.timestampMs;
    result.lighting = lighting_.stats();
    result.lightingEvaluated = lighting_.hasStats();
    result.classifierReady = ready();
    result.face = computeFaceMotion(frame.face);

    const bool calibrating = mode_ == Mode::Calibration && calibration_.isRunning();
    if (!calibrating && matcher_.phase() != SequenceMatcher::Phase::Active) {
        fillProgress(result);
        return result;
    }

    const auto query = math::LandmarkNormalizer::buildFeatures(frame.hands);
    result.handCount = query.numHands;

    const bool assistUnlocked = config_.assistEnabled && matcher_.assistUnlocked();
    const bool requiresTwoHands = !config_.assistEnabled || !assistUnlocked;
    const float minConfidence = effectiveMinConfidence();

    if (query.features.empty() || !classifier_) {
        voteEngine_.clearWindow();
    } else {
        core::Prediction prediction;
        if (config_.assistEnabled && query.numHands < 2) {
            prediction = inference::OneHandAssist::predict(*classifier_, query.features, query.primary);
        } else {
            prediction = classifier_->predict(query.features);
        }
        result.rawLabel = normalizeLabel(prediction.label);
        if (result.rawLabel.empty()) result.rawLabel = IDLE_LABEL;
        result.rawConfidence = std::max(0.0f, prediction.confidence);
        result.rawDistance = prediction.distance;

        if (!calibrating && requiresTwoHands && query.numHands < 2) {
            if (config_.assistEnabled) {
                matcher_.noteOneHandMatch(result.rawLabel, result.rawConfidence, minConfidence);
            }
            voteEngine_.clearWindow();
            result.needsBothHands = true;
            fillProgress(result);
            return result;
        }

        const bool allowed = lightingPass() && (!requiresTwoHands || query.numHands >= 2);
        VoteResult vote = voteEngine_.vote(result.rawLabel, result.rawConfidence, frame.timestampMs, allowed);
        result.stableLabel = vote.label;
        result.stableConfidence = vote.confidence;
        result.hits = vote.hits;
    }

    if (++tickCount_ % DEBUG_LOG_EVERY == 1) {
        Logger::debug("SignPipeline: hands=", result.handCount, " raw=", result.rawLabel,
                      " (", result.rawConfidence, ") stable=", result.stableLabel,
                      " hits=", result.hits, " light=", lightingStatusName(result.lighting.status));
    }

    if (calibrating) {
        calibration_.addSample(result.lighting, result.rawLabel, result.rawConfidence);
        if (calibration_.isComplete(frame.timestampMs)) {
            finishCalibration(result);
        }
        fillProgress(result);
        return result;
    }

    auto event = matcher_.consume(result.stableLabel, result.stableConfidence,
                                  result.rawLabel, result.rawConfidence,
                                  frame.timestampMs, minConfidence);
    if (event == SequenceMatcher::MatchEvent::StepAccepted) {
        result.event = TickEvent::StepAccepted;
    } else if (event == SequenceMatcher::MatchEvent::SequenceCompleted) {
        result.event = TickEvent::SequenceCompleted;
    }

    fillProgress(result);
    return result;
}

} // namespace core
