#include "core/CalibrationEngine.hpp"
#include "core/Logger.hpp"
#include "core/SignLabels.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace core {

namespace {

float clampRange(float value, const CalibrationEngine::Range& range) {
    if (!std::isfinite(value)) return range.min;
    return std::clamp(value, range.min, range.max);
}

// Upper median of a sorted list; 0 for an empty list
float upperMedian(const std::vector<float>& sorted) {
    return sorted.empty() ? 0.0f : sorted[sorted.size() / 2];
}

float percentile(const std::vector<float>& sorted, float pct) {
    if (sorted.empty()) return 0.0f;
    const auto last = static_cast<long>(sorted.size()) - 1;
    long idx = static_cast<long>(std::floor((pct / 100.0f) * static_cast<float>(last)));
    idx = std::clamp(idx, 0L, last);
    return sorted[static_cast<size_t>(idx)];
}

void checkRange(const char* field, float value, const CalibrationEngine::Range& range) {
    if (!std::isfinite(value) || value < range.min || value > range.max) {
        std::ostringstream ss;
        ss << "CalibrationProfile: " << field << "=" << value
           << " outside [" << range.min << ", " << range.max << "]";
        throw std::invalid_argument(ss.str());
    }
}

} // namespace

std::string CalibrationEngine::nowIso8601() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

CalibrationProfile CalibrationEngine::finalize(const std::vector<CalibrationSample>& samples,
                                               int voteWindowSize) {
    return finalize(samples, voteWindowSize, nowIso8601());
}

CalibrationProfile CalibrationEngine::finalize(const std::vector<CalibrationSample>& samples,
                                               int voteWindowSize,
                                               const std::string& updatedAt) {
    if (voteWindowSize < MIN_REQUIRED_HITS) {
        throw std::invalid_argument("CalibrationEngine: voteWindowSize must be >= 2");
    }

    CalibrationProfile profile;
    profile.updatedAt = updatedAt;
    if (samples.empty()) {
        Logger::warn("CalibrationEngine: no samples captured, using default thresholds");
        return profile;
    }

    std::vector<float> brightness;
    std::vector<float> contrast;
    std::vector<float> confidence;
    brightness.reserve(samples.size());
    contrast.reserve(samples.size());
    for (const auto& s : samples) {
        brightness.push_back(s.brightness);
        contrast.push_back(s.contrast);
        if (s.confidence && *s.confidence > 0.0f) {
            confidence.push_back(*s.confidence);
        }
    }
    std::sort(brightness.begin(), brightness.end());
    std::sort(contrast.begin(), contrast.end());
    std::sort(confidence.begin(), confidence.end());

    float bMed = upperMedian(brightness);
    float cMed = upperMedian(contrast);
    float conf30 = percentile(confidence, CONFIDENCE_PERCENTILE);
    if (bMed <= 0.0f) bMed = 100.0f;
    if (cMed <= 0.0f) cMed = 30.0f;
    if (conf30 <= 0.0f) conf30 = CalibrationProfile{}.voteMinConfidence;

    profile.samples = static_cast<int>(samples.size());
    profile.lightingMin = clampRange(bMed * LIGHTING_MIN_FACTOR, LIGHTING_MIN_RANGE);
    profile.lightingMax = clampRange(bMed * LIGHTING_MAX_FACTOR, LIGHTING_MAX_RANGE);
    profile.lightingMinContrast = clampRange(cMed * CONTRAST_FACTOR, MIN_CONTRAST_RANGE);
    profile.voteMinConfidence = clampRange(conf30 * CONFIDENCE_FACTOR, VOTE_CONFIDENCE_RANGE);
    profile.voteRequiredHits = std::clamp(CalibrationProfile{}.voteRequiredHits, MIN_REQUIRED_HITS, voteWindowSize);

    Logger::info("CalibrationEngine: ", profile.samples, " samples (", confidence.size(),
                 " with detections) → light [", profile.lightingMin, ", ", profile.lightingMax,
                 "] contrast>=", profile.lightingMinContrast,
                 " vote conf>=", profile.voteMinConfidence, " hits>=", profile.voteRequiredHits);
    return profile;
}

CalibrationProfile CalibrationEngine::sanitize(const CalibrationProfile& profile, int voteWindowSize) {
    CalibrationProfile out = profile;
    out.version = std::max(1, profile.version);
    out.samples = std::max(0, profile.samples);
    out.lightingMin = clampRange(profile.lightingMin, LIGHTING_MIN_RANGE);
    out.lightingMax = clampRange(profile.lightingMax, LIGHTING_MAX_RANGE);
    out.lightingMinContrast = clampRange(profile.lightingMinContrast, MIN_CONTRAST_RANGE);
    out.voteMinConfidence = clampRange(profile.voteMinConfidence, VOTE_CONFIDENCE_RANGE);
    out.voteRequiredHits = std::clamp(profile.voteRequiredHits, MIN_REQUIRED_HITS,
                                      std::max(MIN_REQUIRED_HITS, voteWindowSize));
    return out;
}

void CalibrationEngine::validate(const CalibrationProfile& profile, int voteWindowSize) {
    if (profile.version < 1) {
        throw std::invalid_argument("CalibrationProfile: version must be >= 1");
    }
    if (profile.samples < 0) {
        throw std::invalid_argument("CalibrationProfile: samples must be >= 0");
    }
    checkRange("lightingMin", profile.lightingMin, LIGHTING_MIN_RANGE);
    checkRange("lightingMax", profile.lightingMax, LIGHTING_MAX_RANGE);
    checkRange("lightingMinContrast", profile.lightingMinContrast, MIN_CONTRAST_RANGE);
    checkRange("voteMinConfidence", profile.voteMinConfidence, VOTE_CONFIDENCE_RANGE);
    if (profile.voteRequiredHits < MIN_REQUIRED_HITS || profile.voteRequiredHits > voteWindowSize) {
        throw std::invalid_argument("CalibrationProfile: voteRequiredHits=" +
                                    std::to_string(profile.voteRequiredHits) + " outside [2, " +
                                    std::to_string(voteWindowSize) + "]");
    }
}

// ============================================================
// CalibrationSession
// ============================================================

CalibrationSession::CalibrationSession()
    : CalibrationSession(Config{}) {
}

CalibrationSession::CalibrationSession(const Config& config)
    : config_(config) {
    config_.maxSamples = std::max<size_t>(1, config_.maxSamples);
}

void CalibrationSession::start(int64_t nowMs) {
    samples_.clear();
    startMs_ = nowMs;
    finished_ = false;
    Logger::info("CalibrationSession: started (", config_.durationS, "s, min ",
                 config_.minSamples, " samples)");
}

void CalibrationSession::addSample(const LightingStats& lighting, const std::string& rawLabel,
                                   float rawConfidence) {
    if (!isRunning()) return;

    CalibrationSample sample;
    sample.brightness = lighting.mean;
    sample.contrast = lighting.contrast;
    if (!isIdleLabel(rawLabel) && rawConfidence > 0.0f) {
        sample.confidence = rawConfidence;
    }

    samples_.push_back(sample);
    while (samples_.size() > config_.maxSamples) {
        samples_.pop_front();
    }
}

float CalibrationSession::elapsedSeconds(int64_t nowMs) const {
    if (startMs_ < 0) return 0.0f;
    return std::max(0.0f, static_cast<float>(nowMs - startMs_) / 1000.0f);
}

bool CalibrationSession::isComplete(int64_t nowMs) const {
    if (startMs_ < 0) return false;
    const float elapsed = elapsedSeconds(nowMs);
    const bool enoughTime = elapsed >= config_.durationS;
    const bool enoughSamples = samples_.size() >= config_.minSamples;
    const bool timedOut = elapsed >= config_.durationS * config_.timeoutFactor;
    return (enoughTime && enoughSamples) || timedOut;
}

float CalibrationSession::secondsLeft(int64_t nowMs) const {
    return std::max(0.0f, config_.durationS - elapsedSeconds(nowMs));
}

CalibrationProfile CalibrationSession::finalize() {
    finished_ = true;
    if (samples_.size() < config_.minSamples) {
        Logger::warn("CalibrationSession: only ", samples_.size(), " of ", config_.minSamples,
                     " samples captured before timeout");
    }
    std::vector<CalibrationSample> samples(samples_.begin(), samples_.end());
    return CalibrationEngine::finalize(samples, config_.voteWindowSize);
}

void CalibrationSession::reset() {
    samples_.clear();
    startMs_ = -1;
    finished_ = false;
}

} // namespace core
