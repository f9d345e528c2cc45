#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace core {

// ============================================================
// Sign Pipeline Constants
// ============================================================

// Landmark layout (MediaPipe Hand Landmark model)
constexpr size_t HAND_LANDMARK_COUNT = 21;
constexpr size_t HAND_FEATURE_LENGTH = HAND_LANDMARK_COUNT * 3;   // 63
constexpr size_t QUERY_FEATURE_LENGTH = HAND_FEATURE_LENGTH * 2;  // 126 (slot 1 + slot 2)

// Detection loop
constexpr int64_t DETECTION_INTERVAL_MS = 70;   // Host polling period, slower than render refresh

// Temporal vote
constexpr int VOTE_WINDOW_SIZE = 2;
constexpr int64_t VOTE_TTL_MS = 700;
constexpr int64_t OCCLUSION_GRACE_MS = 240;     // Hold last stable label through brief dropouts
constexpr float OCCLUSION_CONFIDENCE_DECAY = 0.90f; // Per 30 fps frame

// Sequence matching
constexpr int64_t SIGN_ACCEPT_COOLDOWN_MS = 500;
constexpr float GAME_MIN_CONFIDENCE = 0.2f;
constexpr float RAW_MATCH_CONFIDENCE_FLOOR = 0.30f;
constexpr float RAW_MATCH_CONFIDENCE_MARGIN = 0.10f;

// Lighting
constexpr int64_t LIGHTING_INTERVAL_MS = 240;
constexpr int LIGHTING_SAMPLE_WIDTH = 96;
constexpr int LIGHTING_SAMPLE_HEIGHT = 72;

// Classifier
constexpr int KNN_DEFAULT_K = 3;
constexpr float KNN_DEFAULT_THRESHOLD = 1.8f;   // Idle distance and confidence decay

// Calibration
constexpr float CALIBRATION_DURATION_S = 12.0f;
constexpr float CALIBRATION_TIMEOUT_FACTOR = 1.7f;
constexpr size_t CALIBRATION_MIN_SAMPLES = 100;
constexpr size_t CALIBRATION_MAX_SAMPLES = 1200;
constexpr int CALIBRATION_PROFILE_VERSION = 1;

// Reserved label for "no meaningful sign"
inline const std::string IDLE_LABEL = "idle";

// ============================================================
// Data Structures
// ============================================================

struct Landmark {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

enum class Handedness {
    Unknown = 0,
    Left = 1,
    Right = 2
};

/**
 * One detected hand: 21 landmarks in normalized frame space.
 * Produced by the external tracker, consumed within a single tick.
 */
struct HandLandmarkSet {
    std::vector<Landmark> landmarks;
    Handedness handedness = Handedness::Unknown;

    [[nodiscard]] bool isComplete() const { return landmarks.size() >= HAND_LANDMARK_COUNT; }
};

// 63 floats for one hand, 126 for the two-slot query
using FeatureVector = std::vector<float>;

struct ReferenceSample {
    std::string label;
    FeatureVector features;
};

// label -> samples, immutable for the lifetime of a classifier
using ReferenceSet = std::map<std::string, std::vector<ReferenceSample>>;

struct Prediction {
    std::string label = IDLE_LABEL;
    float confidence = 0.0f;
    float distance = std::numeric_limits<float>::infinity();

    [[nodiscard]] bool isIdle() const { return label == IDLE_LABEL; }
};

struct VoteEntry {
    std::string label;
    float confidence = 0.0f;
    int64_t timestampMs = 0;
};

enum class LightingStatus {
    Good = 0,
    LowLight = 1,
    Overexposed = 2,
    LowContrast = 3
};

struct LightingStats {
    float mean = 0.0f;
    float contrast = 0.0f;
    LightingStatus status = LightingStatus::LowLight;
};

struct CalibrationSample {
    float brightness = 0.0f;
    float contrast = 0.0f;
    std::optional<float> confidence;
};

/**
 * Persisted lighting and vote thresholds for one user/environment.
 * Field ranges are enforced by CalibrationEngine::sanitize/validate.
 */
struct CalibrationProfile {
    int version = CALIBRATION_PROFILE_VERSION;
    int samples = 0;
    std::string updatedAt;

    float lightingMin = 45.0f;          // [25, 120]
    float lightingMax = 210.0f;         // [120, 245]
    float lightingMinContrast = 22.0f;  // [10, 80]

    float voteMinConfidence = 0.45f;    // [0.2, 0.9]
    int voteRequiredHits = 2;           // [2, voteWindowSize]
};

// Per-tick input from the hand/face tracker
struct HandFrame {
    std::vector<HandLandmarkSet> hands;
    std::vector<Landmark> face;         // Empty when no face tracker is attached
    int64_t timestampMs = 0;
};

[[nodiscard]] inline const char* lightingStatusName(LightingStatus status) {
    switch (status) {
        case LightingStatus::Good:        return "good";
        case LightingStatus::LowLight:    return "low_light";
        case LightingStatus::Overexposed: return "overexposed";
        case LightingStatus::LowContrast: return "low_contrast";
        default: return "low_light";
    }
}

} // namespace core
