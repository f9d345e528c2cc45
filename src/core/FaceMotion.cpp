#include "core/FaceMotion.hpp"

#include <algorithm>
#include <cmath>

namespace core {

std::optional<FaceMotion> computeFaceMotion(const std::vector<Landmark>& landmarks) {
    if (landmarks.size() < FaceMotion::MIN_LANDMARKS) {
        return std::nullopt;
    }

    using LI = FaceMotion::LandmarkIndices;
    const auto& leftEye = landmarks[LI::LEFT_EYE];
    const auto& rightEye = landmarks[LI::RIGHT_EYE];
    const auto& nose = landmarks[LI::NOSE];
    const auto& mouthUpper = landmarks[LI::MOUTH_UPPER];
    const auto& mouthLower = landmarks[LI::MOUTH_LOWER];

    const float eyeCenterX = (leftEye.x + rightEye.x) / 2.0f;
    const float eyeCenterY = (leftEye.y + rightEye.y) / 2.0f;
    const float mouthY = (mouthUpper.y + mouthLower.y) / 2.0f;
    // Floor keeps yaw/pitch bounded for profile views
    const float eyeDist = std::max(0.06f, std::fabs(rightEye.x - leftEye.x));

    FaceMotion motion;
    motion.yaw = std::clamp((eyeCenterX - nose.x) / eyeDist, -1.0f, 1.0f);
    motion.pitch = std::clamp((((mouthY - eyeCenterY) / eyeDist) - 0.35f) * 1.2f, -1.0f, 1.0f);
    motion.anchor.x = std::clamp(1.0f - (mouthUpper.x + mouthLower.x) / 2.0f, 0.04f, 0.96f);
    motion.anchor.y = std::clamp(mouthY, 0.1f, 0.9f);
    return motion;
}

} // namespace core
