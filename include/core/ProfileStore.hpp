#pragma once

#include "core/Types.hpp"
#include <string>

namespace core {

/**
 * YAML persistence for CalibrationProfile.
 *
 * Layout:
 *   version: 1
 *   samples: 240
 *   updated_at: "2026-10-19T09:12:44.120Z"
 *   lighting: { min: 45, max: 210, min_contrast: 22 }
 *   vote: { min_confidence: 0.45, required_hits: 2 }
 *
 * Loading always sanitizes into valid ranges. Missing keys keep defaults;
 * a newer version is accepted with a warning (unknown keys are ignored).
 */
class ProfileStore {
public:
    /**
     * @return stored profile, or defaults if the file does not exist or cannot be parsed
     */
    [[nodiscard]] static CalibrationProfile load(const std::string& path, int voteWindowSize);

    /**
     * Parse from a YAML string.
     * @throws std::runtime_error on malformed YAML
     */
    [[nodiscard]] static CalibrationProfile fromYaml(const std::string& yaml, int voteWindowSize);

    [[nodiscard]] static std::string toYaml(const CalibrationProfile& profile);

    /**
     * @return false (and logs) if the file cannot be written
     */
    static bool save(const std::string& path, const CalibrationProfile& profile);
};

} // namespace core
