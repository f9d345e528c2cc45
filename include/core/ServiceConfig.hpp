#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/Types.hpp"
#include "core/SignPipeline.hpp"

namespace core {

/**
 * Runtime settings of handsign_service, loaded from YAML.
 *
 * Every key is optional; absent keys keep the defaults below.
 */
struct ServiceConfig {
    struct Osc {
        std::string host = "127.0.0.1";
        std::string port = "9000";
        bool enabled = true;
    };

    struct Dataset {
        std::string csvPath = "data/signs.csv";
        std::string version;                      // "" resolves to "local"
    };

    struct Camera {
        bool enabled = false;
        int index = 0;
    };

    Osc osc;
    Dataset dataset;
    Camera camera;

    std::string profilePath = "data/profile.yaml";
    std::string replayPath;                       // Landmark recording; required to run
    bool loopReplay = false;

    std::string mode = "play";                    // "play" | "calibration"
    std::vector<std::string> sequence;

    int64_t detectionIntervalMs = DETECTION_INTERVAL_MS;
    bool realtime = true;                         // Sleep between ticks
    bool assistEnabled = true;
    bool requireGoodLighting = true;
    std::optional<float> voteMinConfidence;

    int knnK = KNN_DEFAULT_K;
    float knnThreshold = KNN_DEFAULT_THRESHOLD;

    std::string logLevel = "info";

    /**
     * Parse a YAML document. Throws YAML::Exception on malformed input.
     */
    static ServiceConfig fromYamlString(const std::string& yaml);

    /**
     * Load from a file; a missing or malformed file is logged and defaults are returned.
     */
    static ServiceConfig fromYaml(const std::string& path);

    [[nodiscard]] bool isCalibration() const { return mode == "calibration"; }

    /**
     * Pipeline settings derived from this config.
     */
    [[nodiscard]] SignPipeline::Config pipelineConfig() const;
};

} // namespace core
