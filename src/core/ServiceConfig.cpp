#include "core/ServiceConfig.hpp"
#include "core/Logger.hpp"
#include "core/SignLabels.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace core {

namespace {

template <typename T>
void tryGet(const YAML::Node& node, const char* key, T& value) {
    if (node && node[key]) value = node[key].as<T>();
}

ServiceConfig parseNode(const YAML::Node& root) {
    ServiceConfig c;
    if (!root || root.IsNull()) return c;
    if (!root.IsMap()) {
        throw YAML::Exception(YAML::Mark::null_mark(), "service config root must be a map");
    }

    if (auto osc = root["osc"]) {
        tryGet(osc, "host", c.osc.host);
        tryGet(osc, "port", c.osc.port);
        tryGet(osc, "enabled", c.osc.enabled);
    }
    if (auto dataset = root["dataset"]) {
        tryGet(dataset, "csv", c.dataset.csvPath);
        tryGet(dataset, "version", c.dataset.version);
    }
    if (auto camera = root["camera"]) {
        tryGet(camera, "enabled", c.camera.enabled);
        tryGet(camera, "index", c.camera.index);
    }

    tryGet(root, "profile", c.profilePath);
    tryGet(root, "replay", c.replayPath);
    tryGet(root, "loop_replay", c.loopReplay);
    tryGet(root, "mode", c.mode);
    tryGet(root, "detection_interval_ms", c.detectionIntervalMs);
    tryGet(root, "realtime", c.realtime);
    tryGet(root, "assist", c.assistEnabled);
    tryGet(root, "require_good_lighting", c.requireGoodLighting);
    tryGet(root, "log_level", c.logLevel);

    if (auto knn = root["knn"]) {
        tryGet(knn, "k", c.knnK);
        tryGet(knn, "threshold", c.knnThreshold);
    }
    if (root["vote_min_confidence"]) {
        const float value = root["vote_min_confidence"].as<float>();
        constexpr auto range = CalibrationEngine::VOTE_CONFIDENCE_RANGE;
        if (value >= range.min && value <= range.max) {
            c.voteMinConfidence = value;
        } else {
            Logger::error("ServiceConfig: vote_min_confidence ", value, " outside [", range.min, ", ",
                          range.max, "], using the profile value");
        }
    }
    if (auto seq = root["sequence"]) {
        c.sequence.clear();
        for (const auto& item : seq) {
            c.sequence.push_back(normalizeLabel(item.as<std::string>()));
        }
    }

    std::transform(c.mode.begin(), c.mode.end(), c.mode.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (c.mode != "play" && c.mode != "calibration") {
        Logger::warn("ServiceConfig: unknown mode '", c.mode, "', using play");
        c.mode = "play";
    }
    if (c.detectionIntervalMs < 1) {
        Logger::warn("ServiceConfig: detection_interval_ms must be positive, using ", DETECTION_INTERVAL_MS);
        c.detectionIntervalMs = DETECTION_INTERVAL_MS;
    }
    return c;
}

} // namespace

ServiceConfig ServiceConfig::fromYamlString(const std::string& yaml) {
    return parseNode(YAML::Load(yaml));
}

ServiceConfig ServiceConfig::fromYaml(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::warn("ServiceConfig: ", path, " not found, using defaults");
        return {};
    }
    try {
        return parseNode(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        Logger::error("ServiceConfig: failed to parse ", path, ": ", e.what(), " (using defaults)");
    }
    return {};
}

SignPipeline::Config ServiceConfig::pipelineConfig() const {
    SignPipeline::Config pc;
    pc.knn.k = knnK;
    pc.knn.decay = knnThreshold;
    pc.knn.idleDistance = knnThreshold;
    pc.assistEnabled = assistEnabled;
    pc.requireGoodLighting = requireGoodLighting;
    pc.voteMinConfidence = voteMinConfidence;
    return pc;
}

} // namespace core
