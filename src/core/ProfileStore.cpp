#include "core/ProfileStore.hpp"
#include "core/CalibrationEngine.hpp"
#include "core/Logger.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace core {

namespace {

template<typename T>
void tryGet(const YAML::Node& node, const char* key, T& value) {
    if (node && node[key]) value = node[key].as<T>();
}

} // namespace

CalibrationProfile ProfileStore::fromYaml(const std::string& yaml, int voteWindowSize) {
    CalibrationProfile profile;
    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root.IsMap()) {
            throw std::runtime_error("ProfileStore: profile root is not a map");
        }

        tryGet(root, "version", profile.version);
        tryGet(root, "samples", profile.samples);
        tryGet(root, "updated_at", profile.updatedAt);

        const YAML::Node lighting = root["lighting"];
        tryGet(lighting, "min", profile.lightingMin);
        tryGet(lighting, "max", profile.lightingMax);
        tryGet(lighting, "min_contrast", profile.lightingMinContrast);

        const YAML::Node vote = root["vote"];
        tryGet(vote, "min_confidence", profile.voteMinConfidence);
        tryGet(vote, "required_hits", profile.voteRequiredHits);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("ProfileStore: malformed profile: ") + e.what());
    }

    if (profile.version > CALIBRATION_PROFILE_VERSION) {
        Logger::warn("ProfileStore: profile version ", profile.version,
                     " is newer than supported (", CALIBRATION_PROFILE_VERSION, "), reading known fields");
    }
    return CalibrationEngine::sanitize(profile, voteWindowSize);
}

CalibrationProfile ProfileStore::load(const std::string& path, int voteWindowSize) {
    if (path.empty() || !std::filesystem::exists(path)) {
        Logger::info("ProfileStore: no calibration profile at '", path, "', using defaults");
        return CalibrationEngine::sanitize(CalibrationProfile{}, voteWindowSize);
    }

    std::ifstream in(path);
    if (!in) {
        Logger::warn("ProfileStore: cannot open '", path, "', using defaults");
        return CalibrationEngine::sanitize(CalibrationProfile{}, voteWindowSize);
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    try {
        CalibrationProfile profile = fromYaml(content, voteWindowSize);
        Logger::info("ProfileStore: loaded profile v", profile.version, " (", profile.samples,
                     " samples, updated ", profile.updatedAt.empty() ? "never" : profile.updatedAt, ")");
        return profile;
    } catch (const std::exception& e) {
        Logger::error(e.what(), " in '", path, "', using defaults");
        return CalibrationEngine::sanitize(CalibrationProfile{}, voteWindowSize);
    }
}

std::string ProfileStore::toYaml(const CalibrationProfile& profile) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << profile.version;
    out << YAML::Key << "samples" << YAML::Value << profile.samples;
    out << YAML::Key << "updated_at" << YAML::Value << YAML::DoubleQuoted << profile.updatedAt;

    out << YAML::Key << "lighting" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "min" << YAML::Value << profile.lightingMin;
    out << YAML::Key << "max" << YAML::Value << profile.lightingMax;
    out << YAML::Key << "min_contrast" << YAML::Value << profile.lightingMinContrast;
    out << YAML::EndMap;

    out << YAML::Key << "vote" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "min_confidence" << YAML::Value << profile.voteMinConfidence;
    out << YAML::Key << "required_hits" << YAML::Value << profile.voteRequiredHits;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

bool ProfileStore::save(const std::string& path, const CalibrationProfile& profile) {
    std::ofstream outFile(path, std::ios::trunc);
    if (!outFile) {
        Logger::error("ProfileStore: cannot write '", path, "'");
        return false;
    }
    outFile << toYaml(profile);
    if (!outFile) {
        Logger::error("ProfileStore: write to '", path, "' failed");
        return false;
    }
    Logger::info("ProfileStore: saved profile to '", path, "'");
    return true;
}

} // namespace core
