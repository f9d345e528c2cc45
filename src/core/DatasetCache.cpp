#include "core/DatasetCache.hpp"
#include "core/Logger.hpp"
#include "core/SignLabels.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace core {

namespace {

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                cell.push_back('"');
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == ',' && !quoted) {
            cells.push_back(cell);
            cell.clear();
        } else if (c != '\r') {
            cell.push_back(c);
        }
    }
    cells.push_back(cell);
    return cells;
}

float parseFeature(const std::string& cell) {
    if (cell.empty()) return 0.0f;
    const char* begin = cell.c_str();
    char* end = nullptr;
    float value = std::strtof(begin, &end);
    if (end == begin || !std::isfinite(value)) return 0.0f;
    return value;
}

// Column index for every feature slot, -1 when the column is absent
std::vector<int> featureColumns(const std::vector<std::string>& header) {
    std::map<std::string, int> byName;
    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = header[i];
        name.erase(0, name.find_first_not_of(" \t"));
        name.erase(name.find_last_not_of(" \t") + 1);
        byName[name] = static_cast<int>(i);
    }

    static const char AXES[3] = {'x', 'y', 'z'};
    std::vector<int> columns;
    columns.reserve(QUERY_FEATURE_LENGTH);
    for (int hand = 1; hand <= 2; ++hand) {
        for (size_t lm = 0; lm < HAND_LANDMARK_COUNT; ++lm) {
            for (char axis : AXES) {
                std::string key = "h" + std::to_string(hand) + "_" + std::to_string(lm) + "_" + axis;
                auto it = byName.find(key);
                columns.push_back(it != byName.end() ? it->second : -1);
            }
        }
    }
    return columns;
}

} // namespace

std::string DatasetCache::versionToken(const std::string& version) {
    std::string token = version;
    token.erase(0, token.find_first_not_of(" \t"));
    token.erase(token.find_last_not_of(" \t") + 1);
    return token.empty() ? "local" : token;
}

ReferenceSet DatasetCache::parseCsv(std::istream& in, const std::vector<std::string>& labelFilter,
                                    ParseStats* stats) {
    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("DatasetCache: empty CSV");
    }

    const std::vector<std::string> header = splitCsvLine(line);
    int labelColumn = -1;
    for (size_t i = 0; i < header.size(); ++i) {
        if (normalizeLabel(header[i]) == "label") {
            labelColumn = static_cast<int>(i);
            break;
        }
    }
    if (labelColumn < 0) {
        throw std::runtime_error("DatasetCache: CSV header has no 'label' column");
    }
    const std::vector<int> columns = featureColumns(header);

    std::vector<std::string> wanted;
    wanted.reserve(labelFilter.size());
    for (const auto& name : labelFilter) wanted.push_back(normalizeLabel(name));

    ReferenceSet references;
    ParseStats local;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") continue;

        const std::vector<std::string> cells = splitCsvLine(line);
        const std::string label = labelColumn < static_cast<int>(cells.size())
                                      ? normalizeLabel(cells[static_cast<size_t>(labelColumn)])
                                      : std::string();
        if (label.empty()) {
            local.skipped++;
            continue;
        }
        if (!wanted.empty() && std::find(wanted.begin(), wanted.end(), label) == wanted.end()) {
            continue;
        }

        ReferenceSample sample;
        sample.label = label;
        sample.features.resize(QUERY_FEATURE_LENGTH, 0.0f);
        for (size_t i = 0; i < columns.size(); ++i) {
            int col = columns[i];
            if (col >= 0 && col < static_cast<int>(cells.size())) {
                sample.features[i] = parseFeature(cells[static_cast<size_t>(col)]);
            }
        }
        references[label].push_back(std::move(sample));
        local.rows++;
    }

    if (stats) *stats = local;
    return references;
}

size_t DatasetCache::loadFile(const std::string& path, const std::string& version,
                              const std::vector<std::string>& labelFilter) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("DatasetCache: cannot open '" + path + "'");
    }

    ParseStats stats;
    ReferenceSet rows = parseCsv(in, labelFilter, &stats);
    merge(version, rows);

    Logger::info("DatasetCache: loaded ", stats.rows, " rows (", rows.size(), " labels) from '",
                 path, "' as version ", versionToken(version));
    if (stats.skipped > 0) {
        Logger::warn("DatasetCache: skipped ", stats.skipped, " rows without a label");
    }
    return stats.rows;
}

void DatasetCache::merge(const std::string& version, const ReferenceSet& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& target = versions_[versionToken(version)];
    for (const auto& [label, samples] : rows) {
        target[label] = samples;
    }
}

ReferenceSet DatasetCache::select(const std::string& version, const std::vector<std::string>& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ReferenceSet out;
    auto it = versions_.find(versionToken(version));
    if (it == versions_.end()) return out;

    const ReferenceSet& cached = it->second;
    auto copyLabel = [&](const std::string& label) {
        auto rows = cached.find(label);
        if (rows != cached.end() && !rows->second.empty()) {
            out[label] = rows->second;
        }
    };

    copyLabel(IDLE_LABEL);
    for (const auto& label : labels) {
        copyLabel(normalizeLabel(label));
    }
    return out;
}

std::vector<std::string> DatasetCache::labels(const std::string& version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    auto it = versions_.find(versionToken(version));
    if (it == versions_.end()) return out;
    for (const auto& [label, rows] : it->second) {
        if (!rows.empty()) out.push_back(label);
    }
    return out;
}

bool DatasetCache::hasVersion(const std::string& version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return versions_.count(versionToken(version)) > 0;
}

std::vector<std::string> DatasetCache::missingLabels(const std::string& version,
                                                     const std::vector<std::string>& required) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = versions_.find(versionToken(version));
    if (it == versions_.end()) {
        std::vector<std::string> all;
        for (const auto& label : required) all.push_back(normalizeLabel(label));
        return all;
    }
    return core::missingLabels(it->second, required);
}

void DatasetCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    versions_.clear();
}

std::vector<std::string> missingLabels(const ReferenceSet& references, const std::vector<std::string>& required) {
    std::vector<std::string> missing;
    for (const auto& raw : required) {
        const std::string label = normalizeLabel(raw);
        auto it = references.find(label);
        if (it == references.end() || it->second.empty()) {
            missing.push_back(label);
        }
    }
    return missing;
}

} // namespace core
