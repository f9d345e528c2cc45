#include "core/SignLabels.hpp"
#include "core/Types.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace core {

namespace {

const std::map<std::string, std::string>& aliasTable() {
    static const std::map<std::string, std::string> aliases = {
        {"none", "idle"},
        {"unknown", "idle"},
        {"rabbit", "hare"},
        {"pig", "boar"},
        {"sheep", "ram"},
        {"bull", "ox"},
        {"hand clap", "clap"},
        {"hands clap", "clap"},
        {"handclap", "clap"},
        {"clap hands", "clap"},
    };
    return aliases;
}

} // namespace

std::string normalizeLabel(const std::string& label) {
    std::string token;
    token.reserve(label.size());

    bool pendingSpace = false;
    for (char ch : label) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c == '-' || c == '_' || std::isspace(c)) {
            pendingSpace = !token.empty();
            continue;
        }
        if (pendingSpace) {
            token.push_back(' ');
            pendingSpace = false;
        }
        token.push_back(static_cast<char>(std::tolower(c)));
    }

    const auto& aliases = aliasTable();
    auto it = aliases.find(token);
    return it != aliases.end() ? it->second : token;
}

bool isIdleLabel(const std::string& label) {
    const std::string normalized = normalizeLabel(label);
    return normalized.empty() || normalized == IDLE_LABEL;
}

std::string toDisplayLabel(const std::string& label) {
    std::string normalized = normalizeLabel(label);
    if (normalized.empty() || normalized == IDLE_LABEL) return "Idle";
    normalized[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(normalized[0])));
    return normalized;
}

std::vector<std::string> requiredLabels(const std::vector<std::string>& sequence) {
    std::vector<std::string> labels;
    for (const auto& raw : sequence) {
        std::string normalized = normalizeLabel(raw);
        if (normalized.empty() || normalized == IDLE_LABEL) continue;
        if (std::find(labels.begin(), labels.end(), normalized) == labels.end()) {
            labels.push_back(std::move(normalized));
        }
    }
    return labels;
}

} // namespace core
