#include "core/LandmarkReplay.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace core {

namespace {

constexpr size_t FIXED_COLUMNS = 3;   // t_ms, hand, handedness
constexpr size_t COLUMN_COUNT = FIXED_COLUMNS + HAND_LANDMARK_COUNT * 3;

std::vector<std::string> splitRow(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        cells.push_back(cell);
    }
    if (!line.empty() && line.back() == ',') cells.emplace_back();
    return cells;
}

bool parseFloat(const std::string& text, float& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    out = std::strtof(text.c_str(), &end);
    return end != text.c_str() && std::isfinite(out);
}

bool parseInt(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    out = std::strtoll(text.c_str(), &end, 10);
    return end != text.c_str();
}

} // namespace

Handedness LandmarkReplay::parseHandedness(const std::string& value) {
    std::string lower;
    for (char ch : value) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
    }
    if (lower == "left") return Handedness::Left;
    if (lower == "right") return Handedness::Right;
    return Handedness::Unknown;
}

void LandmarkReplay::load(std::istream& in) {
    frames_.clear();
    cursor_ = 0;
    loopOffsetMs_ = 0;
    stats_ = {};

    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("LandmarkReplay: empty recording");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    auto header = splitRow(line);
    if (header.size() < FIXED_COLUMNS || header[0] != "t_ms") {
        throw std::runtime_error("LandmarkReplay: missing t_ms,hand,handedness header");
    }

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        stats_.rows++;

        auto cells = splitRow(line);
        int64_t tMs = 0;
        int64_t handIndex = 0;
        if (cells.size() < 2 || !parseInt(cells[0], tMs) || !parseInt(cells[1], handIndex)) {
            stats_.skippedRows++;
            continue;
        }

        if (frames_.empty() || frames_.back().timestampMs != tMs) {
            if (!frames_.empty() && tMs < frames_.back().timestampMs) {
                stats_.skippedRows++;
                continue;
            }
            HandFrame frame;
            frame.timestampMs = tMs;
            frames_.push_back(std::move(frame));
        }
        if (handIndex < 0) continue;   // Empty frame marker

        if (cells.size() < COLUMN_COUNT) {
            stats_.skippedRows++;
            continue;
        }
        auto& frame = frames_.back();
        if (frame.hands.size() >= 2) {
            stats_.skippedRows++;
            continue;
        }

        HandLandmarkSet hand;
        hand.handedness = parseHandedness(cells[2]);
        hand.landmarks.resize(HAND_LANDMARK_COUNT);
        bool ok = true;
        for (size_t i = 0; i < HAND_LANDMARK_COUNT && ok; ++i) {
            const size_t base = FIXED_COLUMNS + i * 3;
            ok = parseFloat(cells[base], hand.landmarks[i].x) &&
                 parseFloat(cells[base + 1], hand.landmarks[i].y) &&
                 parseFloat(cells[base + 2], hand.landmarks[i].z);
        }
        if (!ok) {
            stats_.skippedRows++;
            continue;
        }
        frame.hands.push_back(std::move(hand));
    }

    stats_.frames = frames_.size();
    if (stats_.skippedRows > 0) {
        Logger::warn("LandmarkReplay: skipped ", stats_.skippedRows, " of ", stats_.rows, " rows");
    }
}

void LandmarkReplay::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("LandmarkReplay: cannot open " + path);
    }
    load(file);
    Logger::info("LandmarkReplay: loaded ", stats_.frames, " frames from ", path);
}

bool LandmarkReplay::next(HandFrame& frame) {
    if (frames_.empty()) return false;
    if (cursor_ >= frames_.size()) {
        if (!loop_) return false;
        // Continue the clock past the last frame so TTLs and cooldowns stay monotonic
        const int64_t span = frames_.back().timestampMs - frames_.front().timestampMs;
        loopOffsetMs_ += span + DETECTION_INTERVAL_MS;
        cursor_ = 0;
    }
    frame = frames_[cursor_++];
    frame.timestampMs += loopOffsetMs_;
    return true;
}

void LandmarkReplay::rewind() {
    cursor_ = 0;
    loopOffsetMs_ = 0;
}

} // namespace core
