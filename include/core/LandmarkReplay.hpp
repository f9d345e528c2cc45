#pragma once

#include <istream>
#include <string>
#include <vector>

#include "core/Types.hpp"

namespace core {

/**
 * Landmark recording source for the host service.
 *
 * CSV layout, one row per detected hand:
 *   t_ms,hand,handedness,x0,y0,z0,...,x20,y20,z20
 *
 * Rows sharing t_ms form one HandFrame (in file order, at most two hands).
 * handedness is "Left" / "Right" (case-insensitive) or empty. A row with
 * hand < 0 marks a frame with no hands.
 */
class LandmarkReplay {
public:
    struct Stats {
        size_t rows = 0;
        size_t frames = 0;
        size_t skippedRows = 0;
    };

    LandmarkReplay() = default;

    /**
     * Parse a recording. Malformed rows are skipped and counted.
     * @throws std::runtime_error if the header is missing
     */
    void load(std::istream& in);

    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    void loadFile(const std::string& path);

    /**
     * Next frame in recording order. Returns false at the end unless looping,
     * in which case timestamps keep increasing across loops.
     */
    bool next(HandFrame& frame);

    void rewind();
    void setLoop(bool loop) { loop_ = loop; }

    [[nodiscard]] bool empty() const { return frames_.empty(); }
    [[nodiscard]] size_t frameCount() const { return frames_.size(); }
    [[nodiscard]] const Stats& stats() const { return stats_; }

    static Handedness parseHandedness(const std::string& value);

private:
    std::vector<HandFrame> frames_;
    size_t cursor_ = 0;
    bool loop_ = false;
    int64_t loopOffsetMs_ = 0;
    Stats stats_;
};

} // namespace core
