#pragma once

#include "core/Types.hpp"
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace core {

/**
 * Reference dataset cache, keyed by dataset version token.
 *
 * CSV layout (header required, column order free):
 *   label,h1_0_x,h1_0_y,h1_0_z,...,h1_20_z,h2_0_x,...,h2_20_z
 * Labels are normalized on load; missing or non-numeric feature cells are 0.
 *
 * Rows can be merged in several batches (e.g. per-label slices fetched as
 * the active sequence changes). Owned by the host; the pipeline only
 * receives a ready ReferenceSet.
 */
class DatasetCache {
public:
    struct ParseStats {
        size_t rows = 0;
        size_t skipped = 0;   // Rows without a label
    };

    /**
     * Parse CSV rows, optionally keeping only the given normalized labels.
     * @throws std::runtime_error if the header has no "label" column
     */
    [[nodiscard]] static ReferenceSet parseCsv(std::istream& in,
                                               const std::vector<std::string>& labelFilter = {},
                                               ParseStats* stats = nullptr);

    /**
     * Load a CSV file into the cache under `version` (merging with rows
     * already cached for that version).
     * @return number of rows added; throws std::runtime_error if the file cannot be read
     */
    size_t loadFile(const std::string& path, const std::string& version,
                    const std::vector<std::string>& labelFilter = {});

    /**
     * Merge already-parsed rows under `version`. Labels already present are
     * replaced, not appended, so re-fetching a slice is idempotent.
     */
    void merge(const std::string& version, const ReferenceSet& rows);

    /**
     * Subset for the given labels. "idle" rows are always included when present.
     */
    [[nodiscard]] ReferenceSet select(const std::string& version,
                                      const std::vector<std::string>& labels) const;

    [[nodiscard]] bool hasVersion(const std::string& version) const;

    // All labels cached for `version`, sorted
    [[nodiscard]] std::vector<std::string> labels(const std::string& version) const;

    // Labels from `required` that the cached version does not have yet
    [[nodiscard]] std::vector<std::string> missingLabels(const std::string& version,
                                                         const std::vector<std::string>& required) const;

    void clear();

    // "" -> "local"
    [[nodiscard]] static std::string versionToken(const std::string& version);

private:
    mutable std::mutex mutex_;
    std::map<std::string, ReferenceSet> versions_;
};

/**
 * Labels in `required` with no rows in `references`.
 */
[[nodiscard]] std::vector<std::string> missingLabels(const ReferenceSet& references,
                                                     const std::vector<std::string>& required);

} // namespace core
