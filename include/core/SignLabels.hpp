#pragma once

#include <string>
#include <vector>

namespace core {

/**
 * Sign label canonicalization shared by the dataset loader, the vote engine
 * and the sequence matcher.
 *
 * normalizeLabel: trim, lowercase, '-' and '_' -> ' ', collapse whitespace,
 * then resolve aliases (rabbit -> hare, pig -> boar, sheep -> ram,
 * bull -> ox, none/unknown -> idle, "hand clap" variants -> clap).
 */
[[nodiscard]] std::string normalizeLabel(const std::string& label);

// Empty, "idle" and "unknown" (after normalization) all mean "no sign"
[[nodiscard]] bool isIdleLabel(const std::string& label);

// "hare" -> "Hare", idle -> "Idle"
[[nodiscard]] std::string toDisplayLabel(const std::string& label);

/**
 * Labels a classifier must know before it can drive this sequence:
 * every normalized sign once, in first-seen order.
 */
[[nodiscard]] std::vector<std::string> requiredLabels(const std::vector<std::string>& sequence);

} // namespace core
