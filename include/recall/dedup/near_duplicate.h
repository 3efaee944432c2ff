// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/store/fact.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recall::dedup {

// Default word-overlap ratio above which two facts count as near-duplicates
inline constexpr double kNearDuplicateThreshold = 0.8;

/**
 * |words(a) ∩ words(b)| / min(|words(a)|, |words(b)|) over lowercased,
 * whitespace-split word sets. 0 when either side has no words.
 */
double wordOverlapRatio(std::string_view a, std::string_view b);

/**
 * Fuzzy write-time check, independent of the fingerprint index.
 *
 * Compares @p candidate with every *active* fact: a match is either equal after
 * lowercasing and trimming, or has a word-overlap ratio strictly above
 * @p threshold. Returns the id of the first matching fact.
 */
std::optional<std::string> findNearDuplicate(std::string_view candidate,
                                             const std::vector<store::Fact>& existing,
                                             double threshold = kNearDuplicateThreshold);

} // namespace recall::dedup
