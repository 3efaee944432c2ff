// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/common/text_utils.h>
#include <recall/dedup/near_duplicate.h>

#include <algorithm>
#include <unordered_set>

namespace recall::dedup {

namespace {

std::unordered_set<std::string> wordSet(std::string_view text) {
    auto words = common::splitWhitespace(common::toLowerAscii(text));
    return {words.begin(), words.end()};
}

double overlap(const std::unordered_set<std::string>& a, const std::unordered_set<std::string>& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    const auto& smaller = a.size() <= b.size() ? a : b;
    const auto& larger = a.size() <= b.size() ? b : a;
    size_t shared = 0;
    for (const auto& w : smaller) {
        if (larger.contains(w)) {
            ++shared;
        }
    }
    return static_cast<double>(shared) / static_cast<double>(smaller.size());
}

} // namespace

double wordOverlapRatio(std::string_view a, std::string_view b) {
    return overlap(wordSet(a), wordSet(b));
}

std::optional<std::string> findNearDuplicate(std::string_view candidate,
                                             const std::vector<store::Fact>& existing,
                                             double threshold) {
    const std::string needle{common::trimView(common::toLowerAscii(candidate))};
    const auto needleWords = wordSet(needle);

    for (const auto& f : existing) {
        if (!f.isActive()) {
            continue;
        }
        const std::string other{common::trimView(common::toLowerAscii(f.fact))};
        if (needle == other) {
            return f.id;
        }
        if (overlap(needleWords, wordSet(other)) > threshold) {
            return f.id;
        }
    }
    return std::nullopt;
}

} // namespace recall::dedup
