// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/common/text_utils.h>
#include <recall/graph/mention_extractor.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace recall::graph {

SubstringMentionExtractor::SubstringMentionExtractor(std::vector<NameEntry> names,
                                                     size_t minNameLength)
    : names_(std::move(names)), minNameLength_(minNameLength) {}

std::vector<NameEntry>
SubstringMentionExtractor::buildNameTable(const std::vector<store::EntityKey>& entities) {
    std::vector<NameEntry> table;
    std::unordered_map<std::string, size_t> position;

    auto put = [&](std::string name, const std::string& key) {
        if (name.empty()) {
            return;
        }
        auto [it, inserted] = position.try_emplace(name, table.size());
        if (inserted) {
            table.push_back(NameEntry{std::move(name), key});
        } else {
            table[it->second].key = key;
        }
    };

    for (const auto& entity : entities) {
        const auto key = entity.str();
        auto lower = common::toLowerAscii(entity.name);
        auto spaced = lower;
        std::replace_if(
            spaced.begin(), spaced.end(), [](char c) { return c == '_' || c == '-'; }, ' ');
        put(lower, key);
        put(spaced, key);
    }
    return table;
}

std::vector<std::string> SubstringMentionExtractor::extract(std::string_view text) const {
    const auto haystack = common::toLowerAscii(text);
    std::vector<std::string> keys;
    std::unordered_set<std::string> seen;
    for (const auto& entry : names_) {
        if (entry.name.size() < minNameLength_) {
            continue;
        }
        if (haystack.find(entry.name) != std::string::npos && seen.insert(entry.key).second) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

} // namespace recall::graph
