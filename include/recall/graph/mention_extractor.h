// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/store/entity_key.h>

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace recall::graph {

/**
 * Finds the entities a piece of text refers to.
 *
 * Implementations return each candidate entity key at most once.
 */
class IMentionExtractor {
public:
    virtual ~IMentionExtractor() = default;
    virtual std::vector<std::string> extract(std::string_view text) const = 0;
};

// Lowercase surface form of an entity name and the key it resolves to
struct NameEntry {
    std::string name;
    std::string key;
};

/**
 * Case-insensitive substring matching against a table of entity names.
 *
 * The table holds, for every entity, its lowercased name plus a variant with
 * '_' and '-' replaced by spaces. When two entities share a surface form the
 * later one owns it. Names shorter than @p minNameLength are ignored.
 */
class SubstringMentionExtractor : public IMentionExtractor {
public:
    explicit SubstringMentionExtractor(std::vector<NameEntry> names, size_t minNameLength = 0);

    static std::vector<NameEntry> buildNameTable(const std::vector<store::EntityKey>& entities);

    std::vector<std::string> extract(std::string_view text) const override;

    const std::vector<NameEntry>& names() const noexcept { return names_; }

private:
    std::vector<NameEntry> names_;
    size_t minNameLength_;
};

} // namespace recall::graph
