// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/types.h>
#include <recall/search/search_result.h>
#include <recall/store/fact_store.h>

#include <string>
#include <string_view>
#include <vector>

namespace recall::search {

inline constexpr size_t kSnippetLength = 200;

/**
 * Keyword relevance of @p text for @p query, in [0, 1]. Case-insensitive.
 *
 * 1.0 when the whole query occurs in the text. Otherwise
 * min(1, exact + 0.5 * partial), where exact is the fraction of query words
 * occurring anywhere in the text and partial the fraction occurring inside
 * some whitespace-separated word of the text.
 */
double keywordScore(std::string_view text, std::string_view query);

/**
 * Window of about @p maxLength bytes centred on the first occurrence of the
 * query (or, failing that, of its first query word that occurs). "..." marks
 * each cut end. Without any occurrence the head of the content is returned.
 * Matching ignores case; the returned text keeps the original case.
 */
std::string extractSnippet(std::string_view content, std::string_view query,
                           size_t maxLength = kSnippetLength);

/**
 * Local search over active facts, entity summaries and notes.
 */
class KeywordSearcher {
public:
    explicit KeywordSearcher(const store::FactStore& store);

    // Results with a positive score, best first (newer timestamp breaks ties).
    // InvalidArgument for a blank query.
    Result<std::vector<SearchResult>> search(std::string_view query, size_t limit) const;

private:
    const store::FactStore& store_;
};

} // namespace recall::search
