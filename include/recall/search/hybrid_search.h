// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/types.h>
#include <recall/search/keyword_search.h>
#include <recall/search/search_result.h>
#include <recall/search/semantic_search_client.h>

#include <string_view>
#include <vector>

namespace recall::search {

// Characters of lowercased, trimmed content that identify a result during fusion
inline constexpr size_t kFusionDedupPrefix = 100;

// Independent multipliers, each in [0, 1]; they need not sum to 1
struct FusionWeights {
    double vector = 0.6;
    double keyword = 0.4;
};

enum class SearchMode { Hybrid, KeywordOnly, VectorOnly };

/**
 * Merge two ranked lists: finalScore = score * path weight, results tagged
 * with their path, vector results considered first when dropping duplicates
 * (first 100 chars of lowercased, trimmed content), then sorted by finalScore
 * descending (stable) and cut to @p limit.
 */
std::vector<SearchResult> fuseResults(std::vector<SearchResult> vectorResults,
                                      std::vector<SearchResult> keywordResults,
                                      const FusionWeights& weights, size_t limit);

/**
 * Keyword + semantic retrieval over one workspace.
 *
 * Each path is asked for 2 * limit candidates before fusion. A failing
 * semantic service only removes the vector path's contribution.
 */
class HybridSearcher {
public:
    HybridSearcher(const KeywordSearcher& keyword, ISemanticSearchClient& semantic);

    // InvalidArgument for a blank query, limit 0 or a weight outside [0, 1]
    Result<std::vector<SearchResult>> search(std::string_view query, size_t limit,
                                             const FusionWeights& weights = {},
                                             SearchMode mode = SearchMode::Hybrid);

private:
    const KeywordSearcher& keyword_;
    ISemanticSearchClient& semantic_;
};

} // namespace recall::search
