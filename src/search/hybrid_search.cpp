// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/common/text_utils.h>
#include <recall/search/hybrid_search.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace recall::search {

namespace {

bool validWeight(double w) {
    return w >= 0.0 && w <= 1.0;
}

std::string dedupKey(const std::string& content) {
    return common::utf8Prefix(common::trimView(common::toLowerAscii(content)), kFusionDedupPrefix);
}

} // namespace

std::vector<SearchResult> fuseResults(std::vector<SearchResult> vectorResults,
                                      std::vector<SearchResult> keywordResults,
                                      const FusionWeights& weights, size_t limit) {
    std::vector<SearchResult> merged;
    merged.reserve(vectorResults.size() + keywordResults.size());
    std::unordered_set<std::string> seen;

    auto take = [&](std::vector<SearchResult>& from, SearchPath path, double weight) {
        for (auto& r : from) {
            r.finalScore = r.score * weight;
            r.searchType = path;
            if (seen.insert(dedupKey(r.content)).second) {
                merged.push_back(std::move(r));
            }
        }
    };
    take(vectorResults, SearchPath::Vector, weights.vector);
    take(keywordResults, SearchPath::Keyword, weights.keyword);

    std::stable_sort(merged.begin(), merged.end(),
                     [](const SearchResult& a, const SearchResult& b) {
                         return a.finalScore > b.finalScore;
                     });
    if (merged.size() > limit) {
        merged.resize(limit);
    }
    return merged;
}

HybridSearcher::HybridSearcher(const KeywordSearcher& keyword, ISemanticSearchClient& semantic)
    : keyword_(keyword), semantic_(semantic) {}

Result<std::vector<SearchResult>> HybridSearcher::search(std::string_view query, size_t limit,
                                                         const FusionWeights& weights,
                                                         SearchMode mode) {
    if (common::trimView(query).empty()) {
        return Error{ErrorCode::InvalidArgument, "Search query must not be empty"};
    }
    if (limit == 0) {
        return Error{ErrorCode::InvalidArgument, "Search limit must be at least 1"};
    }
    if (!validWeight(weights.vector) || !validWeight(weights.keyword)) {
        return Error{ErrorCode::InvalidArgument, "Weights must be between 0.0 and 1.0"};
    }

    switch (mode) {
        case SearchMode::KeywordOnly:
            return keyword_.search(query, limit);
        case SearchMode::VectorOnly: {
            auto hits = semantic_.search(query, limit);
            if (hits.size() > limit) {
                hits.resize(limit);
            }
            return hits;
        }
        case SearchMode::Hybrid:
            break;
    }

    auto vectorHits = semantic_.search(query, limit * 2);
    auto keywordHits = keyword_.search(query, limit * 2);
    if (!keywordHits) {
        return keywordHits.error();
    }
    spdlog::debug("Fusing {} vector and {} keyword candidates", vectorHits.size(),
                  keywordHits.value().size());
    return fuseResults(std::move(vectorHits), std::move(keywordHits).value(), weights, limit);
}

} // namespace recall::search
