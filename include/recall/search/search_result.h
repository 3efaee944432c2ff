// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <string>

namespace recall::search {

// Retrieval path a result came from
enum class SearchPath { Keyword, Vector };

inline constexpr const char* searchPathToString(SearchPath p) noexcept {
    return p == SearchPath::Vector ? "vector" : "keyword";
}

// Result kinds
inline constexpr const char* kEntityFact = "entity_fact";
inline constexpr const char* kEntitySummary = "entity_summary";
inline constexpr const char* kDailyNote = "daily_note";
inline constexpr const char* kVectorMatch = "vector_match";

struct SearchResult {
    std::string type;
    std::string entity;
    std::string content;
    // Raw score reported by the originating path
    double score = 0.0;
    // Score after applying the path weight; equals score outside fusion
    double finalScore = 0.0;
    std::string timestamp;
    std::string category;
    std::string source;
    SearchPath searchType = SearchPath::Keyword;
};

} // namespace recall::search
