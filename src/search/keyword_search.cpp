// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/common/text_utils.h>
#include <recall/search/keyword_search.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace recall::search {

namespace {

bool isContinuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

double keywordScore(std::string_view text, std::string_view query) {
    const auto haystack = common::toLowerAscii(text);
    const auto needle = common::toLowerAscii(common::trimView(query));
    if (needle.empty()) {
        return 0.0;
    }
    if (haystack.find(needle) != std::string::npos) {
        return 1.0;
    }

    const auto queryWords = common::splitWhitespace(needle);
    const auto textWords = common::splitWhitespace(haystack);

    size_t exact = 0;
    size_t partial = 0;
    for (const auto& word : queryWords) {
        if (haystack.find(word) != std::string::npos) {
            ++exact;
        }
        if (std::any_of(textWords.begin(), textWords.end(), [&](const std::string& tw) {
                return tw.find(word) != std::string::npos;
            })) {
            ++partial;
        }
    }

    const auto n = static_cast<double>(queryWords.size());
    return std::min(1.0, static_cast<double>(exact) / n + 0.5 * static_cast<double>(partial) / n);
}

std::string extractSnippet(std::string_view content, std::string_view query, size_t maxLength) {
    const auto haystack = common::toLowerAscii(content);
    const auto needle = common::toLowerAscii(common::trimView(query));

    auto pos = needle.empty() ? std::string::npos : haystack.find(needle);
    if (pos == std::string::npos) {
        for (const auto& word : common::splitWhitespace(needle)) {
            pos = haystack.find(word);
            if (pos != std::string::npos) {
                break;
            }
        }
    }

    if (pos == std::string::npos) {
        if (content.size() <= maxLength) {
            return std::string(content);
        }
        size_t cut = maxLength;
        while (cut > 0 && isContinuation(content[cut])) {
            --cut;
        }
        return std::string(content.substr(0, cut)) + "...";
    }

    const size_t half = maxLength / 2;
    size_t start = pos > half ? pos - half : 0;
    size_t end = std::min(content.size(), pos + half);
    while (start > 0 && isContinuation(content[start])) {
        --start;
    }
    while (end < content.size() && isContinuation(content[end])) {
        ++end;
    }

    std::string snippet;
    if (start > 0) {
        snippet += "...";
    }
    snippet.append(content.substr(start, end - start));
    if (end < content.size()) {
        snippet += "...";
    }
    return snippet;
}

KeywordSearcher::KeywordSearcher(const store::FactStore& store) : store_(store) {}

Result<std::vector<SearchResult>> KeywordSearcher::search(std::string_view query,
                                                          size_t limit) const {
    if (common::trimView(query).empty()) {
        return Error{ErrorCode::InvalidArgument, "Search query must not be empty"};
    }

    std::vector<SearchResult> results;
    auto add = [&](SearchResult r) {
        r.finalScore = r.score;
        r.searchType = SearchPath::Keyword;
        results.push_back(std::move(r));
    };

    for (const auto& key : store_.listEntities()) {
        const auto entity = key.str();
        const auto itemsSource = store_.relativeSource(store_.itemsPath(key));

        for (const auto& fact : store_.loadFacts(key)) {
            if (!fact.isActive()) {
                continue;
            }
            const double s = keywordScore(fact.fact, query);
            if (s <= 0.0) {
                continue;
            }
            add(SearchResult{kEntityFact, entity, fact.fact, s, 0.0, fact.timestamp, fact.category,
                             itemsSource + "#" + fact.id});
        }

        if (auto summary = store_.loadSummary(key)) {
            const double s = keywordScore(*summary, query);
            if (s > 0.0) {
                add(SearchResult{kEntitySummary, entity, extractSnippet(*summary, query), s, 0.0,
                                 "", "summary",
                                 store_.relativeSource(store_.entityDir(key) / "summary.md")});
            }
        }
    }

    for (const auto& note : store_.loadNotes()) {
        const double s = keywordScore(note.content, query);
        if (s <= 0.0) {
            continue;
        }
        add(SearchResult{kDailyNote, note.date, extractSnippet(note.content, query), s, 0.0,
                         note.date, "daily_event", store_.relativeSource(note.path)});
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) {
                         if (a.score != b.score) {
                             return a.score > b.score;
                         }
                         return a.timestamp > b.timestamp;
                     });
    if (results.size() > limit) {
        results.resize(limit);
    }
    spdlog::debug("Keyword search '{}' returned {} results", query, results.size());
    return results;
}

} // namespace recall::search
