// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/time_parser.h>
#include <recall/graph/mention_extractor.h>
#include <recall/graph/relationship.h>
#include <recall/store/fact_store.h>

#include <array>
#include <string_view>
#include <vector>

namespace recall::graph {

// Verbs that produce typed edges; matched with '_' read as a space
inline constexpr std::array<std::string_view, 6> kRelationVerbs = {
    "works_at", "knows", "uses", "manages", "leads", "founded"};

inline constexpr std::string_view kMentionsRelation = "mentions";
inline constexpr std::string_view kCoMentionedRelation = "co_mentioned";

// Names of this length or shorter never produce mentions/co_mentioned edges
inline constexpr size_t kShortNameLength = 3;

/**
 * Derives relationships from the content of the fact store.
 *
 * Three passes over the workspace:
 *  - typed: an active fact containing a relation verb links its entity to every
 *    other entity named in the same fact
 *  - mentions: an active fact naming another entity (name longer than 3 chars)
 *  - co_mentioned: every unordered pair of entities named in one note, dated by the note
 *
 * The combined list is deduplicated on (from, to, relation), first occurrence wins.
 * Nothing is persisted here.
 */
class RelationshipDetector {
public:
    explicit RelationshipDetector(const store::FactStore& store,
                                  core::ClockFn clock = core::systemNow);

    // Detect with substring matching over the entities currently in the store
    std::vector<Relationship> detect() const;

    // @p typedTargets resolves targets of verb edges, @p mentionTargets the other two passes
    std::vector<Relationship> detect(const IMentionExtractor& typedTargets,
                                     const IMentionExtractor& mentionTargets) const;

private:
    const store::FactStore& store_;
    core::ClockFn clock_;
};

} // namespace recall::graph
