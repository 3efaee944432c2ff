// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/common/text_utils.h>
#include <recall/graph/relationship_detector.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace recall::graph {

RelationshipDetector::RelationshipDetector(const store::FactStore& store, core::ClockFn clock)
    : store_(store), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = core::systemNow;
    }
}

std::vector<Relationship> RelationshipDetector::detect() const {
    auto table = SubstringMentionExtractor::buildNameTable(store_.listEntities());
    SubstringMentionExtractor typedTargets(table);
    SubstringMentionExtractor mentionTargets(std::move(table), kShortNameLength + 1);
    return detect(typedTargets, mentionTargets);
}

std::vector<Relationship> RelationshipDetector::detect(const IMentionExtractor& typedTargets,
                                                       const IMentionExtractor& mentionTargets) const {
    const auto today = core::TimeParser::formatDate(clock_());
    const auto entities = store_.listEntities();
    spdlog::debug("Scanning for relationships among {} entities", entities.size());

    std::vector<Relationship> found;
    std::set<RelationshipKey> seen;
    auto emit = [&](Relationship rel) {
        if (seen.insert(rel.key()).second) {
            found.push_back(std::move(rel));
        }
    };

    for (const auto& entity : entities) {
        const auto from = entity.str();
        const auto itemsSource = store_.relativeSource(store_.itemsPath(entity));

        for (const auto& fact : store_.loadFacts(entity)) {
            if (!fact.isActive()) {
                continue;
            }
            const auto text = common::toLowerAscii(fact.fact);
            const auto since = fact.timestamp.empty() ? today : fact.timestamp;
            const auto source = itemsSource + "#" + fact.id;

            for (auto verb : kRelationVerbs) {
                std::string phrase(verb);
                std::replace(phrase.begin(), phrase.end(), '_', ' ');
                if (text.find(phrase) == std::string::npos) {
                    continue;
                }
                for (const auto& to : typedTargets.extract(text)) {
                    if (to != from) {
                        emit(Relationship{from, to, std::string(verb), since, source});
                    }
                }
            }

            for (const auto& to : mentionTargets.extract(text)) {
                if (to != from) {
                    emit(Relationship{from, to, std::string(kMentionsRelation), since, source});
                }
            }
        }
    }

    for (const auto& note : store_.loadNotes()) {
        const auto keys = mentionTargets.extract(note.content);
        const auto source = store_.relativeSource(note.path);
        for (size_t i = 0; i < keys.size(); ++i) {
            for (size_t j = i + 1; j < keys.size(); ++j) {
                emit(Relationship{keys[i], keys[j], std::string(kCoMentionedRelation), note.date,
                                  source});
            }
        }
    }

    spdlog::debug("Detected {} unique relationships", found.size());
    return found;
}

} // namespace recall::graph
