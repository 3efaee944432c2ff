// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/common/text_utils.h>
#include <recall/graph/graph_service.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace recall::graph {

GraphService::GraphService(const store::FactStore& store, core::ClockFn clock)
    : store_(store), relationships_(store.root()), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = core::systemNow;
    }
}

RelationshipGraph GraphService::loadGraph() const {
    return RelationshipGraph(relationships_.load().relationships);
}

Result<store::EntityKey> GraphService::resolveKey(std::string_view key,
                                                  const RelationshipGraph& graph) const {
    auto verbatim = store::EntityKey::parseVerbatim(key);
    if (!verbatim) {
        return verbatim.error();
    }
    if (graph.hasNode(verbatim.value().str())) {
        return verbatim;
    }
    return store_.resolveKey(key);
}

Result<AddOutcome> GraphService::addRelationship(std::string_view from, std::string_view to,
                                                 std::string_view relation,
                                                 std::optional<std::string> since) {
    auto set = relationships_.load();
    RelationshipGraph graph(set.relationships);

    auto fromKey = resolveKey(from, graph);
    if (!fromKey) {
        return fromKey.error();
    }
    auto toKey = resolveKey(to, graph);
    if (!toKey) {
        return toKey.error();
    }
    const std::string rel{common::trimView(relation)};
    if (rel.empty()) {
        return Error{ErrorCode::InvalidArgument, "Relation must not be empty"};
    }

    std::string sinceDate;
    if (since) {
        auto parsed = core::TimeParser::parseDateOrNatural(*since, clock_());
        if (!parsed) {
            return parsed.error();
        }
        sinceDate = core::TimeParser::formatDate(parsed.value());
    } else {
        sinceDate = core::TimeParser::formatDate(clock_());
    }

    Relationship edge{fromKey.value().str(), toKey.value().str(), rel, sinceDate, std::nullopt};
    auto outcome = graph.addRelationship(edge);
    if (!outcome.added) {
        spdlog::debug("Relationship already exists: {} -[{}]-> {}", edge.from, edge.relation,
                      edge.to);
        return outcome;
    }

    set.relationships.push_back(std::move(edge));
    if (auto saved = relationships_.save(set); !saved) {
        return saved.error();
    }
    return outcome;
}

Result<ScanReport> GraphService::scan() {
    RelationshipDetector detector(store_, clock_);
    auto detected = detector.detect();

    auto set = relationships_.load();
    RelationshipGraph graph(set.relationships);

    ScanReport report;
    report.detected = detected.size();
    for (auto& rel : detected) {
        if (graph.addRelationship(rel).added) {
            set.relationships.push_back(std::move(rel));
            ++report.added;
        }
    }
    report.total = set.relationships.size();

    if (report.added > 0) {
        if (auto saved = relationships_.save(set); !saved) {
            return saved.error();
        }
    }
    spdlog::info("Relationship scan: {} detected, {} new, {} total", report.detected,
                 report.added, report.total);
    return report;
}

Result<ConnectionsByDepth> GraphService::connections(std::string_view entity, int maxDepth,
                                                     TraversalDirection direction) const {
    if (maxDepth < 1) {
        return Error{ErrorCode::InvalidArgument,
                     "Traversal depth must be at least 1, got " + std::to_string(maxDepth)};
    }

    auto graph = loadGraph();
    auto key = resolveKey(entity, graph);
    if (!key) {
        return key.error();
    }
    const auto start = key.value().str();
    if (!graph.hasNode(start)) {
        if (store_.hasEntity(key.value())) {
            return ConnectionsByDepth{};
        }
        return Error{ErrorCode::NotFound, "Unknown entity '" + start + "'"};
    }
    return graph.traverse(start, maxDepth, direction);
}

GraphStats GraphService::stats() const {
    return loadGraph().stats();
}

std::map<std::string, std::vector<std::string>> GraphService::entitiesByType() const {
    std::map<std::string, std::vector<std::string>> byType;
    for (const auto& key : store_.listEntities()) {
        byType[key.type].push_back(key.name);
    }
    for (auto& [type, names] : byType) {
        std::sort(names.begin(), names.end());
    }
    return byType;
}

} // namespace recall::graph
