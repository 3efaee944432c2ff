// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/time_parser.h>
#include <recall/core/types.h>
#include <recall/graph/relationship_detector.h>
#include <recall/graph/relationship_graph.h>
#include <recall/graph/relationship_store.h>
#include <recall/store/fact_store.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recall::graph {

struct ScanReport {
    size_t detected = 0;
    size_t added = 0;
    size_t total = 0;
};

/**
 * Persistent relationship operations over one workspace.
 *
 * Every call loads patterns.json, rebuilds the in-memory graph and, for
 * mutations, writes the set back. Single writer only.
 */
class GraphService {
public:
    explicit GraphService(const store::FactStore& store, core::ClockFn clock = core::systemNow);

    /**
     * Add an explicit edge. Keys naming a known entity or graph node are used as
     * spelled; other keys are normalized as on creation. @p since
     * accepts YYYY-MM-DD, "today" or "yesterday" and defaults to today.
     * An existing (from, to, relation) yields added=false and nothing is written.
     */
    Result<AddOutcome> addRelationship(std::string_view from, std::string_view to,
                                       std::string_view relation,
                                       std::optional<std::string> since = std::nullopt);

    // Detect relationships from facts and notes, persist the ones not yet known
    Result<ScanReport> scan();

    /**
     * Connections of @p entity grouped by depth. An entity that exists in the
     * store but has no edges yields an empty map; an unknown key is NotFound.
     */
    Result<ConnectionsByDepth> connections(std::string_view entity, int maxDepth,
                                           TraversalDirection direction = TraversalDirection::Both) const;

    GraphStats stats() const;

    // Entity names per type, both sorted
    std::map<std::string, std::vector<std::string>> entitiesByType() const;

    RelationshipGraph loadGraph() const;

private:
    Result<store::EntityKey> resolveKey(std::string_view key, const RelationshipGraph& graph) const;

    const store::FactStore& store_;
    RelationshipStore relationships_;
    core::ClockFn clock_;
};

} // namespace recall::graph
