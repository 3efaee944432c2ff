// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/types.h>
#include <recall/graph/relationship.h>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace recall::graph {

using ConnectionsByDepth = std::map<int, std::vector<Connection>>;

struct GraphStats {
    size_t totalEdges = 0;
    size_t nodeCount = 0;
    // Sorted by count, descending; ties keep name order
    std::vector<std::pair<std::string, size_t>> byRelation;
    // "fromType -> toType" pairs, same ordering
    std::vector<std::pair<std::string, size_t>> byTypePair;
};

/**
 * In-memory directed multigraph over entity keys.
 *
 * Keys are interned into a dense node arena; adjacency lists hold edge
 * indices so traversal never touches the string keys. (from, to, relation)
 * is unique: adding an existing edge is a no-op.
 */
class RelationshipGraph {
public:
    RelationshipGraph() = default;
    explicit RelationshipGraph(const std::vector<Relationship>& edges);

    AddOutcome addRelationship(Relationship rel);

    // Add every edge whose key is not yet present; returns the number added
    size_t merge(const std::vector<Relationship>& edges);

    bool contains(std::string_view from, std::string_view to, std::string_view relation) const;
    bool hasNode(std::string_view key) const;

    /**
     * Breadth-first traversal from @p start.
     *
     * Each node is expanded at most once. A node at depth d reports all its
     * edges in the requested direction(s) into bucket d; endpoints not yet seen
     * are queued at d + 1 while d + 1 < maxDepth. No reported edge therefore
     * touches a node more than maxDepth hops away.
     *
     * InvalidArgument when maxDepth < 1, NotFound when @p start has no edges.
     */
    Result<ConnectionsByDepth> traverse(std::string_view start, int maxDepth,
                                        TraversalDirection direction) const;

    GraphStats stats() const;

    const std::vector<Relationship>& edges() const noexcept { return edges_; }
    size_t nodeCount() const noexcept { return nodeKeys_.size(); }

private:
    uint32_t internNode(const std::string& key);
    std::optional<uint32_t> findNode(std::string_view key) const;

    std::vector<Relationship> edges_;
    std::vector<std::pair<uint32_t, uint32_t>> edgeEnds_;

    std::vector<std::string> nodeKeys_;
    std::unordered_map<std::string, uint32_t> nodeIndex_;
    std::vector<std::vector<uint32_t>> outEdges_;
    std::vector<std::vector<uint32_t>> inEdges_;

    std::set<RelationshipKey> edgeKeys_;
};

} // namespace recall::graph
