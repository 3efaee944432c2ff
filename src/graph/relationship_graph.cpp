// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/graph/relationship_graph.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>

namespace recall::graph {

namespace {

std::string entityType(const std::string& key) {
    auto slash = key.find('/');
    return slash == std::string::npos ? key : key.substr(0, slash);
}

std::vector<std::pair<std::string, size_t>> sortedCounts(const std::map<std::string, size_t>& m) {
    std::vector<std::pair<std::string, size_t>> out(m.begin(), m.end());
    std::stable_sort(out.begin(), out.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return out;
}

} // namespace

RelationshipGraph::RelationshipGraph(const std::vector<Relationship>& edges) {
    merge(edges);
}

uint32_t RelationshipGraph::internNode(const std::string& key) {
    auto [it, inserted] = nodeIndex_.try_emplace(key, static_cast<uint32_t>(nodeKeys_.size()));
    if (inserted) {
        nodeKeys_.push_back(key);
        outEdges_.emplace_back();
        inEdges_.emplace_back();
    }
    return it->second;
}

std::optional<uint32_t> RelationshipGraph::findNode(std::string_view key) const {
    auto it = nodeIndex_.find(std::string(key));
    if (it == nodeIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

AddOutcome RelationshipGraph::addRelationship(Relationship rel) {
    if (!edgeKeys_.insert(rel.key()).second) {
        return AddOutcome{false};
    }
    const auto from = internNode(rel.from);
    const auto to = internNode(rel.to);
    const auto edge = static_cast<uint32_t>(edges_.size());
    edges_.push_back(std::move(rel));
    edgeEnds_.emplace_back(from, to);
    outEdges_[from].push_back(edge);
    inEdges_[to].push_back(edge);
    return AddOutcome{true};
}

size_t RelationshipGraph::merge(const std::vector<Relationship>& edges) {
    size_t added = 0;
    for (const auto& rel : edges) {
        if (addRelationship(rel).added) {
            ++added;
        }
    }
    return added;
}

bool RelationshipGraph::contains(std::string_view from, std::string_view to,
                                 std::string_view relation) const {
    return edgeKeys_.contains(
        RelationshipKey{std::string(from), std::string(to), std::string(relation)});
}

bool RelationshipGraph::hasNode(std::string_view key) const {
    return findNode(key).has_value();
}

Result<ConnectionsByDepth> RelationshipGraph::traverse(std::string_view start, int maxDepth,
                                                       TraversalDirection direction) const {
    if (maxDepth < 1) {
        return Error{ErrorCode::InvalidArgument,
                     "Traversal depth must be at least 1, got " + std::to_string(maxDepth)};
    }
    auto startNode = findNode(start);
    if (!startNode) {
        return Error{ErrorCode::NotFound, "No relationships for '" + std::string(start) + "'"};
    }

    const bool wantOut = direction != TraversalDirection::In;
    const bool wantIn = direction != TraversalDirection::Out;

    ConnectionsByDepth result;
    std::vector<bool> visited(nodeKeys_.size(), false);
    std::deque<std::pair<uint32_t, int>> queue;

    visited[*startNode] = true;
    queue.emplace_back(*startNode, 0);

    auto discover = [&](uint32_t node, int depth) {
        if (depth < maxDepth && !visited[node]) {
            visited[node] = true;
            queue.emplace_back(node, depth);
        }
    };

    while (!queue.empty()) {
        auto [node, depth] = queue.front();
        queue.pop_front();

        if (wantOut) {
            for (auto e : outEdges_[node]) {
                const auto& rel = edges_[e];
                result[depth].push_back(Connection{rel.from, rel.to, ConnectionType::Outbound,
                                                   rel.relation, rel.since, rel.source});
                discover(edgeEnds_[e].second, depth + 1);
            }
        }
        if (wantIn) {
            for (auto e : inEdges_[node]) {
                const auto& rel = edges_[e];
                result[depth].push_back(Connection{rel.from, rel.to, ConnectionType::Inbound,
                                                   rel.relation, rel.since, rel.source});
                discover(edgeEnds_[e].first, depth + 1);
            }
        }
    }

    spdlog::debug("Traversal from {} (depth {}) reached {} depth levels", start, maxDepth,
                  result.size());
    return result;
}

GraphStats RelationshipGraph::stats() const {
    std::map<std::string, size_t> byRelation;
    std::map<std::string, size_t> byTypePair;
    for (const auto& rel : edges_) {
        ++byRelation[rel.relation];
        ++byTypePair[entityType(rel.from) + " -> " + entityType(rel.to)];
    }

    GraphStats s;
    s.totalEdges = edges_.size();
    s.nodeCount = nodeKeys_.size();
    s.byRelation = sortedCounts(byRelation);
    s.byTypePair = sortedCounts(byTypePair);
    return s;
}

} // namespace recall::graph
