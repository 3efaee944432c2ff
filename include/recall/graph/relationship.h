// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <optional>
#include <string>
#include <tuple>

namespace recall::graph {

// (from, to, relation)
using RelationshipKey = std::tuple<std::string, std::string, std::string>;

// Directed, labeled edge between two entity keys ("type/name")
struct Relationship {
    std::string from;
    std::string to;
    std::string relation;
    std::string since;
    std::optional<std::string> source;

    RelationshipKey key() const { return {from, to, relation}; }
};

enum class TraversalDirection { Out, In, Both };

enum class ConnectionType { Outbound, Inbound };

inline constexpr const char* connectionTypeToString(ConnectionType t) noexcept {
    return t == ConnectionType::Outbound ? "outbound" : "inbound";
}

// One edge reported during traversal, seen from the expanded node
struct Connection {
    std::string from;
    std::string to;
    ConnectionType type = ConnectionType::Outbound;
    std::string relation;
    std::string since;
    std::optional<std::string> source;
};

// Result of addRelationship; re-adding an existing edge is not an error
struct AddOutcome {
    bool added = false;
};

} // namespace recall::graph
