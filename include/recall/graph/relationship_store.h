// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/types.h>
#include <recall/graph/relationship.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <vector>

namespace recall::graph {

// Contents of patterns.json
struct RelationshipSet {
    int version = 1;
    std::vector<Relationship> relationships;
    // Auxiliary records owned by other tools; written back unchanged
    nlohmann::json behavioralSequences = nlohmann::json::array();
};

/**
 * Persists the global relationship set at <workspace>/patterns.json.
 *
 * A missing or corrupt file loads as an empty set. Records lacking a string
 * from/to/relation are dropped with a warning.
 */
class RelationshipStore {
public:
    static constexpr const char* kFileName = "patterns.json";

    explicit RelationshipStore(const std::filesystem::path& workspaceRoot);

    const std::filesystem::path& path() const noexcept { return path_; }

    RelationshipSet load() const;
    Result<void> save(const RelationshipSet& set) const;

private:
    std::filesystem::path path_;
};

} // namespace recall::graph
