// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace recall::config {

// Connection settings for the external semantic-search service
struct SemanticSearchConfig {
    bool enabled = true;
    std::string host = "localhost";
    std::uint16_t port = 37777;
    std::chrono::milliseconds timeout{10'000};
};

/**
 * Explicit configuration handed to every component at construction.
 *
 * Built from defaults, then the TOML file, then RECALL_* environment variables.
 * Command-line flags are applied on top by the CLI.
 */
struct RecallConfig {
    std::filesystem::path workspaceRoot = std::filesystem::current_path();
    std::string logLevel = "warn";

    SemanticSearchConfig semantic;

    // Relationship graph
    int traversalDepth = 2;

    // Salience decay window in days
    int decayWindowDays = 365;

    // Retrieval fusion
    double vectorWeight = 0.6;
    double keywordWeight = 0.4;
    std::size_t searchLimit = 10;

    // Rejects out-of-range weights, depths, windows and ports
    Result<void> validate() const;
};

// Defaults overlaid with @p configPath (missing file ignored) and the environment.
// Malformed values are reported as InvalidArgument.
Result<RecallConfig> loadConfig(const std::filesystem::path& configPath);

// Apply RECALL_* environment overrides to @p cfg
Result<void> applyEnvironment(RecallConfig& cfg);

} // namespace recall::config
