// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <CLI/CLI.hpp>
#include <recall/core/types.h>

#include <memory>
#include <string>

namespace recall::cli {

class RecallCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "search", "graph")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, RecallCLI* cli) = 0;

    /**
     * Execute the command after parsing and configuration are complete
     */
    virtual Result<void> execute() = 0;
};

} // namespace recall::cli
