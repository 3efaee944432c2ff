// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <CLI/CLI.hpp>
#include <recall/cli/command.h>
#include <recall/config/recall_config.h>
#include <recall/store/fact_store.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace recall::cli {

/**
 * Main CLI application class
 */
class RecallCLI {
public:
    RecallCLI();
    ~RecallCLI();

    /**
     * Run the CLI with given arguments; returns the process exit code
     */
    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until parsing and configuration are done
     */
    void setPendingCommand(ICommand* cmd);

    /**
     * Effective configuration: defaults, config file, environment, then flags
     */
    const config::RecallConfig& getConfig() const { return config_; }

    /**
     * Fact store rooted at the configured workspace (lazy)
     */
    const store::FactStore& getFactStore();

    bool getVerbose() const { return verbose_; }
    bool getJsonOutput() const { return jsonOutput_; }

    // Accepts trace, debug, info, warn/warning, error/err, critical/crit, off/none/silent
    static std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& s);

private:
    Result<void> loadConfiguration();
    void applyLogLevel();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    std::string workspaceOpt_;
    std::string configOpt_;
    bool verbose_{false};
    bool jsonOutput_{false};

    config::RecallConfig config_;
    std::unique_ptr<store::FactStore> factStore_;
};

} // namespace recall::cli
