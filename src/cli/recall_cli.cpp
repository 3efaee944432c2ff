// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/cli/command_registry.h>
#include <recall/cli/recall_cli.h>
#include <recall/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace recall::cli {

namespace fs = std::filesystem;

RecallCLI::RecallCLI() {
    app_ = std::make_unique<CLI::App>("recall - memory graph and retrieval engine", "recall");
    app_->require_subcommand(1);

    app_->add_option("--workspace,-w", workspaceOpt_,
                     "Workspace root (default: RECALL_WORKSPACE_DIR or current directory)");
    app_->add_option("--config,-c", configOpt_,
                     "Config file (default: $XDG_CONFIG_HOME/recall/config.toml)");
    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
    app_->add_flag("--json", jsonOutput_, "Output as JSON");
}

RecallCLI::~RecallCLI() = default;

void RecallCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void RecallCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

const store::FactStore& RecallCLI::getFactStore() {
    if (!factStore_) {
        factStore_ = std::make_unique<store::FactStore>(config_.workspaceRoot);
    }
    return *factStore_;
}

std::optional<spdlog::level::level_enum> RecallCLI::parseLogLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

Result<void> RecallCLI::loadConfiguration() {
    auto loaded = config::loadConfig(config::get_config_path(configOpt_));
    if (!loaded) {
        return loaded.error();
    }
    config_ = std::move(loaded).value();

    // Flags win over file and environment
    if (!workspaceOpt_.empty()) {
        config_.workspaceRoot = config::expand_tilde(workspaceOpt_);
    }

    std::error_code ec;
    auto absolute = fs::absolute(config_.workspaceRoot, ec);
    if (!ec) {
        config_.workspaceRoot = absolute.lexically_normal();
    }
    return config_.validate();
}

void RecallCLI::applyLogLevel() {
    // Precedence: env RECALL_LOG_LEVEL > --verbose > config log_level > warn
    if (auto env = config::get_env("RECALL_LOG_LEVEL")) {
        if (auto lvl = parseLogLevel(*env)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    if (auto lvl = parseLogLevel(config_.logLevel)) {
        spdlog::set_level(*lvl);
        return;
    }
    spdlog::set_level(spdlog::level::warn);
}

int RecallCLI::run(int argc, char* argv[]) {
    CommandRegistry::registerAllCommands(this);

    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    if (auto r = loadConfiguration(); !r) {
        applyLogLevel();
        std::cerr << "Configuration error: " << r.error().message << "\n";
        return 1;
    }
    applyLogLevel();
    spdlog::debug("Workspace: {}", config_.workspaceRoot.string());

    if (!pendingCommand_) {
        std::cerr << app_->help() << "\n";
        return 1;
    }

    auto result = pendingCommand_->execute();
    if (!result) {
        spdlog::debug("{} failed: {}", pendingCommand_->getName(),
                      errorToString(result.error().code));
        std::cerr << "Error: " << result.error().message << "\n";
        return 1;
    }
    return 0;
}

} // namespace recall::cli
