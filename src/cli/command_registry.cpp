// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/cli/command_registry.h>
#include <recall/cli/recall_cli.h>

namespace recall::cli {

// Factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createRememberCommand();
std::unique_ptr<ICommand> createDedupCommand();
std::unique_ptr<ICommand> createGraphCommand();
std::unique_ptr<ICommand> createSalienceCommand();
std::unique_ptr<ICommand> createSearchCommand();

void CommandRegistry::registerAllCommands(RecallCLI* cli) {
    cli->registerCommand(CommandRegistry::createRememberCommand());
    cli->registerCommand(CommandRegistry::createDedupCommand());
    cli->registerCommand(CommandRegistry::createGraphCommand());
    cli->registerCommand(CommandRegistry::createSalienceCommand());
    cli->registerCommand(CommandRegistry::createSearchCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createRememberCommand() {
    return ::recall::cli::createRememberCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createDedupCommand() {
    return ::recall::cli::createDedupCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createGraphCommand() {
    return ::recall::cli::createGraphCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createSalienceCommand() {
    return ::recall::cli::createSalienceCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createSearchCommand() {
    return ::recall::cli::createSearchCommand();
}

} // namespace recall::cli
