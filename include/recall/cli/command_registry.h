// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/cli/command.h>

#include <memory>

namespace recall::cli {

class RecallCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    static void registerAllCommands(RecallCLI* cli);

    static std::unique_ptr<ICommand> createRememberCommand();
    static std::unique_ptr<ICommand> createDedupCommand();
    static std::unique_ptr<ICommand> createGraphCommand();
    static std::unique_ptr<ICommand> createSalienceCommand();
    static std::unique_ptr<ICommand> createSearchCommand();
};

} // namespace recall::cli
