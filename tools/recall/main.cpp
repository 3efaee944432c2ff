// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <recall/cli/recall_cli.h>

#include <exception>

int main(int argc, char* argv[]) {
    try {
        // Logs go to stderr so command output on stdout stays parseable
        spdlog::set_default_logger(spdlog::stderr_color_mt("recall"));
        // Conservative default; RecallCLI::run() adjusts based on flags and config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        recall::cli::RecallCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
