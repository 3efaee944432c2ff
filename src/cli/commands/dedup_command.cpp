// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <recall/cli/command.h>
#include <recall/cli/recall_cli.h>
#include <recall/dedup/dedup_engine.h>

namespace recall::cli {

using json = nlohmann::json;

namespace {

std::string shortHash(const std::string& fp) {
    return fp.substr(0, 12) + "...";
}

} // namespace

class DedupCommand : public ICommand {
public:
    std::string getName() const override { return "dedup"; }
    std::string getDescription() const override {
        return "Check and maintain the content fingerprint index";
    }

    void registerCommand(CLI::App& app, RecallCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->require_subcommand(1);

        auto* check = cmd->add_subcommand("check", "Check whether text was seen before");
        check->add_option("text", text_, "Text to check")->required();
        check->callback([this]() { schedule(Action::Check); });

        cmd->add_subcommand("scan", "Rebuild the index and list duplicates")
            ->callback([this]() { schedule(Action::Scan); });
        cmd->add_subcommand("rebuild", "Rebuild the index from facts and notes")
            ->callback([this]() { schedule(Action::Rebuild); });
        cmd->add_subcommand("stats", "Show index statistics")->callback([this]() {
            schedule(Action::Stats);
        });
        cmd->add_subcommand("clean", "Delete the index")->callback([this]() {
            schedule(Action::Clean);
        });
    }

    Result<void> execute() override {
        dedup::DedupEngine engine(cli_->getFactStore());
        switch (action_) {
            case Action::Check:
                return check(engine);
            case Action::Scan:
                return rebuild(engine, true);
            case Action::Rebuild:
                return rebuild(engine, false);
            case Action::Stats:
                return stats(engine);
            case Action::Clean:
                return clean(engine);
        }
        return Error{ErrorCode::InvalidArgument, "No dedup action selected"};
    }

private:
    enum class Action { Check, Scan, Rebuild, Stats, Clean };

    void schedule(Action a) {
        action_ = a;
        cli_->setPendingCommand(this);
    }

    std::string joinedText() const {
        std::string out;
        for (const auto& w : text_) {
            if (!out.empty()) {
                out += ' ';
            }
            out += w;
        }
        return out;
    }

    Result<void> check(dedup::DedupEngine& engine) {
        const auto text = joinedText();
        if (text.empty()) {
            return Error{ErrorCode::InvalidArgument, "Nothing to check"};
        }
        auto result = engine.checkDuplicate(text);
        if (cli_->getJsonOutput()) {
            json out{{"is_duplicate", result.isDuplicate}, {"hash", result.fingerprint}};
            if (result.isDuplicate) {
                out["first_seen"] = result.firstSeen.value_or("");
                out["original_source"] = result.originalSource.value_or("");
            }
            std::cout << out.dump(2) << std::endl;
            return Result<void>();
        }
        if (result.isDuplicate) {
            std::cout << "DUPLICATE FOUND\n"
                      << "Hash: " << shortHash(result.fingerprint) << "\n"
                      << "First seen: " << result.firstSeen.value_or("?") << "\n"
                      << "Original source: " << result.originalSource.value_or("unknown")
                      << "\n";
        } else {
            std::cout << "Not a duplicate\n"
                      << "Hash: " << shortHash(result.fingerprint) << "\n";
        }
        return Result<void>();
    }

    Result<void> rebuild(dedup::DedupEngine& engine, bool showDuplicates) {
        auto report = engine.rebuildIndex();
        if (!report) {
            return report.error();
        }
        const auto& r = report.value();

        if (cli_->getJsonOutput()) {
            json dups = json::array();
            for (const auto& d : r.duplicates) {
                dups.push_back({{"original_source", d.originalSource},
                                {"duplicate_source", d.duplicateSource},
                                {"content", d.contentPreview},
                                {"hash", d.fingerprint}});
            }
            json out{{"total_processed", r.totalProcessed},
                     {"duplicates_found", r.duplicates.size()},
                     {"hash_index_size", r.indexSize},
                     {"duplicates", std::move(dups)}};
            std::cout << out.dump(2) << std::endl;
            return Result<void>();
        }

        std::cout << "Total items processed: " << r.totalProcessed << "\n"
                  << "Duplicates found: " << r.duplicates.size() << "\n"
                  << "Hash index size: " << r.indexSize << "\n";
        if (showDuplicates) {
            size_t i = 0;
            for (const auto& d : r.duplicates) {
                std::cout << "\nDuplicate #" << ++i << ":\n"
                          << "  Original: " << d.originalSource << "\n"
                          << "  Duplicate: " << d.duplicateSource << "\n"
                          << "  Content: " << d.contentPreview << "\n"
                          << "  Hash: " << shortHash(d.fingerprint) << "\n";
            }
        }
        return Result<void>();
    }

    Result<void> stats(dedup::DedupEngine& engine) {
        auto s = engine.stats();
        if (cli_->getJsonOutput()) {
            json out{{"total", s.totalEntries},
                     {"items.json", s.itemsEntries},
                     {"daily_notes", s.noteEntries},
                     {"other", s.otherEntries},
                     {"index_file", s.indexPath.string()},
                     {"index_bytes", s.fileBytes}};
            std::cout << out.dump(2) << std::endl;
            return Result<void>();
        }
        if (s.totalEntries == 0) {
            std::cout << "No hash index found. Run 'recall dedup scan' first.\n";
            return Result<void>();
        }
        std::cout << "Total unique hashes: " << s.totalEntries << "\n"
                  << "items.json: " << s.itemsEntries << "\n"
                  << "daily_notes: " << s.noteEntries << "\n"
                  << "other: " << s.otherEntries << "\n"
                  << "Index file: " << s.indexPath.string() << "\n"
                  << "Index size: " << s.fileBytes << " bytes\n";
        return Result<void>();
    }

    Result<void> clean(dedup::DedupEngine& engine) {
        auto removed = engine.clean();
        if (!removed) {
            return removed.error();
        }
        if (cli_->getJsonOutput()) {
            std::cout << json{{"removed", removed.value()}}.dump(2) << std::endl;
        } else if (removed.value()) {
            std::cout << "Removed hash index: " << engine.indexPath().string() << "\n";
        } else {
            std::cout << "No hash index to clean\n";
        }
        return Result<void>();
    }

    RecallCLI* cli_{nullptr};
    Action action_{Action::Stats};
    std::vector<std::string> text_;
};

std::unique_ptr<ICommand> createDedupCommand() {
    return std::make_unique<DedupCommand>();
}

} // namespace recall::cli
