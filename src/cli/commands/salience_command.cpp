// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include <recall/cli/command.h>
#include <recall/cli/recall_cli.h>
#include <recall/common/text_utils.h>
#include <recall/core/time_parser.h>
#include <recall/salience/salience_scorer.h>
#include <recall/store/entity_key.h>

namespace recall::cli {

using json = nlohmann::json;

class SalienceCommand : public ICommand {
public:
    std::string getName() const override { return "salience"; }
    std::string getDescription() const override {
        return "Score facts by recency and access frequency";
    }

    void registerCommand(CLI::App& app, RecallCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->require_subcommand(1);

        cmd->add_subcommand("migrate", "Add salience fields to legacy facts")
            ->callback([this]() { schedule(Action::Migrate); });
        cmd->add_subcommand("sweep", "Periodic salience maintenance pass")
            ->callback([this]() { schedule(Action::Sweep); });

        auto* entity = cmd->add_subcommand("entity", "Facts of an entity ranked by salience");
        entity->add_option("entity", entity_, "Entity key, e.g. people/john")->required();
        entity->add_option("--limit,-l", limit_, "Maximum facts to show")
            ->default_val(10)
            ->check(CLI::PositiveNumber);
        entity->callback([this]() { schedule(Action::Entity); });

        auto* access = cmd->add_subcommand("access", "Record an access to a fact");
        access->add_option("entity", entity_, "Entity key")->required();
        access->add_option("fact-id", factId_, "Fact id")->required();
        access->callback([this]() { schedule(Action::Access); });

        cmd->add_subcommand("stats", "Salience statistics")->callback([this]() {
            schedule(Action::Stats);
        });

        auto* score = cmd->add_subcommand("score", "Explain the score for given inputs");
        score->add_option("last-accessed", lastAccessed_, "YYYY-MM-DD, today or yesterday")
            ->required();
        score->add_option("access-count", accessCount_, "Number of accesses")
            ->required()
            ->check(CLI::NonNegativeNumber);
        score->callback([this]() { schedule(Action::Score); });
    }

    Result<void> execute() override {
        salience::SalienceScorer scorer(cli_->getConfig().decayWindowDays);
        switch (action_) {
            case Action::Migrate:
                return migrate(scorer, "Migration");
            case Action::Sweep:
                return migrate(scorer, "Decay sweep");
            case Action::Entity:
                return entity(scorer);
            case Action::Access:
                return access(scorer);
            case Action::Stats:
                return stats(scorer);
            case Action::Score:
                return score(scorer);
        }
        return Error{ErrorCode::InvalidArgument, "No salience action selected"};
    }

private:
    enum class Action { Migrate, Sweep, Entity, Access, Stats, Score };

    void schedule(Action a) {
        action_ = a;
        cli_->setPendingCommand(this);
    }

    Result<void> migrate(const salience::SalienceScorer& scorer, const char* label) {
        auto report = scorer.migrate(cli_->getFactStore());
        if (cli_->getJsonOutput()) {
            std::cout << json{{"files_processed", report.filesProcessed},
                              {"items_updated", report.factsUpdated},
                              {"errors", report.errors}}
                             .dump(2)
                      << std::endl;
            return Result<void>();
        }
        std::cout << label << " completed:\n"
                  << "Files processed: " << report.filesProcessed << "\n"
                  << "Items updated: " << report.factsUpdated << "\n";
        if (!report.errors.empty()) {
            std::cout << "Errors: " << report.errors.size() << "\n";
            for (size_t i = 0; i < report.errors.size() && i < 5; ++i) {
                std::cout << "  " << report.errors[i] << "\n";
            }
        }
        return Result<void>();
    }

    Result<void> entity(const salience::SalienceScorer& scorer) {
        const auto& store = cli_->getFactStore();
        auto key = store.resolveKey(entity_);
        if (!key) {
            return key.error();
        }
        if (!store.hasEntity(key.value())) {
            return Error{ErrorCode::NotFound, "Entity '" + key.value().str() + "' not found"};
        }
        auto ranked = scorer.rankByScore(store.loadFacts(key.value()), limit_);

        if (cli_->getJsonOutput()) {
            json arr = json::array();
            for (const auto& sf : ranked) {
                arr.push_back({{"id", sf.fact.id},
                               {"fact", sf.fact.fact},
                               {"salience_score", sf.score},
                               {"accessCount", sf.fact.effectiveAccessCount()},
                               {"lastAccessed", sf.fact.effectiveLastAccessed()}});
            }
            std::cout << json{{"entity", key.value().str()}, {"items", arr}}.dump(2)
                      << std::endl;
            return Result<void>();
        }

        std::cout << key.value().str() << ":\n";
        size_t i = 0;
        for (const auto& sf : ranked) {
            std::cout << fmt::format("{:2d}. [{:.4f}] {}\n", ++i, sf.score,
                                     common::previewText(sf.fact.fact, 80))
                      << "     ID: " << sf.fact.id << " | Access: "
                      << sf.fact.effectiveAccessCount()
                      << "x | Last: " << sf.fact.lastAccessed.value_or("N/A") << "\n";
        }
        return Result<void>();
    }

    Result<void> access(const salience::SalienceScorer& scorer) {
        auto key = cli_->getFactStore().resolveKey(entity_);
        if (!key) {
            return key.error();
        }
        auto updated = scorer.recordAccess(cli_->getFactStore(), key.value(), factId_);
        if (!updated) {
            return updated.error();
        }
        const auto& f = updated.value();
        if (cli_->getJsonOutput()) {
            std::cout << json{{"id", f.id},
                              {"lastAccessed", f.lastAccessed.value_or("")},
                              {"accessCount", f.effectiveAccessCount()}}
                             .dump(2)
                      << std::endl;
        } else {
            std::cout << "Updated access for " << f.id << " in " << key.value().str()
                      << " (count " << f.effectiveAccessCount() << ")\n";
        }
        return Result<void>();
    }

    Result<void> stats(const salience::SalienceScorer& scorer) {
        auto s = scorer.stats(cli_->getFactStore());
        if (cli_->getJsonOutput()) {
            std::cout << json{{"total_items", s.totalFacts},
                              {"items_with_salience", s.factsWithSalience},
                              {"avg_access_count", s.averageAccessCount},
                              {"avg_salience_score", s.averageScore},
                              {"max_salience_score", s.maxScore},
                              {"high_salience_items", s.highSalience},
                              {"low_salience_items", s.lowSalience}}
                             .dump(2)
                      << std::endl;
            return Result<void>();
        }
        const double coverage =
            s.totalFacts > 0 ? 100.0 * static_cast<double>(s.factsWithSalience) /
                                   static_cast<double>(s.totalFacts)
                             : 0.0;
        std::cout << "Total items: " << s.totalFacts << "\n"
                  << "Items with salience data: " << s.factsWithSalience << "\n"
                  << fmt::format("Coverage: {:.1f}%\n", coverage);
        if (s.factsWithSalience > 0) {
            std::cout << fmt::format("\nAverage score: {:.4f}\nMaximum score: {:.4f}\n",
                                     s.averageScore, s.maxScore)
                      << "High salience items (>1.0): " << s.highSalience << "\n"
                      << "Low salience items (<0.1): " << s.lowSalience << "\n"
                      << fmt::format("Average access count: {:.2f}\n", s.averageAccessCount);
        }
        return Result<void>();
    }

    Result<void> score(const salience::SalienceScorer& scorer) {
        // Natural words resolve to a date; anything else is scored as given
        std::string when = lastAccessed_;
        if (auto resolved = core::TimeParser::parseDateOrNatural(lastAccessed_, core::systemNow())) {
            when = core::TimeParser::formatDate(resolved.value());
        }
        auto b = scorer.explain(when, accessCount_);
        if (cli_->getJsonOutput()) {
            std::cout << json{{"last_accessed", lastAccessed_},
                              {"access_count", accessCount_},
                              {"recency_weight", b.recencyWeight},
                              {"frequency_weight", b.frequencyWeight},
                              {"score", b.score}}
                             .dump(2)
                      << std::endl;
            return Result<void>();
        }
        std::cout << "Last accessed: " << lastAccessed_ << "\n"
                  << "Access count: " << accessCount_ << "\n"
                  << fmt::format("Recency weight: {:.4f}\nFrequency weight: {:.4f}\n"
                                 "Final score: {:.4f}\n",
                                 b.recencyWeight, b.frequencyWeight, b.score);
        return Result<void>();
    }

    RecallCLI* cli_{nullptr};
    Action action_{Action::Stats};

    std::string entity_;
    size_t limit_{10};
    std::string factId_;
    std::string lastAccessed_;
    std::int64_t accessCount_{0};
};

std::unique_ptr<ICommand> createSalienceCommand() {
    return std::make_unique<SalienceCommand>();
}

} // namespace recall::cli
