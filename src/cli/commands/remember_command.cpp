// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>

#include <recall/cli/command.h>
#include <recall/cli/recall_cli.h>
#include <recall/dedup/dedup_engine.h>
#include <recall/store/entity_key.h>

namespace recall::cli {

using json = nlohmann::json;

class RememberCommand : public ICommand {
public:
    std::string getName() const override { return "remember"; }
    std::string getDescription() const override {
        return "Store a fact for an entity unless it duplicates an existing one";
    }

    void registerCommand(CLI::App& app, RecallCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("entity", entity_, "Entity key, e.g. people/john")->required();
        cmd->add_option("fact", fact_, "Fact text")->required();
        cmd->add_option("--category", category_, "Fact category")->default_val("general");
        cmd->add_option("--type", type_, "Fact classification")->default_val("fact");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto key = cli_->getFactStore().resolveKey(entity_);
        if (!key) {
            return key.error();
        }

        store::Fact fact;
        fact.fact = fact_;
        fact.category = category_;
        fact.type = type_;

        dedup::DedupEngine engine(cli_->getFactStore());
        auto outcome = engine.ingestFact(key.value(), std::move(fact));
        if (!outcome) {
            return outcome.error();
        }
        const auto& o = outcome.value();

        if (cli_->getJsonOutput()) {
            json out;
            out["entity"] = key.value().str();
            out["status"] = dedup::ingestStatusToString(o.status);
            out["fingerprint"] = o.fingerprint;
            if (o.stored) {
                out["id"] = o.stored->id;
                out["timestamp"] = o.stored->timestamp;
            }
            if (o.matchedFactId) {
                out["matched_fact_id"] = *o.matchedFactId;
            }
            if (o.firstSeen) {
                out["first_seen"] = *o.firstSeen;
            }
            if (o.originalSource) {
                out["original_source"] = *o.originalSource;
            }
            std::cout << out.dump(2) << std::endl;
            return Result<void>();
        }

        switch (o.status) {
            case dedup::IngestStatus::Written:
                std::cout << "Stored fact " << o.stored->id << " for " << key.value().str()
                          << "\n";
                break;
            case dedup::IngestStatus::ExactDuplicate:
                std::cout << "Duplicate: already seen " << o.firstSeen.value_or("?") << " in "
                          << o.originalSource.value_or("unknown source") << "\n";
                break;
            case dedup::IngestStatus::NearDuplicate:
                std::cout << "Near-duplicate of fact " << *o.matchedFactId << " in "
                          << key.value().str() << "; not stored\n";
                break;
        }
        return Result<void>();
    }

private:
    RecallCLI* cli_{nullptr};
    std::string entity_;
    std::string fact_;
    std::string category_;
    std::string type_;
};

std::unique_ptr<ICommand> createRememberCommand() {
    return std::make_unique<RememberCommand>();
}

} // namespace recall::cli
