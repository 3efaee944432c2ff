// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <recall/cli/command.h>
#include <recall/cli/recall_cli.h>
#include <recall/graph/graph_service.h>

namespace recall::cli {

using json = nlohmann::json;

namespace {

std::optional<graph::TraversalDirection> parseDirection(const std::string& s) {
    if (s == "out")
        return graph::TraversalDirection::Out;
    if (s == "in")
        return graph::TraversalDirection::In;
    if (s == "both")
        return graph::TraversalDirection::Both;
    return std::nullopt;
}

json connectionToJson(const graph::Connection& c) {
    json j{{"from", c.from},
           {"to", c.to},
           {"type", graph::connectionTypeToString(c.type)},
           {"relation", c.relation},
           {"since", c.since}};
    j["source"] = c.source ? json(*c.source) : json(nullptr);
    return j;
}

} // namespace

class GraphCommand : public ICommand {
public:
    std::string getName() const override { return "graph"; }
    std::string getDescription() const override {
        return "Detect, edit and traverse entity relationships";
    }

    void registerCommand(CLI::App& app, RecallCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->require_subcommand(1);

        cmd->add_subcommand("scan", "Detect relationships from facts and notes")
            ->callback([this]() { schedule(Action::Scan); });

        auto* show = cmd->add_subcommand("show", "Show connections of an entity");
        show->add_option("entity", entity_, "Entity key, e.g. people/john")->required();
        depthOpt_ = show->add_option("--depth,-d", depth_,
                                     "Traversal depth; edges are listed at levels 0 to depth-1, "
                                     "so no edge reaches past depth hops (default from config)")
                        ->check(CLI::PositiveNumber);
        show->add_option("--direction", direction_, "out, in or both")
            ->default_val("both")
            ->check(CLI::IsMember({"out", "in", "both"}));
        show->callback([this]() { schedule(Action::Show); });

        auto* add = cmd->add_subcommand("add", "Add a relationship");
        add->add_option("from", from_, "Source entity")->required();
        add->add_option("to", to_, "Target entity")->required();
        add->add_option("relation", relation_, "Relation label, e.g. works_at")->required();
        sinceOpt_ = add->add_option("--since", since_, "YYYY-MM-DD, today or yesterday");
        add->callback([this]() { schedule(Action::Add); });

        cmd->add_subcommand("stats", "Relationship statistics")->callback([this]() {
            schedule(Action::Stats);
        });
        cmd->add_subcommand("list", "List entities by type")->callback([this]() {
            schedule(Action::List);
        });
    }

    Result<void> execute() override {
        graph::GraphService service(cli_->getFactStore());
        switch (action_) {
            case Action::Scan:
                return scan(service);
            case Action::Show:
                return show(service);
            case Action::Add:
                return add(service);
            case Action::Stats:
                return stats(service);
            case Action::List:
                return list(service);
        }
        return Error{ErrorCode::InvalidArgument, "No graph action selected"};
    }

private:
    enum class Action { Scan, Show, Add, Stats, List };

    void schedule(Action a) {
        action_ = a;
        cli_->setPendingCommand(this);
    }

    Result<void> scan(graph::GraphService& service) {
        auto report = service.scan();
        if (!report) {
            return report.error();
        }
        const auto& r = report.value();
        if (cli_->getJsonOutput()) {
            std::cout << json{{"detected", r.detected}, {"added", r.added}, {"total", r.total}}
                             .dump(2)
                      << std::endl;
        } else {
            std::cout << "Detected " << r.detected << " unique relationships\n"
                      << "Added " << r.added << " new relationships (" << r.total
                      << " total)\n";
        }
        return Result<void>();
    }

    Result<void> show(graph::GraphService& service) {
        const int depth = depthOpt_->count() > 0 ? depth_ : cli_->getConfig().traversalDepth;
        auto dir = parseDirection(direction_);
        if (!dir) {
            return Error{ErrorCode::InvalidArgument, "Unknown direction '" + direction_ + "'"};
        }
        auto conns = service.connections(entity_, depth, *dir);
        if (!conns) {
            return conns.error();
        }

        if (cli_->getJsonOutput()) {
            json byDepth = json::object();
            for (const auto& [d, list] : conns.value()) {
                json arr = json::array();
                for (const auto& c : list) {
                    arr.push_back(connectionToJson(c));
                }
                byDepth[std::to_string(d)] = std::move(arr);
            }
            std::cout << json{{"entity", entity_}, {"depth", depth}, {"connections", byDepth}}
                             .dump(2)
                      << std::endl;
            return Result<void>();
        }

        if (conns.value().empty()) {
            std::cout << "No connections found for " << entity_ << "\n";
            return Result<void>();
        }
        std::cout << "Connections for " << entity_ << ":\n";
        for (const auto& [d, list] : conns.value()) {
            std::cout << "\nDepth " << d << ":\n";
            for (const auto& c : list) {
                const char* arrow = c.type == graph::ConnectionType::Outbound ? "->" : "<-";
                const auto& other = c.type == graph::ConnectionType::Outbound ? c.to : c.from;
                const auto& self = c.type == graph::ConnectionType::Outbound ? c.from : c.to;
                std::cout << "  " << self << " " << arrow << " " << other << " (" << c.relation
                          << ")\n";
                if (!c.since.empty()) {
                    std::cout << "    Since: " << c.since << "\n";
                }
                if (c.source) {
                    std::cout << "    Source: " << *c.source << "\n";
                }
            }
        }
        return Result<void>();
    }

    Result<void> add(graph::GraphService& service) {
        std::optional<std::string> since;
        if (sinceOpt_->count() > 0) {
            since = since_;
        }
        auto outcome = service.addRelationship(from_, to_, relation_, since);
        if (!outcome) {
            return outcome.error();
        }
        const bool added = outcome.value().added;
        if (cli_->getJsonOutput()) {
            std::cout << json{{"added", added}}.dump(2) << std::endl;
        } else if (added) {
            std::cout << "Added relationship: " << from_ << " -> " << to_ << " (" << relation_
                      << ")\n";
        } else {
            std::cout << "Relationship already exists: " << from_ << " -> " << to_ << " ("
                      << relation_ << ")\n";
        }
        return Result<void>();
    }

    Result<void> stats(graph::GraphService& service) {
        auto s = service.stats();
        if (cli_->getJsonOutput()) {
            json byRelation = json::object();
            for (const auto& [rel, n] : s.byRelation) {
                byRelation[rel] = n;
            }
            json byType = json::object();
            for (const auto& [pair, n] : s.byTypePair) {
                byType[pair] = n;
            }
            std::cout << json{{"total", s.totalEdges},
                              {"entities", s.nodeCount},
                              {"by_relation", byRelation},
                              {"by_entity_type", byType}}
                             .dump(2)
                      << std::endl;
            return Result<void>();
        }
        if (s.totalEdges == 0) {
            std::cout << "No relationships found. Run 'recall graph scan' to detect them.\n";
            return Result<void>();
        }
        std::cout << "Total relationships: " << s.totalEdges << "\n\nBy relation type:\n";
        for (const auto& [rel, n] : s.byRelation) {
            std::cout << "  " << rel << ": " << n << "\n";
        }
        std::cout << "\nBy entity type:\n";
        const auto shown = std::min<size_t>(s.byTypePair.size(), 10);
        for (size_t i = 0; i < shown; ++i) {
            std::cout << "  " << s.byTypePair[i].first << ": " << s.byTypePair[i].second << "\n";
        }
        return Result<void>();
    }

    Result<void> list(graph::GraphService& service) {
        auto byType = service.entitiesByType();
        if (cli_->getJsonOutput()) {
            std::cout << json(byType).dump(2) << std::endl;
            return Result<void>();
        }
        if (byType.empty()) {
            std::cout << "No entities found\n";
            return Result<void>();
        }
        for (const auto& [type, names] : byType) {
            std::cout << "\n" << type << " (" << names.size() << "):\n";
            for (const auto& name : names) {
                std::cout << "  " << type << "/" << name << "\n";
            }
        }
        return Result<void>();
    }

    RecallCLI* cli_{nullptr};
    Action action_{Action::Stats};

    std::string entity_;
    int depth_{2};
    CLI::Option* depthOpt_{nullptr};
    std::string direction_{"both"};

    std::string from_;
    std::string to_;
    std::string relation_;
    std::string since_;
    CLI::Option* sinceOpt_{nullptr};
};

std::unique_ptr<ICommand> createGraphCommand() {
    return std::make_unique<GraphCommand>();
}

} // namespace recall::cli
