// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <recall/cli/command.h>
#include <recall/cli/recall_cli.h>
#include <recall/search/hybrid_search.h>
#include <recall/search/keyword_search.h>
#include <recall/search/semantic_search_client.h>

namespace recall::cli {

using json = nlohmann::json;

class SearchCommand : public ICommand {
public:
    std::string getName() const override { return "search"; }
    std::string getDescription() const override {
        return "Hybrid keyword and semantic search over facts and notes";
    }

    void registerCommand(CLI::App& app, RecallCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("query", query_, "Search query")->required();
        limitOpt_ = cmd->add_option("--limit,-l", limit_, "Maximum results (default from config)")
                        ->check(CLI::PositiveNumber);
        vectorWeightOpt_ =
            cmd->add_option("--vector-weight", vectorWeight_, "Vector path weight (0.0-1.0)")
                ->check(CLI::Range(0.0, 1.0));
        keywordWeightOpt_ =
            cmd->add_option("--keyword-weight", keywordWeight_, "Keyword path weight (0.0-1.0)")
                ->check(CLI::Range(0.0, 1.0));
        auto* kw = cmd->add_flag("--keyword-only", keywordOnly_, "Keyword search only");
        auto* vec = cmd->add_flag("--vector-only", vectorOnly_, "Semantic search only");
        kw->excludes(vec);
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const auto& cfg = cli_->getConfig();
        const size_t limit = limitOpt_->count() > 0 ? limit_ : cfg.searchLimit;
        search::FusionWeights weights{
            vectorWeightOpt_->count() > 0 ? vectorWeight_ : cfg.vectorWeight,
            keywordWeightOpt_->count() > 0 ? keywordWeight_ : cfg.keywordWeight};
        auto mode = keywordOnly_  ? search::SearchMode::KeywordOnly
                    : vectorOnly_ ? search::SearchMode::VectorOnly
                                  : search::SearchMode::Hybrid;

        const auto query = joinedQuery();
        search::KeywordSearcher keyword(cli_->getFactStore());
        auto semantic = search::createSemanticSearchClient(cfg.semantic);
        search::HybridSearcher searcher(keyword, *semantic);

        auto results = searcher.search(query, limit, weights, mode);
        if (!results) {
            return results.error();
        }

        if (cli_->getJsonOutput()) {
            json arr = json::array();
            for (const auto& r : results.value()) {
                arr.push_back({{"type", r.type},
                               {"entity", r.entity},
                               {"content", r.content},
                               {"score", r.score},
                               {"final_score", r.finalScore},
                               {"timestamp", r.timestamp},
                               {"category", r.category},
                               {"source", r.source},
                               {"search_type", search::searchPathToString(r.searchType)}});
            }
            std::cout << json{{"query", query}, {"mode", modeName(mode, weights)}, {"results", arr}}
                             .dump(2)
                      << std::endl;
            return Result<void>();
        }

        std::cout << "# " << modeName(mode, weights) << " Search Results\n"
                  << "Query: \"" << query << "\"\n"
                  << "Found " << results.value().size() << " results\n\n";
        size_t i = 0;
        for (const auto& r : results.value()) {
            std::cout << fmt::format("## {}. {} [{:.3f}]\n", ++i, r.entity, r.finalScore)
                      << "Type: " << r.type << " | Category: " << r.category << "\n"
                      << "Search: " << search::searchPathToString(r.searchType) << "\n"
                      << "Source: " << r.source << "\n";
            if (!r.timestamp.empty()) {
                std::cout << "Date: " << r.timestamp << "\n";
            }
            std::cout << "\n" << r.content << "\n\n---\n\n";
        }
        if (results.value().empty()) {
            std::cout << "No results found.\n";
        }
        return Result<void>();
    }

private:
    std::string joinedQuery() const {
        std::string out;
        for (const auto& w : query_) {
            if (!out.empty()) {
                out += ' ';
            }
            out += w;
        }
        return out;
    }

    static std::string modeName(search::SearchMode mode, const search::FusionWeights& w) {
        switch (mode) {
            case search::SearchMode::KeywordOnly:
                return "Keyword-only";
            case search::SearchMode::VectorOnly:
                return "Vector-only";
            case search::SearchMode::Hybrid:
                break;
        }
        return fmt::format("Hybrid (vector: {:.1f}, keyword: {:.1f})", w.vector, w.keyword);
    }

    RecallCLI* cli_{nullptr};
    std::vector<std::string> query_;
    size_t limit_{10};
    double vectorWeight_{0.6};
    double keywordWeight_{0.4};
    bool keywordOnly_{false};
    bool vectorOnly_{false};
    CLI::Option* limitOpt_{nullptr};
    CLI::Option* vectorWeightOpt_{nullptr};
    CLI::Option* keywordWeightOpt_{nullptr};
};

std::unique_ptr<ICommand> createSearchCommand() {
    return std::make_unique<SearchCommand>();
}

} // namespace recall::cli
