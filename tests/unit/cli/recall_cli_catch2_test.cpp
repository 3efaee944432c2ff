// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <catch2/catch_test_macros.hpp>

#include <recall/cli/recall_cli.h>
#include <recall/graph/relationship_store.h>
#include <recall/store/fact_store.h>

#include <string>
#include <vector>

#include "../../common/test_helpers_catch2.h"

using namespace recall;

namespace {

struct CliFixture {
    test::TempWorkspace ws;
    test::ScopedEnvVar level{"RECALL_LOG_LEVEL", std::string("off")};
    test::ScopedEnvVar semantic{"RECALL_SEMANTIC_ENABLED", std::string("false")};

    int run(std::vector<std::string> args) {
        std::vector<std::string> argvStore{"recall", "--workspace", ws.root().string(), "--config",
                                           (ws.root() / "absent.toml").string()};
        argvStore.insert(argvStore.end(), args.begin(), args.end());
        std::vector<char*> argv;
        for (auto& a : argvStore) {
            argv.push_back(a.data());
        }
        cli::RecallCLI app;
        return app.run(static_cast<int>(argv.size()), argv.data());
    }
};

} // namespace

TEST_CASE("Log level names are parsed case-insensitively", "[unit][cli][logging]") {
    CHECK(cli::RecallCLI::parseLogLevel("DEBUG") == spdlog::level::debug);
    CHECK(cli::RecallCLI::parseLogLevel("warning") == spdlog::level::warn);
    CHECK(cli::RecallCLI::parseLogLevel("silent") == spdlog::level::off);
    CHECK_FALSE(cli::RecallCLI::parseLogLevel("loud").has_value());
}

TEST_CASE_METHOD(CliFixture, "remember writes once and skips duplicates", "[unit][cli][remember]") {
    CHECK(run({"remember", "people/John", "Likes green tea"}) == 0);
    CHECK(run({"remember", "people/john", "likes green tea."}) == 0);

    store::FactStore store(ws.root());
    auto facts = store.loadFacts(store::EntityKey::parse("people/john").value());
    REQUIRE(facts.size() == 1);
    CHECK(facts[0].category == "general");
    CHECK(std::filesystem::exists(ws.root() / ".memory-hashes.json"));

    CHECK(run({"remember", "john", "No type prefix"}) == 1);
}

TEST_CASE_METHOD(CliFixture, "graph commands persist and report edges", "[unit][cli][graph]") {
    CHECK(run({"graph", "add", "people/john", "companies/acme", "works_at", "--since",
               "2026-01-01"}) == 0);
    CHECK(run({"graph", "show", "people/john", "--depth", "2"}) == 0);
    CHECK(run({"graph", "show", "people/nobody"}) == 1);
    CHECK(run({"graph", "show", "people/john", "--depth", "0"}) != 0);
    CHECK(run({"--json", "graph", "stats"}) == 0);

    auto set = graph::RelationshipStore(ws.root()).load();
    REQUIRE(set.relationships.size() == 1);
    CHECK(set.relationships[0].since == "2026-01-01");
}

TEST_CASE_METHOD(CliFixture, "search validates weights and falls back to keywords",
                 "[unit][cli][search]") {
    ws.writeItems("people/john", R"([{"id": "j1", "fact": "John works at Acme",
                                      "status": "active"}])");
    CHECK(run({"search", "acme"}) == 0);
    CHECK(run({"search", "acme", "--vector-weight", "1.5"}) != 0);
    CHECK(run({"search", "acme", "--keyword-only", "--vector-only"}) != 0);
}

TEST_CASE_METHOD(CliFixture, "dedup and salience subcommands run", "[unit][cli][dedup]") {
    ws.writeItems("people/john", R"([{"id": "j1", "fact": "John works at Acme",
                                      "status": "active", "timestamp": "2026-01-01"}])");
    CHECK(run({"dedup", "rebuild"}) == 0);
    CHECK(run({"dedup", "check", "john", "works", "at", "acme"}) == 0);
    CHECK(run({"dedup", "stats"}) == 0);
    CHECK(run({"salience", "migrate"}) == 0);
    CHECK(run({"salience", "access", "people/john", "j1"}) == 0);
    CHECK(run({"salience", "access", "people/john", "missing"}) == 1);
    CHECK(run({"salience", "score", "2026-01-01", "3"}) == 0);
    CHECK(run({"dedup", "clean"}) == 0);

    store::FactStore store(ws.root());
    auto facts = store.loadFacts(store::EntityKey::parse("people/john").value());
    REQUIRE(facts.size() == 1);
    CHECK(facts[0].accessCount == std::optional<std::int64_t>(2));
}

TEST_CASE_METHOD(CliFixture, "commands address mixed-case entities as stored",
                 "[unit][cli][remember]") {
    ws.writeItems("people/Alice_Smith", R"([{"id": "a1", "fact": "Alice works at Acme",
                                            "status": "active", "timestamp": "2026-01-01"}])");
    CHECK(run({"salience", "access", "people/Alice_Smith", "a1"}) == 0);
    CHECK(run({"salience", "entity", "people/Alice_Smith"}) == 0);
    CHECK(run({"remember", "people/Alice_Smith", "Alice moved to the Berlin office"}) == 0);

    store::FactStore store(ws.root());
    auto keys = store.listEntities();
    REQUIRE(keys.size() == 1);
    CHECK(keys[0].str() == "people/Alice_Smith");
    auto facts = store.loadFacts(keys[0]);
    REQUIRE(facts.size() == 2);
    CHECK(facts[0].accessCount == std::optional<std::int64_t>(2));
}
