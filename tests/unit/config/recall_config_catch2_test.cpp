// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <recall/config/config_helpers.h>
#include <recall/config/recall_config.h>

#include "../../common/test_helpers_catch2.h"

using Catch::Matchers::ContainsSubstring;
using namespace recall;
using namespace recall::config;

namespace {

struct CleanEnv {
    test::ScopedEnvVar workspace{"RECALL_WORKSPACE_DIR", std::nullopt};
    test::ScopedEnvVar level{"RECALL_LOG_LEVEL", std::nullopt};
    test::ScopedEnvVar enabled{"RECALL_SEMANTIC_ENABLED", std::nullopt};
    test::ScopedEnvVar host{"RECALL_SEMANTIC_HOST", std::nullopt};
    test::ScopedEnvVar port{"RECALL_SEMANTIC_PORT", std::nullopt};
};

} // namespace

TEST_CASE("Config defaults", "[unit][config]") {
    CleanEnv env;
    auto cfg = loadConfig({});
    REQUIRE(cfg);
    const auto& c = cfg.value();
    CHECK(c.semantic.enabled);
    CHECK(c.semantic.host == "localhost");
    CHECK(c.semantic.port == 37777);
    CHECK(c.semantic.timeout.count() == 10000);
    CHECK(c.traversalDepth == 2);
    CHECK(c.decayWindowDays == 365);
    CHECK(c.vectorWeight == 0.6);
    CHECK(c.keywordWeight == 0.4);
    CHECK(c.searchLimit == 10);
    CHECK(c.validate());
}

TEST_CASE("Config file values are applied", "[unit][config]") {
    CleanEnv env;
    test::TempWorkspace ws;
    auto path = test::write_file(ws.root() / "config.toml", R"(# recall config
[core]
workspace = "/tmp/recall-ws"
log_level = "debug"

[semantic]
enabled = false
port = 40000  # custom port

[graph]
depth = 3

[search]
vector_weight = 0.5
keyword_weight = 0.5
limit = 7
)");

    auto cfg = loadConfig(path);
    REQUIRE(cfg);
    CHECK(cfg.value().workspaceRoot == std::filesystem::path("/tmp/recall-ws"));
    CHECK(cfg.value().logLevel == "debug");
    CHECK_FALSE(cfg.value().semantic.enabled);
    CHECK(cfg.value().semantic.port == 40000);
    CHECK(cfg.value().traversalDepth == 3);
    CHECK(cfg.value().vectorWeight == 0.5);
    CHECK(cfg.value().searchLimit == 7);
}

TEST_CASE("Environment overrides the config file", "[unit][config]") {
    CleanEnv env;
    test::TempWorkspace ws;
    auto path = test::write_file(ws.root() / "config.toml", "[semantic]\nport = 40000\n");
    test::ScopedEnvVar port("RECALL_SEMANTIC_PORT", std::string("41000"));
    test::ScopedEnvVar enabled("RECALL_SEMANTIC_ENABLED", std::string("false"));
    test::ScopedEnvVar root("RECALL_WORKSPACE_DIR", ws.root().string());

    auto cfg = loadConfig(path);
    REQUIRE(cfg);
    CHECK(cfg.value().semantic.port == 41000);
    CHECK_FALSE(cfg.value().semantic.enabled);
    CHECK(cfg.value().workspaceRoot == ws.root());
}

TEST_CASE("Malformed config values are rejected", "[unit][config]") {
    CleanEnv env;
    test::TempWorkspace ws;
    auto path = test::write_file(ws.root() / "config.toml", "[semantic]\nport = abc\n");
    auto cfg = loadConfig(path);
    REQUIRE_FALSE(cfg);
    CHECK(cfg.error().code == ErrorCode::InvalidArgument);
    CHECK_THAT(cfg.error().message, ContainsSubstring("semantic.port"));
}

TEST_CASE("Config validation bounds", "[unit][config]") {
    RecallConfig c;
    CHECK(c.validate());

    c.vectorWeight = 1.5;
    CHECK_FALSE(c.validate());
    c.vectorWeight = 0.6;

    c.keywordWeight = -0.1;
    CHECK_FALSE(c.validate());
    c.keywordWeight = 0.4;

    c.traversalDepth = 0;
    CHECK_FALSE(c.validate());
    c.traversalDepth = 2;

    c.decayWindowDays = 0;
    CHECK_FALSE(c.validate());
}

TEST_CASE("Simple TOML reader handles sections and quotes", "[unit][config]") {
    test::TempWorkspace ws;
    auto path = test::write_file(ws.root() / "c.toml",
                                 "top = 1\n[a]\nx = \"quoted # not comment\"\ny = 'single'\n");
    auto values = parse_simple_toml(path);
    CHECK(values["top"] == "1");
    CHECK(values["a.x"] == "quoted # not comment");
    CHECK(values["a.y"] == "single");
    CHECK(parse_bool("Yes") == std::optional<bool>(true));
    CHECK(parse_bool("off") == std::optional<bool>(false));
    CHECK_FALSE(parse_bool("maybe").has_value());
}
