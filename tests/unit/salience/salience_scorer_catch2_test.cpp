// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <recall/salience/salience_scorer.h>
#include <recall/store/json_file.h>

#include <cmath>

#include "../../common/test_helpers_catch2.h"

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;
using namespace recall;
using namespace recall::salience;
using recall::store::EntityKey;
using recall::store::Fact;

namespace {

core::ClockFn fixedClock() {
    return [] { return test::local_time_point(2026, 2, 1); };
}

Fact scoredFact(std::string id, std::string lastAccessed, std::int64_t count) {
    Fact f;
    f.id = std::move(id);
    f.fact = "fact " + f.id;
    f.lastAccessed = std::move(lastAccessed);
    f.accessCount = count;
    return f;
}

} // namespace

TEST_CASE("Recency weight decays with age", "[unit][salience][score]") {
    SalienceScorer scorer(365, fixedClock());
    CHECK_THAT(scorer.recencyWeight("2026-02-01"), WithinAbs(1.0, 1e-12));
    CHECK_THAT(scorer.recencyWeight("2026-01-31T23:59:00"),
               WithinRel(std::exp(-1.0 / (365.0 / 3.0)), 1e-9));
    CHECK(scorer.recencyWeight("2026-01-01") < scorer.recencyWeight("2026-01-20"));
    CHECK(scorer.recencyWeight("2025-02-01") == 0.0);
    CHECK(scorer.recencyWeight("2020-01-01") == 0.0);
    CHECK_THAT(scorer.recencyWeight("2026-03-01"), WithinAbs(1.0, 1e-12));
    CHECK(scorer.recencyWeight("last week") == kUnparsableRecencyWeight);
}

TEST_CASE("Frequency weight is log of count plus one", "[unit][salience][score]") {
    CHECK(SalienceScorer::frequencyWeight(0) == 0.0);
    CHECK(SalienceScorer::frequencyWeight(-4) == 0.0);
    CHECK_THAT(SalienceScorer::frequencyWeight(1), WithinRel(std::log(2.0), 1e-12));
    CHECK(SalienceScorer::frequencyWeight(10) > SalienceScorer::frequencyWeight(9));
}

TEST_CASE("Score combines recency and frequency", "[unit][salience][score]") {
    SalienceScorer scorer(365, fixedClock());
    CHECK(scorer.score("2026-02-01", 0) == 0.0);
    CHECK_THAT(scorer.score("garbage", 5), WithinRel(0.1 * std::log(6.0), 1e-12));
    CHECK(scorer.score("2025-01-01", 100) == 0.0);

    auto b = scorer.explain("2026-02-01", 4);
    CHECK_THAT(b.recencyWeight, WithinAbs(1.0, 1e-12));
    CHECK_THAT(b.frequencyWeight, WithinRel(std::log(5.0), 1e-12));
    CHECK_THAT(b.score, WithinRel(std::log(5.0), 1e-12));

    SalienceScorer shortWindow(30, fixedClock());
    CHECK(shortWindow.score("2026-01-01", 3) == 0.0);
    CHECK(scorer.score("2026-01-01", 3) > 0.0);

    SalienceScorer fallback(0, fixedClock());
    CHECK(fallback.decayWindowDays() == kDefaultDecayWindowDays);
}

TEST_CASE("Legacy facts score with timestamp and one access", "[unit][salience][score]") {
    SalienceScorer scorer(365, fixedClock());
    Fact legacy;
    legacy.timestamp = "2026-02-01";
    CHECK_THAT(scorer.score(legacy), WithinRel(std::log(2.0), 1e-12));
}

TEST_CASE("Ranking is stable and limited", "[unit][salience][rank]") {
    SalienceScorer scorer(365, fixedClock());
    std::vector<Fact> facts{scoredFact("low", "2025-06-01", 1), scoredFact("tie1", "2026-02-01", 2),
                            scoredFact("high", "2026-02-01", 20),
                            scoredFact("tie2", "2026-02-01", 2)};

    auto ranked = scorer.rankByScore(facts);
    REQUIRE(ranked.size() == 4);
    CHECK(ranked[0].fact.id == "high");
    CHECK(ranked[1].fact.id == "tie1");
    CHECK(ranked[2].fact.id == "tie2");
    CHECK(ranked[3].fact.id == "low");

    auto top = scorer.rankByScore(facts, 2);
    REQUIRE(top.size() == 2);
    CHECK(top[1].fact.id == "tie1");
}

TEST_CASE("Recording access updates the stored fact", "[unit][salience][access]") {
    test::TempWorkspace ws;
    ws.writeItems("people/john", R"([{"id": "j1", "fact": "Likes tea", "status": "active",
                                      "timestamp": "2026-01-01"}])");
    store::FactStore store(ws.root());
    SalienceScorer scorer(365, fixedClock());
    auto key = EntityKey::parse("people/john").value();

    auto first = scorer.recordAccess(store, key, "j1");
    REQUIRE(first);
    CHECK(first.value().accessCount == std::optional<std::int64_t>(2));
    CHECK(first.value().lastAccessed == std::optional<std::string>("2026-02-01T12:00:00"));

    auto second = scorer.recordAccess(store, key, "j1");
    REQUIRE(second);
    CHECK(store.loadFacts(key)[0].accessCount == std::optional<std::int64_t>(3));

    auto missingFact = scorer.recordAccess(store, key, "nope");
    REQUIRE_FALSE(missingFact);
    CHECK(missingFact.error().code == ErrorCode::NotFound);

    auto missingEntity = scorer.recordAccess(store, EntityKey::parse("people/jane").value(), "j1");
    REQUIRE_FALSE(missingEntity);
    CHECK(missingEntity.error().code == ErrorCode::NotFound);
}

TEST_CASE("Recording access keeps records the store cannot decode", "[unit][salience][access]") {
    test::TempWorkspace ws;
    const auto path = ws.writeItems("people/john", R"(["legacy note",
                                     {"id": "j1", "fact": "Likes tea", "status": "active",
                                      "category": ["food", "habits"]}])");
    store::FactStore store(ws.root());
    SalienceScorer scorer(365, fixedClock());

    REQUIRE(scorer.recordAccess(store, EntityKey::parse("people/john").value(), "j1"));

    auto doc = store::readJsonFile(path);
    REQUIRE(doc.has_value());
    REQUIRE(doc->size() == 2);
    CHECK((*doc)[0] == "legacy note");
    CHECK((*doc)[1]["category"] == nlohmann::json({"food", "habits"}));
    CHECK((*doc)[1]["accessCount"] == 2);
}

TEST_CASE("Recording access refuses a corrupt items file", "[unit][salience][access]") {
    test::TempWorkspace ws;
    const auto path = ws.writeItems("people/john", "[{ broken");
    store::FactStore store(ws.root());
    SalienceScorer scorer(365, fixedClock());

    auto result = scorer.recordAccess(store, EntityKey::parse("people/john").value(), "j1");
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::InvalidData);
    CHECK(test::read_file(path) == "[{ broken");
}

TEST_CASE("Migration fills missing salience fields", "[unit][salience][migrate]") {
    test::TempWorkspace ws;
    ws.writeItems("people/john", R"([{"id": "a", "fact": "x", "status": "active",
                                      "timestamp": "2026-01-05"},
                                     {"id": "b", "fact": "y", "status": "active"},
                                     {"id": "c", "fact": "z", "status": "active",
                                      "lastAccessed": "2026-01-20", "accessCount": 4}])");
    ws.writeItems("people/broken", "{oops");
    store::FactStore store(ws.root());
    SalienceScorer scorer(365, fixedClock());

    auto report = scorer.migrate(store);
    CHECK(report.filesProcessed == 1);
    CHECK(report.factsUpdated == 2);
    REQUIRE(report.errors.size() == 1);

    auto facts = store.loadFacts(EntityKey::parse("people/john").value());
    REQUIRE(facts.size() == 3);
    CHECK(facts[0].lastAccessed == std::optional<std::string>("2026-01-05"));
    CHECK(facts[1].lastAccessed == std::optional<std::string>("2026-02-01"));
    CHECK(facts[1].accessCount == std::optional<std::int64_t>(1));
    CHECK(facts[2].accessCount == std::optional<std::int64_t>(4));

    auto rerun = scorer.migrate(store);
    CHECK(rerun.factsUpdated == 0);
}

TEST_CASE("Stats cover facts with salience data", "[unit][salience][stats]") {
    test::TempWorkspace ws;
    ws.writeItems("people/john", R"([{"id": "a", "fact": "x", "status": "active",
                                      "lastAccessed": "2026-02-01", "accessCount": 20},
                                     {"id": "b", "fact": "y", "status": "active",
                                      "lastAccessed": "2020-01-01", "accessCount": 2},
                                     {"id": "c", "fact": "z", "status": "active"}])");
    store::FactStore store(ws.root());
    SalienceScorer scorer(365, fixedClock());

    auto s = scorer.stats(store);
    CHECK(s.totalFacts == 3);
    CHECK(s.factsWithSalience == 2);
    CHECK(s.highSalience == 1);
    CHECK(s.lowSalience == 1);
    CHECK_THAT(s.averageAccessCount, WithinAbs(11.0, 1e-12));
    CHECK_THAT(s.maxScore, WithinRel(std::log(21.0), 1e-12));
}
