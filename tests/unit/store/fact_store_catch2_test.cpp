// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <catch2/catch_test_macros.hpp>

#include <recall/store/fact_store.h>
#include <recall/store/json_file.h>

#include <nlohmann/json.hpp>

#include "../../common/test_helpers_catch2.h"

using namespace recall;
using namespace recall::store;
using json = nlohmann::json;

TEST_CASE("EntityKey normalizes caller input", "[unit][store][entity_key]") {
    auto key = EntityKey::parse("people/John Smith");
    REQUIRE(key);
    CHECK(key.value().type == "people");
    CHECK(key.value().name == "john-smith");
    CHECK(key.value().str() == "people/john-smith");

    auto dotted = EntityKey::parse("companies/Acme Inc.");
    REQUIRE(dotted);
    CHECK(dotted.value().name == "acme-inc");

    CHECK(EntityKey::fromStored("people", "John_Smith").name == "John_Smith");
}

TEST_CASE("EntityKey rejects malformed keys", "[unit][store][entity_key]") {
    for (const char* bad : {"john", "/john", "people/", "people/a/b", ""}) {
        auto key = EntityKey::parse(bad);
        INFO(bad);
        REQUIRE_FALSE(key);
        CHECK(key.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("EntityKey keeps verbatim spelling when asked", "[unit][store][entity_key]") {
    auto key = EntityKey::parseVerbatim(" people/Alice_Smith ");
    REQUIRE(key);
    CHECK(key.value().str() == "people/Alice_Smith");

    auto bad = EntityKey::parseVerbatim("people/a/b");
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("FactStore resolves keys of existing entities as spelled on disk",
          "[unit][store][fact_store]") {
    test::TempWorkspace ws;
    ws.writeItems("people/Alice_Smith", R"([{"id": "a1", "fact": "Alice works at Acme",
                                            "status": "active"}])");
    FactStore store(ws.root());

    auto existing = store.resolveKey("people/Alice_Smith");
    REQUIRE(existing);
    CHECK(existing.value().str() == "people/Alice_Smith");
    CHECK(store.loadFacts(existing.value()).size() == 1);

    auto fresh = store.resolveKey("people/Bob Jones");
    REQUIRE(fresh);
    CHECK(fresh.value().str() == "people/bob-jones");

    REQUIRE(store.appendFact(existing.value(), Fact{.fact = "Alice leads the data team"}));
    CHECK(store.loadFacts(existing.value()).size() == 2);
    CHECK(store.listEntities().size() == 1);
}

TEST_CASE("Fact records keep unknown fields and statuses", "[unit][store][fact]") {
    json in = {{"id", "john-001"},
               {"fact", "Works at Acme"},
               {"category", "work"},
               {"type", "fact"},
               {"timestamp", "2026-01-05"},
               {"status", "archived"},
               {"supersededBy", nullptr},
               {"confidence", 0.9},
               {"tags", {"a", "b"}}};

    auto f = factFromJson(in);
    REQUIRE(f);
    CHECK(f.value().status == FactStatus::Unknown);
    CHECK_FALSE(f.value().isActive());
    CHECK(f.value().rawStatus == std::optional<std::string>("archived"));
    CHECK(f.value().effectiveAccessCount() == 1);
    CHECK(f.value().effectiveLastAccessed() == "2026-01-05");

    auto out = factToJson(f.value());
    CHECK(out["status"] == "archived");
    CHECK(out["confidence"] == 0.9);
    CHECK(out["tags"] == json({"a", "b"}));
    CHECK_FALSE(out.contains("lastAccessed"));
    CHECK_FALSE(out.contains("accessCount"));
}

TEST_CASE("Fact records keep raw values of known fields they cannot decode",
          "[unit][store][fact]") {
    json in = {{"id", "x1"},
               {"fact", "Runs marathons"},
               {"category", {"sport", "health"}},
               {"type", true},
               {"status", "active"},
               {"supersededBy", {{"id", "y"}}}};

    auto f = factFromJson(in);
    REQUIRE(f);
    CHECK(f.value().category.empty());

    auto updated = f.value();
    updated.lastAccessed = "2026-02-01T12:00:00";
    updated.accessCount = 2;
    auto out = factToJson(updated);
    CHECK(out["category"] == json({"sport", "health"}));
    CHECK(out["type"] == true);
    CHECK(out["supersededBy"] == json({{"id", "y"}}));
    CHECK(out["lastAccessed"] == "2026-02-01T12:00:00");
    CHECK(out["accessCount"] == 2);

    updated.fact = "Runs ultramarathons";
    CHECK(factToJson(updated)["fact"] == "Runs ultramarathons");
}

TEST_CASE("Fact access counts are clamped and numeric ids rendered", "[unit][store][fact]") {
    auto f = factFromJson(json{{"id", 7}, {"fact", "x"}, {"status", "active"}, {"accessCount", -3}});
    REQUIRE(f);
    CHECK(f.value().id == "7");
    CHECK(f.value().accessCount == std::optional<std::int64_t>(0));
    CHECK(f.value().isActive());

    CHECK_FALSE(factFromJson(json::array()));
}

TEST_CASE("FactStore appends with generated ids and defaults", "[unit][store][fact_store]") {
    test::TempWorkspace ws;
    FactStore store(ws.root());
    auto key = EntityKey::parse("people/john").value();

    Fact fact;
    fact.fact = "Met at the conference";
    fact.category = "relationship";
    fact.type = "fact";
    fact.status = FactStatus::Superseded;
    fact.supersededBy = "other";

    auto stored = store.appendFact(key, fact);
    REQUIRE(stored);
    CHECK(stored.value().id.size() == 8);
    CHECK(stored.value().id.find_first_not_of("0123456789abcdef") == std::string::npos);
    CHECK(stored.value().timestamp.size() == 10);
    CHECK(stored.value().isActive());
    CHECK_FALSE(stored.value().supersededBy.has_value());

    CHECK(store.hasEntity(key));
    CHECK(store.loadSummary(key).has_value());

    auto second = store.appendFact(key, Fact{.fact = "Second"});
    REQUIRE(second);
    CHECK(second.value().id != stored.value().id);

    auto facts = store.loadFacts(key);
    REQUIRE(facts.size() == 2);
    CHECK(facts[0].fact == "Met at the conference");
    CHECK(facts[1].fact == "Second");

    Fact dup;
    dup.id = stored.value().id;
    dup.fact = "clash";
    auto clash = store.appendFact(key, dup);
    REQUIRE_FALSE(clash);
    CHECK(clash.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("FactStore treats corrupt items as empty", "[unit][store][fact_store]") {
    test::TempWorkspace ws;
    ws.writeItems("people/broken", "{ not json");
    ws.writeItems("people/object", R"({"id": "x"})");
    ws.writeItems("people/mixed", R"([{"id": "a", "fact": "ok", "status": "active"}, 42])");

    FactStore store(ws.root());
    CHECK(store.loadFacts(EntityKey::fromStored("people", "broken")).empty());
    CHECK(store.loadFacts(EntityKey::fromStored("people", "object")).empty());
    CHECK(store.loadFacts(EntityKey::fromStored("people", "missing")).empty());

    auto mixed = store.loadFacts(EntityKey::fromStored("people", "mixed"));
    REQUIRE(mixed.size() == 1);
    CHECK(mixed[0].id == "a");
}

TEST_CASE("FactStore rewrites keep records it cannot decode in place",
          "[unit][store][fact_store]") {
    test::TempWorkspace ws;
    const auto path = ws.writeItems(
        "people/mixed", R"([{"id": "a", "fact": "first", "status": "active"}, 42,
                            {"id": "b", "fact": "second", "status": "active"}])");
    FactStore store(ws.root());
    auto key = EntityKey::fromStored("people", "mixed");

    auto file = store.readFactFile(key);
    REQUIRE(file);
    CHECK(file.value().facts.size() == 2);
    REQUIRE(file.value().unparsed.size() == 1);
    CHECK(file.value().unparsed[0].first == 1);

    REQUIRE(store.appendFact(key, Fact{.fact = "third"}));
    auto doc = readJsonFile(path);
    REQUIRE(doc.has_value());
    REQUIRE(doc->size() == 4);
    CHECK((*doc)[0]["id"] == "a");
    CHECK((*doc)[1] == 42);
    CHECK((*doc)[2]["id"] == "b");
    CHECK((*doc)[3]["fact"] == "third");
}

TEST_CASE("FactStore write paths refuse corrupt items files", "[unit][store][fact_store]") {
    test::TempWorkspace ws;
    const auto broken = ws.writeItems("people/broken", "{ not json");
    const auto object = ws.writeItems("people/object", R"({"id": "x"})");
    FactStore store(ws.root());

    for (const char* name : {"broken", "object"}) {
        INFO(name);
        auto key = EntityKey::fromStored("people", name);
        auto file = store.readFactFile(key);
        REQUIRE_FALSE(file);
        CHECK(file.error().code == ErrorCode::InvalidData);

        auto appended = store.appendFact(key, Fact{.fact = "new"});
        REQUIRE_FALSE(appended);
        CHECK(appended.error().code == ErrorCode::InvalidData);
    }
    CHECK(test::read_file(broken) == "{ not json");
    CHECK(test::read_file(object) == R"({"id": "x"})");

    auto missing = store.readFactFile(EntityKey::fromStored("people", "missing"));
    REQUIRE(missing);
    CHECK(missing.value().facts.empty());
}

TEST_CASE("FactStore lists entities and notes in path order", "[unit][store][fact_store]") {
    test::TempWorkspace ws;
    ws.writeItems("projects/zeta", "[]");
    ws.writeItems("companies/acme", "[]");
    ws.writeItems("people/john", "[]");
    test::write_file(ws.root() / "life" / "areas" / "people" / "no-items" / "summary.md", "x");
    ws.writeNote("2026-02-02", "second");
    ws.writeNote("2026-02-01", "first");
    test::write_file(ws.root() / "memory" / "readme.txt", "ignored");

    FactStore store(ws.root());
    auto keys = store.listEntities();
    REQUIRE(keys.size() == 3);
    CHECK(keys[0].str() == "companies/acme");
    CHECK(keys[1].str() == "people/john");
    CHECK(keys[2].str() == "projects/zeta");

    auto notes = store.loadNotes();
    REQUIRE(notes.size() == 2);
    CHECK(notes[0].date == "2026-02-01");
    CHECK(notes[0].content == "first");
    CHECK(store.relativeSource(notes[1].path) == "memory/2026-02-02.md");
}

TEST_CASE("writeJsonFile replaces files atomically", "[unit][store][json_file]") {
    test::TempWorkspace ws;
    auto path = ws.root() / "nested" / "doc.json";
    REQUIRE(writeJsonFile(path, json{{"a", 1}}));
    REQUIRE(writeJsonFile(path, json{{"a", 2}}));
    auto doc = readJsonFile(path);
    REQUIRE(doc.has_value());
    CHECK((*doc)["a"] == 2);
    CHECK_FALSE(readJsonFile(ws.root() / "absent.json").has_value());
}
