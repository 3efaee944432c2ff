// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <catch2/catch_test_macros.hpp>

#include <recall/graph/graph_service.h>
#include <recall/graph/relationship_detector.h>
#include <recall/graph/relationship_graph.h>
#include <recall/graph/relationship_store.h>

#include <algorithm>

#include "../../common/test_helpers_catch2.h"

using namespace recall;
using namespace recall::graph;

namespace {

Relationship edge(std::string from, std::string to, std::string relation = "knows") {
    return Relationship{std::move(from), std::move(to), std::move(relation), "2026-01-01",
                        std::nullopt};
}

bool hasEdge(const std::vector<Relationship>& edges, std::string_view from, std::string_view to,
             std::string_view relation) {
    return std::any_of(edges.begin(), edges.end(), [&](const Relationship& r) {
        return r.from == from && r.to == to && r.relation == relation;
    });
}

struct GraphFixture {
    test::TempWorkspace ws;
    store::FactStore store{ws.root()};
    core::ClockFn clock = [] { return test::local_time_point(2026, 2, 1); };
};

} // namespace

TEST_CASE("Adding an existing edge is a no-op", "[unit][graph][add]") {
    RelationshipGraph g;
    CHECK(g.addRelationship(edge("people/a", "people/b")).added);
    CHECK_FALSE(g.addRelationship(edge("people/a", "people/b")).added);
    CHECK(g.addRelationship(edge("people/a", "people/b", "manages")).added);
    CHECK(g.addRelationship(edge("people/b", "people/a")).added);
    CHECK(g.edges().size() == 3);
    CHECK(g.nodeCount() == 2);
    CHECK(g.contains("people/a", "people/b", "manages"));
    CHECK(g.merge({edge("people/a", "people/b"), edge("people/c", "people/a")}) == 1);
}

TEST_CASE("Edge identity does not depend on separator characters", "[unit][graph][add]") {
    RelationshipGraph g;
    CHECK(g.addRelationship(edge("people/a#b", "people/c")).added);
    CHECK(g.addRelationship(edge("people/a", "b#people/c")).added);
    CHECK(g.edges().size() == 2);
    CHECK(g.contains("people/a#b", "people/c", "knows"));
    CHECK_FALSE(g.contains("people/a", "b#people/c#knows", ""));
}

TEST_CASE("Traversal stays within the depth bound", "[unit][graph][traverse]") {
    RelationshipGraph g({edge("people/a", "people/b"), edge("people/b", "people/c"),
                         edge("people/c", "people/d")});

    auto one = g.traverse("people/a", 1, TraversalDirection::Out);
    REQUIRE(one);
    REQUIRE(one.value().size() == 1);
    CHECK(one.value().at(0).size() == 1);
    CHECK(one.value().at(0)[0].to == "people/b");

    auto two = g.traverse("people/a", 2, TraversalDirection::Out);
    REQUIRE(two);
    REQUIRE(two.value().size() == 2);
    CHECK(two.value().at(1)[0].from == "people/b");
    CHECK(two.value().at(1)[0].to == "people/c");
    for (const auto& [depth, conns] : two.value()) {
        for (const auto& c : conns) {
            CHECK(c.to != "people/d");
        }
    }
}

TEST_CASE("Traversal terminates on cycles", "[unit][graph][traverse]") {
    RelationshipGraph g({edge("people/a", "people/b"), edge("people/b", "people/a")});
    auto result = g.traverse("people/a", 5, TraversalDirection::Both);
    REQUIRE(result);
    REQUIRE(result.value().size() == 2);
    CHECK(result.value().at(0).size() == 2);
    CHECK(result.value().at(1).size() == 2);
}

TEST_CASE("Traversal honours direction", "[unit][graph][traverse]") {
    RelationshipGraph g({edge("people/a", "companies/x", "works_at"),
                         edge("people/b", "people/a", "manages")});

    auto out = g.traverse("people/a", 1, TraversalDirection::Out);
    REQUIRE(out);
    REQUIRE(out.value().at(0).size() == 1);
    CHECK(out.value().at(0)[0].type == ConnectionType::Outbound);
    CHECK(out.value().at(0)[0].relation == "works_at");

    auto in = g.traverse("people/a", 1, TraversalDirection::In);
    REQUIRE(in);
    REQUIRE(in.value().at(0).size() == 1);
    CHECK(in.value().at(0)[0].type == ConnectionType::Inbound);
    CHECK(in.value().at(0)[0].from == "people/b");

    auto both = g.traverse("people/a", 1, TraversalDirection::Both);
    REQUIRE(both);
    CHECK(both.value().at(0).size() == 2);
}

TEST_CASE("Traversal rejects bad input", "[unit][graph][traverse]") {
    RelationshipGraph g({edge("people/a", "people/b")});
    auto zero = g.traverse("people/a", 0, TraversalDirection::Both);
    REQUIRE_FALSE(zero);
    CHECK(zero.error().code == ErrorCode::InvalidArgument);

    auto missing = g.traverse("people/z", 2, TraversalDirection::Both);
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE("Graph stats group relations and type pairs", "[unit][graph][stats]") {
    RelationshipGraph g({edge("people/a", "companies/x", "works_at"),
                         edge("people/b", "companies/x", "works_at"),
                         edge("people/a", "people/b", "knows")});
    auto s = g.stats();
    CHECK(s.totalEdges == 3);
    CHECK(s.nodeCount == 3);
    REQUIRE(s.byRelation.size() == 2);
    CHECK(s.byRelation[0] == std::pair<std::string, size_t>{"works_at", 2});
    REQUIRE(s.byTypePair.size() == 2);
    CHECK(s.byTypePair[0].first == "people -> companies");
}

TEST_CASE_METHOD(GraphFixture, "Relationship store survives corrupt input",
                 "[unit][graph][store]") {
    RelationshipStore rs(ws.root());
    CHECK(rs.load().relationships.empty());

    test::write_file(rs.path(), "{ not json");
    CHECK(rs.load().relationships.empty());

    test::write_file(rs.path(), R"({"version": 1,
        "relationships": [{"from": "people/a", "to": "people/b", "relation": "knows",
                           "since": "2026-01-01"},
                          {"from": "people/a", "relation": "knows"}],
        "behavioral_sequences": [{"name": "morning"}]})");
    auto set = rs.load();
    REQUIRE(set.relationships.size() == 1);
    CHECK(set.behavioralSequences.size() == 1);

    REQUIRE(rs.save(set));
    auto again = rs.load();
    CHECK(again.relationships.size() == 1);
    CHECK(again.behavioralSequences[0]["name"] == "morning");
}

TEST_CASE_METHOD(GraphFixture, "Detector derives typed, mention and co-mention edges",
                 "[unit][graph][detect]") {
    ws.writeItems("people/john", R"([{"id": "j1", "fact": "John works at Acme",
                                      "status": "active", "timestamp": "2026-01-10"},
                                     {"id": "j2", "fact": "John knows Acme CEO",
                                      "status": "superseded"}])");
    ws.writeItems("companies/acme", "[]");
    ws.writeNote("2026-01-12", "Lunch with John and the Acme team.");

    RelationshipDetector detector(store, clock);
    auto edges = detector.detect();

    REQUIRE(edges.size() == 3);
    CHECK(hasEdge(edges, "people/john", "companies/acme", "works_at"));
    CHECK(hasEdge(edges, "people/john", "companies/acme", "mentions"));
    CHECK(hasEdge(edges, "companies/acme", "people/john", "co_mentioned"));
    CHECK_FALSE(hasEdge(edges, "people/john", "companies/acme", "knows"));

    auto typed = std::find_if(edges.begin(), edges.end(),
                              [](const Relationship& r) { return r.relation == "works_at"; });
    CHECK(typed->since == "2026-01-10");
    CHECK(typed->source == std::optional<std::string>("life/areas/people/john/items.json#j1"));

    auto co = std::find_if(edges.begin(), edges.end(),
                           [](const Relationship& r) { return r.relation == "co_mentioned"; });
    CHECK(co->since == "2026-01-12");
    CHECK(co->source == std::optional<std::string>("memory/2026-01-12.md"));
}

TEST_CASE_METHOD(GraphFixture, "Short names only produce typed edges", "[unit][graph][detect]") {
    ws.writeItems("people/john", R"([{"id": "j1", "fact": "John knows Al well",
                                      "status": "active"}])");
    ws.writeItems("people/al", "[]");

    RelationshipDetector detector(store, clock);
    auto edges = detector.detect();
    CHECK(hasEdge(edges, "people/john", "people/al", "knows"));
    CHECK_FALSE(hasEdge(edges, "people/john", "people/al", "mentions"));
    for (const auto& r : edges) {
        CHECK(r.from != r.to);
        if (r.relation == "knows") {
            CHECK(r.since == "2026-02-01");
        }
    }
}

TEST_CASE_METHOD(GraphFixture, "Graph service persists edges once", "[unit][graph][service]") {
    GraphService service(store, clock);

    auto added = service.addRelationship("people/John Smith", "companies/Acme", "works_at",
                                         std::string("yesterday"));
    REQUIRE(added);
    CHECK(added.value().added);

    auto again = service.addRelationship("people/john-smith", "companies/acme", "works_at");
    REQUIRE(again);
    CHECK_FALSE(again.value().added);

    auto set = RelationshipStore(ws.root()).load();
    REQUIRE(set.relationships.size() == 1);
    CHECK(set.relationships[0].from == "people/john-smith");
    CHECK(set.relationships[0].since == "2026-01-31");

    auto blank = service.addRelationship("people/a", "people/b", "  ");
    REQUIRE_FALSE(blank);
    CHECK(blank.error().code == ErrorCode::InvalidArgument);

    auto badDate = service.addRelationship("people/a", "people/b", "knows", std::string("soon"));
    REQUIRE_FALSE(badDate);
}

TEST_CASE_METHOD(GraphFixture, "Graph service connections distinguish empty from unknown",
                 "[unit][graph][service]") {
    ws.writeItems("people/loner", "[]");
    GraphService service(store, clock);
    REQUIRE(service.addRelationship("people/a", "people/b", "knows"));

    auto loner = service.connections("people/loner", 2);
    REQUIRE(loner);
    CHECK(loner.value().empty());

    auto unknown = service.connections("people/nobody", 2);
    REQUIRE_FALSE(unknown);
    CHECK(unknown.error().code == ErrorCode::NotFound);

    auto a = service.connections("people/a", 2, TraversalDirection::Out);
    REQUIRE(a);
    CHECK(a.value().at(0).size() == 1);
}

TEST_CASE_METHOD(GraphFixture, "Scanning twice adds nothing new", "[unit][graph][service]") {
    ws.writeItems("people/john", R"([{"id": "j1", "fact": "John works at Acme",
                                      "status": "active", "timestamp": "2026-01-10"}])");
    ws.writeItems("companies/acme", "[]");
    GraphService service(store, clock);

    auto first = service.scan();
    REQUIRE(first);
    CHECK(first.value().added == 2);
    CHECK(first.value().total == 2);

    auto second = service.scan();
    REQUIRE(second);
    CHECK(second.value().detected == 2);
    CHECK(second.value().added == 0);

    auto byType = service.entitiesByType();
    CHECK(byType["people"] == std::vector<std::string>{"john"});
    CHECK(service.stats().totalEdges == 2);
}

TEST_CASE_METHOD(GraphFixture, "Graph service addresses mixed-case entities as stored",
                 "[unit][graph][service]") {
    ws.writeItems("people/Alice_Smith", R"([{"id": "a1", "fact": "Alice works at Acme",
                                            "status": "active", "timestamp": "2026-01-10"}])");
    ws.writeItems("companies/acme", "[]");
    GraphService service(store, clock);
    REQUIRE(service.scan());

    auto conns = service.connections("people/Alice_Smith", 2, TraversalDirection::Out);
    REQUIRE(conns);
    REQUIRE_FALSE(conns.value().empty());
    for (const auto& c : conns.value().at(0)) {
        CHECK(c.from == "people/Alice_Smith");
    }

    REQUIRE(service.addRelationship("people/Alice_Smith", "companies/New Co", "knows"));
    auto set = RelationshipStore(ws.root()).load();
    CHECK(hasEdge(set.relationships, "people/Alice_Smith", "companies/new-co", "knows"));
    CHECK_FALSE(hasEdge(set.relationships, "people/alice_smith", "companies/new-co", "knows"));
}
