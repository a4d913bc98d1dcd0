#include <gtest/gtest.h>
#include "exchange/graph_exchange.hpp"
#include "mutation/mutation_manager.hpp"
#include "store/memory_record_store.hpp"
#include "common/errors.hpp"

#include <cstdio>
#include <filesystem>

using namespace kgraph;

namespace {

class ExchangeTest : public ::testing::Test {
protected:
    void SetUp() override {
        NodeInput alice{"p1", "Alice", std::string("Person"), Json::Value(Json::objectValue)};
        alice.properties["age"] = 30;
        mutations.createNode("kg", alice);
        mutations.createNode("kg", NodeInput{"p2", "Bob", std::string("Person"), Json::Value()});
        mutations.createNode("kg", NodeInput{"c1", "Paris", std::nullopt, Json::Value()});

        EdgeInput knows;
        knows.id = "e1";
        knows.source = "p1";
        knows.target = "p2";
        knows.relation_type = "knows";
        knows.weight = 0.5;
        mutations.createEdge("kg", knows);

        EdgeInput lives;
        lives.source = "p1";
        lives.target = "c1";
        lives.relation_type = "lives_in";
        mutations.createEdge("kg", lives);
    }

    Json::Value minimalDocument() const {
        return GraphExchange::parseDocument(R"({
            "nodes": [ {"node_id": "x1", "name": "Xavier"},
                       {"node_id": "x2", "name": "Yolanda", "type": "Person"} ],
            "edges": [ {"source_node_id": "x1", "target_node_id": "x2", "relation_type": "knows"} ]
        })");
    }

    MemoryRecordStore store;
    EngineConfig config;
    MutationManager mutations{store, config};
    GraphExchange exchange{store, mutations};
};

} // namespace

// ─── Export ────────────────────────────────────────────────────

TEST_F(ExchangeTest, ExportLayout) {
    Json::Value doc = exchange.exportCollection("kg");
    EXPECT_EQ(doc["format_version"].asInt(), GraphExchange::kFormatVersion);
    EXPECT_EQ(doc["collection"].asString(), "kg");
    ASSERT_EQ(doc["nodes"].size(), 3u);
    ASSERT_EQ(doc["edges"].size(), 2u);
    EXPECT_EQ(doc["nodes"][0]["node_id"].asString(), "c1");
    EXPECT_TRUE(doc["nodes"][0]["type"].isNull());
    EXPECT_EQ(doc["edges"][1]["edge_id"].asString(), "p1_lives_in_c1");
    EXPECT_DOUBLE_EQ(doc["edges"][0]["weight"].asDouble(), 0.5);
}

TEST_F(ExchangeTest, ExportEmptyCollection) {
    Json::Value doc = exchange.exportCollection("empty");
    EXPECT_TRUE(doc["nodes"].isArray());
    EXPECT_EQ(doc["nodes"].size(), 0u);
    EXPECT_EQ(doc["edges"].size(), 0u);
}

// ─── Import ────────────────────────────────────────────────────

TEST_F(ExchangeTest, RoundTripIntoFreshCollection) {
    Json::Value doc = GraphExchange::parseDocument(
        GraphExchange::writeDocument(exchange.exportCollection("kg")));

    ImportSummary s = exchange.importCollection("copy", doc, true);
    EXPECT_EQ(s.nodes_created, 3u);
    EXPECT_EQ(s.edges_created, 2u);

    EXPECT_EQ(mutations.listNodes("copy"), mutations.listNodes("kg"));
    EXPECT_EQ(mutations.listEdges("copy"), mutations.listEdges("kg"));
}

TEST_F(ExchangeTest, RepeatedImportIsNoOp) {
    Json::Value doc = minimalDocument();
    ImportSummary first = exchange.importCollection("kg", doc, false);
    EXPECT_EQ(first.nodes_created, 2u);
    EXPECT_EQ(first.edges_created, 1u);
    auto nodes = mutations.listNodes("kg");
    auto edges = mutations.listEdges("kg");

    ImportSummary second = exchange.importCollection("kg", doc, false);
    EXPECT_EQ(second.nodes_created, 0u);
    EXPECT_EQ(second.nodes_updated, 0u);
    EXPECT_EQ(second.nodes_unchanged, 2u);
    EXPECT_EQ(second.edges_unchanged, 1u);
    EXPECT_EQ(mutations.listNodes("kg"), nodes);
    EXPECT_EQ(mutations.listEdges("kg"), edges);
    EXPECT_TRUE(mutations.edgeExists("kg", "x1_knows_x2"));
}

TEST_F(ExchangeTest, ImportMergesWithExisting) {
    Json::Value doc = GraphExchange::parseDocument(R"({
        "nodes": [ {"node_id": "p2", "name": "Robert", "type": "Person"} ],
        "edges": [ {"edge_id": "e9", "source_node_id": "p2", "target_node_id": "c1"} ]
    })");

    ImportSummary s = exchange.importCollection("kg", doc, false);
    EXPECT_EQ(s.nodes_updated, 1u);
    EXPECT_EQ(s.edges_created, 1u);
    EXPECT_EQ(mutations.getNode("kg", "p2").name, "Robert");
    EXPECT_EQ(mutations.listNodes("kg").size(), 3u);
    EXPECT_TRUE(mutations.edgeExists("kg", "e1"));
}

TEST_F(ExchangeTest, ClearExistingReplacesCollection) {
    exchange.importCollection("kg", minimalDocument(), true);
    EXPECT_FALSE(mutations.nodeExists("kg", "p1"));
    EXPECT_EQ(mutations.listNodes("kg").size(), 2u);
    EXPECT_EQ(mutations.listEdges("kg").size(), 1u);
}

TEST_F(ExchangeTest, InvalidDocumentWritesNothing) {
    // Second edge references a node that exists nowhere
    Json::Value doc = GraphExchange::parseDocument(R"({
        "nodes": [ {"node_id": "n1", "name": "New"} ],
        "edges": [ {"edge_id": "ok", "source_node_id": "n1", "target_node_id": "p1"},
                   {"edge_id": "bad", "source_node_id": "n1", "target_node_id": "ghost"} ]
    })");

    EXPECT_THROW(exchange.importCollection("kg", doc, false), EndpointNotFoundError);
    EXPECT_THROW(exchange.importCollection("kg", doc, true), EndpointNotFoundError);
    EXPECT_FALSE(mutations.nodeExists("kg", "n1"));
    EXPECT_TRUE(mutations.nodeExists("kg", "p1"));
    EXPECT_EQ(mutations.listEdges("kg").size(), 2u);
}

TEST_F(ExchangeTest, EndpointsMustExistAfterClear) {
    // p1 exists now but would be gone after clearing
    Json::Value doc = GraphExchange::parseDocument(R"({
        "nodes": [ {"node_id": "n1", "name": "New"} ],
        "edges": [ {"source_node_id": "n1", "target_node_id": "p1"} ]
    })");
    EXPECT_THROW(exchange.importCollection("kg", doc, true), EndpointNotFoundError);
    EXPECT_NO_THROW(exchange.importCollection("kg", doc, false));
}

TEST_F(ExchangeTest, ShapeErrors) {
    EXPECT_THROW(exchange.importCollection("kg", Json::Value(Json::arrayValue), false), ValidationError);
    EXPECT_THROW(exchange.importCollection("kg", GraphExchange::parseDocument(R"({"nodes": {}})"), false),
                 ValidationError);
    EXPECT_THROW(exchange.importCollection("kg", GraphExchange::parseDocument(R"({"format_version": 99})"), false),
                 ValidationError);
    EXPECT_THROW(exchange.importCollection("kg", GraphExchange::parseDocument(
                     R"({"nodes": [ {"node_id": "d", "name": "A"}, {"node_id": "d", "name": "B"} ]})"),
                     false),
                 ValidationError);
    EXPECT_THROW(GraphExchange::parseDocument("{not json"), ValidationError);
    EXPECT_THROW(exchange.importCollection("kg", GraphExchange::parseDocument(
                     R"({"nodes": [ {"node_id": "a", "name": "A", "created_at": 1e19} ]})"),
                     false),
                 ValidationError);
    EXPECT_THROW(exchange.importCollection("kg", GraphExchange::parseDocument(
                     R"({"nodes": [ {"node_id": "a", "name": "A", "updated_at": 18446744073709551615} ]})"),
                     false),
                 ValidationError);

    try {
        exchange.importCollection("kg", GraphExchange::parseDocument(
            R"({"nodes": [ {"node_id": "ok", "name": "Fine"}, {"node_id": "n2"} ]})"), false);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("nodes[1]"), std::string::npos);
    }
    EXPECT_FALSE(mutations.nodeExists("kg", "ok"));
}

// ─── Files ─────────────────────────────────────────────────────

TEST_F(ExchangeTest, FileRoundTrip) {
    auto path = (std::filesystem::temp_directory_path() / "kgraph_exchange_test.json").string();
    exchange.exportToFile("kg", path);

    ImportSummary s = exchange.importFromFile("restored", path, true);
    EXPECT_EQ(s.nodes_created, 3u);
    EXPECT_EQ(mutations.listEdges("restored"), mutations.listEdges("kg"));
    std::remove(path.c_str());

    EXPECT_THROW(exchange.importFromFile("restored", path, false), ValidationError);
}
