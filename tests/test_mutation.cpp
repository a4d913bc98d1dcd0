#include <gtest/gtest.h>
#include "mutation/mutation_manager.hpp"
#include "store/memory_record_store.hpp"

#include <limits>

using namespace kgraph;

namespace {

NodeInput person(const std::string& id, const std::string& name) {
    NodeInput in;
    in.id = id;
    in.name = name;
    in.type = "Person";
    return in;
}

EdgeInput link(const std::string& id, const std::string& source, const std::string& target,
               const std::string& relation = "knows") {
    EdgeInput in;
    in.id = id;
    in.source = source;
    in.target = target;
    in.relation_type = relation;
    return in;
}

class MutationTest : public ::testing::Test {
protected:
    MemoryRecordStore store;
    EngineConfig config;
    MutationManager mutations{store, config};
};

} // namespace

// ─── Nodes ─────────────────────────────────────────────────────

TEST_F(MutationTest, CreateAndGetNode) {
    NodeInput in = person("p1", "Alice");
    in.properties["age"] = 30;

    Node created = mutations.createNode("kg", in);
    EXPECT_GT(created.created_at, 0);
    EXPECT_EQ(created.created_at, created.updated_at);

    Node fetched = mutations.getNode("kg", "p1");
    EXPECT_EQ(fetched, created);
    EXPECT_EQ(fetched.getProperty("age").asInt(), 30);
}

TEST_F(MutationTest, DuplicateNodeLeavesOriginal) {
    mutations.createNode("kg", person("p1", "Alice"));
    EXPECT_THROW(mutations.createNode("kg", person("p1", "Impostor")), DuplicateIdError);
    EXPECT_EQ(mutations.getNode("kg", "p1").name, "Alice");
}

TEST_F(MutationTest, NodeValidation) {
    EXPECT_THROW(mutations.createNode("kg", person("", "Nobody")), ValidationError);
    EXPECT_THROW(mutations.createNode("kg", person("p1", "")), ValidationError);
    EXPECT_THROW(mutations.createNode("kg", person(std::string(101, 'x'), "Long")), ValidationError);

    NodeInput long_type = person("p1", "Alice");
    long_type.type = std::string(51, 't');
    EXPECT_THROW(mutations.createNode("kg", long_type), ValidationError);

    NodeInput bad_props = person("p1", "Alice");
    bad_props.properties = Json::Value(Json::arrayValue);
    EXPECT_THROW(mutations.createNode("kg", bad_props), ValidationError);

    EXPECT_FALSE(mutations.nodeExists("kg", "p1"));
}

TEST_F(MutationTest, EmptyTypeMeansUntyped) {
    NodeInput in = person("p1", "Alice");
    in.type = "";
    EXPECT_FALSE(mutations.createNode("kg", in).type.has_value());
}

TEST_F(MutationTest, UpdateNodeOnlySuppliedFields) {
    NodeInput in = person("p1", "Alice");
    in.properties["age"] = 30;
    in.properties["city"] = "Paris";
    Node before = mutations.createNode("kg", in);

    NodePatch patch;
    patch.properties = Json::Value(Json::objectValue);
    (*patch.properties)["age"] = 31;
    (*patch.properties)["city"] = Json::Value();
    patch.property_update = PropertyUpdate::Merge;

    Node after = mutations.updateNode("kg", "p1", patch);
    EXPECT_EQ(after.name, "Alice");
    EXPECT_EQ(after.type.value_or(""), "Person");
    EXPECT_EQ(after.getProperty("age").asInt(), 31);
    EXPECT_FALSE(after.hasProperty("city"));
    EXPECT_EQ(after.created_at, before.created_at);
    EXPECT_GE(after.updated_at, before.updated_at);

    NodePatch clear;
    clear.clear_type = true;
    clear.name = "Alicia";
    Node cleared = mutations.updateNode("kg", "p1", clear);
    EXPECT_FALSE(cleared.type.has_value());
    EXPECT_EQ(cleared.name, "Alicia");

    EXPECT_THROW(mutations.updateNode("kg", "ghost", clear), NotFoundError);
}

TEST_F(MutationTest, ReplacePropertiesByDefault) {
    NodeInput in = person("p1", "Alice");
    in.properties["age"] = 30;
    mutations.createNode("kg", in);

    NodePatch patch;
    patch.properties = Json::Value(Json::objectValue);
    (*patch.properties)["role"] = "admin";
    Node after = mutations.updateNode("kg", "p1", patch);
    EXPECT_FALSE(after.hasProperty("age"));
    EXPECT_EQ(after.getProperty("role").asString(), "admin");
}

TEST_F(MutationTest, DeleteNodeCascadesTouchingEdgesOnly) {
    mutations.createNode("kg", person("p1", "Alice"));
    mutations.createNode("kg", person("p2", "Bob"));
    mutations.createNode("kg", person("p3", "Carol"));
    mutations.createEdge("kg", link("e1", "p1", "p2"));
    mutations.createEdge("kg", link("e2", "p3", "p1"));
    mutations.createEdge("kg", link("e3", "p2", "p3"));

    auto cascaded = mutations.deleteNode("kg", "p1");
    EXPECT_EQ(cascaded, (std::vector<std::string>{"e1", "e2"}));
    EXPECT_FALSE(mutations.nodeExists("kg", "p1"));
    EXPECT_TRUE(mutations.edgeExists("kg", "e3"));
    EXPECT_EQ(mutations.listEdges("kg").size(), 1u);

    EXPECT_THROW(mutations.deleteNode("kg", "p1"), NotFoundError);
}

TEST_F(MutationTest, ListNodesByType) {
    mutations.createNode("kg", person("p2", "Bob"));
    mutations.createNode("kg", person("p1", "Alice"));
    NodeInput city;
    city.id = "c1";
    city.name = "Paris";
    city.type = "City";
    mutations.createNode("kg", city);

    auto people = mutations.listNodes("kg", std::string("Person"));
    ASSERT_EQ(people.size(), 2u);
    EXPECT_EQ(people[0].id, "p1");
    EXPECT_EQ(mutations.listNodes("kg").size(), 3u);
    EXPECT_EQ(mutations.listNodes("kg", std::nullopt, 1).size(), 1u);
}

// ─── Edges ─────────────────────────────────────────────────────

TEST_F(MutationTest, EdgeRequiresEndpoints) {
    mutations.createNode("kg", person("p1", "Alice"));
    try {
        mutations.createEdge("kg", link("e1", "p1", "p2"));
        FAIL() << "expected EndpointNotFoundError";
    } catch (const EndpointNotFoundError& e) {
        EXPECT_EQ(e.subject(), "p2");
        EXPECT_EQ(e.edgeId(), "e1");
    }
    EXPECT_FALSE(mutations.edgeExists("kg", "e1"));

    mutations.createNode("kg", person("p2", "Bob"));
    Edge e = mutations.createEdge("kg", link("e1", "p1", "p2"));
    EXPECT_EQ(mutations.getEdge("kg", "e1"), e);
}

TEST_F(MutationTest, GeneratedEdgeIdAndDuplicates) {
    mutations.createNode("kg", person("p1", "Alice"));
    mutations.createNode("kg", person("p2", "Bob"));

    Edge e = mutations.createEdge("kg", link("", "p1", "p2"));
    EXPECT_EQ(e.id, "p1_knows_p2");
    EXPECT_THROW(mutations.createEdge("kg", link("", "p1", "p2")), DuplicateIdError);
}

TEST_F(MutationTest, EdgeValidation) {
    mutations.createNode("kg", person("p1", "Alice"));
    EdgeInput in = link("e1", "p1", "p1");
    in.weight = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(mutations.createEdge("kg", in), ValidationError);

    in.weight = -2.5;  // any finite weight is accepted
    EXPECT_DOUBLE_EQ(mutations.createEdge("kg", in).weight, -2.5);
}

TEST_F(MutationTest, UpdateEdgeRechecksEndpoints) {
    mutations.createNode("kg", person("p1", "Alice"));
    mutations.createNode("kg", person("p2", "Bob"));
    mutations.createEdge("kg", link("e1", "p1", "p2"));

    EdgePatch move;
    move.target = "ghost";
    EXPECT_THROW(mutations.updateEdge("kg", "e1", move), EndpointNotFoundError);
    EXPECT_EQ(mutations.getEdge("kg", "e1").target, "p2");

    EdgePatch reweigh;
    reweigh.weight = 0.25;
    reweigh.clear_relation_type = true;
    Edge updated = mutations.updateEdge("kg", "e1", reweigh);
    EXPECT_DOUBLE_EQ(updated.weight, 0.25);
    EXPECT_FALSE(updated.relation_type.has_value());

    EXPECT_THROW(mutations.updateEdge("kg", "nope", reweigh), NotFoundError);
}

TEST_F(MutationTest, DeleteEdgeKeepsNodes) {
    mutations.createNode("kg", person("p1", "Alice"));
    mutations.createNode("kg", person("p2", "Bob"));
    mutations.createEdge("kg", link("e1", "p1", "p2"));

    mutations.deleteEdge("kg", "e1");
    EXPECT_FALSE(mutations.edgeExists("kg", "e1"));
    EXPECT_TRUE(mutations.nodeExists("kg", "p1"));
    EXPECT_TRUE(mutations.nodeExists("kg", "p2"));
    EXPECT_THROW(mutations.deleteEdge("kg", "e1"), NotFoundError);
}

TEST_F(MutationTest, ListEdgesByNodeAndRelation) {
    mutations.createNode("kg", person("p1", "Alice"));
    mutations.createNode("kg", person("p2", "Bob"));
    mutations.createNode("kg", person("p3", "Carol"));
    mutations.createEdge("kg", link("e1", "p1", "p2", "knows"));
    mutations.createEdge("kg", link("e2", "p3", "p1", "likes"));
    mutations.createEdge("kg", link("e3", "p2", "p3", "knows"));

    EXPECT_EQ(mutations.listEdges("kg", std::string("p1")).size(), 2u);
    EXPECT_EQ(mutations.listEdges("kg", std::nullopt, std::string("knows")).size(), 2u);
    auto both = mutations.listEdges("kg", std::string("p1"), std::string("likes"));
    ASSERT_EQ(both.size(), 1u);
    EXPECT_EQ(both[0].id, "e2");
}

// ─── Bulk ──────────────────────────────────────────────────────

TEST_F(MutationTest, BatchReportsEachItem) {
    mutations.createNode("kg", person("p1", "Alice"));

    BatchResult nodes = mutations.batchCreateNodes("kg", {
        person("p2", "Bob"),
        person("p1", "Duplicate"),
        person("", "NoId"),
        person("p3", "Carol"),
    });
    EXPECT_EQ(nodes.succeeded, 2u);
    EXPECT_EQ(nodes.failed, 2u);
    EXPECT_EQ(nodes.created_ids, (std::vector<std::string>{"p2", "p3"}));
    ASSERT_EQ(nodes.failures.size(), 2u);
    EXPECT_EQ(nodes.failures[0].index, 1u);
    EXPECT_EQ(nodes.failures[0].kind, ErrorKind::DuplicateId);
    EXPECT_EQ(nodes.failures[1].kind, ErrorKind::Validation);

    BatchResult edges = mutations.batchCreateEdges("kg", {
        link("", "p1", "p2"),
        link("e2", "p2", "ghost"),
    });
    EXPECT_EQ(edges.succeeded, 1u);
    EXPECT_EQ(edges.created_ids[0], "p1_knows_p2");
    ASSERT_EQ(edges.failures.size(), 1u);
    EXPECT_EQ(edges.failures[0].id, "e2");
    EXPECT_EQ(edges.failures[0].kind, ErrorKind::EndpointNotFound);
}

TEST_F(MutationTest, ClearIsIdempotent) {
    mutations.createNode("kg", person("p1", "Alice"));
    mutations.clear("kg");
    mutations.clear("kg");
    EXPECT_TRUE(mutations.listNodes("kg").empty());
}
