#include <gtest/gtest.h>
#include "store/memory_record_store.hpp"
#include "store/record_codec.hpp"
#include "common/errors.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace kgraph;

namespace {

Record nodeRecord(const std::string& id, const std::string& name, const char* type = nullptr) {
    Node n(id, name);
    if (type) n.type = type;
    return nodeToJson(n);
}

std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

// ─── Memory Record Store ───────────────────────────────────────

TEST(StoreTest, UpsertGetRemove) {
    MemoryRecordStore store;
    EXPECT_FALSE(store.get("kg", RecordKind::Node, "p1").has_value());

    store.upsert("kg", RecordKind::Node, nodeRecord("p1", "Alice"));
    auto rec = store.get("kg", RecordKind::Node, "p1");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ((*rec)["name"].asString(), "Alice");

    store.upsert("kg", RecordKind::Node, nodeRecord("p1", "Alicia"));
    EXPECT_EQ((*store.get("kg", RecordKind::Node, "p1"))["name"].asString(), "Alicia");
    EXPECT_EQ(store.count("kg", RecordKind::Node), 1u);

    EXPECT_TRUE(store.remove("kg", RecordKind::Node, "p1"));
    EXPECT_FALSE(store.remove("kg", RecordKind::Node, "p1"));
}

TEST(StoreTest, CollectionsAreIsolated) {
    MemoryRecordStore store;
    store.upsert("a", RecordKind::Node, nodeRecord("p1", "Alice"));
    store.upsert("b", RecordKind::Node, nodeRecord("p1", "Bob"));

    EXPECT_EQ((*store.get("a", RecordKind::Node, "p1"))["name"].asString(), "Alice");
    EXPECT_EQ((*store.get("b", RecordKind::Node, "p1"))["name"].asString(), "Bob");
    EXPECT_EQ(store.collections(), (std::vector<std::string>{"a", "b"}));

    store.clear("a");
    EXPECT_EQ(store.count("a", RecordKind::Node), 0u);
    EXPECT_EQ(store.count("b", RecordKind::Node), 1u);
    store.clear("a");  // idempotent
}

TEST(StoreTest, UpsertWithoutIdIsStoreError) {
    MemoryRecordStore store;
    Json::Value bad(Json::objectValue);
    bad["name"] = "nameless";
    EXPECT_THROW(store.upsert("kg", RecordKind::Node, bad), StoreError);
    EXPECT_THROW(store.upsert("kg", RecordKind::Edge, nodeRecord("p1", "Alice")), StoreError);
}

TEST(StoreTest, ListFiltersAndLimits) {
    MemoryRecordStore store;
    store.upsert("kg", RecordKind::Node, nodeRecord("c", "Carol", "Person"));
    store.upsert("kg", RecordKind::Node, nodeRecord("a", "Alice", "Person"));
    store.upsert("kg", RecordKind::Node, nodeRecord("b", "Berlin", "City"));

    auto all = store.list("kg", RecordKind::Node);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0]["node_id"].asString(), "a");
    EXPECT_EQ(all[2]["node_id"].asString(), "c");

    RecordFilter people;
    people.all_of.push_back({"type", "Person"});
    EXPECT_EQ(store.list("kg", RecordKind::Node, people).size(), 2u);
    EXPECT_EQ(store.list("kg", RecordKind::Node, people, 1).size(), 1u);

    RecordFilter either;
    either.any_of.push_back({"node_id", "a"});
    either.any_of.push_back({"node_id", "b"});
    EXPECT_EQ(store.list("kg", RecordKind::Node, either).size(), 2u);

    RecordFilter text;
    text.contains = "BER";
    text.contains_fields = {"name"};
    auto hits = store.list("kg", RecordKind::Node, text);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0]["node_id"].asString(), "b");

    EXPECT_TRUE(store.list("missing", RecordKind::Node).empty());
}

// ─── Persistence ───────────────────────────────────────────────

TEST(StoreTest, SaveAndLoadFile) {
    std::string path = tempPath("kgraph_store_roundtrip.json");
    MemoryRecordStore store;
    store.upsert("kg", RecordKind::Node, nodeRecord("p1", "Alice"));
    store.upsert("kg", RecordKind::Node, nodeRecord("p2", "Bob"));
    store.upsert("kg", RecordKind::Edge, edgeToJson(Edge("e1", "p1", "p2", "knows")));
    store.saveToFile(path);

    MemoryRecordStore loaded;
    loaded.loadFromFile(path);
    EXPECT_EQ(loaded.count("kg", RecordKind::Node), 2u);
    EXPECT_EQ(loaded.count("kg", RecordKind::Edge), 1u);
    EXPECT_EQ(*loaded.get("kg", RecordKind::Edge, "e1"), *store.get("kg", RecordKind::Edge, "e1"));
    std::remove(path.c_str());
}

TEST(StoreTest, BadFileLeavesStoreUnchanged) {
    std::string path = tempPath("kgraph_store_bad.json");
    {
        std::ofstream out(path);
        out << "{\"collections\": {\"kg\": {\"nodes\": [{\"name\": \"no id\"}]}}}";
    }

    MemoryRecordStore store;
    store.upsert("kg", RecordKind::Node, nodeRecord("p1", "Alice"));
    EXPECT_THROW(store.loadFromFile(path), StoreError);
    EXPECT_THROW(store.loadFromFile(tempPath("kgraph_does_not_exist.json")), StoreError);
    EXPECT_EQ(store.count("kg", RecordKind::Node), 1u);
    std::remove(path.c_str());
}

// ─── Record codec ──────────────────────────────────────────────

TEST(RecordCodecTest, NodeLayout) {
    Node n("p1", "Alice");
    n.setProperty("age", 30);
    n.created_at = 5;
    n.updated_at = 6;

    Json::Value v = nodeToJson(n);
    EXPECT_EQ(v["node_id"].asString(), "p1");
    EXPECT_TRUE(v["type"].isNull());
    EXPECT_EQ(v["properties"]["age"].asInt(), 30);

    EXPECT_EQ(nodeFromJson(v, "node"), n);
}

TEST(RecordCodecTest, EdgeDefaults) {
    Json::Value v(Json::objectValue);
    v["source_node_id"] = "p1";
    v["target_node_id"] = "p2";
    v["relation_type"] = "knows";

    Edge e = edgeFromJson(v, "edges[0]");
    EXPECT_EQ(e.id, "p1_knows_p2");
    EXPECT_DOUBLE_EQ(e.weight, 1.0);
    EXPECT_EQ(e.created_at, 0);
    EXPECT_TRUE(e.properties.isObject());
}

TEST(RecordCodecTest, FieldErrorsNameTheField) {
    Json::Value v(Json::objectValue);
    v["node_id"] = "p1";
    try {
        nodeFromJson(v, "nodes[2]");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.subject(), "nodes[2].name");
    }

    Json::Value edge(Json::objectValue);
    edge["source_node_id"] = "a";
    edge["target_node_id"] = "b";
    edge["weight"] = "heavy";
    EXPECT_THROW(edgeFromJson(edge, "edge"), ValidationError);
}

TEST(RecordCodecTest, CorruptStoredRecordIsStoreError) {
    Json::Value v(Json::objectValue);
    v["node_id"] = "p1";
    EXPECT_THROW(decodeStoredNode(v), StoreError);
}
