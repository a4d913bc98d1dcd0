#include <gtest/gtest.h>
#include "search/keyword_search.hpp"
#include "mutation/mutation_manager.hpp"
#include "store/memory_record_store.hpp"
#include "common/errors.hpp"

using namespace kgraph;

namespace {

class SearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        addNode("p1", "Alice", "Person");
        addNode("p2", "Bob", "Person");
        addNode("p3", "Malice", "Villain");
        addNode("p4", "ali", std::nullopt);
        NodeInput carol{"p5", "Carol", std::string("Person"), Json::Value(Json::objectValue)};
        carol.properties["friend"] = "Alistair";
        mutations.createNode("kg", carol);
        addNode("c1", "Berlin", std::string("City of Alignment"));

        EdgeInput knows;
        knows.id = "e1";
        knows.source = "p1";
        knows.target = "p2";
        knows.relation_type = "knows";
        mutations.createEdge("kg", knows);

        EdgeInput allied;
        allied.id = "e2";
        allied.source = "p2";
        allied.target = "p3";
        allied.relation_type = "allied_with";
        allied.properties["since"] = 1999;
        mutations.createEdge("kg", allied);
    }

    void addNode(const std::string& id, const std::string& name,
                 const std::optional<std::string>& type) {
        NodeInput in;
        in.id = id;
        in.name = name;
        in.type = type;
        mutations.createNode("kg", in);
    }

    static std::vector<std::string> ids(const std::vector<NodeHit>& hits) {
        std::vector<std::string> out;
        for (const auto& h : hits) out.push_back(h.node.id);
        return out;
    }

    MemoryRecordStore store;
    EngineConfig config;
    MutationManager mutations{store, config};
    KeywordSearch search{store, config};
};

/// Ranks a node only by an exact "role" property.
class RolePolicy : public SearchPolicy {
public:
    RecordFilter nodeCandidates(const std::string&) const override { return {}; }
    RecordFilter edgeCandidates(const std::string&) const override { return {}; }
    std::optional<int> rankNode(const Node& node, const std::string& needle) const override {
        if (node.getProperty("role").asString() == needle) return 0;
        return std::nullopt;
    }
    std::optional<int> rankEdge(const Edge&, const std::string&) const override {
        return std::nullopt;
    }
};

} // namespace

// ─── Node search ───────────────────────────────────────────────

TEST_F(SearchTest, TieredRanking) {
    auto hits = search.searchNodes("kg", "Ali", 10);
    // exact, prefix, substring, type, property
    EXPECT_EQ(ids(hits), (std::vector<std::string>{"p4", "p1", "p3", "c1", "p5"}));
    EXPECT_EQ(hits[0].tier, kExactLabel);
    EXPECT_EQ(hits[1].tier, kLabelPrefix);
    EXPECT_EQ(hits[2].tier, kLabelSubstring);
    EXPECT_EQ(hits[3].tier, kSecondaryField);
    EXPECT_EQ(hits[4].tier, kPropertyMatch);
}

TEST_F(SearchTest, CaseInsensitiveAndTrimmed) {
    auto hits = search.searchNodes("kg", "  BOB ", 10);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].node.id, "p2");
}

TEST_F(SearchTest, TiesBrokenById) {
    auto hits = search.searchNodes("kg", "person", 10);
    EXPECT_EQ(ids(hits), (std::vector<std::string>{"p1", "p2", "p5"}));
}

TEST_F(SearchTest, LimitCapsResults) {
    EXPECT_EQ(search.searchNodes("kg", "ali", 2).size(), 2u);
    EXPECT_THROW(search.searchNodes("kg", "ali", 0), ValidationError);
    EXPECT_THROW(search.searchNodes("kg", "ali", -1), ValidationError);
    EXPECT_THROW(search.searchNodes("kg", "ali", config.max_search_limit + 1), ValidationError);
}

TEST_F(SearchTest, EmptyKeywordRejected) {
    EXPECT_THROW(search.searchNodes("kg", "   ", 5), ValidationError);
}

TEST_F(SearchTest, NoMatchOrUnknownCollection) {
    EXPECT_TRUE(search.searchNodes("kg", "zebra", 5).empty());
    EXPECT_TRUE(search.searchNodes("other", "alice", 5).empty());
}

// ─── Edge search ───────────────────────────────────────────────

TEST_F(SearchTest, EdgeSearch) {
    auto hits = search.searchEdges("kg", "knows", 10);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].edge.id, "e1");
    EXPECT_EQ(hits[0].tier, kExactLabel);

    auto by_prop = search.searchEdges("kg", "1999", 10);
    ASSERT_EQ(by_prop.size(), 1u);
    EXPECT_EQ(by_prop[0].edge.id, "e2");
    EXPECT_EQ(by_prop[0].tier, kPropertyMatch);

    auto by_id = search.searchEdges("kg", "e2", 10);
    ASSERT_EQ(by_id.size(), 1u);
    EXPECT_EQ(by_id[0].tier, kSecondaryField);
}

// ─── Policy ────────────────────────────────────────────────────

TEST_F(SearchTest, CustomPolicy) {
    NodePatch patch;
    patch.properties = Json::Value(Json::objectValue);
    (*patch.properties)["role"] = "admin";
    mutations.updateNode("kg", "p2", patch);

    search.setPolicy(std::make_unique<RolePolicy>());
    auto hits = search.searchNodes("kg", "ADMIN", 10);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].node.id, "p2");

    EXPECT_THROW(search.setPolicy(nullptr), ValidationError);
}
