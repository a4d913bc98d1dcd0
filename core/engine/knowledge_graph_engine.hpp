#pragma once

#include "context/context_formatter.hpp"
#include "engine/collection_locks.hpp"
#include "exchange/graph_exchange.hpp"
#include "materialize/graph_materializer.hpp"
#include "mutation/mutation_manager.hpp"
#include "search/keyword_search.hpp"
#include "store/record_store.hpp"
#include "traversal/traversal_engine.hpp"
#include "common/config.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kgraph {

/// Output of the search-then-format pipeline.
struct ContextResult {
    std::vector<Node> nodes;    // ranked best-first
    std::vector<Edge> edges;    // edges touching the ranked nodes
    std::string text;
};

// ─── KnowledgeGraphEngine ─────────────────────────────────────
// Collection-scoped facade over a RecordStore. Every call validates the
// collection name, then runs under that collection's lock: writes
// exclusive (and drop the cached view), reads shared against one
// materialized snapshot. Distinct collections never contend.
// Whole-store operations (reloadStore, setSearchPolicy) wait for all.
//
// The store must outlive the engine.

class KnowledgeGraphEngine {
public:
    explicit KnowledgeGraphEngine(RecordStore& store, EngineConfig config = {});

    const EngineConfig& config() const { return config_; }

    // ── Nodes ──
    Node createNode(const std::string& collection, const NodeInput& input);
    Node updateNode(const std::string& collection, const std::string& id, const NodePatch& patch);
    std::vector<std::string> deleteNode(const std::string& collection, const std::string& id);
    Node getNode(const std::string& collection, const std::string& id);
    std::vector<Node> listNodes(const std::string& collection,
                                const std::optional<std::string>& type = std::nullopt,
                                size_t limit = 0);

    // ── Edges ──
    Edge createEdge(const std::string& collection, const EdgeInput& input);
    Edge updateEdge(const std::string& collection, const std::string& id, const EdgePatch& patch);
    void deleteEdge(const std::string& collection, const std::string& id);
    Edge getEdge(const std::string& collection, const std::string& id);
    std::vector<Edge> listEdges(const std::string& collection,
                                const std::optional<std::string>& node_id = std::nullopt,
                                const std::optional<std::string>& relation_type = std::nullopt,
                                size_t limit = 0);

    // ── Bulk ──
    BatchResult batchCreateNodes(const std::string& collection, const std::vector<NodeInput>& nodes);
    BatchResult batchCreateEdges(const std::string& collection, const std::vector<EdgeInput>& edges);
    void clearCollection(const std::string& collection);

    // ── Traversal ──
    NeighborResult neighbors(const std::string& collection, const std::string& node_id,
                             Direction direction = Direction::Out, int max_depth = 1);
    std::optional<Path> findPath(const std::string& collection, const std::string& source_id,
                                 const std::string& target_id, int max_length,
                                 Direction direction = Direction::Out);
    std::vector<Path> findAllPaths(const std::string& collection, const std::string& source_id,
                                   const std::string& target_id, int max_length,
                                   size_t limit = 0, Direction direction = Direction::Out);
    GraphStats stats(const std::string& collection);

    // ── Search ──
    std::vector<NodeHit> searchNodes(const std::string& collection, const std::string& keyword,
                                     int limit);
    std::vector<NodeHit> searchNodes(const std::string& collection, const std::string& keyword);
    std::vector<EdgeHit> searchEdges(const std::string& collection, const std::string& keyword,
                                     int limit);

    /// Replaces the ranking policy once every running call has finished.
    void setSearchPolicy(std::unique_ptr<SearchPolicy> policy);

    // ── Exchange ──
    Json::Value exportCollection(const std::string& collection);
    ImportSummary importCollection(const std::string& collection, const Json::Value& document,
                                   bool clear_existing = false);
    void exportToFile(const std::string& collection, const std::string& path);
    ImportSummary importFromFile(const std::string& collection, const std::string& path,
                                 bool clear_existing = false);

    // ── Context ──
    /// max_chars == 0 uses config().context_max_chars.
    std::string formatContext(const std::vector<Node>& ranked_nodes, const std::vector<Edge>& edges,
                              int max_chars = 0) const;

    /// Search the collection for query_text, gather the strongest edges
    /// around each hit and format them.
    ContextResult queryContext(const std::string& collection, const std::string& query_text,
                               int top_k, int max_chars = 0);

    std::vector<std::string> collections() const;

    // ── Store maintenance ──
    /// Runs `reload` with every collection locked and all cached views
    /// dropped. Use it for anything that rewrites the store wholesale,
    /// e.g. MemoryRecordStore::loadFromFile.
    void reloadStore(const std::function<void(RecordStore&)>& reload);

    size_t cachedViewCount() const;
    size_t lockedCollectionCount() const;

private:
    WriteGuard lockForWrite(const std::string& collection);
    ReadGuard lockForRead(const std::string& collection);
    int contextBudget(int max_chars) const;

    EngineConfig config_;
    RecordStore& store_;
    MutationManager mutations_;
    GraphMaterializer materializer_;
    MaterializedViewCache views_;
    TraversalEngine traversal_;
    KeywordSearch search_;
    GraphExchange exchange_;
    ContextFormatter formatter_;
    CollectionLocks locks_;
};

} // namespace kgraph
