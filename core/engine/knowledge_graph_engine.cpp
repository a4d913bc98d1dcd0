#include "engine/knowledge_graph_engine.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include "common/validation.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace kgraph {

KnowledgeGraphEngine::KnowledgeGraphEngine(RecordStore& store, EngineConfig config)
    : config_(std::move(config)),
      store_(store),
      mutations_(store, config_),
      materializer_(store),
      views_(materializer_, config_.cache_materialized_views, config_.max_cached_views),
      traversal_(config_),
      search_(store, config_),
      exchange_(store, mutations_) {
    configureLogging(config_.log_level);
    logger()->debug("engine ready (view cache {})", views_.enabled() ? "on" : "off");
}

WriteGuard KnowledgeGraphEngine::lockForWrite(const std::string& collection) {
    requireCollectionName(collection, config_);
    WriteGuard guard(locks_, collection);
    // No reader can rebuild the view while this lock is held
    views_.invalidate(collection);
    return guard;
}

ReadGuard KnowledgeGraphEngine::lockForRead(const std::string& collection) {
    requireCollectionName(collection, config_);
    return ReadGuard(locks_, collection);
}

// ─── Nodes ─────────────────────────────────────────────────────

Node KnowledgeGraphEngine::createNode(const std::string& collection, const NodeInput& input) {
    auto lock = lockForWrite(collection);
    return mutations_.createNode(collection, input);
}

Node KnowledgeGraphEngine::updateNode(const std::string& collection, const std::string& id,
                                      const NodePatch& patch) {
    auto lock = lockForWrite(collection);
    return mutations_.updateNode(collection, id, patch);
}

std::vector<std::string> KnowledgeGraphEngine::deleteNode(const std::string& collection,
                                                          const std::string& id) {
    auto lock = lockForWrite(collection);
    return mutations_.deleteNode(collection, id);
}

Node KnowledgeGraphEngine::getNode(const std::string& collection, const std::string& id) {
    auto lock = lockForRead(collection);
    return mutations_.getNode(collection, id);
}

std::vector<Node> KnowledgeGraphEngine::listNodes(const std::string& collection,
                                                  const std::optional<std::string>& type,
                                                  size_t limit) {
    auto lock = lockForRead(collection);
    return mutations_.listNodes(collection, type, limit);
}

// ─── Edges ─────────────────────────────────────────────────────

Edge KnowledgeGraphEngine::createEdge(const std::string& collection, const EdgeInput& input) {
    auto lock = lockForWrite(collection);
    return mutations_.createEdge(collection, input);
}

Edge KnowledgeGraphEngine::updateEdge(const std::string& collection, const std::string& id,
                                      const EdgePatch& patch) {
    auto lock = lockForWrite(collection);
    return mutations_.updateEdge(collection, id, patch);
}

void KnowledgeGraphEngine::deleteEdge(const std::string& collection, const std::string& id) {
    auto lock = lockForWrite(collection);
    mutations_.deleteEdge(collection, id);
}

Edge KnowledgeGraphEngine::getEdge(const std::string& collection, const std::string& id) {
    auto lock = lockForRead(collection);
    return mutations_.getEdge(collection, id);
}

std::vector<Edge> KnowledgeGraphEngine::listEdges(const std::string& collection,
                                                  const std::optional<std::string>& node_id,
                                                  const std::optional<std::string>& relation_type,
                                                  size_t limit) {
    auto lock = lockForRead(collection);
    return mutations_.listEdges(collection, node_id, relation_type, limit);
}

// ─── Bulk ──────────────────────────────────────────────────────

BatchResult KnowledgeGraphEngine::batchCreateNodes(const std::string& collection,
                                                   const std::vector<NodeInput>& nodes) {
    auto lock = lockForWrite(collection);
    return mutations_.batchCreateNodes(collection, nodes);
}

BatchResult KnowledgeGraphEngine::batchCreateEdges(const std::string& collection,
                                                   const std::vector<EdgeInput>& edges) {
    auto lock = lockForWrite(collection);
    return mutations_.batchCreateEdges(collection, edges);
}

void KnowledgeGraphEngine::clearCollection(const std::string& collection) {
    auto lock = lockForWrite(collection);
    mutations_.clear(collection);
}

// ─── Traversal ─────────────────────────────────────────────────

NeighborResult KnowledgeGraphEngine::neighbors(const std::string& collection,
                                               const std::string& node_id,
                                               Direction direction, int max_depth) {
    auto lock = lockForRead(collection);
    auto graph = views_.get(collection);
    return traversal_.neighbors(*graph, node_id, direction, max_depth);
}

std::optional<Path> KnowledgeGraphEngine::findPath(const std::string& collection,
                                                   const std::string& source_id,
                                                   const std::string& target_id,
                                                   int max_length, Direction direction) {
    auto lock = lockForRead(collection);
    auto graph = views_.get(collection);
    return traversal_.findPath(*graph, source_id, target_id, max_length, direction);
}

std::vector<Path> KnowledgeGraphEngine::findAllPaths(const std::string& collection,
                                                     const std::string& source_id,
                                                     const std::string& target_id,
                                                     int max_length, size_t limit,
                                                     Direction direction) {
    auto lock = lockForRead(collection);
    auto graph = views_.get(collection);
    return traversal_.findAllPaths(*graph, source_id, target_id, max_length, limit, direction);
}

GraphStats KnowledgeGraphEngine::stats(const std::string& collection) {
    auto lock = lockForRead(collection);
    auto graph = views_.get(collection);
    return traversal_.stats(*graph);
}

// ─── Search ────────────────────────────────────────────────────

std::vector<NodeHit> KnowledgeGraphEngine::searchNodes(const std::string& collection,
                                                       const std::string& keyword, int limit) {
    auto lock = lockForRead(collection);
    return search_.searchNodes(collection, keyword, limit);
}

std::vector<NodeHit> KnowledgeGraphEngine::searchNodes(const std::string& collection,
                                                       const std::string& keyword) {
    return searchNodes(collection, keyword, config_.default_search_limit);
}

std::vector<EdgeHit> KnowledgeGraphEngine::searchEdges(const std::string& collection,
                                                       const std::string& keyword, int limit) {
    auto lock = lockForRead(collection);
    return search_.searchEdges(collection, keyword, limit);
}

void KnowledgeGraphEngine::setSearchPolicy(std::unique_ptr<SearchPolicy> policy) {
    StoreGuard all(locks_.registry());
    search_.setPolicy(std::move(policy));
}

// ─── Exchange ──────────────────────────────────────────────────

Json::Value KnowledgeGraphEngine::exportCollection(const std::string& collection) {
    auto lock = lockForRead(collection);
    return exchange_.exportCollection(collection);
}

ImportSummary KnowledgeGraphEngine::importCollection(const std::string& collection,
                                                     const Json::Value& document,
                                                     bool clear_existing) {
    auto lock = lockForWrite(collection);
    return exchange_.importCollection(collection, document, clear_existing);
}

void KnowledgeGraphEngine::exportToFile(const std::string& collection, const std::string& path) {
    auto lock = lockForRead(collection);
    exchange_.exportToFile(collection, path);
}

ImportSummary KnowledgeGraphEngine::importFromFile(const std::string& collection,
                                                   const std::string& path, bool clear_existing) {
    auto lock = lockForWrite(collection);
    return exchange_.importFromFile(collection, path, clear_existing);
}

// ─── Context ───────────────────────────────────────────────────

int KnowledgeGraphEngine::contextBudget(int max_chars) const {
    return max_chars == 0 ? config_.context_max_chars : max_chars;
}

std::string KnowledgeGraphEngine::formatContext(const std::vector<Node>& ranked_nodes,
                                                const std::vector<Edge>& edges,
                                                int max_chars) const {
    return formatter_.format(ranked_nodes, edges, contextBudget(max_chars));
}

ContextResult KnowledgeGraphEngine::queryContext(const std::string& collection,
                                                 const std::string& query_text,
                                                 int top_k, int max_chars) {
    int budget = contextBudget(max_chars);
    if (budget <= 0) {
        throw ValidationError("max_chars", "must be positive");
    }

    auto lock = lockForRead(collection);
    ContextResult result;
    for (auto& hit : search_.searchNodes(collection, query_text, top_k)) {
        result.nodes.push_back(std::move(hit.node));
    }

    auto graph = views_.get(collection);
    std::unordered_set<std::string> listed;
    for (const auto& node : result.nodes) listed.insert(node.id);

    std::unordered_set<std::string> taken;
    std::unordered_map<std::string, std::string> names;
    const size_t per_node = static_cast<size_t>(config_.context_edges_per_node);

    for (const auto& node : result.nodes) {
        std::vector<const Edge*> incident;
        for (const auto& eid : graph->getIncident(node.id)) {
            incident.push_back(graph->getEdge(eid));
        }
        std::sort(incident.begin(), incident.end(), [](const Edge* a, const Edge* b) {
            if (a->weight != b->weight) return a->weight > b->weight;
            return a->id < b->id;
        });
        if (incident.size() > per_node) incident.resize(per_node);

        for (const Edge* edge : incident) {
            if (!taken.insert(edge->id).second) continue;
            result.edges.push_back(*edge);
            for (const auto* end : {&edge->source, &edge->target}) {
                if (listed.count(*end) || names.count(*end)) continue;
                if (const Node* other = graph->getNode(*end)) names.emplace(*end, other->name);
            }
        }
    }

    result.text = formatter_.format(result.nodes, result.edges, budget, names);
    logger()->debug("{}: context for '{}' -> {} nodes, {} edges, {} chars",
                    collection, query_text, result.nodes.size(), result.edges.size(),
                    result.text.size());
    return result;
}

std::vector<std::string> KnowledgeGraphEngine::collections() const {
    return store_.collections();
}

// ─── Store maintenance ─────────────────────────────────────────

void KnowledgeGraphEngine::reloadStore(const std::function<void(RecordStore&)>& reload) {
    StoreGuard all(locks_.registry());
    views_.invalidateAll();
    reload(store_);
    logger()->info("store reloaded; {} collection(s)", store_.collections().size());
}

size_t KnowledgeGraphEngine::cachedViewCount() const {
    return views_.cachedCount();
}

size_t KnowledgeGraphEngine::lockedCollectionCount() const {
    return locks_.size();
}

} // namespace kgraph
