#include "materialize/graph_materializer.hpp"
#include "store/record_codec.hpp"
#include "common/log.hpp"

namespace kgraph {

Graph GraphMaterializer::materialize(const std::string& collection) const {
    Graph g;

    for (const auto& record : store_.list(collection, RecordKind::Node)) {
        g.addNode(decodeStoredNode(record));
    }

    for (const auto& record : store_.list(collection, RecordKind::Edge)) {
        Edge edge = decodeStoredEdge(record);
        if (!g.hasNode(edge.source) || !g.hasNode(edge.target)) {
            // Only reachable if the store was modified behind the engine
            logger()->warn("collection {}: skipping edge {} with dangling endpoint ({} -> {})",
                           collection, edge.id, edge.source, edge.target);
            continue;
        }
        g.addEdge(std::move(edge));
    }

    logger()->trace("materialized {}: {} nodes, {} edges",
                    collection, g.nodeCount(), g.edgeCount());
    return g;
}

MaterializedViewCache::MaterializedViewCache(const GraphMaterializer& materializer,
                                             bool enabled, size_t capacity)
    : materializer_(materializer), enabled_(enabled && capacity > 0), capacity_(capacity) {}

std::shared_ptr<const Graph> MaterializedViewCache::get(const std::string& collection) {
    if (!enabled_) {
        return std::make_shared<const Graph>(materializer_.materialize(collection));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = views_.find(collection);
        if (it != views_.end()) {
            order_.splice(order_.begin(), order_, it->second);
            return it->second->second;
        }
    }

    // Build outside the lock; two readers racing here produce identical views
    auto view = std::make_shared<const Graph>(materializer_.materialize(collection));
    if (view->nodeCount() == 0) return view;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = views_.find(collection);
    if (it != views_.end()) {
        order_.splice(order_.begin(), order_, it->second);
        return it->second->second;
    }
    order_.emplace_front(collection, view);
    views_.emplace(collection, order_.begin());
    while (order_.size() > capacity_) {
        logger()->trace("evicting view of {}", order_.back().first);
        views_.erase(order_.back().first);
        order_.pop_back();
    }
    return view;
}

void MaterializedViewCache::invalidate(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = views_.find(collection);
    if (it == views_.end()) return;
    order_.erase(it->second);
    views_.erase(it);
}

void MaterializedViewCache::invalidateAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    views_.clear();
    order_.clear();
}

size_t MaterializedViewCache::cachedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return views_.size();
}

} // namespace kgraph
