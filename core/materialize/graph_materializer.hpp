#pragma once

#include "graph/graph.hpp"
#include "store/record_store.hpp"

#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace kgraph {

/// Builds the in-memory multigraph of one collection from its flat
/// node/edge records. An unknown or empty collection yields an empty graph.
class GraphMaterializer {
public:
    explicit GraphMaterializer(const RecordStore& store) : store_(store) {}

    Graph materialize(const std::string& collection) const;

private:
    const RecordStore& store_;
};

// ─── MaterializedViewCache ────────────────────────────────────
// Immutable per-collection views shared by concurrent readers.
//
// Contract with callers: get() runs under the collection's shared lock
// and invalidate() under its exclusive lock, so a view can never be
// observed after a write to its collection has completed.
//
// At most `capacity` views are kept, least recently used evicted first.
// Views of empty collections are never cached.

class MaterializedViewCache {
public:
    MaterializedViewCache(const GraphMaterializer& materializer, bool enabled, size_t capacity);

    std::shared_ptr<const Graph> get(const std::string& collection);

    void invalidate(const std::string& collection);
    void invalidateAll();

    size_t cachedCount() const;
    bool enabled() const { return enabled_; }

private:
    using Entry = std::pair<std::string, std::shared_ptr<const Graph>>;

    const GraphMaterializer& materializer_;
    bool enabled_;
    size_t capacity_;

    mutable std::mutex mutex_;
    std::list<Entry> order_;  // most recently used first
    std::unordered_map<std::string, std::list<Entry>::iterator> views_;
};

} // namespace kgraph
