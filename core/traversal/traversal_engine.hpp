#pragma once

#include "graph/graph.hpp"
#include "common/config.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kgraph {

/// A node reached by neighbor expansion.
struct NeighborHit {
    Node node;
    int depth = 0;              // hops from the start node
    std::string via_edge_id;    // edge that first discovered it
};

struct NeighborResult {
    std::string start_id;
    std::vector<NeighborHit> nodes;   // BFS discovery order
    std::vector<Edge> edges;          // every edge traversed, ascending id

    bool contains(const std::string& node_id) const;
    std::vector<std::string> nodeIds() const;
};

/// A walk source → target: node_ids has hops() + 1 entries.
struct Path {
    std::vector<std::string> node_ids;
    std::vector<Edge> edges;

    size_t hops() const { return edges.size(); }
    double totalWeight() const;
};

struct GraphStats {
    size_t node_count = 0;
    size_t edge_count = 0;
    size_t isolated_node_count = 0;
    size_t untyped_node_count = 0;
    size_t max_in_degree = 0;
    size_t max_out_degree = 0;
    double avg_degree = 0.0;    // (in + out) per node
    std::map<std::string, size_t> node_type_counts;
    std::map<std::string, size_t> relation_type_counts;
};

// ─── Traversal Engine ─────────────────────────────────────────
// Breadth-first algorithms over one materialized snapshot. Hops from a
// node are always expanded in ascending edge-id order, which fixes the
// tie-break among equal-length paths for a given snapshot.

class TraversalEngine {
public:
    explicit TraversalEngine(const EngineConfig& config) : config_(config) {}

    /// Nodes within max_depth hops of node_id, start excluded.
    /// Throws NotFoundError / ValidationError.
    NeighborResult neighbors(const Graph& graph, const std::string& node_id,
                             Direction direction, int max_depth) const;

    /// Shortest path within max_length hops, or nullopt if none exists.
    /// source == target yields the zero-hop path.
    std::optional<Path> findPath(const Graph& graph, const std::string& source_id,
                                 const std::string& target_id, int max_length,
                                 Direction direction = Direction::Out) const;

    /// All simple paths within max_length hops, shortest first, then by
    /// edge-id sequence. limit == 0 means config.max_paths.
    std::vector<Path> findAllPaths(const Graph& graph, const std::string& source_id,
                                   const std::string& target_id, int max_length,
                                   size_t limit = 0,
                                   Direction direction = Direction::Out) const;

    GraphStats stats(const Graph& graph) const;

private:
    void requireNode(const Graph& graph, const std::string& id) const;

    const EngineConfig& config_;
};

} // namespace kgraph
