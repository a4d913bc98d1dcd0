#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace kgraph {

/// Traversal direction relative to an edge: Out follows source → target,
/// In follows target → source, Both follows either.
enum class Direction { Out, In, Both };

const char* directionName(Direction direction);

/// Parse "in" / "out" / "both" (case-insensitive). Throws ValidationError.
Direction parseDirection(const std::string& text);

/// One hop available from a node: the edge taken and the node reached.
struct Step {
    std::string edge_id;
    std::string neighbor;
};

// ─── Graph ─────────────────────────────────────────────────────
// In-memory directed multigraph of one collection. Nodes and edges are
// keyed by their string ids; adjacency lists hold edge ids in ascending
// lexical order so every traversal over the same snapshot is
// deterministic. Parallel edges and self-loops are allowed.

class Graph {
public:
    Graph() = default;

    // ── Node operations ──
    void addNode(Node node);
    bool removeNode(const std::string& id);
    const Node* getNode(const std::string& id) const;
    bool hasNode(const std::string& id) const { return nodes_.count(id) > 0; }
    size_t nodeCount() const { return nodes_.size(); }

    // ── Edge operations ──
    void addEdge(Edge edge);
    bool removeEdge(const std::string& id);
    const Edge* getEdge(const std::string& id) const;
    bool hasEdge(const std::string& id) const { return edges_.count(id) > 0; }
    size_t edgeCount() const { return edges_.size(); }

    // ── Adjacency queries ──
    std::vector<std::string> getOutgoing(const std::string& node_id) const;
    std::vector<std::string> getIncoming(const std::string& node_id) const;
    std::vector<std::string> getNeighborNodes(const std::string& node_id) const;

    /// Hops available from `node_id` in `direction`, ordered by edge id.
    /// A self-loop is reported once even for Direction::Both.
    std::vector<Step> stepsFrom(const std::string& node_id, Direction direction) const;

    /// Edge ids touching the node on either side, ascending.
    std::vector<std::string> getIncident(const std::string& node_id) const;

    size_t outDegree(const std::string& node_id) const;
    size_t inDegree(const std::string& node_id) const;

    // ── Iteration (ascending id order) ──
    void forEachNode(const std::function<void(const Node&)>& fn) const;
    void forEachEdge(const std::function<void(const Edge&)>& fn) const;

private:
    std::map<std::string, Node> nodes_;
    std::map<std::string, Edge> edges_;

    // Adjacency lists: node_id → set of edge_ids
    std::unordered_map<std::string, std::set<std::string>> outgoing_;
    std::unordered_map<std::string, std::set<std::string>> incoming_;
};

} // namespace kgraph
