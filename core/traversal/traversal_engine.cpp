#include "traversal/traversal_engine.hpp"
#include "common/errors.hpp"
#include "common/validation.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace kgraph {

bool NeighborResult::contains(const std::string& node_id) const {
    return std::any_of(nodes.begin(), nodes.end(),
                       [&](const NeighborHit& h) { return h.node.id == node_id; });
}

std::vector<std::string> NeighborResult::nodeIds() const {
    std::vector<std::string> ids;
    ids.reserve(nodes.size());
    for (const auto& hit : nodes) ids.push_back(hit.node.id);
    return ids;
}

double Path::totalWeight() const {
    double total = 0.0;
    for (const auto& e : edges) total += e.weight;
    return total;
}

namespace {

Direction reversed(Direction direction) {
    switch (direction) {
        case Direction::Out: return Direction::In;
        case Direction::In:  return Direction::Out;
        default:             return direction;
    }
}

/// Hop distance to `target` of every node that can reach it within
/// `max_hops` when walking in `direction`.
std::unordered_map<std::string, int> distancesTo(const Graph& graph, const std::string& target,
                                                 Direction direction, int max_hops) {
    std::unordered_map<std::string, int> distance{{target, 0}};
    std::deque<std::string> frontier{target};
    Direction back = reversed(direction);

    while (!frontier.empty()) {
        std::string current = frontier.front();
        frontier.pop_front();
        int d = distance.at(current);
        if (d >= max_hops) continue;

        for (const auto& step : graph.stepsFrom(current, back)) {
            if (distance.emplace(step.neighbor, d + 1).second) {
                frontier.push_back(step.neighbor);
            }
        }
    }
    return distance;
}

/// Depth-first enumeration of simple paths of exactly `length` hops.
/// Branches whose node cannot reach the target in the hops left are cut.
struct SimplePathSearch {
    const Graph& graph;
    const std::string& target;
    Direction direction;
    size_t cap;
    const std::unordered_map<std::string, int>& distance;

    std::vector<std::string> node_stack;
    std::vector<std::string> edge_stack;
    std::unordered_set<std::string> on_path;
    std::vector<Path>& out;

    void run(int length) {
        const std::string current = node_stack.back();
        int remaining = length - static_cast<int>(edge_stack.size());

        for (const auto& step : graph.stepsFrom(current, direction)) {
            if (out.size() >= cap) return;

            bool reaches_target = step.neighbor == target;
            if (remaining == 1) {
                if (!reaches_target) continue;
                Path p;
                p.node_ids = node_stack;
                p.node_ids.push_back(target);
                for (const auto& eid : edge_stack) p.edges.push_back(*graph.getEdge(eid));
                p.edges.push_back(*graph.getEdge(step.edge_id));
                out.push_back(std::move(p));
                continue;
            }
            // Target may only appear as the final node of a simple path
            if (reaches_target || on_path.count(step.neighbor)) continue;
            auto d = distance.find(step.neighbor);
            if (d == distance.end() || d->second > remaining - 1) continue;

            node_stack.push_back(step.neighbor);
            edge_stack.push_back(step.edge_id);
            on_path.insert(step.neighbor);
            run(length);
            on_path.erase(step.neighbor);
            edge_stack.pop_back();
            node_stack.pop_back();
        }
    }
};

} // namespace

void TraversalEngine::requireNode(const Graph& graph, const std::string& id) const {
    if (!graph.hasNode(id)) {
        throw NotFoundError("Node", id);
    }
}

// ─── Neighbor expansion ────────────────────────────────────────

NeighborResult TraversalEngine::neighbors(const Graph& graph, const std::string& node_id,
                                          Direction direction, int max_depth) const {
    requireRange(max_depth, config_.max_neighbor_depth, "max_depth");
    requireNode(graph, node_id);

    NeighborResult result;
    result.start_id = node_id;

    std::unordered_set<std::string> visited{node_id};
    std::set<std::string> traversed;
    std::deque<std::pair<std::string, int>> frontier;
    frontier.emplace_back(node_id, 0);

    while (!frontier.empty()) {
        auto [current, depth] = frontier.front();
        frontier.pop_front();
        if (depth >= max_depth) continue;

        for (const auto& step : graph.stepsFrom(current, direction)) {
            traversed.insert(step.edge_id);
            if (visited.insert(step.neighbor).second) {
                result.nodes.push_back({*graph.getNode(step.neighbor), depth + 1, step.edge_id});
                frontier.emplace_back(step.neighbor, depth + 1);
            }
        }
    }

    for (const auto& eid : traversed) {
        result.edges.push_back(*graph.getEdge(eid));
    }
    return result;
}

// ─── Path search ───────────────────────────────────────────────

std::optional<Path> TraversalEngine::findPath(const Graph& graph, const std::string& source_id,
                                              const std::string& target_id, int max_length,
                                              Direction direction) const {
    requireRange(max_length, config_.max_path_length, "max_length");
    requireNode(graph, source_id);
    requireNode(graph, target_id);

    if (source_id == target_id) {
        Path p;
        p.node_ids.push_back(source_id);
        return p;
    }

    // node → (parent node, edge used); the first discovery is the shortest
    std::unordered_map<std::string, std::pair<std::string, std::string>> parent;
    std::unordered_set<std::string> visited{source_id};
    std::deque<std::pair<std::string, int>> frontier;
    frontier.emplace_back(source_id, 0);
    bool found = false;

    while (!frontier.empty() && !found) {
        auto [current, depth] = frontier.front();
        frontier.pop_front();
        if (depth >= max_length) continue;

        for (const auto& step : graph.stepsFrom(current, direction)) {
            if (!visited.insert(step.neighbor).second) continue;
            parent[step.neighbor] = {current, step.edge_id};
            if (step.neighbor == target_id) {
                found = true;
                break;
            }
            frontier.emplace_back(step.neighbor, depth + 1);
        }
    }

    if (!found) return std::nullopt;

    Path p;
    std::string cursor = target_id;
    while (cursor != source_id) {
        const auto& [prev, edge_id] = parent.at(cursor);
        p.node_ids.push_back(cursor);
        p.edges.push_back(*graph.getEdge(edge_id));
        cursor = prev;
    }
    p.node_ids.push_back(source_id);
    std::reverse(p.node_ids.begin(), p.node_ids.end());
    std::reverse(p.edges.begin(), p.edges.end());
    return p;
}

std::vector<Path> TraversalEngine::findAllPaths(const Graph& graph, const std::string& source_id,
                                                const std::string& target_id, int max_length,
                                                size_t limit, Direction direction) const {
    requireRange(max_length, config_.max_path_length, "max_length");
    requireNode(graph, source_id);
    requireNode(graph, target_id);

    size_t cap = limit > 0 ? limit : static_cast<size_t>(config_.max_paths);
    std::vector<Path> paths;

    if (source_id == target_id) {
        Path p;
        p.node_ids.push_back(source_id);
        paths.push_back(std::move(p));
        return paths;
    }

    auto distance = distancesTo(graph, target_id, direction, max_length);
    auto shortest = distance.find(source_id);
    if (shortest == distance.end()) return paths;

    // Iterative deepening yields shortest paths first without sorting
    for (int length = shortest->second; length <= max_length && paths.size() < cap; length++) {
        SimplePathSearch search{graph, target_id, direction, cap, distance,
                                {source_id}, {}, {source_id}, paths};
        search.run(length);
    }
    return paths;
}

// ─── Statistics ────────────────────────────────────────────────

GraphStats TraversalEngine::stats(const Graph& graph) const {
    GraphStats s;
    s.node_count = graph.nodeCount();
    s.edge_count = graph.edgeCount();

    graph.forEachNode([&](const Node& n) {
        size_t in = graph.inDegree(n.id);
        size_t out = graph.outDegree(n.id);
        if (in == 0 && out == 0) s.isolated_node_count++;
        s.max_in_degree = std::max(s.max_in_degree, in);
        s.max_out_degree = std::max(s.max_out_degree, out);
        if (n.type) {
            s.node_type_counts[*n.type]++;
        } else {
            s.untyped_node_count++;
        }
    });

    graph.forEachEdge([&](const Edge& e) {
        if (e.relation_type) s.relation_type_counts[*e.relation_type]++;
    });

    if (s.node_count > 0) {
        s.avg_degree = 2.0 * static_cast<double>(s.edge_count) / static_cast<double>(s.node_count);
    }
    return s;
}

} // namespace kgraph
