#include "graph/graph.hpp"
#include "common/errors.hpp"
#include "common/text.hpp"

#include <algorithm>

namespace kgraph {

const char* directionName(Direction direction) {
    switch (direction) {
        case Direction::Out:  return "out";
        case Direction::In:   return "in";
        case Direction::Both: return "both";
    }
    return "both";
}

Direction parseDirection(const std::string& text) {
    std::string d = toLower(trim(text));
    if (d == "out") return Direction::Out;
    if (d == "in") return Direction::In;
    if (d == "both") return Direction::Both;
    throw ValidationError("direction", "expected in, out or both, got '" + text + "'");
}

// ─── Node operations ───────────────────────────────────────────

void Graph::addNode(Node node) {
    if (nodes_.count(node.id)) {
        throw DuplicateIdError("Node", node.id);
    }
    std::string id = node.id;
    nodes_.emplace(id, std::move(node));
    outgoing_[id];  // ensure entry exists
    incoming_[id];
}

bool Graph::removeNode(const std::string& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;

    // Remove all connected edges
    for (const auto& eid : getIncident(id)) {
        removeEdge(eid);
    }

    outgoing_.erase(id);
    incoming_.erase(id);
    nodes_.erase(it);
    return true;
}

const Node* Graph::getNode(const std::string& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

// ─── Edge operations ───────────────────────────────────────────

void Graph::addEdge(Edge edge) {
    if (edges_.count(edge.id))
        throw DuplicateIdError("Edge", edge.id);
    if (!nodes_.count(edge.source))
        throw EndpointNotFoundError(edge.id, edge.source, "source");
    if (!nodes_.count(edge.target))
        throw EndpointNotFoundError(edge.id, edge.target, "target");

    outgoing_[edge.source].insert(edge.id);
    incoming_[edge.target].insert(edge.id);
    std::string id = edge.id;
    edges_.emplace(id, std::move(edge));
}

bool Graph::removeEdge(const std::string& id) {
    auto it = edges_.find(id);
    if (it == edges_.end()) return false;

    const Edge& e = it->second;
    auto out = outgoing_.find(e.source);
    if (out != outgoing_.end()) out->second.erase(id);
    auto in = incoming_.find(e.target);
    if (in != incoming_.end()) in->second.erase(id);

    edges_.erase(it);
    return true;
}

const Edge* Graph::getEdge(const std::string& id) const {
    auto it = edges_.find(id);
    return it != edges_.end() ? &it->second : nullptr;
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<std::string> Graph::getOutgoing(const std::string& node_id) const {
    auto it = outgoing_.find(node_id);
    if (it == outgoing_.end()) return {};
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> Graph::getIncoming(const std::string& node_id) const {
    auto it = incoming_.find(node_id);
    if (it == incoming_.end()) return {};
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> Graph::getNeighborNodes(const std::string& node_id) const {
    std::set<std::string> neighbors;
    for (const auto& step : stepsFrom(node_id, Direction::Both)) {
        neighbors.insert(step.neighbor);
    }
    return std::vector<std::string>(neighbors.begin(), neighbors.end());
}

std::vector<std::string> Graph::getIncident(const std::string& node_id) const {
    std::set<std::string> ids;
    auto out = outgoing_.find(node_id);
    if (out != outgoing_.end()) ids.insert(out->second.begin(), out->second.end());
    auto in = incoming_.find(node_id);
    if (in != incoming_.end()) ids.insert(in->second.begin(), in->second.end());
    return std::vector<std::string>(ids.begin(), ids.end());
}

std::vector<Step> Graph::stepsFrom(const std::string& node_id, Direction direction) const {
    std::vector<Step> steps;

    if (direction == Direction::Out || direction == Direction::Both) {
        auto it = outgoing_.find(node_id);
        if (it != outgoing_.end()) {
            for (const auto& eid : it->second) {
                steps.push_back({eid, edges_.at(eid).target});
            }
        }
    }
    if (direction == Direction::In || direction == Direction::Both) {
        auto it = incoming_.find(node_id);
        if (it != incoming_.end()) {
            for (const auto& eid : it->second) {
                const Edge& e = edges_.at(eid);
                // Self-loop already reported by the outgoing pass
                if (direction == Direction::Both && e.source == e.target) continue;
                steps.push_back({eid, e.source});
            }
        }
    }

    if (direction == Direction::Both) {
        std::stable_sort(steps.begin(), steps.end(),
            [](const Step& a, const Step& b) { return a.edge_id < b.edge_id; });
    }
    return steps;
}

size_t Graph::outDegree(const std::string& node_id) const {
    auto it = outgoing_.find(node_id);
    return it != outgoing_.end() ? it->second.size() : 0;
}

size_t Graph::inDegree(const std::string& node_id) const {
    auto it = incoming_.find(node_id);
    return it != incoming_.end() ? it->second.size() : 0;
}

// ─── Iteration ─────────────────────────────────────────────────

void Graph::forEachNode(const std::function<void(const Node&)>& fn) const {
    for (const auto& [_, node] : nodes_) {
        fn(node);
    }
}

void Graph::forEachEdge(const std::function<void(const Edge&)>& fn) const {
    for (const auto& [_, edge] : edges_) {
        fn(edge);
    }
}

} // namespace kgraph
