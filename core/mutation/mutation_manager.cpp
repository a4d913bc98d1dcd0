#include "mutation/mutation_manager.hpp"
#include "store/record_codec.hpp"
#include "common/clock.hpp"
#include "common/log.hpp"
#include "common/validation.hpp"

#include <algorithm>
#include <cmath>

namespace kgraph {

namespace {

// An empty category string is the same as no category.
std::optional<std::string> normalizedLabel(const std::optional<std::string>& label) {
    if (label && label->empty()) return std::nullopt;
    return label;
}

void applyProperties(Properties& target, const Properties& patch, PropertyUpdate mode) {
    if (mode == PropertyUpdate::Merge) {
        mergeProperties(target, patch);
    } else {
        target = patch;
    }
}

int64_t touchTime(int64_t created_at) {
    return std::max(nowMillis(), created_at);
}

} // namespace

// ─── Validation ────────────────────────────────────────────────

void MutationManager::validateNode(const Node& node) const {
    requireIdentifier(node.id, "node_id", config_.max_id_length);
    requireIdentifier(node.name, "name", config_.max_name_length);
    if (node.type && node.type->size() > config_.max_type_length) {
        throw ValidationError("type", "longer than " + std::to_string(config_.max_type_length) + " bytes");
    }
}

void MutationManager::validateEdge(const Edge& edge) const {
    requireIdentifier(edge.id, "edge_id", config_.max_id_length);
    requireIdentifier(edge.source, "source_node_id", config_.max_id_length);
    requireIdentifier(edge.target, "target_node_id", config_.max_id_length);
    if (edge.relation_type && edge.relation_type->size() > config_.max_type_length) {
        throw ValidationError("relation_type", "longer than " + std::to_string(config_.max_type_length) + " bytes");
    }
    if (!std::isfinite(edge.weight)) {
        throw ValidationError("weight", "must be a finite number");
    }
}

void MutationManager::requireEndpoints(const std::string& collection, const Edge& edge) const {
    if (!nodeExists(collection, edge.source)) {
        throw EndpointNotFoundError(edge.id, edge.source, "source");
    }
    if (!nodeExists(collection, edge.target)) {
        throw EndpointNotFoundError(edge.id, edge.target, "target");
    }
}

bool MutationManager::nodeExists(const std::string& collection, const std::string& id) const {
    return store_.get(collection, RecordKind::Node, id).has_value();
}

bool MutationManager::edgeExists(const std::string& collection, const std::string& id) const {
    return store_.get(collection, RecordKind::Edge, id).has_value();
}

// ─── Nodes ─────────────────────────────────────────────────────

Node MutationManager::createNode(const std::string& collection, const NodeInput& input) {
    Node node(input.id, input.name, normalizedLabel(input.type));
    node.properties = checkedProperties(input.properties, "node " + input.id);
    validateNode(node);

    if (nodeExists(collection, node.id)) {
        throw DuplicateIdError("Node", node.id);
    }

    node.created_at = node.updated_at = nowMillis();
    store_.upsert(collection, RecordKind::Node, nodeToJson(node));
    logger()->debug("{}: created node {} ({})", collection, node.id, node.name);
    return node;
}

Node MutationManager::updateNode(const std::string& collection, const std::string& id,
                                 const NodePatch& patch) {
    Node node = getNode(collection, id);

    if (patch.name) node.name = *patch.name;
    if (patch.clear_type) {
        node.type.reset();
    } else if (patch.type) {
        node.type = normalizedLabel(patch.type);
    }
    if (patch.properties) {
        applyProperties(node.properties,
                        checkedProperties(*patch.properties, "node " + id),
                        patch.property_update);
    }
    validateNode(node);

    node.updated_at = touchTime(node.created_at);
    store_.upsert(collection, RecordKind::Node, nodeToJson(node));
    logger()->debug("{}: updated node {}", collection, id);
    return node;
}

std::vector<std::string> MutationManager::deleteNode(const std::string& collection,
                                                     const std::string& id) {
    if (!nodeExists(collection, id)) {
        throw NotFoundError("Node", id);
    }

    // Edges first, then the node: a crash in between leaves no dangling edge
    std::vector<std::string> cascaded;
    for (const auto& edge : listEdges(collection, id)) {
        store_.remove(collection, RecordKind::Edge, edge.id);
        cascaded.push_back(edge.id);
    }
    store_.remove(collection, RecordKind::Node, id);

    if (!cascaded.empty()) {
        logger()->info("{}: deleted node {} and {} connected edge(s)",
                       collection, id, cascaded.size());
    } else {
        logger()->debug("{}: deleted node {}", collection, id);
    }
    return cascaded;
}

Node MutationManager::getNode(const std::string& collection, const std::string& id) const {
    auto record = store_.get(collection, RecordKind::Node, id);
    if (!record) {
        throw NotFoundError("Node", id);
    }
    return decodeStoredNode(*record);
}

std::vector<Node> MutationManager::listNodes(const std::string& collection,
                                             const std::optional<std::string>& type,
                                             size_t limit) const {
    RecordFilter filter;
    if (type) filter.all_of.push_back({"type", *type});

    std::vector<Node> nodes;
    for (const auto& record : store_.list(collection, RecordKind::Node, filter, limit)) {
        nodes.push_back(decodeStoredNode(record));
    }
    return nodes;
}

// ─── Edges ─────────────────────────────────────────────────────

Edge MutationManager::createEdge(const std::string& collection, const EdgeInput& input) {
    auto relation = normalizedLabel(input.relation_type);
    std::string id = input.id.empty()
        ? generatedEdgeId(input.source, relation, input.target)
        : input.id;

    Edge edge(id, input.source, input.target, relation, input.weight);
    edge.properties = checkedProperties(input.properties, "edge " + id);
    validateEdge(edge);

    if (edgeExists(collection, edge.id)) {
        throw DuplicateIdError("Edge", edge.id);
    }
    requireEndpoints(collection, edge);

    edge.created_at = edge.updated_at = nowMillis();
    store_.upsert(collection, RecordKind::Edge, edgeToJson(edge));
    logger()->debug("{}: created edge {} ({} -> {})", collection, edge.id, edge.source, edge.target);
    return edge;
}

Edge MutationManager::updateEdge(const std::string& collection, const std::string& id,
                                 const EdgePatch& patch) {
    Edge edge = getEdge(collection, id);

    if (patch.source) edge.source = *patch.source;
    if (patch.target) edge.target = *patch.target;
    if (patch.clear_relation_type) {
        edge.relation_type.reset();
    } else if (patch.relation_type) {
        edge.relation_type = normalizedLabel(patch.relation_type);
    }
    if (patch.properties) {
        applyProperties(edge.properties,
                        checkedProperties(*patch.properties, "edge " + id),
                        patch.property_update);
    }
    if (patch.weight) edge.weight = *patch.weight;
    validateEdge(edge);

    if (patch.source || patch.target) {
        requireEndpoints(collection, edge);
    }

    edge.updated_at = touchTime(edge.created_at);
    store_.upsert(collection, RecordKind::Edge, edgeToJson(edge));
    logger()->debug("{}: updated edge {}", collection, id);
    return edge;
}

void MutationManager::deleteEdge(const std::string& collection, const std::string& id) {
    if (!store_.remove(collection, RecordKind::Edge, id)) {
        throw NotFoundError("Edge", id);
    }
    logger()->debug("{}: deleted edge {}", collection, id);
}

Edge MutationManager::getEdge(const std::string& collection, const std::string& id) const {
    auto record = store_.get(collection, RecordKind::Edge, id);
    if (!record) {
        throw NotFoundError("Edge", id);
    }
    return decodeStoredEdge(*record);
}

std::vector<Edge> MutationManager::listEdges(const std::string& collection,
                                             const std::optional<std::string>& node_id,
                                             const std::optional<std::string>& relation_type,
                                             size_t limit) const {
    RecordFilter filter;
    if (node_id) {
        filter.any_of.push_back({"source_node_id", *node_id});
        filter.any_of.push_back({"target_node_id", *node_id});
    }
    if (relation_type) filter.all_of.push_back({"relation_type", *relation_type});

    std::vector<Edge> edges;
    for (const auto& record : store_.list(collection, RecordKind::Edge, filter, limit)) {
        edges.push_back(decodeStoredEdge(record));
    }
    return edges;
}

// ─── Bulk ──────────────────────────────────────────────────────

BatchResult MutationManager::batchCreateNodes(const std::string& collection,
                                              const std::vector<NodeInput>& nodes) {
    BatchResult result;
    for (size_t i = 0; i < nodes.size(); i++) {
        try {
            Node created = createNode(collection, nodes[i]);
            result.created_ids.push_back(created.id);
            result.succeeded++;
        } catch (const GraphError& e) {
            logger()->warn("{}: batch node #{} ({}) failed: {}", collection, i, nodes[i].id, e.what());
            result.failures.push_back({i, nodes[i].id, e.kind(), e.what()});
            result.failed++;
        }
    }
    logger()->info("{}: batch nodes: {} created, {} failed", collection, result.succeeded, result.failed);
    return result;
}

BatchResult MutationManager::batchCreateEdges(const std::string& collection,
                                              const std::vector<EdgeInput>& edges) {
    BatchResult result;
    for (size_t i = 0; i < edges.size(); i++) {
        const EdgeInput& input = edges[i];
        std::string label = input.id.empty()
            ? generatedEdgeId(input.source, normalizedLabel(input.relation_type), input.target)
            : input.id;
        try {
            Edge created = createEdge(collection, input);
            result.created_ids.push_back(created.id);
            result.succeeded++;
        } catch (const GraphError& e) {
            logger()->warn("{}: batch edge #{} ({}) failed: {}", collection, i, label, e.what());
            result.failures.push_back({i, label, e.kind(), e.what()});
            result.failed++;
        }
    }
    logger()->info("{}: batch edges: {} created, {} failed", collection, result.succeeded, result.failed);
    return result;
}

void MutationManager::clear(const std::string& collection) {
    store_.clear(collection);
    logger()->info("{}: cleared", collection);
}

} // namespace kgraph
