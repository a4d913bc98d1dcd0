#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"
#include "store/record_store.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kgraph {

struct NodeInput {
    std::string id;
    std::string name;
    std::optional<std::string> type;
    Properties properties;             // null or object
};

struct EdgeInput {
    std::string id;                    // empty = generatedEdgeId()
    std::string source;
    std::string target;
    std::optional<std::string> relation_type;
    Properties properties;
    double weight = 1.0;
};

/// How a patch's properties combine with the stored bag.
enum class PropertyUpdate {
    Replace,   // stored bag becomes the patch bag
    Merge,     // shallow overwrite; null values delete keys
};

/// Partial node update: unset fields are left untouched.
struct NodePatch {
    std::optional<std::string> name;
    std::optional<std::string> type;
    bool clear_type = false;
    std::optional<Properties> properties;
    PropertyUpdate property_update = PropertyUpdate::Replace;
};

struct EdgePatch {
    std::optional<std::string> source;
    std::optional<std::string> target;
    std::optional<std::string> relation_type;
    bool clear_relation_type = false;
    std::optional<Properties> properties;
    PropertyUpdate property_update = PropertyUpdate::Replace;
    std::optional<double> weight;
};

struct BatchFailure {
    size_t index = 0;
    std::string id;
    ErrorKind kind = ErrorKind::Validation;
    std::string message;
};

/// Per-item outcome of a batch call. One item's failure never affects another.
struct BatchResult {
    size_t succeeded = 0;
    size_t failed = 0;
    std::vector<std::string> created_ids;
    std::vector<BatchFailure> failures;
};

// ─── Mutation Manager ─────────────────────────────────────────
// Validates and applies writes against the record store. Every single
// item operation checks everything it can before its first write.
// Callers serialize writes per collection (see KnowledgeGraphEngine);
// this class holds no locks of its own.

class MutationManager {
public:
    MutationManager(RecordStore& store, const EngineConfig& config)
        : store_(store), config_(config) {}

    // ── Nodes ──
    Node createNode(const std::string& collection, const NodeInput& input);
    Node updateNode(const std::string& collection, const std::string& id, const NodePatch& patch);

    /// Deletes the node and every edge touching it. Returns the ids of
    /// the cascaded edges.
    std::vector<std::string> deleteNode(const std::string& collection, const std::string& id);

    Node getNode(const std::string& collection, const std::string& id) const;
    std::vector<Node> listNodes(const std::string& collection,
                                const std::optional<std::string>& type = std::nullopt,
                                size_t limit = 0) const;

    // ── Edges ──
    Edge createEdge(const std::string& collection, const EdgeInput& input);
    Edge updateEdge(const std::string& collection, const std::string& id, const EdgePatch& patch);
    void deleteEdge(const std::string& collection, const std::string& id);

    Edge getEdge(const std::string& collection, const std::string& id) const;

    /// `node_id` selects edges with that node as source or target.
    std::vector<Edge> listEdges(const std::string& collection,
                                const std::optional<std::string>& node_id = std::nullopt,
                                const std::optional<std::string>& relation_type = std::nullopt,
                                size_t limit = 0) const;

    // ── Bulk ──
    BatchResult batchCreateNodes(const std::string& collection, const std::vector<NodeInput>& nodes);
    BatchResult batchCreateEdges(const std::string& collection, const std::vector<EdgeInput>& edges);

    /// Remove every node and edge of the collection. Idempotent.
    void clear(const std::string& collection);

    bool nodeExists(const std::string& collection, const std::string& id) const;
    bool edgeExists(const std::string& collection, const std::string& id) const;

    /// Shape checks shared with import.
    void validateNode(const Node& node) const;
    void validateEdge(const Edge& edge) const;

private:
    void requireEndpoints(const std::string& collection, const Edge& edge) const;

    RecordStore& store_;
    const EngineConfig& config_;
};

} // namespace kgraph
