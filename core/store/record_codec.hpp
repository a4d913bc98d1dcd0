#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"
#include "store/record_store.hpp"

#include <string>

namespace kgraph {

// ─── Record codec ──────────────────────────────────────────────
// One JSON layout is shared by stored records and the export
// document, so an exported node is byte-for-byte the stored row:
//
//   node: {node_id, name, type, properties, created_at, updated_at}
//   edge: {edge_id, source_node_id, target_node_id, relation_type,
//          properties, weight, created_at, updated_at}
//
// Absent type / relation_type are written as null.

Json::Value nodeToJson(const Node& node);
Json::Value edgeToJson(const Edge& edge);

/// Parse caller-supplied JSON. `where` prefixes field names in errors
/// (e.g. "nodes[3]"). Missing timestamps decode as 0. Throws ValidationError.
Node nodeFromJson(const Json::Value& value, const std::string& where);

/// As nodeFromJson; a missing edge_id is replaced by generatedEdgeId()
/// and a missing weight defaults to 1.0.
Edge edgeFromJson(const Json::Value& value, const std::string& where);

/// Decode a record read back from a RecordStore. A malformed stored
/// record is a store failure, so these throw StoreError.
Node decodeStoredNode(const Record& record);
Edge decodeStoredEdge(const Record& record);

} // namespace kgraph
