#include "exchange/graph_exchange.hpp"
#include "store/record_codec.hpp"
#include "common/clock.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <algorithm>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace kgraph {

namespace {

const Json::Value& sectionOf(const Json::Value& document, const char* key) {
    static const Json::Value kEmpty(Json::arrayValue);
    if (!document.isMember(key) || document[key].isNull()) return kEmpty;
    if (!document[key].isArray()) {
        throw ValidationError(key, "expected an array");
    }
    return document[key];
}

std::string indexed(const char* section, Json::ArrayIndex i) {
    return std::string(section) + "[" + std::to_string(i) + "]";
}

/// Fill timestamps of an incoming record against the stored one (if any).
/// Document timestamps win; otherwise a record with unchanged content
/// keeps its stored times so a repeated import changes nothing.
template <typename Item>
void settleTimestamps(Item& incoming, const Item* stored, int64_t now) {
    if (!stored) {
        if (incoming.created_at == 0) incoming.created_at = now;
        if (incoming.updated_at == 0) incoming.updated_at = incoming.created_at;
        return;
    }
    if (incoming.created_at == 0) incoming.created_at = stored->created_at;
    if (incoming.updated_at == 0) {
        incoming.updated_at = incoming.sameContent(*stored)
            ? stored->updated_at
            : std::max(now, incoming.created_at);
    }
}

} // namespace

// ─── Export ────────────────────────────────────────────────────

Json::Value GraphExchange::exportCollection(const std::string& collection) const {
    Json::Value doc(Json::objectValue);
    doc["format_version"] = kFormatVersion;
    doc["collection"] = collection;
    doc["nodes"] = Json::Value(Json::arrayValue);
    doc["edges"] = Json::Value(Json::arrayValue);

    for (const auto& record : store_.list(collection, RecordKind::Node)) {
        doc["nodes"].append(nodeToJson(decodeStoredNode(record)));
    }
    for (const auto& record : store_.list(collection, RecordKind::Edge)) {
        doc["edges"].append(edgeToJson(decodeStoredEdge(record)));
    }

    logger()->info("{}: exported {} nodes, {} edges",
                   collection, doc["nodes"].size(), doc["edges"].size());
    return doc;
}

// ─── Import ────────────────────────────────────────────────────

ImportSummary GraphExchange::importCollection(const std::string& collection,
                                              const Json::Value& document,
                                              bool clear_existing) {
    if (!document.isObject()) {
        throw ValidationError("document", "expected a JSON object");
    }
    if (document.isMember("format_version")) {
        const Json::Value& v = document["format_version"];
        if (!v.isInt() || v.asInt() < 1 || v.asInt() > kFormatVersion) {
            throw ValidationError("format_version", "unsupported document version");
        }
    }

    // Pass 1: parse and validate everything
    std::vector<Node> nodes;
    std::unordered_set<std::string> doc_node_ids;
    const Json::Value& node_rows = sectionOf(document, "nodes");
    for (Json::ArrayIndex i = 0; i < node_rows.size(); i++) {
        std::string where = indexed("nodes", i);
        Node node = nodeFromJson(node_rows[i], where);
        try {
            mutations_.validateNode(node);
        } catch (const ValidationError& e) {
            throw ValidationError(where, e.what());
        }
        if (!doc_node_ids.insert(node.id).second) {
            throw ValidationError(where + ".node_id", "duplicate id in document: " + node.id);
        }
        nodes.push_back(std::move(node));
    }

    std::vector<Edge> edges;
    std::unordered_set<std::string> doc_edge_ids;
    const Json::Value& edge_rows = sectionOf(document, "edges");
    for (Json::ArrayIndex i = 0; i < edge_rows.size(); i++) {
        std::string where = indexed("edges", i);
        Edge edge = edgeFromJson(edge_rows[i], where);
        try {
            mutations_.validateEdge(edge);
        } catch (const ValidationError& e) {
            throw ValidationError(where, e.what());
        }
        if (!doc_edge_ids.insert(edge.id).second) {
            throw ValidationError(where + ".edge_id", "duplicate id in document: " + edge.id);
        }
        edges.push_back(std::move(edge));
    }

    auto resolvable = [&](const std::string& node_id) {
        if (doc_node_ids.count(node_id)) return true;
        return !clear_existing && mutations_.nodeExists(collection, node_id);
    };
    for (const auto& edge : edges) {
        if (!resolvable(edge.source)) throw EndpointNotFoundError(edge.id, edge.source, "source");
        if (!resolvable(edge.target)) throw EndpointNotFoundError(edge.id, edge.target, "target");
    }

    // Pass 2: write
    if (clear_existing) {
        mutations_.clear(collection);
    }

    ImportSummary summary;
    int64_t now = nowMillis();

    for (auto& node : nodes) {
        std::optional<Node> stored;
        if (auto record = store_.get(collection, RecordKind::Node, node.id)) {
            stored = decodeStoredNode(*record);
        }
        settleTimestamps(node, stored ? &*stored : nullptr, now);

        if (!stored) {
            summary.nodes_created++;
        } else if (node == *stored) {
            summary.nodes_unchanged++;
            continue;
        } else {
            summary.nodes_updated++;
        }
        store_.upsert(collection, RecordKind::Node, nodeToJson(node));
    }

    for (auto& edge : edges) {
        std::optional<Edge> stored;
        if (auto record = store_.get(collection, RecordKind::Edge, edge.id)) {
            stored = decodeStoredEdge(*record);
        }
        settleTimestamps(edge, stored ? &*stored : nullptr, now);

        if (!stored) {
            summary.edges_created++;
        } else if (edge == *stored) {
            summary.edges_unchanged++;
            continue;
        } else {
            summary.edges_updated++;
        }
        store_.upsert(collection, RecordKind::Edge, edgeToJson(edge));
    }

    logger()->info("{}: import (clear_existing={}) nodes +{} ~{} ={}, edges +{} ~{} ={}",
                   collection, clear_existing,
                   summary.nodes_created, summary.nodes_updated, summary.nodes_unchanged,
                   summary.edges_created, summary.edges_updated, summary.edges_unchanged);
    return summary;
}

// ─── Files ─────────────────────────────────────────────────────

void GraphExchange::exportToFile(const std::string& collection, const std::string& path) const {
    std::string text = writeDocument(exportCollection(collection));
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw StoreError("cannot open " + path + " for writing", path);
    }
    out << text << "\n";
    if (!out) {
        throw StoreError("write failed for " + path, path);
    }
}

ImportSummary GraphExchange::importFromFile(const std::string& collection, const std::string& path,
                                            bool clear_existing) {
    std::ifstream in(path);
    if (!in) {
        throw ValidationError("path", "cannot open " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return importCollection(collection, parseDocument(buffer.str()), clear_existing);
}

Json::Value GraphExchange::parseDocument(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw ValidationError("document", "invalid JSON: " + errors);
    }
    return root;
}

std::string GraphExchange::writeDocument(const Json::Value& document) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, document);
}

} // namespace kgraph
