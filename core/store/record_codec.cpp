#include "store/record_codec.hpp"
#include "common/errors.hpp"

#include <cmath>

namespace kgraph {

namespace {

Json::Value optionalString(const std::optional<std::string>& s) {
    return s ? Json::Value(*s) : Json::Value();
}

std::string requiredString(const Json::Value& obj, const char* key, const std::string& where) {
    const Json::Value& v = obj[key];
    if (!v.isString() || v.asString().empty()) {
        throw ValidationError(where + "." + key, "required non-empty string");
    }
    return v.asString();
}

std::optional<std::string> nullableString(const Json::Value& obj, const char* key,
                                          const std::string& where) {
    if (!obj.isMember(key) || obj[key].isNull()) return std::nullopt;
    if (!obj[key].isString()) {
        throw ValidationError(where + "." + key, "expected a string or null");
    }
    return obj[key].asString();
}

int64_t timestamp(const Json::Value& obj, const char* key, const std::string& where) {
    if (!obj.isMember(key) || obj[key].isNull()) return 0;
    if (!obj[key].isInt64()) {
        throw ValidationError(where + "." + key, "expected integer milliseconds");
    }
    return obj[key].asInt64();
}

void requireObject(const Json::Value& value, const std::string& where) {
    if (!value.isObject()) {
        throw ValidationError(where, "expected a JSON object");
    }
}

} // namespace

Json::Value nodeToJson(const Node& node) {
    Json::Value out(Json::objectValue);
    out["node_id"] = node.id;
    out["name"] = node.name;
    out["type"] = optionalString(node.type);
    out["properties"] = node.properties;
    out["created_at"] = static_cast<Json::Int64>(node.created_at);
    out["updated_at"] = static_cast<Json::Int64>(node.updated_at);
    return out;
}

Json::Value edgeToJson(const Edge& edge) {
    Json::Value out(Json::objectValue);
    out["edge_id"] = edge.id;
    out["source_node_id"] = edge.source;
    out["target_node_id"] = edge.target;
    out["relation_type"] = optionalString(edge.relation_type);
    out["properties"] = edge.properties;
    out["weight"] = edge.weight;
    out["created_at"] = static_cast<Json::Int64>(edge.created_at);
    out["updated_at"] = static_cast<Json::Int64>(edge.updated_at);
    return out;
}

Node nodeFromJson(const Json::Value& value, const std::string& where) {
    requireObject(value, where);

    Node node;
    node.id = requiredString(value, "node_id", where);
    node.name = requiredString(value, "name", where);
    node.type = nullableString(value, "type", where);
    node.properties = checkedProperties(value.get("properties", Json::Value()), where);
    node.created_at = timestamp(value, "created_at", where);
    node.updated_at = timestamp(value, "updated_at", where);
    return node;
}

Edge edgeFromJson(const Json::Value& value, const std::string& where) {
    requireObject(value, where);

    Edge edge;
    edge.source = requiredString(value, "source_node_id", where);
    edge.target = requiredString(value, "target_node_id", where);
    edge.relation_type = nullableString(value, "relation_type", where);

    if (value.isMember("edge_id") && !value["edge_id"].isNull()) {
        edge.id = requiredString(value, "edge_id", where);
    } else {
        edge.id = generatedEdgeId(edge.source, edge.relation_type, edge.target);
    }

    if (value.isMember("weight") && !value["weight"].isNull()) {
        const Json::Value& w = value["weight"];
        if (!w.isNumeric() || !std::isfinite(w.asDouble())) {
            throw ValidationError(where + ".weight", "expected a finite number");
        }
        edge.weight = w.asDouble();
    }

    edge.properties = checkedProperties(value.get("properties", Json::Value()), where);
    edge.created_at = timestamp(value, "created_at", where);
    edge.updated_at = timestamp(value, "updated_at", where);
    return edge;
}

Node decodeStoredNode(const Record& record) {
    try {
        return nodeFromJson(record, "node");
    } catch (const ValidationError& e) {
        throw StoreError(std::string("corrupt node record: ") + e.what(), e.subject());
    }
}

Edge decodeStoredEdge(const Record& record) {
    try {
        return edgeFromJson(record, "edge");
    } catch (const ValidationError& e) {
        throw StoreError(std::string("corrupt edge record: ") + e.what(), e.subject());
    }
}

} // namespace kgraph
