#pragma once

#include "graph/properties.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace kgraph {

/// A directed relationship source → target with an optional relation type
/// and an opaque weight (no sign or range is enforced).
struct Edge {
    std::string id;
    std::string source;
    std::string target;
    std::optional<std::string> relation_type;
    Properties properties = Properties(Json::objectValue);
    double weight = 1.0;
    int64_t created_at = 0;
    int64_t updated_at = 0;

    Edge() = default;
    Edge(std::string id, std::string source, std::string target,
         std::optional<std::string> relation_type = std::nullopt, double weight = 1.0)
        : id(std::move(id)), source(std::move(source)), target(std::move(target)),
          relation_type(std::move(relation_type)), weight(weight) {}

    bool touches(const std::string& node_id) const {
        return source == node_id || target == node_id;
    }

    bool sameContent(const Edge& other) const {
        return id == other.id && source == other.source && target == other.target &&
               relation_type == other.relation_type && weight == other.weight &&
               properties == other.properties;
    }
};

inline bool operator==(const Edge& a, const Edge& b) {
    return a.sameContent(b) && a.created_at == b.created_at && a.updated_at == b.updated_at;
}

inline bool operator!=(const Edge& a, const Edge& b) { return !(a == b); }

/// Id used when an edge is created without one: "<source>_<relation>_<target>".
inline std::string generatedEdgeId(const std::string& source,
                                   const std::optional<std::string>& relation_type,
                                   const std::string& target) {
    return source + "_" + relation_type.value_or("") + "_" + target;
}

} // namespace kgraph
