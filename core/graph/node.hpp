#pragma once

#include "graph/properties.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace kgraph {

/// An entity in a knowledge-graph collection.
/// Identified by `id`, which is unique among live nodes of its collection.
struct Node {
    std::string id;
    std::string name;
    std::optional<std::string> type;
    Properties properties = Properties(Json::objectValue);
    int64_t created_at = 0;   // ms since epoch
    int64_t updated_at = 0;

    Node() = default;
    Node(std::string id, std::string name, std::optional<std::string> type = std::nullopt)
        : id(std::move(id)), name(std::move(name)), type(std::move(type)) {}

    void setProperty(const std::string& key, const Json::Value& value) {
        properties[key] = value;
    }

    Json::Value getProperty(const std::string& key,
                            const Json::Value& default_val = Json::Value()) const {
        return properties.isMember(key) ? properties[key] : default_val;
    }

    bool hasProperty(const std::string& key) const {
        return properties.isMember(key);
    }

    /// Same user-visible content, timestamps ignored.
    bool sameContent(const Node& other) const {
        return id == other.id && name == other.name && type == other.type &&
               properties == other.properties;
    }
};

inline bool operator==(const Node& a, const Node& b) {
    return a.sameContent(b) && a.created_at == b.created_at && a.updated_at == b.updated_at;
}

inline bool operator!=(const Node& a, const Node& b) { return !(a == b); }

} // namespace kgraph
