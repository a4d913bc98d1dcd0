#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <fstream>

namespace kgraph {

namespace {

void readSize(const Json::Value& root, const char* key, size_t& out) {
    if (!root.isMember(key)) return;
    const Json::Value& v = root[key];
    if (!v.isUInt64() || v.asUInt64() == 0) {
        throw ValidationError(key, "expected a positive integer");
    }
    out = static_cast<size_t>(v.asUInt64());
}

void readInt(const Json::Value& root, const char* key, int& out) {
    if (!root.isMember(key)) return;
    const Json::Value& v = root[key];
    if (!v.isInt() || v.asInt() <= 0) {
        throw ValidationError(key, "expected a positive integer");
    }
    out = v.asInt();
}

void readBool(const Json::Value& root, const char* key, bool& out) {
    if (!root.isMember(key)) return;
    const Json::Value& v = root[key];
    if (!v.isBool()) {
        throw ValidationError(key, "expected a boolean");
    }
    out = v.asBool();
}

} // namespace

EngineConfig configFromJson(const Json::Value& root) {
    if (!root.isObject()) {
        throw ValidationError("config", "expected a JSON object");
    }

    EngineConfig config;
    readSize(root, "max_id_length", config.max_id_length);
    readSize(root, "max_name_length", config.max_name_length);
    readSize(root, "max_type_length", config.max_type_length);
    readSize(root, "max_collection_name_length", config.max_collection_name_length);
    readInt(root, "default_search_limit", config.default_search_limit);
    readInt(root, "max_search_limit", config.max_search_limit);
    readInt(root, "max_neighbor_depth", config.max_neighbor_depth);
    readInt(root, "max_path_length", config.max_path_length);
    readInt(root, "max_paths", config.max_paths);
    readInt(root, "context_max_chars", config.context_max_chars);
    readInt(root, "context_edges_per_node", config.context_edges_per_node);
    readBool(root, "cache_materialized_views", config.cache_materialized_views);
    readSize(root, "max_cached_views", config.max_cached_views);

    if (root.isMember("log_level")) {
        const Json::Value& v = root["log_level"];
        if (!v.isString() || !isValidLogLevel(v.asString())) {
            throw ValidationError("log_level", "expected one of trace, debug, info, warn, error, critical, off");
        }
        config.log_level = v.asString();
    }

    if (config.default_search_limit > config.max_search_limit) {
        throw ValidationError("default_search_limit", "exceeds max_search_limit");
    }
    return config;
}

EngineConfig loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ValidationError("config", "cannot open " + path);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw ValidationError("config", "invalid JSON in " + path + ": " + errors);
    }
    return configFromJson(root);
}

Json::Value configToJson(const EngineConfig& config) {
    Json::Value root(Json::objectValue);
    root["max_id_length"] = static_cast<Json::UInt64>(config.max_id_length);
    root["max_name_length"] = static_cast<Json::UInt64>(config.max_name_length);
    root["max_type_length"] = static_cast<Json::UInt64>(config.max_type_length);
    root["max_collection_name_length"] = static_cast<Json::UInt64>(config.max_collection_name_length);
    root["default_search_limit"] = config.default_search_limit;
    root["max_search_limit"] = config.max_search_limit;
    root["max_neighbor_depth"] = config.max_neighbor_depth;
    root["max_path_length"] = config.max_path_length;
    root["max_paths"] = config.max_paths;
    root["context_max_chars"] = config.context_max_chars;
    root["context_edges_per_node"] = config.context_edges_per_node;
    root["cache_materialized_views"] = config.cache_materialized_views;
    root["max_cached_views"] = static_cast<Json::UInt64>(config.max_cached_views);
    root["log_level"] = config.log_level;
    return root;
}

} // namespace kgraph
