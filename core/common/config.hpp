#pragma once

#include <json/json.h>

#include <cstddef>
#include <string>

namespace kgraph {

/// Engine-wide limits and switches.
struct EngineConfig {
    size_t max_id_length = 100;              // node_id / edge_id bytes
    size_t max_name_length = 200;            // node display name bytes
    size_t max_type_length = 50;             // node type / relation type bytes
    size_t max_collection_name_length = 50;
    int default_search_limit = 50;
    int max_search_limit = 1000;
    int max_neighbor_depth = 10;
    int max_path_length = 10;
    int max_paths = 100;                     // cap for findAllPaths
    int context_max_chars = 4000;
    int context_edges_per_node = 20;
    bool cache_materialized_views = true;
    size_t max_cached_views = 64;            // least recently used views evicted beyond this
    std::string log_level = "info";          // trace|debug|info|warn|error|critical|off
};

/// Build a config from a JSON object. Unknown keys are ignored; a known
/// key with the wrong type or an out-of-range value is a ValidationError.
EngineConfig configFromJson(const Json::Value& root);

/// Read a JSON config file. Missing or unparsable files are a ValidationError.
EngineConfig loadConfig(const std::string& path);

Json::Value configToJson(const EngineConfig& config);

} // namespace kgraph
