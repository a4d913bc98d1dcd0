#pragma once

#include "mutation/mutation_manager.hpp"
#include "store/record_store.hpp"

#include <json/json.h>

#include <string>

namespace kgraph {

struct ImportSummary {
    size_t nodes_created = 0;
    size_t nodes_updated = 0;
    size_t nodes_unchanged = 0;
    size_t edges_created = 0;
    size_t edges_updated = 0;
    size_t edges_unchanged = 0;
};

// ─── Graph Exchange ───────────────────────────────────────────
// Whole-collection export/import. Document layout (stable; new
// versions may only add optional fields):
//
//   { "format_version": 1,
//     "collection": "<name>",
//     "nodes": [ <node record> ... ],    ascending node_id
//     "edges": [ <edge record> ... ] }   ascending edge_id
//
// Record layout is the one in record_codec.hpp.

class GraphExchange {
public:
    static constexpr int kFormatVersion = 1;

    GraphExchange(RecordStore& store, MutationManager& mutations)
        : store_(store), mutations_(mutations) {}

    Json::Value exportCollection(const std::string& collection) const;

    /// Validates the whole document (shape, fields, endpoints against
    /// existing ∪ document nodes) before writing anything. With
    /// clear_existing the collection is emptied first; otherwise existing
    /// ids are updated in place and identical records left untouched, so
    /// repeating an import is a no-op.
    ImportSummary importCollection(const std::string& collection, const Json::Value& document,
                                   bool clear_existing);

    void exportToFile(const std::string& collection, const std::string& path) const;
    ImportSummary importFromFile(const std::string& collection, const std::string& path,
                                 bool clear_existing);

    /// Throws ValidationError on malformed JSON.
    static Json::Value parseDocument(const std::string& text);
    static std::string writeDocument(const Json::Value& document);

private:
    RecordStore& store_;
    MutationManager& mutations_;
};

} // namespace kgraph
