#pragma once

#include <json/json.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace kgraph {

enum class RecordKind { Node, Edge };

const char* recordKindName(RecordKind kind);

/// Name of the id field in a record of this kind ("node_id" / "edge_id").
const char* idFieldFor(RecordKind kind);

/// A stored row: a JSON object holding the serialized node or edge.
using Record = Json::Value;

struct FieldMatch {
    std::string field;
    std::string value;
};

/// Field filter for list(). All conditions present must hold:
///   - every `all_of` field equals its value
///   - at least one `any_of` field equals its value (if any are given)
///   - `contains` (case-insensitive) occurs in one of `contains_fields`
/// Non-string fields are compared in their compact JSON form.
struct RecordFilter {
    std::vector<FieldMatch> all_of;
    std::vector<FieldMatch> any_of;
    std::string contains;
    std::vector<std::string> contains_fields;

    bool empty() const {
        return all_of.empty() && any_of.empty() && contains.empty();
    }

    bool matches(const Record& record) const;
};

/// Durable keyed storage for node and edge records, grouped by
/// collection. Implementations must be safe to call from several
/// threads; the engine layers its own per-collection locking on top.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual std::optional<Record> get(const std::string& collection, RecordKind kind,
                                      const std::string& id) const = 0;

    /// Matching records in ascending id order. limit == 0 means unlimited.
    virtual std::vector<Record> list(const std::string& collection, RecordKind kind,
                                     const RecordFilter& filter = {},
                                     size_t limit = 0) const = 0;

    /// Insert or replace by the record's id field.
    virtual void upsert(const std::string& collection, RecordKind kind,
                        const Record& record) = 0;

    /// Returns false if no such record existed.
    virtual bool remove(const std::string& collection, RecordKind kind,
                        const std::string& id) = 0;

    /// Drop every record of the collection. Idempotent.
    virtual void clear(const std::string& collection) = 0;

    virtual size_t count(const std::string& collection, RecordKind kind) const = 0;

    virtual std::vector<std::string> collections() const = 0;
};

} // namespace kgraph
