#include "store/record_store.hpp"
#include "graph/properties.hpp"
#include "common/text.hpp"

namespace kgraph {

const char* recordKindName(RecordKind kind) {
    return kind == RecordKind::Node ? "node" : "edge";
}

const char* idFieldFor(RecordKind kind) {
    return kind == RecordKind::Node ? "node_id" : "edge_id";
}

namespace {

std::string fieldText(const Record& record, const std::string& field) {
    if (!record.isMember(field)) return "";
    const Json::Value& v = record[field];
    if (v.isNull()) return "";
    return stringifyValue(v);
}

} // namespace

bool RecordFilter::matches(const Record& record) const {
    for (const auto& m : all_of) {
        if (fieldText(record, m.field) != m.value) return false;
    }

    if (!any_of.empty()) {
        bool hit = false;
        for (const auto& m : any_of) {
            if (fieldText(record, m.field) == m.value) {
                hit = true;
                break;
            }
        }
        if (!hit) return false;
    }

    if (!contains.empty()) {
        std::string needle = toLower(contains);
        bool hit = false;
        for (const auto& field : contains_fields) {
            if (containsFolded(fieldText(record, field), needle)) {
                hit = true;
                break;
            }
        }
        if (!hit) return false;
    }
    return true;
}

} // namespace kgraph
