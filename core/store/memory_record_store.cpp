#include "store/memory_record_store.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <fstream>
#include <mutex>

namespace kgraph {

const MemoryRecordStore::Table* MemoryRecordStore::findTable(const std::string& collection,
                                                             RecordKind kind) const {
    auto it = collections_.find(collection);
    if (it == collections_.end()) return nullptr;
    return &it->second.table(kind);
}

std::optional<Record> MemoryRecordStore::get(const std::string& collection, RecordKind kind,
                                             const std::string& id) const {
    std::shared_lock lock(mutex_);
    const Table* table = findTable(collection, kind);
    if (!table) return std::nullopt;
    auto it = table->find(id);
    if (it == table->end()) return std::nullopt;
    return it->second;
}

std::vector<Record> MemoryRecordStore::list(const std::string& collection, RecordKind kind,
                                            const RecordFilter& filter, size_t limit) const {
    std::shared_lock lock(mutex_);
    std::vector<Record> result;
    const Table* table = findTable(collection, kind);
    if (!table) return result;

    for (const auto& [_, record] : *table) {
        if (!filter.empty() && !filter.matches(record)) continue;
        result.push_back(record);
        if (limit > 0 && result.size() >= limit) break;
    }
    return result;
}

void MemoryRecordStore::upsert(const std::string& collection, RecordKind kind,
                               const Record& record) {
    const char* id_field = idFieldFor(kind);
    if (!record.isObject() || !record[id_field].isString() || record[id_field].asString().empty()) {
        throw StoreError(std::string(recordKindName(kind)) + " record without " + id_field);
    }

    std::unique_lock lock(mutex_);
    collections_[collection].table(kind)[record[id_field].asString()] = record;
}

bool MemoryRecordStore::remove(const std::string& collection, RecordKind kind,
                               const std::string& id) {
    std::unique_lock lock(mutex_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) return false;
    return it->second.table(kind).erase(id) > 0;
}

void MemoryRecordStore::clear(const std::string& collection) {
    std::unique_lock lock(mutex_);
    collections_.erase(collection);
}

size_t MemoryRecordStore::count(const std::string& collection, RecordKind kind) const {
    std::shared_lock lock(mutex_);
    const Table* table = findTable(collection, kind);
    return table ? table->size() : 0;
}

std::vector<std::string> MemoryRecordStore::collections() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(collections_.size());
    for (const auto& [name, _] : collections_) {
        names.push_back(name);
    }
    return names;
}

// ─── Persistence ───────────────────────────────────────────────

void MemoryRecordStore::saveToFile(const std::string& path) const {
    Json::Value root(Json::objectValue);
    Json::Value& colls = root["collections"] = Json::Value(Json::objectValue);
    {
        std::shared_lock lock(mutex_);
        for (const auto& [name, data] : collections_) {
            Json::Value entry(Json::objectValue);
            entry["nodes"] = Json::Value(Json::arrayValue);
            entry["edges"] = Json::Value(Json::arrayValue);
            for (const auto& [_, record] : data.nodes) entry["nodes"].append(record);
            for (const auto& [_, record] : data.edges) entry["edges"].append(record);
            colls[name] = std::move(entry);
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw StoreError("cannot open " + path + " for writing", path);
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    writer["emitUTF8"] = true;
    out << Json::writeString(writer, root) << "\n";
    if (!out) {
        throw StoreError("write failed for " + path, path);
    }
    logger()->debug("saved {} collection(s) to {}", colls.size(), path);
}

void MemoryRecordStore::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw StoreError("cannot open " + path, path);
    }

    Json::CharReaderBuilder reader;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(reader, in, &root, &errors)) {
        throw StoreError("invalid JSON in " + path + ": " + errors, path);
    }
    if (!root.isObject() || !root["collections"].isObject()) {
        throw StoreError("missing 'collections' object in " + path, path);
    }

    std::map<std::string, CollectionData> loaded;
    const Json::Value& colls = root["collections"];
    for (const auto& name : colls.getMemberNames()) {
        if (!colls[name].isObject()) {
            throw StoreError("collection " + name + " is not an object", path);
        }
        CollectionData data;
        for (RecordKind kind : {RecordKind::Node, RecordKind::Edge}) {
            const char* key = kind == RecordKind::Node ? "nodes" : "edges";
            const char* id_field = idFieldFor(kind);
            const Json::Value& rows = colls[name][key];
            if (!rows.isNull() && !rows.isArray()) {
                throw StoreError(std::string(key) + " of collection " + name + " is not an array", path);
            }
            for (const auto& record : rows) {
                if (!record.isObject() || !record[id_field].isString()) {
                    throw StoreError(std::string(key) + " entry without " + id_field +
                                     " in collection " + name, path);
                }
                data.table(kind)[record[id_field].asString()] = record;
            }
        }
        loaded.emplace(name, std::move(data));
    }

    std::unique_lock lock(mutex_);
    collections_ = std::move(loaded);
    logger()->info("loaded {} collection(s) from {}", collections_.size(), path);
}

} // namespace kgraph
