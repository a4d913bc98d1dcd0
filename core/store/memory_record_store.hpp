#pragma once

#include "store/record_store.hpp"

#include <map>
#include <shared_mutex>
#include <string>

namespace kgraph {

// ─── Memory Record Store ───────────────────────────────────────
// Key-sorted in-process RecordStore. The whole store can be written
// to and read back from a single JSON file:
//
//   {"collections": {"<name>": {"nodes": [...], "edges": [...]}}}

class MemoryRecordStore : public RecordStore {
public:
    MemoryRecordStore() = default;

    std::optional<Record> get(const std::string& collection, RecordKind kind,
                              const std::string& id) const override;
    std::vector<Record> list(const std::string& collection, RecordKind kind,
                             const RecordFilter& filter = {},
                             size_t limit = 0) const override;
    void upsert(const std::string& collection, RecordKind kind,
                const Record& record) override;
    bool remove(const std::string& collection, RecordKind kind,
                const std::string& id) override;
    void clear(const std::string& collection) override;
    size_t count(const std::string& collection, RecordKind kind) const override;
    std::vector<std::string> collections() const override;

    /// Write every collection to `path`. Throws StoreError on I/O failure.
    void saveToFile(const std::string& path) const;

    /// Replace the store contents with the file at `path`.
    /// Throws StoreError if the file cannot be read or parsed; the store
    /// is left unchanged in that case.
    void loadFromFile(const std::string& path);

private:
    using Table = std::map<std::string, Record>;

    struct CollectionData {
        Table nodes;
        Table edges;

        Table& table(RecordKind kind) { return kind == RecordKind::Node ? nodes : edges; }
        const Table& table(RecordKind kind) const {
            return kind == RecordKind::Node ? nodes : edges;
        }
    };

    const Table* findTable(const std::string& collection, RecordKind kind) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, CollectionData> collections_;
};

} // namespace kgraph
