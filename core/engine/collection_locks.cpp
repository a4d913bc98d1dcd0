#include "engine/collection_locks.hpp"

namespace kgraph {

CollectionLocks::Handle CollectionLocks::acquire(const std::string& collection) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto& slot = locks_[collection];
    if (!slot) slot = std::make_shared<std::shared_mutex>();
    return slot;
}

void CollectionLocks::release(const std::string& collection, Handle& handle) {
    std::lock_guard<std::mutex> guard(mutex_);
    handle.reset();
    // New holders only appear under mutex_, so a count of one is final
    auto it = locks_.find(collection);
    if (it != locks_.end() && it->second.use_count() == 1) {
        locks_.erase(it);
    }
}

size_t CollectionLocks::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return locks_.size();
}

} // namespace kgraph
