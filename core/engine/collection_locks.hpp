#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace kgraph {

// ─── CollectionLocks ──────────────────────────────────────────
// One reader/writer lock per collection plus a registry-wide lock.
// Per-collection guards hold the registry lock shared, so an
// exclusive StoreGuard waits out every collection at once.
//
// A collection's entry lives only while some guard holds it; the last
// guard to let go erases it, so the registry stays as small as the
// number of in-flight calls.

class CollectionLocks {
public:
    using Handle = std::shared_ptr<std::shared_mutex>;

    /// Shared ownership of the collection's mutex, creating it if needed.
    Handle acquire(const std::string& collection);

    /// Drops `handle` and erases the entry if nobody else holds it.
    void release(const std::string& collection, Handle& handle);

    std::shared_mutex& registry() { return registry_; }

    /// Number of collections with a live entry.
    size_t size() const;

private:
    std::shared_mutex registry_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Handle> locks_;
};

/// Holds one collection locked for the guard's lifetime. `Lock` is
/// std::shared_lock (readers) or std::unique_lock (writers).
template <typename Lock>
class CollectionGuard {
public:
    CollectionGuard(CollectionLocks& locks, const std::string& collection)
        : locks_(&locks),
          collection_(collection),
          registry_lock_(locks.registry()),
          handle_(locks.acquire(collection)),
          lock_(*handle_) {}

    CollectionGuard(CollectionGuard&&) = default;
    CollectionGuard& operator=(CollectionGuard&&) = delete;
    CollectionGuard(const CollectionGuard&) = delete;
    CollectionGuard& operator=(const CollectionGuard&) = delete;

    ~CollectionGuard() {
        if (lock_.owns_lock()) lock_.unlock();
        if (handle_) locks_->release(collection_, handle_);
    }

private:
    CollectionLocks* locks_;
    std::string collection_;
    std::shared_lock<std::shared_mutex> registry_lock_;
    CollectionLocks::Handle handle_;
    Lock lock_;
};

using ReadGuard = CollectionGuard<std::shared_lock<std::shared_mutex>>;
using WriteGuard = CollectionGuard<std::unique_lock<std::shared_mutex>>;

/// Excludes every collection operation for its lifetime.
using StoreGuard = std::unique_lock<std::shared_mutex>;

} // namespace kgraph
