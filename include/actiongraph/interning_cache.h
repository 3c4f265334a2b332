#pragma once

#include "error.h"
#include "identity_table.h"
#include "output_sink.h"
#include "absl/base/thread_annotations.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/synchronization/mutex.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace actiongraph {

/// Interns keys of type K into serialized values of type V.
///
/// The first dataToId() call for a key assigns the next id, runs construct
/// with that id, hands the result to publish and returns the id. Every later
/// call with an equal key returns the same id without constructing or
/// publishing again.
///
/// All calls on one instance are serialized by a single mutex held for the
/// whole get-or-construct sequence, so a racing caller for the same new key
/// blocks until the first one has published and then sees its id.
///
/// Preconditions (not enforced, except where noted):
///   - keys are not mutated after their first dataToId() call;
///   - construct only calls into *other* cache instances, and the graph of
///     such delegations is acyclic. Reentering the same instance from its
///     own construct on the same thread throws ReentrantInternError instead
///     of deadlocking. This holds for a different key too, and for find()
///     and size(): the mutex is not recursive, and an id handed out to a
///     nested key would be published ahead of the id being constructed.
///
/// If construct or publish throws, the id is retracted and the exception
/// propagates; the key is treated as unseen on the next call.
template <typename K, typename V, typename Hash = absl::Hash<K>, typename Eq = std::equal_to<K>>
class InterningCache {
public:
    using ConstructFn = std::function<V(const K&, uint32_t)>;
    using PublishFn = std::function<void(V)>;

    InterningCache(std::string name, ConstructFn construct, PublishFn publish)
        : name_(std::move(name)),
          construct_(std::move(construct)),
          publish_(std::move(publish)) {}

    /// Convenience: publish by appending to sink, which must outlive the cache.
    InterningCache(std::string name, ConstructFn construct, OutputSink<V>& sink)
        : InterningCache(std::move(name), std::move(construct),
                         [&sink](V value) { sink.append(std::move(value)); }) {}

    InterningCache(const InterningCache&) = delete;
    InterningCache& operator=(const InterningCache&) = delete;

    uint32_t dataToId(const K& key) {
        checkNotReentrant();
        absl::MutexLock lock(&mutex_);
        OwnerMark mark(owner_);

        auto assignment = table_.getOrAssign(key);
        if (!assignment.isNew) return assignment.id;

        try {
            publish_(construct_(key, assignment.id));
        } catch (...) {
            table_.retract(key);
            throw;
        }
        ++published_;
        CHECK_EQ(published_, table_.size()) << "cache '" << name_ << "' lost track of a key";
        return assignment.id;
    }

    /// Id previously assigned to key, if any. Never constructs.
    std::optional<uint32_t> find(const K& key) const {
        checkNotReentrant();
        absl::MutexLock lock(&mutex_);
        uint32_t id = table_.find(key);
        if (id == 0) return std::nullopt;
        return id;
    }

    /// Number of keys materialized so far.
    size_t size() const {
        checkNotReentrant();
        absl::MutexLock lock(&mutex_);
        return published_;
    }

    const std::string& name() const { return name_; }

private:
    void checkNotReentrant() const {
        if (owner_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
            LOG(ERROR) << "cache '" << name_ << "' reentered from its own construct function";
            throw ReentrantInternError(name_);
        }
    }

    // Marks the calling thread as the one currently inside the critical
    // section, so a nested call from construct can be told apart from a
    // second thread waiting on the mutex.
    class OwnerMark {
    public:
        explicit OwnerMark(std::atomic<std::thread::id>& owner) : owner_(owner) {
            owner_.store(std::this_thread::get_id(), std::memory_order_release);
        }
        ~OwnerMark() { owner_.store(std::thread::id(), std::memory_order_release); }

    private:
        std::atomic<std::thread::id>& owner_;
    };

    const std::string name_;
    const ConstructFn construct_;
    const PublishFn publish_;

    mutable absl::Mutex mutex_;
    IdentityTable<K, Hash, Eq> table_ ABSL_GUARDED_BY(mutex_);
    size_t published_ ABSL_GUARDED_BY(mutex_) = 0;
    std::atomic<std::thread::id> owner_{};
};

} // namespace actiongraph
