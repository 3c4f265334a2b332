#pragma once

#include "artifact.h"
#include "interning_cache.h"
#include "known_artifacts.h"
#include "output_sink.h"
#include "action_graph.pb.h"
#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include <cstdint>
#include <utility>
#include <vector>

namespace actiongraph {

/// Dep sets of files. A set is keyed by the ids of its direct artifacts and
/// child sets, so structurally equal sets share one entry even when they
/// are distinct objects. Children are interned before their parent, so a
/// child always has a smaller id than any set containing it.
class KnownNestedSets {
public:
    KnownNestedSets(analysis::ActionGraphContainer& container, KnownArtifacts& artifacts);

    /// Throws MalformedKeyError for a null set.
    uint32_t dataToId(const NestedSet::Ptr& set);

    size_t size() const { return cache_.size(); }
    RepeatedFieldSink<analysis::DepSetOfFiles>& sink() { return sink_; }

private:
    struct Key {
        std::vector<uint32_t> directIds;
        std::vector<uint32_t> transitiveIds;

        bool operator==(const Key& other) const {
            return directIds == other.directIds && transitiveIds == other.transitiveIds;
        }

        template <typename H>
        friend H AbslHashValue(H h, const Key& k) {
            return H::combine(std::move(h), k.directIds, k.transitiveIds);
        }
    };

    KnownArtifacts& artifacts_;
    RepeatedFieldSink<analysis::DepSetOfFiles> sink_;
    InterningCache<Key, analysis::DepSetOfFiles> cache_;

    // Sets already resolved, by object identity. Holding the pointer keeps
    // the address from being reused by a different set during the run.
    mutable absl::Mutex resolvedMutex_;
    absl::flat_hash_map<NestedSet::Ptr, uint32_t> resolved_ ABSL_GUARDED_BY(resolvedMutex_);
};

} // namespace actiongraph
