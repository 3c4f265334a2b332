#include "actiongraph/known_nested_sets.h"
#include "actiongraph/error.h"

namespace actiongraph {

KnownNestedSets::KnownNestedSets(analysis::ActionGraphContainer& container,
                                 KnownArtifacts& artifacts)
    : artifacts_(artifacts),
      sink_("dep_set_of_files", container.mutable_dep_set_of_files()),
      cache_(
          "dep_set_of_files",
          [](const Key& key, uint32_t id) {
              analysis::DepSetOfFiles proto;
              proto.set_id(id);
              for (uint32_t child : key.transitiveIds) proto.add_transitive_dep_set_ids(child);
              for (uint32_t artifact : key.directIds) proto.add_direct_artifact_ids(artifact);
              return proto;
          },
          sink_) {}

uint32_t KnownNestedSets::dataToId(const NestedSet::Ptr& set) {
    if (!set) throw MalformedKeyError("null nested set");

    {
        absl::MutexLock lock(&resolvedMutex_);
        auto it = resolved_.find(set);
        if (it != resolved_.end()) return it->second;
    }

    // Resolve children outside any lock: they go through this same public
    // entry point, never through cache_ while it is constructing.
    Key key;
    key.transitiveIds.reserve(set->transitive().size());
    for (const auto& child : set->transitive()) {
        key.transitiveIds.push_back(dataToId(child));
    }
    key.directIds.reserve(set->direct().size());
    for (const auto& artifact : set->direct()) {
        key.directIds.push_back(artifacts_.dataToId(artifact));
    }

    uint32_t id = cache_.dataToId(key);

    absl::MutexLock lock(&resolvedMutex_);
    resolved_.emplace(set, id);
    return id;
}

} // namespace actiongraph
