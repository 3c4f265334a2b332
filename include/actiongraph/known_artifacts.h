#pragma once

#include "artifact.h"
#include "interning_cache.h"
#include "known_path_fragments.h"
#include "output_sink.h"
#include "action_graph.pb.h"
#include <cstdint>

namespace actiongraph {

class KnownArtifacts {
public:
    KnownArtifacts(analysis::ActionGraphContainer& container, KnownPathFragments& pathFragments);

    uint32_t dataToId(const Artifact& artifact);
    size_t size() const { return cache_.size(); }
    RepeatedFieldSink<analysis::Artifact>& sink() { return sink_; }

private:
    KnownPathFragments& pathFragments_;
    RepeatedFieldSink<analysis::Artifact> sink_;
    InterningCache<Artifact, analysis::Artifact> cache_;
};

} // namespace actiongraph
