#pragma once

#include "configured_target.h"
#include "interning_cache.h"
#include "output_sink.h"
#include "action_graph.pb.h"
#include <cstdint>

namespace actiongraph {

class KnownAspectDescriptors {
public:
    explicit KnownAspectDescriptors(analysis::ActionGraphContainer& container);

    uint32_t dataToId(const AspectDescriptor& aspect);
    size_t size() const { return cache_.size(); }
    RepeatedFieldSink<analysis::AspectDescriptor>& sink() { return sink_; }

private:
    RepeatedFieldSink<analysis::AspectDescriptor> sink_;
    InterningCache<AspectDescriptor, analysis::AspectDescriptor> cache_;
};

} // namespace actiongraph
