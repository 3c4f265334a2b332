#pragma once

#include "configured_target.h"
#include "interning_cache.h"
#include "output_sink.h"
#include "action_graph.pb.h"
#include <cstdint>

namespace actiongraph {

class KnownConfigurations {
public:
    explicit KnownConfigurations(analysis::ActionGraphContainer& container);

    uint32_t dataToId(const BuildConfiguration& configuration);
    size_t size() const { return cache_.size(); }
    RepeatedFieldSink<analysis::Configuration>& sink() { return sink_; }

private:
    RepeatedFieldSink<analysis::Configuration> sink_;
    InterningCache<BuildConfiguration, analysis::Configuration> cache_;
};

} // namespace actiongraph
