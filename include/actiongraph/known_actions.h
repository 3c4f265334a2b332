#pragma once

#include "action.h"
#include "dump_options.h"
#include "interning_cache.h"
#include "known_artifacts.h"
#include "known_aspect_descriptors.h"
#include "known_configurations.h"
#include "known_nested_sets.h"
#include "known_rule_configured_targets.h"
#include "output_sink.h"
#include "action_graph.pb.h"
#include <cstdint>

namespace actiongraph {

/// Actions section. Every reference (owner target, aspects, configuration,
/// inputs, outputs) is resolved through the sibling caches.
class KnownActions {
public:
    struct Dependencies {
        KnownRuleConfiguredTargets& targets;
        KnownAspectDescriptors& aspects;
        KnownConfigurations& configurations;
        KnownNestedSets& nestedSets;
        KnownArtifacts& artifacts;
    };

    KnownActions(analysis::ActionGraphContainer& container, const DumpOptions& options,
                 Dependencies deps);

    uint32_t dataToId(const ActionInfo& action);
    size_t size() const { return cache_.size(); }
    RepeatedFieldSink<analysis::Action>& sink() { return sink_; }

private:
    analysis::Action createProto(const ActionInfo& action, uint32_t id);

    const DumpOptions& options_;
    Dependencies deps_;
    RepeatedFieldSink<analysis::Action> sink_;
    InterningCache<ActionInfo, analysis::Action, ActionKeyHash, ActionKeyEq> cache_;
};

} // namespace actiongraph
