#pragma once

#include "configured_target.h"
#include "interning_cache.h"
#include "known_rule_classes.h"
#include "output_sink.h"
#include "action_graph.pb.h"
#include <cstdint>

namespace actiongraph {

/// Targets section. The rule class is stored as a reference into
/// KnownRuleClasses and left unset when the target has none.
class KnownRuleConfiguredTargets {
public:
    KnownRuleConfiguredTargets(analysis::ActionGraphContainer& container,
                               KnownRuleClasses& ruleClasses);

    uint32_t dataToId(const RuleConfiguredTarget& target);
    size_t size() const { return cache_.size(); }
    RepeatedFieldSink<analysis::Target>& sink() { return sink_; }

private:
    analysis::Target createProto(const RuleConfiguredTarget& target, uint32_t id);

    KnownRuleClasses& ruleClasses_;
    RepeatedFieldSink<analysis::Target> sink_;
    InterningCache<RuleConfiguredTarget, analysis::Target> cache_;
};

} // namespace actiongraph
