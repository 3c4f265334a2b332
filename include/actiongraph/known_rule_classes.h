#pragma once

#include "interning_cache.h"
#include "output_sink.h"
#include "action_graph.pb.h"
#include <cstdint>
#include <string>

namespace actiongraph {

/// Rule class names ("java_library", "cc_binary", ...) of the dumped targets.
class KnownRuleClasses {
public:
    explicit KnownRuleClasses(analysis::ActionGraphContainer& container);

    uint32_t dataToId(const std::string& ruleClass);
    size_t size() const { return cache_.size(); }
    RepeatedFieldSink<analysis::RuleClass>& sink() { return sink_; }

private:
    RepeatedFieldSink<analysis::RuleClass> sink_;
    InterningCache<std::string, analysis::RuleClass> cache_;
};

} // namespace actiongraph
