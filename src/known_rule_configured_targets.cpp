#include "actiongraph/known_rule_configured_targets.h"
#include "actiongraph/error.h"

namespace actiongraph {

KnownRuleConfiguredTargets::KnownRuleConfiguredTargets(analysis::ActionGraphContainer& container,
                                                       KnownRuleClasses& ruleClasses)
    : ruleClasses_(ruleClasses),
      sink_("targets", container.mutable_targets()),
      cache_(
          "targets",
          [this](const RuleConfiguredTarget& target, uint32_t id) {
              return createProto(target, id);
          },
          sink_) {}

uint32_t KnownRuleConfiguredTargets::dataToId(const RuleConfiguredTarget& target) {
    return cache_.dataToId(target);
}

analysis::Target KnownRuleConfiguredTargets::createProto(const RuleConfiguredTarget& target,
                                                         uint32_t id) {
    if (target.label.empty()) throw MalformedKeyError("target without a label");

    analysis::Target proto;
    proto.set_id(id);
    proto.set_label(target.label.toString());
    if (target.ruleClass && !target.ruleClass->empty()) {
        proto.set_rule_class_id(ruleClasses_.dataToId(*target.ruleClass));
    }
    return proto;
}

} // namespace actiongraph
