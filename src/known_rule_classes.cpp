#include "actiongraph/known_rule_classes.h"
#include "actiongraph/error.h"

namespace actiongraph {

KnownRuleClasses::KnownRuleClasses(analysis::ActionGraphContainer& container)
    : sink_("rule_classes", container.mutable_rule_classes()),
      cache_(
          "rule_classes",
          [](const std::string& ruleClass, uint32_t id) {
              if (ruleClass.empty()) throw MalformedKeyError("empty rule class name");
              analysis::RuleClass proto;
              proto.set_id(id);
              proto.set_name(ruleClass);
              return proto;
          },
          sink_) {}

uint32_t KnownRuleClasses::dataToId(const std::string& ruleClass) {
    return cache_.dataToId(ruleClass);
}

} // namespace actiongraph
