#pragma once

#include "label.h"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace actiongraph {

/// A configured rule target as far as the action graph needs it.
/// An absent or empty rule class means "no rule class".
struct RuleConfiguredTarget {
    Label label;
    std::optional<std::string> ruleClass;

    /// The rule class with "absent" and "empty" folded together.
    std::string_view effectiveRuleClass() const {
        return ruleClass ? std::string_view(*ruleClass) : std::string_view();
    }

    bool operator==(const RuleConfiguredTarget& other) const {
        return label == other.label && effectiveRuleClass() == other.effectiveRuleClass();
    }
    bool operator!=(const RuleConfiguredTarget& other) const { return !(*this == other); }

    template <typename H>
    friend H AbslHashValue(H h, const RuleConfiguredTarget& t) {
        return H::combine(std::move(h), t.label, t.effectiveRuleClass());
    }
};

struct BuildConfiguration {
    std::string mnemonic;
    std::string platformName;
    std::string checksum;
    bool isTool = false;

    bool operator==(const BuildConfiguration& other) const {
        return mnemonic == other.mnemonic && platformName == other.platformName &&
               checksum == other.checksum && isTool == other.isTool;
    }
    bool operator!=(const BuildConfiguration& other) const { return !(*this == other); }

    template <typename H>
    friend H AbslHashValue(H h, const BuildConfiguration& c) {
        return H::combine(std::move(h), c.mnemonic, c.platformName, c.checksum, c.isTool);
    }
};

/// Aspect applied to a target. Parameter order is significant.
struct AspectDescriptor {
    std::string name;
    std::vector<std::pair<std::string, std::string>> parameters;

    bool operator==(const AspectDescriptor& other) const {
        return name == other.name && parameters == other.parameters;
    }
    bool operator!=(const AspectDescriptor& other) const { return !(*this == other); }

    template <typename H>
    friend H AbslHashValue(H h, const AspectDescriptor& a) {
        return H::combine(std::move(h), a.name, a.parameters);
    }
};

} // namespace actiongraph
