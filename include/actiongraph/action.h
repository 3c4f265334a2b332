#pragma once

#include "artifact.h"
#include "configured_target.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace actiongraph {

/// One action of the build graph. Two actions are the same action iff their
/// action keys are equal; the remaining fields are payload.
struct ActionInfo {
    RuleConfiguredTarget owner;
    std::vector<AspectDescriptor> aspects;
    std::string actionKey;
    std::string mnemonic;
    BuildConfiguration configuration;
    std::vector<std::string> arguments;
    std::vector<std::pair<std::string, std::string>> environment;
    NestedSet::Ptr inputs;
    std::vector<Artifact> outputs;
    std::optional<Artifact> primaryOutput;
    std::string executionPlatform;
    bool discoversInputs = false;
};

struct ActionKeyHash {
    size_t operator()(const ActionInfo& action) const;
};

struct ActionKeyEq {
    bool operator()(const ActionInfo& a, const ActionInfo& b) const {
        return a.actionKey == b.actionKey;
    }
};

} // namespace actiongraph
