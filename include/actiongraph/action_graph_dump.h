#pragma once

#include "action.h"
#include "configured_target.h"
#include "dump_options.h"
#include "action_graph.pb.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace actiongraph {

class KnownRuleClasses;
class KnownRuleConfiguredTargets;
class KnownPathFragments;
class KnownArtifacts;
class KnownConfigurations;
class KnownAspectDescriptors;
class KnownNestedSets;
class KnownActions;

/// One action graph serialization run: the output container plus the full
/// set of section caches writing into it. Producers may call the dump
/// methods and the caches from several threads; finish() must not race
/// with them.
class ActionGraphDump {
public:
    explicit ActionGraphDump(DumpOptions options = {});
    ~ActionGraphDump();

    ActionGraphDump(const ActionGraphDump&) = delete;
    ActionGraphDump& operator=(const ActionGraphDump&) = delete;

    uint32_t dumpRuleConfiguredTarget(const RuleConfiguredTarget& target);

    /// Returns std::nullopt, and records nothing, for actions rejected by
    /// the mnemonic filter.
    std::optional<uint32_t> dumpAction(const ActionInfo& action);

    KnownRuleClasses& ruleClasses();
    KnownRuleConfiguredTargets& targets();
    KnownPathFragments& pathFragments();
    KnownArtifacts& artifacts();
    KnownConfigurations& configurations();
    KnownAspectDescriptors& aspectDescriptors();
    KnownNestedSets& nestedSets();
    KnownActions& actions();

    const DumpOptions& options() const;
    const analysis::ActionGraphContainer& container() const;

    /// Seal every section. Later dump calls throw InternError and later
    /// appends through the caches throw OutputError. Idempotent.
    const analysis::ActionGraphContainer& finish();
    bool finished() const;

    /// finish(), then write the container in the configured format.
    void write(std::ostream& out);
    std::string serialize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace actiongraph
