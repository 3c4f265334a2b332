#include "actiongraph/known_actions.h"
#include "actiongraph/error.h"
#include "absl/hash/hash.h"

namespace actiongraph {

size_t ActionKeyHash::operator()(const ActionInfo& action) const {
    return absl::Hash<std::string>()(action.actionKey);
}

KnownActions::KnownActions(analysis::ActionGraphContainer& container, const DumpOptions& options,
                           Dependencies deps)
    : options_(options),
      deps_(deps),
      sink_("actions", container.mutable_actions()),
      cache_(
          "actions",
          [this](const ActionInfo& action, uint32_t id) { return createProto(action, id); },
          sink_) {}

uint32_t KnownActions::dataToId(const ActionInfo& action) {
    return cache_.dataToId(action);
}

analysis::Action KnownActions::createProto(const ActionInfo& action, uint32_t id) {
    if (action.actionKey.empty()) {
        throw MalformedKeyError("action '" + action.mnemonic + "' has no action key");
    }

    analysis::Action proto;
    proto.set_id(id);
    proto.set_target_id(deps_.targets.dataToId(action.owner));
    for (const auto& aspect : action.aspects) {
        proto.add_aspect_descriptor_ids(deps_.aspects.dataToId(aspect));
    }
    proto.set_action_key(action.actionKey);
    proto.set_mnemonic(action.mnemonic);
    proto.set_configuration_id(deps_.configurations.dataToId(action.configuration));

    if (options_.includeCommandline) {
        for (const auto& argument : action.arguments) proto.add_arguments(argument);
    }
    if (options_.includeEnvironment) {
        for (const auto& [key, value] : action.environment) {
            auto* variable = proto.add_environment_variables();
            variable->set_key(key);
            variable->set_value(value);
        }
    }

    // Actions without inputs carry no dep set at all.
    if (action.inputs && !action.inputs->empty()) {
        proto.add_input_dep_set_ids(deps_.nestedSets.dataToId(action.inputs));
    }
    for (const auto& output : action.outputs) {
        proto.add_output_ids(deps_.artifacts.dataToId(output));
    }
    if (action.primaryOutput) {
        proto.set_primary_output_id(deps_.artifacts.dataToId(*action.primaryOutput));
    }
    proto.set_execution_platform(action.executionPlatform);
    proto.set_discovers_inputs(action.discoversInputs);
    return proto;
}

} // namespace actiongraph
