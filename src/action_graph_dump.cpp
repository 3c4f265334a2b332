#include "actiongraph/action_graph_dump.h"
#include "actiongraph/error.h"
#include "actiongraph/known_actions.h"
#include "actiongraph/known_artifacts.h"
#include "actiongraph/known_aspect_descriptors.h"
#include "actiongraph/known_configurations.h"
#include "actiongraph/known_nested_sets.h"
#include "actiongraph/known_path_fragments.h"
#include "actiongraph/known_rule_classes.h"
#include "actiongraph/known_rule_configured_targets.h"
#include "absl/log/log.h"
#include <google/protobuf/text_format.h>
#include <google/protobuf/util/json_util.h>
#include <atomic>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace actiongraph {

namespace {

std::optional<std::regex> compileFilter(const std::string& pattern) {
    if (pattern.empty()) return std::nullopt;
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("bad mnemonic filter '" + pattern + "': " + e.what());
    }
}

} // namespace

// Members are declared in dependency order: every cache is constructed
// after, and destroyed before, the caches it delegates to.
struct ActionGraphDump::Impl {
    DumpOptions options;
    std::optional<std::regex> mnemonicFilter;
    analysis::ActionGraphContainer container;

    KnownRuleClasses ruleClasses{container};
    KnownRuleConfiguredTargets targets{container, ruleClasses};
    KnownPathFragments pathFragments{container};
    KnownArtifacts artifacts{container, pathFragments};
    KnownConfigurations configurations{container};
    KnownAspectDescriptors aspectDescriptors{container};
    KnownNestedSets nestedSets{container, artifacts};
    KnownActions actions{container, options,
                         KnownActions::Dependencies{targets, aspectDescriptors, configurations,
                                                    nestedSets, artifacts}};

    std::atomic<bool> finished{false};

    explicit Impl(DumpOptions opts)
        : options(std::move(opts)), mnemonicFilter(compileFilter(options.mnemonicFilter)) {}

    void checkOpen() const {
        if (finished.load()) throw InternError("action graph dump already finished");
    }
};

ActionGraphDump::ActionGraphDump(DumpOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

ActionGraphDump::~ActionGraphDump() = default;

uint32_t ActionGraphDump::dumpRuleConfiguredTarget(const RuleConfiguredTarget& target) {
    impl_->checkOpen();
    return impl_->targets.dataToId(target);
}

std::optional<uint32_t> ActionGraphDump::dumpAction(const ActionInfo& action) {
    impl_->checkOpen();
    if (impl_->mnemonicFilter && !std::regex_match(action.mnemonic, *impl_->mnemonicFilter)) {
        return std::nullopt;
    }
    return impl_->actions.dataToId(action);
}

KnownRuleClasses& ActionGraphDump::ruleClasses() { return impl_->ruleClasses; }
KnownRuleConfiguredTargets& ActionGraphDump::targets() { return impl_->targets; }
KnownPathFragments& ActionGraphDump::pathFragments() { return impl_->pathFragments; }
KnownArtifacts& ActionGraphDump::artifacts() { return impl_->artifacts; }
KnownConfigurations& ActionGraphDump::configurations() { return impl_->configurations; }
KnownAspectDescriptors& ActionGraphDump::aspectDescriptors() { return impl_->aspectDescriptors; }
KnownNestedSets& ActionGraphDump::nestedSets() { return impl_->nestedSets; }
KnownActions& ActionGraphDump::actions() { return impl_->actions; }

const DumpOptions& ActionGraphDump::options() const { return impl_->options; }

const analysis::ActionGraphContainer& ActionGraphDump::container() const {
    return impl_->container;
}

const analysis::ActionGraphContainer& ActionGraphDump::finish() {
    if (impl_->finished.exchange(true)) return impl_->container;

    impl_->ruleClasses.sink().seal();
    impl_->targets.sink().seal();
    impl_->pathFragments.sink().seal();
    impl_->artifacts.sink().seal();
    impl_->configurations.sink().seal();
    impl_->aspectDescriptors.sink().seal();
    impl_->nestedSets.sink().seal();
    impl_->actions.sink().seal();

    const auto& c = impl_->container;
    LOG(INFO) << "action graph: " << c.targets_size() << " targets, " << c.actions_size()
              << " actions, " << c.artifacts_size() << " artifacts, " << c.dep_set_of_files_size()
              << " dep sets, " << c.path_fragments_size() << " path fragments, "
              << c.rule_classes_size() << " rule classes, " << c.configuration_size()
              << " configurations, " << c.aspect_descriptors_size() << " aspects";
    return impl_->container;
}

bool ActionGraphDump::finished() const { return impl_->finished.load(); }

void ActionGraphDump::write(std::ostream& out) {
    const auto& container = finish();

    switch (impl_->options.outputFormat) {
        case OutputFormat::Proto:
            if (!container.SerializeToOstream(&out)) {
                throw OutputError("failed to serialize action graph");
            }
            break;
        case OutputFormat::TextProto: {
            std::string text;
            if (!google::protobuf::TextFormat::PrintToString(container, &text)) {
                throw OutputError("failed to print action graph as text");
            }
            out << text;
            break;
        }
        case OutputFormat::JsonProto: {
            std::string json;
            google::protobuf::util::JsonPrintOptions printOptions;
            printOptions.preserve_proto_field_names = true;
            auto status = google::protobuf::util::MessageToJsonString(container, &json, printOptions);
            if (!status.ok()) {
                throw OutputError("failed to print action graph as json: " + status.ToString());
            }
            out << json;
            break;
        }
    }

    out.flush();
    if (!out) {
        throw OutputError(std::string("stream error writing ") +
                          std::string(outputFormatName(impl_->options.outputFormat)) + " output");
    }
}

std::string ActionGraphDump::serialize() {
    std::ostringstream out;
    write(out);
    return out.str();
}

} // namespace actiongraph
