#include "actiongraph/known_configurations.h"
#include "actiongraph/error.h"

namespace actiongraph {

KnownConfigurations::KnownConfigurations(analysis::ActionGraphContainer& container)
    : sink_("configuration", container.mutable_configuration()),
      cache_(
          "configuration",
          [](const BuildConfiguration& configuration, uint32_t id) {
              if (configuration.checksum.empty()) {
                  throw MalformedKeyError("configuration '" + configuration.mnemonic +
                                          "' has no checksum");
              }
              analysis::Configuration proto;
              proto.set_id(id);
              proto.set_mnemonic(configuration.mnemonic);
              proto.set_platform_name(configuration.platformName);
              proto.set_checksum(configuration.checksum);
              proto.set_is_tool(configuration.isTool);
              return proto;
          },
          sink_) {}

uint32_t KnownConfigurations::dataToId(const BuildConfiguration& configuration) {
    return cache_.dataToId(configuration);
}

} // namespace actiongraph
