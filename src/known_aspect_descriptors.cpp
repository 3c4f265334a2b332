#include "actiongraph/known_aspect_descriptors.h"
#include "actiongraph/error.h"

namespace actiongraph {

KnownAspectDescriptors::KnownAspectDescriptors(analysis::ActionGraphContainer& container)
    : sink_("aspect_descriptors", container.mutable_aspect_descriptors()),
      cache_(
          "aspect_descriptors",
          [](const AspectDescriptor& aspect, uint32_t id) {
              if (aspect.name.empty()) throw MalformedKeyError("aspect without a name");
              analysis::AspectDescriptor proto;
              proto.set_id(id);
              proto.set_name(aspect.name);
              for (const auto& [key, value] : aspect.parameters) {
                  auto* parameter = proto.add_parameters();
                  parameter->set_key(key);
                  parameter->set_value(value);
              }
              return proto;
          },
          sink_) {}

uint32_t KnownAspectDescriptors::dataToId(const AspectDescriptor& aspect) {
    return cache_.dataToId(aspect);
}

} // namespace actiongraph
