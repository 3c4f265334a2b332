#include "actiongraph/known_artifacts.h"

namespace actiongraph {

KnownArtifacts::KnownArtifacts(analysis::ActionGraphContainer& container,
                               KnownPathFragments& pathFragments)
    : pathFragments_(pathFragments),
      sink_("artifacts", container.mutable_artifacts()),
      cache_(
          "artifacts",
          [this](const Artifact& artifact, uint32_t id) {
              analysis::Artifact proto;
              proto.set_id(id);
              proto.set_path_fragment_id(pathFragments_.dataToId(artifact.execPath));
              proto.set_is_tree_artifact(artifact.isTreeArtifact);
              return proto;
          },
          sink_) {}

uint32_t KnownArtifacts::dataToId(const Artifact& artifact) {
    return cache_.dataToId(artifact);
}

} // namespace actiongraph
