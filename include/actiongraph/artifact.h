#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace actiongraph {

/// A file (or tree of files) produced or consumed by an action, identified
/// by its path relative to the execution root.
struct Artifact {
    std::string execPath;
    bool isTreeArtifact = false;

    bool operator==(const Artifact& other) const {
        return execPath == other.execPath && isTreeArtifact == other.isTreeArtifact;
    }
    bool operator!=(const Artifact& other) const { return !(*this == other); }

    template <typename H>
    friend H AbslHashValue(H h, const Artifact& a) {
        return H::combine(std::move(h), a.execPath, a.isTreeArtifact);
    }
};

/// Immutable DAG of artifacts: direct members plus shared child sets.
/// Children are shared, so the same subset may be reached from many parents.
class NestedSet {
public:
    using Ptr = std::shared_ptr<const NestedSet>;

    static Ptr create(std::vector<Artifact> direct, std::vector<Ptr> transitive = {}) {
        return Ptr(new NestedSet(std::move(direct), std::move(transitive)));
    }

    const std::vector<Artifact>& direct() const { return direct_; }
    const std::vector<Ptr>& transitive() const { return transitive_; }
    bool empty() const { return direct_.empty() && transitive_.empty(); }

private:
    NestedSet(std::vector<Artifact> direct, std::vector<Ptr> transitive)
        : direct_(std::move(direct)), transitive_(std::move(transitive)) {}

    std::vector<Artifact> direct_;
    std::vector<Ptr> transitive_;
};

} // namespace actiongraph
