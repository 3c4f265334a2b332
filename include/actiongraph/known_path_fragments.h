#pragma once

#include "interning_cache.h"
#include "output_sink.h"
#include "action_graph.pb.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace actiongraph {

/// Exec paths, stored as a tree of segments so common prefixes such as
/// `bazel-out/k8-fastbuild/bin` appear once.
class KnownPathFragments {
public:
    explicit KnownPathFragments(analysis::ActionGraphContainer& container);

    /// Interns every prefix of execPath and returns the id of its last
    /// segment. The path must be relative, non-empty and free of empty
    /// segments; otherwise MalformedKeyError is thrown.
    uint32_t dataToId(std::string_view execPath);

    size_t size() const { return cache_.size(); }
    RepeatedFieldSink<analysis::PathFragment>& sink() { return sink_; }

private:
    // Parent id 0 marks a segment directly under the exec root.
    struct Segment {
        uint32_t parentId = 0;
        std::string label;

        bool operator==(const Segment& other) const {
            return parentId == other.parentId && label == other.label;
        }

        template <typename H>
        friend H AbslHashValue(H h, const Segment& s) {
            return H::combine(std::move(h), s.parentId, s.label);
        }
    };

    RepeatedFieldSink<analysis::PathFragment> sink_;
    InterningCache<Segment, analysis::PathFragment> cache_;
};

/// Rebuild the exec path of a path fragment from a finished container.
/// Throws std::out_of_range for an unknown id.
std::string expandPathFragment(const analysis::ActionGraphContainer& container, uint32_t id);

} // namespace actiongraph
