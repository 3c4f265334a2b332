#include "actiongraph/known_path_fragments.h"
#include "actiongraph/error.h"
#include "absl/strings/str_cat.h"
#include <stdexcept>
#include <vector>

namespace actiongraph {

KnownPathFragments::KnownPathFragments(analysis::ActionGraphContainer& container)
    : sink_("path_fragments", container.mutable_path_fragments()),
      cache_(
          "path_fragments",
          [](const Segment& segment, uint32_t id) {
              analysis::PathFragment proto;
              proto.set_id(id);
              proto.set_label(segment.label);
              if (segment.parentId != 0) proto.set_parent_id(segment.parentId);
              return proto;
          },
          sink_) {}

uint32_t KnownPathFragments::dataToId(std::string_view execPath) {
    if (execPath.empty()) throw MalformedKeyError("empty exec path");
    if (execPath.front() == '/') {
        throw MalformedKeyError(absl::StrCat("exec path '", execPath, "' is absolute"));
    }

    // Validate everything before interning the first prefix, so a bad path
    // leaves the section untouched.
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start <= execPath.size()) {
        size_t end = execPath.find('/', start);
        if (end == std::string_view::npos) end = execPath.size();
        auto segment = execPath.substr(start, end - start);
        if (segment.empty()) {
            throw MalformedKeyError(absl::StrCat("empty segment in exec path '", execPath, "'"));
        }
        segments.push_back(segment);
        start = end + 1;
    }

    uint32_t parentId = 0;
    for (auto segment : segments) {
        parentId = cache_.dataToId(Segment{parentId, std::string(segment)});
    }
    return parentId;
}

std::string expandPathFragment(const analysis::ActionGraphContainer& container, uint32_t id) {
    const auto& fragments = container.path_fragments();
    std::vector<const analysis::PathFragment*> chain;
    uint32_t current = id;
    while (true) {
        // Ids are dense and appended in order, so id N lives at index N-1.
        if (current == 0 || current > static_cast<uint32_t>(fragments.size()) ||
            fragments[static_cast<int>(current - 1)].id() != current) {
            throw std::out_of_range("expandPathFragment: invalid id " + std::to_string(current));
        }
        const auto& fragment = fragments[static_cast<int>(current - 1)];
        chain.push_back(&fragment);
        if (!fragment.has_parent_id()) break;
        current = fragment.parent_id();
    }

    std::string path;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (!path.empty()) path += '/';
        path += (*it)->label();
    }
    return path;
}

} // namespace actiongraph
