#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace actiongraph {

/// Build label: `@repository//package:name`. An empty repository denotes
/// the main repository and is rendered without the `@` prefix.
class Label {
public:
    Label() = default;
    Label(std::string repository, std::string package, std::string name);

    /// Parse `//pkg:name`, `//pkg` (short for `//pkg:pkg`) or
    /// `@repo//pkg:name`. Throws MalformedKeyError on anything else.
    static Label parse(std::string_view text);

    const std::string& repository() const { return repository_; }
    const std::string& package() const { return package_; }
    const std::string& name() const { return name_; }

    /// True for a default-constructed label.
    bool empty() const { return name_.empty(); }

    std::string toString() const;

    bool operator==(const Label& other) const {
        return repository_ == other.repository_ && package_ == other.package_ &&
               name_ == other.name_;
    }
    bool operator!=(const Label& other) const { return !(*this == other); }

    template <typename H>
    friend H AbslHashValue(H h, const Label& label) {
        return H::combine(std::move(h), label.repository_, label.package_, label.name_);
    }

private:
    std::string repository_;
    std::string package_;
    std::string name_;
};

} // namespace actiongraph
