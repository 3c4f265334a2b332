#include "actiongraph/label.h"
#include "actiongraph/error.h"
#include "absl/strings/str_cat.h"

namespace actiongraph {

namespace {

void validatePackage(std::string_view package, std::string_view text) {
    if (package.empty()) return;
    if (package.front() == '/' || package.back() == '/' ||
        package.find("//") != std::string_view::npos) {
        throw MalformedKeyError(absl::StrCat("bad package in label '", text, "'"));
    }
}

void validateName(std::string_view name, std::string_view text) {
    if (name.empty() || name.find(':') != std::string_view::npos) {
        throw MalformedKeyError(absl::StrCat("bad target name in label '", text, "'"));
    }
}

} // namespace

Label::Label(std::string repository, std::string package, std::string name)
    : repository_(std::move(repository)), package_(std::move(package)), name_(std::move(name)) {
    std::string text = toString();
    validatePackage(package_, text);
    validateName(name_, text);
}

Label Label::parse(std::string_view text) {
    std::string_view rest = text;
    std::string_view repository;

    if (!rest.empty() && rest.front() == '@') {
        auto slashes = rest.find("//");
        if (slashes == std::string_view::npos) {
            throw MalformedKeyError(absl::StrCat("missing '//' in label '", text, "'"));
        }
        repository = rest.substr(1, slashes - 1);
        rest.remove_prefix(slashes);
    }
    if (rest.substr(0, 2) != "//") {
        throw MalformedKeyError(absl::StrCat("label must start with '//': '", text, "'"));
    }
    rest.remove_prefix(2);

    std::string_view package;
    std::string_view name;
    auto colon = rest.find(':');
    if (colon == std::string_view::npos) {
        // //foo/bar is short for //foo/bar:bar
        package = rest;
        auto slash = package.rfind('/');
        name = slash == std::string_view::npos ? package : package.substr(slash + 1);
    } else {
        package = rest.substr(0, colon);
        name = rest.substr(colon + 1);
    }

    validatePackage(package, text);
    validateName(name, text);

    Label label;
    label.repository_ = std::string(repository);
    label.package_ = std::string(package);
    label.name_ = std::string(name);
    return label;
}

std::string Label::toString() const {
    if (repository_.empty()) return absl::StrCat("//", package_, ":", name_);
    return absl::StrCat("@", repository_, "//", package_, ":", name_);
}

} // namespace actiongraph
