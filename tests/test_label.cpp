#include <catch2/catch_test_macros.hpp>
#include "actiongraph/error.h"
#include "actiongraph/label.h"
#include "absl/hash/hash.h"

using namespace actiongraph;

TEST_CASE("Label parses package and name", "[label]") {
    auto label = Label::parse("//java/com/example:lib");
    CHECK(label.repository().empty());
    CHECK(label.package() == "java/com/example");
    CHECK(label.name() == "lib");
    CHECK(label.toString() == "//java/com/example:lib");
}

TEST_CASE("Label shorthand names the last package segment", "[label]") {
    auto label = Label::parse("//java/com/example");
    CHECK(label.name() == "example");
    CHECK(label.toString() == "//java/com/example:example");
}

TEST_CASE("Label with repository", "[label]") {
    auto label = Label::parse("@rules_java//toolchains:jdk");
    CHECK(label.repository() == "rules_java");
    CHECK(label.package() == "toolchains");
    CHECK(label.name() == "jdk");
    CHECK(label.toString() == "@rules_java//toolchains:jdk");
}

TEST_CASE("Label in the root package", "[label]") {
    auto label = Label::parse("//:all");
    CHECK(label.package().empty());
    CHECK(label.toString() == "//:all");
}

TEST_CASE("Label rejects malformed text", "[label]") {
    CHECK_THROWS_AS(Label::parse(""), MalformedKeyError);
    CHECK_THROWS_AS(Label::parse("foo:bar"), MalformedKeyError);
    CHECK_THROWS_AS(Label::parse("//"), MalformedKeyError);
    CHECK_THROWS_AS(Label::parse("//foo:"), MalformedKeyError);
    CHECK_THROWS_AS(Label::parse("//foo:a:b"), MalformedKeyError);
    CHECK_THROWS_AS(Label::parse("//foo//bar:baz"), MalformedKeyError);
    CHECK_THROWS_AS(Label::parse("//foo/:baz"), MalformedKeyError);
    CHECK_THROWS_AS(Label::parse("@repo"), MalformedKeyError);
}

TEST_CASE("Label constructor validates its parts", "[label]") {
    CHECK_NOTHROW(Label("", "pkg", "name"));
    CHECK_THROWS_AS(Label("", "pkg", ""), MalformedKeyError);
    CHECK_THROWS_AS(Label("", "/pkg", "name"), MalformedKeyError);
}

TEST_CASE("Label equality and hashing are semantic", "[label]") {
    auto parsed = Label::parse("//a/b:c");
    Label built("", "a/b", "c");
    CHECK(parsed == built);
    CHECK(absl::Hash<Label>()(parsed) == absl::Hash<Label>()(built));
    CHECK(parsed != Label::parse("//a/b:d"));
    CHECK(parsed != Label::parse("@x//a/b:c"));
}

TEST_CASE("Default label is empty", "[label]") {
    Label label;
    CHECK(label.empty());
    CHECK_FALSE(Label::parse("//a:b").empty());
}
