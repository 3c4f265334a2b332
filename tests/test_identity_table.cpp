#include <catch2/catch_test_macros.hpp>
#include "actiongraph/identity_table.h"
#include <stdexcept>
#include <string>

using namespace actiongraph;

TEST_CASE("IdentityTable assigns from the first id", "[identity_table]") {
    IdentityTable<std::string> table;

    auto a = table.getOrAssign("a");
    CHECK(a.isNew);
    CHECK(a.id == IdentityTable<std::string>::kFirstId);
    CHECK(a.id == 1);
}

TEST_CASE("IdentityTable returns existing id without growing", "[identity_table]") {
    IdentityTable<std::string> table;

    auto first = table.getOrAssign("stone");
    auto again = table.getOrAssign("stone");
    CHECK_FALSE(again.isNew);
    CHECK(again.id == first.id);
    CHECK(table.size() == 1);
    CHECK(table.lastId() == 1);
}

TEST_CASE("IdentityTable ids are dense in insertion order", "[identity_table]") {
    IdentityTable<std::string> table;

    CHECK(table.getOrAssign("first").id == 1);
    CHECK(table.getOrAssign("second").id == 2);
    CHECK(table.getOrAssign("first").id == 1);
    CHECK(table.getOrAssign("third").id == 3);
    CHECK(table.size() == 3);
}

TEST_CASE("IdentityTable find never assigns", "[identity_table]") {
    IdentityTable<std::string> table;

    CHECK(table.find("missing") == 0);
    table.getOrAssign("present");
    CHECK(table.find("present") == 1);
    CHECK(table.find("missing") == 0);
    CHECK(table.size() == 1);
}

TEST_CASE("IdentityTable retract undoes the latest assignment", "[identity_table]") {
    IdentityTable<std::string> table;
    table.getOrAssign("a");
    table.getOrAssign("b");

    table.retract("b");
    CHECK(table.size() == 1);
    CHECK(table.find("b") == 0);

    // The retracted id is handed out again.
    auto c = table.getOrAssign("c");
    CHECK(c.isNew);
    CHECK(c.id == 2);
}

TEST_CASE("IdentityTable retract rejects anything but the latest key", "[identity_table]") {
    IdentityTable<std::string> table;
    table.getOrAssign("a");
    table.getOrAssign("b");

    CHECK_THROWS_AS(table.retract("a"), std::logic_error);
    CHECK_THROWS_AS(table.retract("never"), std::logic_error);
    CHECK(table.size() == 2);
}
