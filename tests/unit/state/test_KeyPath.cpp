#include <doctest/doctest.h>

#include <blueprint/state/KeyPath.hpp>

using namespace BP;

TEST_SUITE("state.keypath") {

TEST_CASE("bracket and dot indices split the same way") {
    CHECK(KeyPath::Split("user.items[2].name") == std::vector<std::string>{"user", "items", "2", "name"});
    CHECK(KeyPath::Split("user.items.2.name") == std::vector<std::string>{"user", "items", "2", "name"});
    CHECK(KeyPath::Split("..a..b.") == std::vector<std::string>{"a", "b"});
    CHECK(KeyPath::Split("").empty());
}

TEST_CASE("normalize produces the dot form") {
    CHECK(KeyPath::Normalize("items[0].name") == "items.0.name");
    CHECK(KeyPath::Normalize("count") == "count");
}

TEST_CASE("ancestors and overlap") {
    CHECK(KeyPath::Ancestors("a.b.c") == std::vector<std::string>{"a", "a.b"});
    CHECK(KeyPath::Ancestors("a").empty());

    CHECK(KeyPath::IsSameOrAncestor("user", "user.name"));
    CHECK(KeyPath::IsSameOrAncestor("user", "user"));
    CHECK_FALSE(KeyPath::IsSameOrAncestor("user", "username"));

    CHECK(KeyPath::Overlaps("items", "items.0"));
    CHECK(KeyPath::Overlaps("items.0", "items"));
    CHECK_FALSE(KeyPath::Overlaps("items", "other"));
}

TEST_CASE("find walks objects and arrays") {
    Value::Object user;
    user.emplace("tags", Value{Value::Array{Value{"a"}, Value{"b"}}});
    Value root{Value::Object{{"user", Value{user}}}};

    auto const* tag = KeyPath::Find(root, KeyPath::Split("user.tags[1]"));
    REQUIRE(tag != nullptr);
    CHECK(tag->asString() == "b");
    CHECK(KeyPath::Find(root, KeyPath::Split("user.tags[5]")) == nullptr);
    CHECK(KeyPath::Find(root, KeyPath::Split("user.missing")) == nullptr);
}

TEST_CASE("ensure creates intermediate containers") {
    Value root{Value::Object{}};
    auto* slot = KeyPath::Ensure(root, KeyPath::Split("a.list.2"));
    REQUIRE(slot != nullptr);
    *slot = Value{7};

    auto const* list = KeyPath::Find(root, KeyPath::Split("a.list"));
    REQUIRE(list != nullptr);
    REQUIRE(list->asArray() != nullptr);
    CHECK(list->asArray()->size() == 3);
    CHECK((*list->asArray())[0].isNull());
    CHECK((*list->asArray())[2].asInt() == 7);
}

TEST_CASE("ensure refuses to pad an array without bound") {
    Value root{Value::Object{}};
    CHECK(KeyPath::Ensure(root, KeyPath::Split("items.4000000000000")) == nullptr);
    CHECK(KeyPath::Ensure(root, KeyPath::Split("nested.list.99999.name")) == nullptr);
    CHECK(root.asObject()->empty());
    CHECK(KeyPath::Ensure(root, KeyPath::Split("items.4096")) != nullptr);
}

} // TEST_SUITE
