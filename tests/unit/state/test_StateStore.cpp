#include <doctest/doctest.h>

#include <blueprint/state/StateStore.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace BP;

namespace {

auto initial_state() -> Value::Object {
    Value::Object user;
    user.emplace("name", Value{"Ada"});
    user.emplace("tags", Value{Value::Array{Value{"a"}, Value{"b"}}});
    Value::Object state;
    state.emplace("count", Value{0});
    state.emplace("user", Value{std::move(user)});
    return state;
}

} // namespace

TEST_SUITE("state.store") {

TEST_CASE("get reads nested paths in both index forms") {
    StateStore store(initial_state());
    CHECK(store.get("count")->asInt() == 0);
    CHECK(store.get("user.name")->asString() == "Ada");
    CHECK(store.get("user.tags[1]")->asString() == "b");
    CHECK(store.get("user.tags.1")->asString() == "b");
    CHECK_FALSE(store.get("user.missing").has_value());
    CHECK_FALSE(store.get("count.deeper").has_value());
}

TEST_CASE("set creates intermediate objects and marks ancestors dirty") {
    StateStore store;
    store.set("settings.display.theme", Value{"dark"});
    CHECK(store.get("settings.display.theme")->asString() == "dark");

    CHECK(store.isDirty("settings"));
    CHECK(store.isDirty("settings.display"));
    CHECK(store.isDirty("settings.display.theme"));
    CHECK_FALSE(store.isDirty("other"));

    auto dirty = store.consumeDirtyPaths();
    CHECK(dirty == std::set<std::string>{"settings", "settings.display", "settings.display.theme"});
    CHECK(store.consumeDirtyPaths().empty());
}

TEST_CASE("initialize replaces state silently") {
    StateStore store(initial_state());
    int        calls = 0;
    auto       sub   = store.observe("", [&](auto const&, auto const&, auto const&) { ++calls; });
    store.initialize(Value::Object{{"count", Value{9}}});
    CHECK(store.get("count")->asInt() == 9);
    CHECK_FALSE(store.get("user").has_value());
    CHECK(calls == 0);
    CHECK(store.consumeDirtyPaths().empty());
}

TEST_CASE("writes far past the end of an array are rejected") {
    StateStore store(initial_state());
    int        calls = 0;
    auto       sub   = store.observe("", [&](auto const&, auto const&, auto const&) { ++calls; });
    CHECK_NOTHROW(store.set("items.4000000000000", Value{1}));
    CHECK_FALSE(store.get("items").has_value());
    CHECK_NOTHROW(store.set("user.tags[9999999]", Value{"z"}));
    CHECK(store.arrayCount("user.tags") == 2);
    CHECK(calls == 0);
    CHECK(store.consumeDirtyPaths().empty());

    store.set("user.tags[3]", Value{"d"});
    CHECK(store.arrayCount("user.tags") == 4);
    CHECK(store.get("user.tags[2]")->isNull());
}

TEST_CASE("remove reports whether anything was removed") {
    StateStore store(initial_state());
    CHECK(store.remove("user.name"));
    CHECK_FALSE(store.get("user.name").has_value());
    CHECK_FALSE(store.remove("user.name"));
}

TEST_CASE("array helpers") {
    StateStore store(initial_state());

    SUBCASE("append creates the array when absent") {
        store.append("items", Value{"x"});
        store.append("items", Value{"y"});
        CHECK(store.arrayCount("items") == 2);
        CHECK(store.arrayContains("items", Value{"y"}));
    }
    SUBCASE("append to a non-array changes nothing") {
        store.append("count", Value{1});
        CHECK(store.get("count")->asInt() == 0);
    }
    SUBCASE("remove by value and by index") {
        store.set("numbers", Value{Value::Array{Value{1}, Value{2}, Value{1}, Value{3}}});
        CHECK(store.removeByValue("numbers", Value{1.0}));
        CHECK(store.getArray("numbers") == Value::Array{Value{2}, Value{3}});
        CHECK(store.removeAt("numbers", 0));
        CHECK_FALSE(store.removeAt("numbers", 4));
        CHECK(store.getArray("numbers") == Value::Array{Value{3}});
    }
    SUBCASE("toggle membership") {
        CHECK(store.toggleMembership("user.tags", Value{"c"}));
        CHECK(store.arrayContains("user.tags", Value{"c"}));
        CHECK_FALSE(store.toggleMembership("user.tags", Value{"a"}));
        CHECK_FALSE(store.arrayContains("user.tags", Value{"a"}));
    }
    SUBCASE("set item in range only") {
        CHECK(store.setArrayItem("user.tags", 0, Value{"z"}));
        CHECK(store.get("user.tags[0]")->asString() == "z");
        CHECK_FALSE(store.setArrayItem("user.tags", 7, Value{"q"}));
    }
    SUBCASE("clear") {
        store.clearArray("user.tags");
        CHECK(store.arrayCount("user.tags") == 0);
        CHECK(store.getArray("user.tags").has_value());
    }
}

TEST_CASE("observers see overlapping writes with old and new values") {
    StateStore store(initial_state());

    std::vector<std::string> userPaths;
    std::optional<Value>     oldCount;
    std::optional<Value>     newCount;
    auto userSub  = store.observe("user", [&](std::string const& path, auto const&, auto const&) { userPaths.push_back(path); });
    auto countSub = store.observe("count", [&](std::string const&, std::optional<Value> const& before, std::optional<Value> const& after) {
        oldCount = before;
        newCount = after;
    });

    store.set("user.name", Value{"Grace"});
    store.set("count", Value{5});
    store.set("unrelated", Value{true});

    CHECK(userPaths == std::vector<std::string>{"user.name"});
    REQUIRE(oldCount.has_value());
    CHECK(oldCount->asInt() == 0);
    CHECK(newCount->asInt() == 5);

    SUBCASE("whole-object writes reach observers of a descendant") {
        std::vector<std::string> namePaths;
        auto nameSub = store.observe("user.name", [&](std::string const& path, auto const&, auto const&) { namePaths.push_back(path); });
        store.set("user", Value{Value::Object{}});
        CHECK(namePaths == std::vector<std::string>{"user"});
    }
}

TEST_CASE("a throwing observer does not block later writes") {
    StateStore store;
    auto       sub = store.observe("boom", [](auto const&, auto const&, auto const&) {
        throw std::runtime_error("observer failed");
    });
    CHECK_THROWS_AS(store.set("boom", Value{1}), std::runtime_error);
    CHECK(store.get("boom")->asInt() == 1);
    sub.cancel();
    CHECK_NOTHROW(store.set("boom", Value{2}));
    CHECK(store.get("boom")->asInt() == 2);
}

TEST_CASE("cancelled subscriptions stop receiving") {
    StateStore store;
    int        calls = 0;
    auto       sub   = store.observe("", [&](auto const&, auto const&, auto const&) { ++calls; });
    store.set("a", Value{1});
    CHECK(sub.active());
    sub.cancel();
    CHECK_FALSE(sub.active());
    store.set("a", Value{2});
    CHECK(calls == 1);

    {
        auto scoped = store.observe("a", [&](auto const&, auto const&, auto const&) { ++calls; });
        store.set("a", Value{3});
    }
    store.set("a", Value{4});
    CHECK(calls == 2);
}

TEST_CASE("snapshot and restore") {
    StateStore store(initial_state());
    auto       snapshot = store.snapshot();
    store.set("count", Value{10});
    store.remove("user");
    store.set("extra", Value{"x"});

    std::vector<std::string> restored;
    auto sub = store.observe("", [&](std::string const& path, auto const&, auto const&) { restored.push_back(path); });
    store.restore(snapshot);

    CHECK(store.get("count")->asInt() == 0);
    CHECK(store.get("user.name")->asString() == "Ada");
    CHECK_FALSE(store.get("extra").has_value());
    CHECK(restored.size() == 3);

    auto json = snapshot.toJson();
    CHECK(json["count"] == 0);
    CHECK(StateStore::Snapshot::FromJson(json).values() == snapshot.values());
}

TEST_CASE("concurrent writers never lose increments of distinct keys") {
    StateStore               store;
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&store, t] {
            for (int i = 0; i < 200; ++i) {
                store.append("list" + std::to_string(t), Value{i});
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    for (int t = 0; t < 4; ++t) {
        CHECK(store.arrayCount("list" + std::to_string(t)) == 200);
    }
}

} // TEST_SUITE
