#include "BlueprintTestHelper.hpp"

using namespace BP;

TEST_SUITE("resolve.resolver") {

TEST_CASE("a failing node is dropped and reported with its path") {
    auto result = BlueprintTestHelper::resolveChildren(R"([
        {"type": "vstack", "children": [
            {"type": "text", "text": "kept"},
            {"type": "shape", "shapeType": "hexagon"},
            {"type": "vstack", "children": [{"type": "shape"}, {"type": "divider"}]}
        ]},
        {"type": "text", "text": "sibling"}
    ])");
    auto const& root = result.tree.root;
    REQUIRE(root.children.size() == 2);
    auto const& stack = root.children[0];
    REQUIRE(stack.children.size() == 2);
    CHECK(stack.children[0].as<IR::TextNode>()->content == "kept");
    CHECK(stack.children[1].id == "root.children[0].children[2]");
    REQUIRE(stack.children[1].children.size() == 1);
    CHECK(stack.children[1].children[0].kindName() == "divider");
    CHECK(root.children[1].as<IR::TextNode>()->content == "sibling");

    REQUIRE(result.errors.size() == 2);
    CHECK(result.errors[0].path == "root.children[0].children[1]");
    CHECK(result.errors[0].error.code == Error::Code::InvalidType);
    CHECK(result.errors[1].path == "root.children[0].children[2].children[0]");
    CHECK(result.errors[1].error.code == Error::Code::MissingParameter);
}

TEST_CASE("unknown kinds fail unless the custom fallback is on") {
    auto document = BlueprintTestHelper::load(R"({
        "id": "custom",
        "state": {"city": "Oslo", "label": "Map"},
        "root": {"children": [
            {"type": "mapView", "id": "map", "region": "${city}", "zoom": 4, "text": "${label}"}
        ]}
    })");

    StateStore plainState(document.state);
    auto       plain = BlueprintTestHelper::resolve(document, plainState);
    CHECK(plain.tree.root.children.empty());
    REQUIRE(plain.errors.size() == 1);
    CHECK(plain.errors[0].path == "root.children[0]");
    CHECK(plain.errors[0].error.code == Error::Code::UnknownKind);

    StateStore fallbackState(document.state);
    auto       fallback = BlueprintTestHelper::resolve(document, fallbackState, ResolverOptions{.customFallback = true});
    CHECK(fallback.errors.empty());
    auto const& map    = BlueprintTestHelper::firstChild(fallback);
    auto const* custom = map.as<IR::CustomNode>();
    REQUIRE(custom != nullptr);
    CHECK(map.id == "map");
    CHECK(map.kindName() == "mapView");
    CHECK(custom->kind == "mapView");
    CHECK(custom->properties.at("region").asString() == "Oslo");
    CHECK(custom->properties.at("zoom").asInt() == 4);
    CHECK(custom->properties.at("text").asString() == "Map");
}

TEST_CASE("a registry fallback takes unknown kinds") {
    auto registries = ResolverRegistries::MakeDefault();
    registries.components.setFallback(MakeCustomComponentResolver());
    auto document = BlueprintTestHelper::load(R"({"id": "f", "root": {"children": [{"type": "chart"}]}})");

    StateStore store(document.state);
    Resolver   resolver(registries);
    auto       result = resolver.resolve(document, store);
    CHECK(result.errors.empty());
    CHECK(BlueprintTestHelper::firstChild(result).as<IR::CustomNode>()->kind == "chart");
}

TEST_CASE("repeated passes over the same input are equal") {
    auto document = BlueprintTestHelper::load(R"({
        "id": "same",
        "state": {"items": ["a", "b"], "title": "Hello"},
        "styles": {"h": {"fontSize": 24}},
        "root": {"children": [
            {"type": "text", "styleId": "h", "text": "${title}"},
            {"type": "forEach", "items": "items", "template": {"type": "button", "text": "${item}", "actions": {"onTap": {"type": "dismiss"}}}}
        ]}
    })");
    StateStore store(document.state);
    auto       first  = BlueprintTestHelper::resolve(document, store);
    auto       second = BlueprintTestHelper::resolve(document, store);
    CHECK(first.tree == second.tree);

    auto tracked      = BlueprintTestHelper::resolve(document, store, ResolverOptions{.tracking = true});
    auto trackedAgain = BlueprintTestHelper::resolve(document, store, ResolverOptions{.tracking = true});
    CHECK(tracked.tree == trackedAgain.tree);
    CHECK_FALSE(tracked.tree == first.tree);
}

TEST_CASE("tracking ids are handed out in document order from the root") {
    auto document = BlueprintTestHelper::load(R"({
        "id": "ids",
        "root": {"children": [
            {"type": "vstack", "id": "column", "children": [{"type": "text", "id": "title", "text": "t"}]},
            {"type": "text", "text": "footer"}
        ]}
    })");
    StateStore store(document.state);

    auto untracked = BlueprintTestHelper::resolve(document, store);
    CHECK(untracked.viewRoot == nullptr);
    CHECK(untracked.tree.root.trackingId == 0);

    auto result = BlueprintTestHelper::resolve(document, store, ResolverOptions{.tracking = true});
    REQUIRE(result.viewRoot != nullptr);
    CHECK(result.tree.root.id == "root");
    CHECK(result.tree.root.trackingId == 1);
    CHECK(result.viewRoot->trackingId() == 1);
    CHECK(IR::FindNode(result.tree.root, "column")->trackingId == 2);
    CHECK(IR::FindNode(result.tree.root, "title")->trackingId == 3);
    CHECK(IR::FindNode(result.tree.root, "root.children[1]")->trackingId == 4);
    CHECK(result.nextTrackingId == 5);
    CHECK(IR::CountNodes(result.tree.root) == 4);

    auto* title = result.viewRoot->findNode("title");
    REQUIRE(title != nullptr);
    CHECK(title->trackingId() == 3);
    CHECK(title->parent()->id() == "column");
    CHECK(title->source() != nullptr);
    CHECK(title->resolutionPath() == "root.children[0].children[0]");
}

TEST_CASE("root appearance and actions") {
    auto document = BlueprintTestHelper::load(R"({
        "id": "screen",
        "styles": {"page": {"backgroundColor": "#FF0000"}},
        "actions": {"load": {"type": "setState", "path": "loaded", "value": true}},
        "root": {
            "backgroundColor": "#000000",
            "edgeInsets": {"all": 10},
            "colorScheme": "dark",
            "styleId": "page",
            "actions": {"onAppear": "load", "onDisappear": {"type": "dismiss"}},
            "children": []
        }
    })");
    StateStore store(document.state);
    auto       result = BlueprintTestHelper::resolve(document, store);
    auto const& tree  = result.tree;
    CHECK(result.errors.empty());
    CHECK(tree.backgroundColor == IR::ColorBlack);
    CHECK(tree.edgeInsets == IR::EdgeInsets{10.0, 10.0, 10.0, 10.0});
    CHECK(tree.colorScheme == IR::ColorScheme::Dark);
    CHECK(tree.root.appearance.backgroundColor == IR::Color{1.0f, 0.0f, 0.0f, 1.0f});
    CHECK(tree.root.as<IR::ContainerNode>()->axis == IR::Axis::Vertical);

    REQUIRE(tree.onAppear.has_value());
    CHECK(std::get<std::string>(*tree.onAppear) == "load");
    REQUIRE(tree.onDisappear.has_value());
    CHECK(std::get<IR::ActionDefinition>(*tree.onDisappear).kind == IR::ActionKind::Dismiss);
    CHECK(tree.actions.at("load").kind == IR::ActionKind::SetState);
}

TEST_CASE("document actions that fail to resolve are reported under actions") {
    auto document = BlueprintTestHelper::load(R"({
        "id": "acts",
        "actions": {"ok": {"type": "dismiss"}},
        "root": {"children": []}
    })");
    document.actions.emplace("broken", Document::Action{"setState", Value::Object{}});

    StateStore store(document.state);
    auto       result = BlueprintTestHelper::resolve(document, store);
    CHECK(result.tree.actions.contains("ok"));
    CHECK_FALSE(result.tree.actions.contains("broken"));
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].path == "actions.broken");
    CHECK(result.errors[0].error.code == Error::Code::MissingParameter);
}

TEST_CASE("style cycles fail only the node that uses them") {
    auto document = BlueprintTestHelper::load(R"({
        "id": "cycle",
        "styles": {"a": {"inherits": "b"}, "b": {"inherits": "a"}, "ok": {"fontSize": 30}},
        "root": {"children": [
            {"type": "text", "styleId": "a", "text": "x"},
            {"type": "text", "styleId": "ok", "text": "y"}
        ]}
    })");
    StateStore store(document.state);
    auto       result = BlueprintTestHelper::resolve(document, store);
    REQUIRE(result.tree.root.children.size() == 1);
    CHECK(result.tree.root.children[0].appearance.fontSize == doctest::Approx(30.0));
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].path == "root.children[0]");
}

} // TEST_SUITE
