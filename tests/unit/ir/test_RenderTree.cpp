#include <doctest/doctest.h>

#include <blueprint/ir/ActionDefinition.hpp>
#include <blueprint/ir/Color.hpp>
#include <blueprint/ir/RenderTree.hpp>

using namespace BP;
using namespace BP::IR;

namespace {

auto text_node(std::string id, std::string content, std::uint64_t trackingId) -> RenderNode {
    RenderNode node;
    node.id         = std::move(id);
    node.trackingId = trackingId;
    node.payload    = TextNode{std::move(content)};
    return node;
}

auto sample_tree() -> RenderNode {
    RenderNode root;
    root.id         = "root";
    root.trackingId = 1;
    root.payload    = ContainerNode{};
    RenderNode row;
    row.id         = "row";
    row.trackingId = 2;
    row.payload    = ContainerNode{Axis::Horizontal};
    row.children.push_back(text_node("a", "A", 3));
    row.children.push_back(text_node("b", "B", 4));
    root.children.push_back(std::move(row));
    root.children.push_back(text_node("c", "C", 5));
    return root;
}

} // namespace

TEST_SUITE("ir.color") {

TEST_CASE("hex forms") {
    CHECK(ParseColor("#FFF") == Color{1.0f, 1.0f, 1.0f, 1.0f});
    CHECK(ParseColor("00FF00") == Color{0.0f, 1.0f, 0.0f, 1.0f});
    auto translucent = ParseColor("#000000FF");
    REQUIRE(translucent.has_value());
    CHECK((*translucent)[3] == doctest::Approx(1.0f));
    CHECK((*ParseColor("#00000000"))[3] == doctest::Approx(0.0f));
}

TEST_CASE("rgba form") {
    auto color = ParseColor("rgba(255, 0, 51, 0.5)");
    REQUIRE(color.has_value());
    CHECK((*color)[0] == doctest::Approx(1.0f));
    CHECK((*color)[2] == doctest::Approx(0.2f));
    CHECK((*color)[3] == doctest::Approx(0.5f));
    CHECK(ParseColor("RGBA(0,0,0,1)").has_value());
    CHECK_FALSE(ParseColor("rgba(1, 2, 3)").has_value());
}

TEST_CASE("rejects everything else") {
    CHECK_FALSE(ParseColor("").has_value());
    CHECK_FALSE(ParseColor("#GGG").has_value());
    CHECK_FALSE(ParseColor("#12345").has_value());
    CHECK_FALSE(ParseColor("red").has_value());
}

} // TEST_SUITE

TEST_SUITE("ir.tree") {

TEST_CASE("kind names") {
    auto tree = sample_tree();
    CHECK(tree.kindName() == "vstack");
    CHECK(tree.children[0].kindName() == "hstack");
    CHECK(tree.children[1].kindName() == "text");

    RenderNode custom;
    custom.payload = CustomNode{"mapView", {}};
    CHECK(custom.kindName() == "mapView");
}

TEST_CASE("lookup by id and tracking id") {
    auto tree = sample_tree();
    REQUIRE(FindNode(tree, "b") != nullptr);
    CHECK(FindNode(tree, "b")->as<TextNode>()->content == "B");
    CHECK(FindNode(tree, "zzz") == nullptr);

    REQUIRE(FindTracked(tree, 4) != nullptr);
    CHECK(FindTracked(tree, 4)->id == "b");
    CHECK(FindTracked(tree, 0) == nullptr);
    CHECK(FindTracked(tree, 99) == nullptr);
    CHECK(CountNodes(tree) == 5);
}

TEST_CASE("replace swaps one subtree in place") {
    auto tree = sample_tree();
    auto replacement = text_node("row", "collapsed", 2);
    CHECK(ReplaceTracked(tree, 2, std::move(replacement)));
    CHECK(CountNodes(tree) == 3);
    CHECK(tree.children[0].as<TextNode>()->content == "collapsed");
    CHECK(tree.children[1].id == "c");

    CHECK_FALSE(ReplaceTracked(tree, 42, text_node("x", "x", 42)));
}

TEST_CASE("equality covers payload and children") {
    auto lhs = sample_tree();
    auto rhs = sample_tree();
    CHECK(lhs == rhs);
    rhs.children[0].children[1].appearance.fontSize = 30.0;
    CHECK_FALSE(lhs == rhs);
}

} // TEST_SUITE

TEST_SUITE("ir.action") {

TEST_CASE("kind names round trip for built-ins only") {
    CHECK(actionKindFromName("setState") == ActionKind::SetState);
    CHECK(actionKindName(ActionKind::Sequence) == "sequence");
    CHECK(actionKindFromName("appendToArray") == ActionKind::Custom);
    CHECK(actionKindName(ActionKind::Custom) == "custom");
}

TEST_CASE("typed parameter access") {
    ActionDefinition definition{ActionKind::Custom, "track", {{"event", Value{"tap"}}, {"count", Value{3}}}};
    CHECK(definition.kindName() == "track");
    CHECK(definition.parameter<std::string>("event") == "tap");
    CHECK(definition.parameter<std::int64_t>("count") == 3);
    CHECK_FALSE(definition.parameter<bool>("count").has_value());
    CHECK_FALSE(definition.parameter<std::string>("missing").has_value());

    auto missing = definition.requiredParameter<std::string>("label");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::MissingParameter);

    auto wrongType = definition.requiredParameter<std::string>("count");
    REQUIRE_FALSE(wrongType.has_value());
    CHECK(wrongType.error().code == Error::Code::InvalidParameterType);
}

} // TEST_SUITE
