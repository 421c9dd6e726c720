#include "BlueprintTestHelper.hpp"

using namespace BP;

namespace {

auto texts(IR::RenderNode const& node) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (auto const& child : node.children) {
        if (auto const* text = child.as<IR::TextNode>()) {
            out.push_back(text->content);
        }
    }
    return out;
}

} // namespace

TEST_SUITE("resolve.layouts") {

TEST_CASE("stacks map alignment onto their cross axis") {
    auto result = BlueprintTestHelper::resolveChildren(R"([
        {"type": "vstack", "spacing": 12, "alignment": "trailing", "children": [{"type": "text", "text": "a"}]},
        {"type": "hstack", "alignment": {"horizontal": "trailing", "vertical": "top"}, "children": []},
        {"type": "zstack", "alignment": {"horizontal": "leading", "vertical": "bottom"}, "children": []},
        {"type": "vstack", "children": []}
    ])");
    auto const& children = result.tree.root.children;
    REQUIRE(children.size() == 4);

    auto const* vstack = children[0].as<IR::ContainerNode>();
    CHECK(vstack->axis == IR::Axis::Vertical);
    CHECK(vstack->spacing == doctest::Approx(12.0));
    CHECK(vstack->alignment == IR::Alignment{IR::HorizontalAlignment::Trailing, IR::VerticalAlignment::Center});
    CHECK(children[0].children.front().id == "root.children[0].children[0]");

    auto const* hstack = children[1].as<IR::ContainerNode>();
    CHECK(hstack->axis == IR::Axis::Horizontal);
    CHECK(hstack->alignment == IR::Alignment{IR::HorizontalAlignment::Center, IR::VerticalAlignment::Top});

    auto const* zstack = children[2].as<IR::ContainerNode>();
    CHECK(zstack->axis == IR::Axis::Depth);
    CHECK(zstack->alignment == IR::Alignment{IR::HorizontalAlignment::Leading, IR::VerticalAlignment::Bottom});

    CHECK(children[3].as<IR::ContainerNode>()->alignment == IR::Alignment{});
    CHECK(children[3].kindName() == "vstack");
}

TEST_CASE("stack padding and style") {
    auto result = BlueprintTestHelper::resolveChildren(R"([
        {"type": "vstack", "id": "card", "padding": {"horizontal": 16}, "style": {"backgroundColor": "#FFFFFF", "cornerRadius": 8},
         "children": []}
    ])");
    auto const& card = BlueprintTestHelper::firstChild(result);
    CHECK(card.id == "card");
    CHECK(card.padding == IR::EdgeInsets{0.0, 16.0, 0.0, 16.0});
    CHECK(card.appearance.backgroundColor == IR::ColorWhite);
    CHECK(card.appearance.cornerRadius == doctest::Approx(8.0));
}

TEST_CASE("spacer") {
    auto result = BlueprintTestHelper::resolveChildren(R"([{"type": "spacer", "minLength": 20, "height": 4}])");
    auto const& spacer = BlueprintTestHelper::firstChild(result);
    REQUIRE(spacer.as<IR::SpacerNode>() != nullptr);
    CHECK(spacer.as<IR::SpacerNode>()->minLength == 20.0);
    CHECK(spacer.appearance.frame.height == IR::Dimension{IR::Dimension::Kind::Absolute, 4.0});
    CHECK_FALSE(spacer.appearance.frame.width.has_value());
}

TEST_CASE("forEach repeats its template with item and index") {
    auto result = BlueprintTestHelper::resolveChildren(
            R"([{"type": "forEach", "items": "people", "layout": "hstack", "spacing": 4,
                 "template": {"type": "text", "text": "${index}: ${item.name}"}}])",
            R"({"people": [{"name": "Ada"}, {"name": "Grace"}]})");
    CHECK(result.errors.empty());
    auto const& repeated = BlueprintTestHelper::firstChild(result);
    CHECK(repeated.id == "forEach_people");
    CHECK(repeated.as<IR::ContainerNode>()->axis == IR::Axis::Horizontal);
    CHECK(repeated.as<IR::ContainerNode>()->spacing == doctest::Approx(4.0));
    CHECK(texts(repeated) == std::vector<std::string>{"0: Ada", "1: Grace"});
    CHECK(repeated.children[1].id == "root.children[0].items[1]");
}

TEST_CASE("forEach variables shadow state and nest") {
    auto result = BlueprintTestHelper::resolveChildren(
            R"([{"type": "forEach", "id": "groups", "items": "groups", "itemVariable": "group", "indexVariable": "g",
                 "template": {"type": "forEach", "items": "group.members", "itemVariable": "item",
                              "template": {"type": "text", "text": "${group.name}/${item} (${g}.${index})"}}}])",
            R"({"item": "shadowed", "groups": [{"name": "x", "members": ["a", "b"]}, {"name": "y", "members": ["c"]}]})");
    auto const& outer = BlueprintTestHelper::firstChild(result);
    CHECK(outer.id == "groups");
    REQUIRE(outer.children.size() == 2);
    CHECK(outer.children[0].id == "forEach_group.members");
    CHECK(texts(outer.children[0]) == std::vector<std::string>{"x/a (0.0)", "x/b (0.1)"});
    CHECK(texts(outer.children[1]) == std::vector<std::string>{"y/c (1.0)"});
    CHECK(outer.children[1].children[0].id == "root.children[0].items[1].items[0]");
}

TEST_CASE("an empty or missing array shows the empty view") {
    auto result = BlueprintTestHelper::resolveChildren(
            R"([{"type": "forEach", "items": "people", "template": {"type": "text", "text": "${item}"},
                 "emptyView": {"type": "text", "text": "Nobody here"}},
                {"type": "forEach", "items": "missing", "template": {"type": "text", "text": "${item}"}},
                {"type": "forEach", "items": "notArray", "template": {"type": "text", "text": "${item}"}}])",
            R"({"people": [], "notArray": 3})");
    auto const& children = result.tree.root.children;
    REQUIRE(children.size() == 3);
    CHECK(children[0].id == "forEach_people_empty");
    CHECK(texts(children[0]) == std::vector<std::string>{"Nobody here"});
    CHECK(children[0].children[0].id == "root.children[0].emptyView");
    CHECK(children[1].id == "forEach_missing_empty");
    CHECK(children[1].children.empty());
    CHECK(children[2].id == "forEach_notArray_empty");
    CHECK(result.errors.empty());
}

TEST_CASE("section layout with static and data-driven sections") {
    auto result = BlueprintTestHelper::resolveChildren(
            R"([{"type": "sectionLayout", "id": "feed", "sectionSpacing": 24, "sections": [
                  {"id": "intro", "layout": {"type": "list"}, "stickyHeader": true,
                   "header": {"type": "text", "text": "Header"},
                   "children": [{"type": "text", "text": "one"}, {"type": "text", "text": "two"}],
                   "footer": {"type": "text", "text": "Footer"}},
                  {"layout": {"type": "grid", "columns": 3, "itemSpacing": 2, "showsDividers": false},
                   "dataSource": "photos", "itemTemplate": {"type": "text", "text": "${index}=${item.title}"}},
                  {"layout": {"type": "carousel"}, "children": []}
                ]}])",
            R"({"photos": [{"title": "sea"}, {"title": "sky"}]})");
    auto const& feed = BlueprintTestHelper::firstChild(result);
    CHECK(feed.id == "feed");
    CHECK(feed.as<IR::SectionLayoutNode>()->sectionSpacing == doctest::Approx(24.0));
    REQUIRE(feed.children.size() == 3);

    auto const& intro   = feed.children[0];
    auto const* payload = intro.as<IR::SectionNode>();
    REQUIRE(payload != nullptr);
    CHECK(intro.id == "intro");
    CHECK(payload->hasHeader);
    CHECK(payload->hasFooter);
    CHECK(payload->stickyHeader);
    CHECK(payload->config.kind == IR::SectionKind::List);
    CHECK(payload->config.itemSpacing == doctest::Approx(8.0));
    CHECK(payload->config.showsDividers);
    CHECK(texts(intro) == std::vector<std::string>{"Header", "one", "two", "Footer"});
    CHECK(intro.children[0].id == "root.children[0].sections[0].header");
    CHECK(intro.children[1].id == "root.children[0].sections[0].children[0]");

    auto const& grid = feed.children[1];
    CHECK(grid.id == "root.children[0].sections[1]");
    auto const& gridConfig = grid.as<IR::SectionNode>()->config;
    CHECK(gridConfig.kind == IR::SectionKind::Grid);
    CHECK(gridConfig.columns == IR::GridColumns{IR::GridColumns::Kind::Fixed, 3, 0.0});
    CHECK(gridConfig.itemSpacing == doctest::Approx(2.0));
    CHECK_FALSE(gridConfig.showsDividers);
    CHECK_FALSE(grid.as<IR::SectionNode>()->hasHeader);
    CHECK(texts(grid) == std::vector<std::string>{"0=sea", "1=sky"});
    CHECK(grid.children[1].id == "root.children[0].sections[1].items[1]");

    auto const& custom = feed.children[2].as<IR::SectionNode>()->config;
    CHECK(custom.kind == IR::SectionKind::Custom);
    CHECK(custom.customKind == "carousel");
}

TEST_CASE("section config registry overrides the built-in mapping") {
    struct Carousel final : SectionLayoutConfigResolver {
        auto type() const -> std::string_view override { return "carousel"; }
        auto resolve(Document::SectionLayoutConfig const& config) const -> IR::SectionConfig override {
            auto section            = ResolveSectionConfig(Document::SectionLayoutConfig{.type = "horizontal"});
            section.isPagingEnabled = true;
            section.itemSpacing     = config.itemSpacing.value_or(0.0);
            return section;
        }
    };
    SectionLayoutConfigRegistry registry;
    registry.registerResolver(std::make_shared<Carousel>());
    CHECK(registry.hasResolver("carousel"));
    CHECK(registry.registeredTypes() == std::vector<std::string>{"carousel"});

    auto section = registry.resolve(Document::SectionLayoutConfig{.type = "carousel"});
    CHECK(section.kind == IR::SectionKind::Horizontal);
    CHECK(section.isPagingEnabled);
    CHECK(section.itemSpacing == doctest::Approx(0.0));

    auto adaptive = ResolveSectionConfig(Document::SectionLayoutConfig{
            .type = "grid", .columns = Document::ColumnConfig{.adaptiveMinWidth = 120.0}});
    CHECK(adaptive.columns == IR::GridColumns{IR::GridColumns::Kind::Adaptive, 0, 120.0});
}

TEST_CASE("layout registry") {
    auto registry = MakeDefaultLayoutResolvers();
    CHECK(registry.registeredKinds()
          == std::vector<std::string>{"forEach", "hstack", "sectionLayout", "spacer", "vstack", "zstack"});
    CHECK(registry.find("grid") == nullptr);
    CHECK(registry.unregisterResolver("spacer"));
    CHECK_FALSE(registry.hasResolver("spacer"));
}

} // TEST_SUITE
