#include "BlueprintTestHelper.hpp"

using namespace BP;

TEST_SUITE("resolve.components") {

TEST_CASE("text interpolates and defaults its id to the document path") {
    auto result = BlueprintTestHelper::resolveChildren(
            R"([{"type": "text", "text": "Hello ${user.name}"}, {"type": "label", "id": "caption", "text": "plain"}])",
            R"({"user": {"name": "Ada"}})");
    CHECK(result.errors.empty());
    auto const& text = BlueprintTestHelper::firstChild(result);
    CHECK(text.id == "root.children[0]");
    REQUIRE(text.as<IR::TextNode>() != nullptr);
    CHECK(text.as<IR::TextNode>()->content == "Hello Ada");

    auto const& label = result.tree.root.children[1];
    CHECK(label.id == "caption");
    CHECK(label.kindName() == "text");
    CHECK(label.as<IR::TextNode>()->content == "plain");
}

TEST_CASE("content sources in precedence order") {
    auto document = BlueprintTestHelper::load(R"({
        "id": "content",
        "state": {"title": "From state", "n": 4},
        "dataSources": {
            "greeting": {"type": "static", "value": "Hi"},
            "live": {"type": "binding", "path": "title"}
        },
        "root": {"children": [
            {"type": "text", "dataSourceId": "greeting", "text": "ignored"},
            {"type": "text", "dataSourceId": "live"},
            {"type": "text", "data": {"value": {"type": "binding", "path": "n"}}, "text": "ignored"},
            {"type": "text", "data": {"value": {"type": "binding", "template": "${n} items"}}},
            {"type": "text", "dataSourceId": "nowhere", "text": "fallback"}
        ]}
    })");
    StateStore store(document.state);
    auto       result   = BlueprintTestHelper::resolve(document, store);
    auto const& children = result.tree.root.children;
    REQUIRE(children.size() == 5);
    CHECK(children[0].as<IR::TextNode>()->content == "Hi");
    CHECK(children[1].as<IR::TextNode>()->content == "From state");
    CHECK(children[2].as<IR::TextNode>()->content == "4");
    CHECK(children[3].as<IR::TextNode>()->content == "4 items");
    CHECK(children[4].as<IR::TextNode>()->content == "fallback");
}

TEST_CASE("styles fold into appearance and padding") {
    auto document = BlueprintTestHelper::load(R"({
        "id": "styled",
        "styles": {
            "base": {"fontSize": 14, "textColor": "#FF0000", "padding": {"all": 4}},
            "title": {"inherits": "base", "fontWeight": "bold", "width": {"fractional": 0.5}}
        },
        "root": {"children": [
            {"type": "text", "text": "T", "styleId": "title", "style": {"fontSize": 30}, "padding": {"top": 10}}
        ]}
    })");
    StateStore  store(document.state);
    auto        result = BlueprintTestHelper::resolve(document, store);
    auto const& text   = BlueprintTestHelper::firstChild(result);
    CHECK(text.appearance.fontSize == doctest::Approx(30.0));
    CHECK(text.appearance.fontWeight == IR::FontWeight::Bold);
    CHECK(text.appearance.textColor == IR::Color{1.0f, 0.0f, 0.0f, 1.0f});
    CHECK(text.appearance.frame.width == IR::Dimension{IR::Dimension::Kind::Fractional, 0.5});
    CHECK(text.padding == IR::EdgeInsets{10.0, 4.0, 4.0, 4.0});
}

TEST_CASE("button") {
    auto document = BlueprintTestHelper::load(R"({
        "id": "buttons",
        "state": {"tab": "home", "isHome": true},
        "styles": {"plain": {"fontSize": 12}, "active": {"fontSize": 20}},
        "actions": {"go": {"type": "navigate", "destination": "next"}},
        "root": {"children": [
            {"type": "button", "text": "Home", "styles": {"normal": "plain", "selected": "active"},
             "isSelectedBinding": "${isHome}", "actions": {"onTap": "go"}},
            {"type": "button", "text": "Add", "buttonShape": "capsule", "fillWidth": true,
             "image": {"system": "plus"}, "imagePlacement": "trailing",
             "actions": {"onTap": {"type": "setState", "path": "tab", "value": "add"}}}
        ]}
    })");
    StateStore store(document.state);
    auto       result = BlueprintTestHelper::resolve(document, store);
    REQUIRE(result.tree.root.children.size() == 2);

    auto const* home = result.tree.root.children[0].as<IR::ButtonNode>();
    REQUIRE(home != nullptr);
    CHECK(home->label == "Home");
    CHECK(home->isSelected);
    CHECK(result.tree.root.children[0].appearance.fontSize == doctest::Approx(12.0));
    REQUIRE(home->selectedAppearance.has_value());
    CHECK(home->selectedAppearance->fontSize == doctest::Approx(20.0));
    CHECK_FALSE(home->disabledAppearance.has_value());
    REQUIRE(home->onTap.has_value());
    CHECK(std::get<std::string>(*home->onTap) == "go");

    auto const* add = result.tree.root.children[1].as<IR::ButtonNode>();
    REQUIRE(add != nullptr);
    CHECK(add->shape == IR::ButtonShape::Capsule);
    CHECK(add->fillWidth);
    CHECK(add->imagePlacement == IR::ImagePlacement::Trailing);
    CHECK(add->image == IR::ImageSource{IR::ImageSource::Kind::System, "plus"});
    REQUIRE(add->onTap.has_value());
    auto const& inlineAction = std::get<IR::ActionDefinition>(*add->onTap);
    CHECK(inlineAction.kind == IR::ActionKind::SetState);
    CHECK(inlineAction.parameter<std::string>("path") == "tab");

    CHECK(result.tree.actions.at("go").kind == IR::ActionKind::Navigate);
}

TEST_CASE("selection follows a bare path condition") {
    auto result = BlueprintTestHelper::resolveChildren(
            R"([{"type": "button", "text": "A", "isSelectedBinding": "selected"},
                {"type": "button", "text": "B", "isSelectedBinding": "!selected"}])",
            R"({"selected": true})");
    CHECK(result.tree.root.children[0].as<IR::ButtonNode>()->isSelected);
    CHECK_FALSE(result.tree.root.children[1].as<IR::ButtonNode>()->isSelected);
}

TEST_CASE("two-way bound primitives") {
    auto result = BlueprintTestHelper::resolveChildren(
            R"([{"type": "textfield", "bind": "form.name", "placeholder": "Name for ${form.kind}"},
                {"type": "toggle", "text": "Wifi", "bind": "wifi"},
                {"type": "slider", "bind": "volume", "minValue": 0, "maxValue": 10},
                {"type": "slider", "bind": "missing", "minValue": 2, "maxValue": 5},
                {"type": "textfield", "bind": "form.empty"}])",
            R"({"form": {"name": "Ada", "kind": "user", "empty": null}, "wifi": true, "volume": 42})");
    auto const& children = result.tree.root.children;
    REQUIRE(children.size() == 5);

    auto const* field = children[0].as<IR::TextFieldNode>();
    CHECK(field->text == "Ada");
    CHECK(field->placeholder == "Name for user");
    CHECK(field->binding == IR::StateBinding{IR::StateBinding::Scope::Store, "form.name"});

    auto const* toggle = children[1].as<IR::ToggleNode>();
    CHECK(toggle->label == "Wifi");
    CHECK(toggle->isOn);

    auto const* slider = children[2].as<IR::SliderNode>();
    CHECK(slider->value == doctest::Approx(10.0));

    auto const* unset = children[3].as<IR::SliderNode>();
    CHECK(unset->maxValue == doctest::Approx(5.0));
    CHECK(unset->value == doctest::Approx(2.0));

    CHECK(children[4].as<IR::TextFieldNode>()->text.empty());
}

TEST_CASE("image sources") {
    auto result = BlueprintTestHelper::resolveChildren(
            R"([{"type": "image", "image": {"url": "https://cdn/${photo}.png", "placeholder": {"system": "photo"}}},
                {"type": "image", "image": {"asset": "logo"}},
                {"type": "image", "data": {"value": {"type": "static", "value": "system:star"}}},
                {"type": "image", "image": {"activityIndicator": true}},
                {"type": "image"}])",
            R"({"photo": "cat"})");
    auto const& children = result.tree.root.children;
    REQUIRE(children.size() == 5);
    auto const* remote = children[0].as<IR::ImageNode>();
    CHECK(remote->source == IR::ImageSource{IR::ImageSource::Kind::Url, "https://cdn/cat.png"});
    CHECK(remote->placeholder == IR::ImageSource{IR::ImageSource::Kind::System, "photo"});
    CHECK(children[1].as<IR::ImageNode>()->source == IR::ImageSource{IR::ImageSource::Kind::Asset, "logo"});
    CHECK(children[2].as<IR::ImageNode>()->source == IR::ImageSource{IR::ImageSource::Kind::System, "star"});
    CHECK(children[3].as<IR::ImageNode>()->activityIndicator);
    CHECK(children[4].as<IR::ImageNode>()->source == IR::ImageSource{IR::ImageSource::Kind::System, "questionmark"});
}

TEST_CASE("gradient stops are sorted and clamped") {
    auto result = BlueprintTestHelper::resolveChildren(
            R"([{"type": "gradient", "gradientStart": "leading", "gradientEnd": "bottomTrailing",
                 "gradientColors": [{"color": "#FFFFFF", "location": 1}, {"color": "#000000", "location": 0}]}])");
    auto const* gradient = BlueprintTestHelper::firstChild(result).as<IR::GradientNode>();
    REQUIRE(gradient != nullptr);
    REQUIRE(gradient->stops.size() == 2);
    CHECK(gradient->stops[0].color == IR::ColorBlack);
    CHECK(gradient->stops[1].location == doctest::Approx(1.0));
    CHECK(gradient->start == IR::UnitPoint{0.0, 0.5});
    CHECK(gradient->end == IR::UnitPoint{1.0, 1.0});
}

TEST_CASE("shapes") {
    auto result = BlueprintTestHelper::resolveChildren(
            R"([{"type": "shape", "shapeType": "roundedRectangle", "style": {"cornerRadius": 6}},
                {"type": "shape", "shapeType": "hexagon"},
                {"type": "shape"},
                {"type": "shape", "shapeType": "circle"}])");
    auto const& children = result.tree.root.children;
    REQUIRE(children.size() == 2);
    auto const* rounded = children[0].as<IR::ShapeNode>();
    CHECK(rounded->type == IR::ShapeType::RoundedRectangle);
    CHECK(rounded->cornerRadius == doctest::Approx(6.0));
    CHECK(children[1].as<IR::ShapeNode>()->type == IR::ShapeType::Circle);
    CHECK(children[1].id == "root.children[3]");

    REQUIRE(result.errors.size() == 2);
    CHECK(result.errors[0].path == "root.children[1]");
    CHECK(result.errors[0].error.code == Error::Code::InvalidType);
    CHECK(result.errors[1].error.code == Error::Code::MissingParameter);
}

TEST_CASE("page indicator clamps and binds") {
    auto result = BlueprintTestHelper::resolveChildren(
            R"([{"type": "pageIndicator", "currentPage": "${page}", "pageCount": 3, "dotColor": "#00FF00"},
                {"type": "pageIndicator", "currentPage": "other", "pageCount": 0}])",
            R"({"page": 7, "other": 2})");
    auto const* clamped = result.tree.root.children[0].as<IR::PageIndicatorNode>();
    CHECK(clamped->currentPage == 2);
    CHECK(clamped->binding == IR::StateBinding{IR::StateBinding::Scope::Store, "page"});
    CHECK(clamped->dotColor == IR::Color{0.0f, 1.0f, 0.0f, 1.0f});
    CHECK(result.tree.root.children[1].as<IR::PageIndicatorNode>()->currentPage == 2);
}

TEST_CASE("divider takes only style") {
    auto result = BlueprintTestHelper::resolveChildren(R"([{"type": "divider", "style": {"backgroundColor": "#000"}}])");
    auto const& divider = BlueprintTestHelper::firstChild(result);
    CHECK(divider.as<IR::DividerNode>() != nullptr);
    CHECK(divider.appearance.backgroundColor == IR::ColorBlack);
}

TEST_CASE("registry lookup and aliases") {
    auto registry = MakeDefaultComponentResolvers();
    CHECK(registry.hasResolver("label"));
    CHECK(registry.find("label") == registry.find("text"));
    CHECK(registry.registeredKinds().size() == 11);
    CHECK(registry.unregisterResolver("label"));
    CHECK_FALSE(registry.hasResolver("label"));
    CHECK_FALSE(registry.unregisterResolver("label"));
    CHECK(registry.fallback() == nullptr);
}

} // TEST_SUITE
