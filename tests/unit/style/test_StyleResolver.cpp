#include <doctest/doctest.h>

#include <blueprint/style/StyleResolver.hpp>

using namespace BP;

namespace {

auto style_with(std::optional<std::string> inherits = std::nullopt) -> Document::Style {
    Document::Style style;
    style.inherits = std::move(inherits);
    return style;
}

class TokenDesignSystem final : public DesignSystemProvider {
public:
    auto identifier() const -> std::string_view override { return "tokens"; }
    auto resolveStyle(std::string_view reference) const -> std::optional<ResolvedStyle> override {
        if (reference != "body") {
            return std::nullopt;
        }
        ResolvedStyle style;
        style.fontSize  = 15.0;
        style.textColor = "#333333";
        return style;
    }
};

} // namespace

TEST_SUITE("style.resolver") {

TEST_CASE("inheritance folds from base to leaf") {
    StyleResolver::StyleMap styles;
    auto base       = style_with();
    base.fontSize   = 12.0;
    base.textColor  = "#000000";
    base.shadow     = Document::Shadow{"#00000080", 4.0, 0.0, 2.0};
    auto title      = style_with("base");
    title.fontSize  = 24.0;
    title.fontWeight = Document::FontWeight::Bold;
    auto hero       = style_with("title");
    hero.textColor  = "#FF0000";
    hero.shadow     = Document::Shadow{std::nullopt, 8.0, std::nullopt, std::nullopt};
    styles.emplace("base", base);
    styles.emplace("title", title);
    styles.emplace("hero", hero);

    StyleResolver resolver(styles);
    auto resolved = resolver.resolve("hero");
    REQUIRE(resolved.has_value());
    CHECK(resolved->fontSize == 24.0);
    CHECK(resolved->fontWeight == Document::FontWeight::Bold);
    CHECK(resolved->textColor == "#FF0000");
    CHECK(resolved->shadowColor == "#00000080");
    CHECK(resolved->shadowRadius == 8.0);
    CHECK(resolved->shadowY == 2.0);

    auto appearance = resolved->toAppearance();
    CHECK(appearance.fontSize == doctest::Approx(24.0));
    CHECK(appearance.fontWeight == IR::FontWeight::Bold);
    CHECK(appearance.textColor == IR::Color{1.0f, 0.0f, 0.0f, 1.0f});
    REQUIRE(appearance.shadow.has_value());
    CHECK(appearance.shadow->radius == doctest::Approx(8.0));
}

TEST_CASE("an empty shadow or padding clears what the chain set") {
    StyleResolver::StyleMap styles;
    auto base    = style_with();
    base.shadow  = Document::Shadow{"#000", 4.0, 1.0, 1.0};
    base.padding = Document::Padding{.all = 10.0};
    auto flat    = style_with("base");
    flat.shadow  = Document::Shadow{};
    flat.padding = Document::Padding{};
    styles.emplace("base", base);
    styles.emplace("flat", flat);

    auto resolved = StyleResolver(styles).resolve("flat");
    REQUIRE(resolved.has_value());
    CHECK_FALSE(resolved->hasShadow());
    CHECK_FALSE(resolved->hasPadding());
    CHECK(resolved->padding() == IR::EdgeInsets{});
}

TEST_CASE("a shadow set again after a clear ignores the cleared values") {
    StyleResolver::StyleMap styles;
    auto raised   = style_with();
    raised.shadow = Document::Shadow{"#000000", 4.0, 1.0, 1.0};
    auto flat     = style_with("raised");
    flat.shadow   = Document::Shadow{};
    auto glow     = style_with("flat");
    glow.shadow   = Document::Shadow{"#FF0000", 2.0, std::nullopt, std::nullopt};
    styles.emplace("raised", raised);
    styles.emplace("flat", flat);
    styles.emplace("glow", glow);

    auto resolved = StyleResolver(styles).resolve("glow");
    REQUIRE(resolved.has_value());
    CHECK(resolved->hasShadow());
    CHECK(resolved->shadowColor == "#FF0000");
    CHECK(resolved->shadowRadius == 2.0);
    CHECK_FALSE(resolved->shadowX.has_value());
    CHECK_FALSE(resolved->shadowY.has_value());
}

TEST_CASE("clearing the shadow keeps every other inherited property") {
    StyleResolver::StyleMap styles;
    auto card            = style_with();
    card.backgroundColor = "#FFFFFF";
    card.cornerRadius    = 12.0;
    card.borderWidth     = 1.0;
    card.borderColor     = "#DDDDDD";
    card.shadow          = Document::Shadow{"#00000033", 6.0, 0.0, 3.0};
    card.padding         = Document::Padding{.all = 16.0};
    auto flatCard        = style_with("card");
    flatCard.shadow      = Document::Shadow{};
    styles.emplace("card", card);
    styles.emplace("flatCard", flatCard);

    auto resolved = StyleResolver(styles).resolve("flatCard");
    REQUIRE(resolved.has_value());
    CHECK_FALSE(resolved->hasShadow());
    CHECK(resolved->backgroundColor == "#FFFFFF");
    CHECK(resolved->cornerRadius == 12.0);
    CHECK(resolved->hasBorder());
    CHECK(resolved->borderColor == "#DDDDDD");
    CHECK(resolved->padding() == IR::EdgeInsets{16.0, 16.0, 16.0, 16.0});
}

TEST_CASE("axis padding equals the same edges spelled out") {
    StyleResolver::StyleMap styles;
    auto axes     = style_with();
    axes.padding  = Document::Padding{.horizontal = 16.0, .vertical = 12.0};
    auto edges    = style_with();
    edges.padding = Document::Padding{.top = 12.0, .bottom = 12.0, .leading = 16.0, .trailing = 16.0};
    styles.emplace("axes", axes);
    styles.emplace("edges", edges);

    StyleResolver resolver(styles);
    auto          fromAxes  = resolver.resolve("axes");
    auto          fromEdges = resolver.resolve("edges");
    REQUIRE(fromAxes.has_value());
    REQUIRE(fromEdges.has_value());
    CHECK(*fromAxes == *fromEdges);
    CHECK(fromAxes->padding() == IR::EdgeInsets{12.0, 16.0, 12.0, 16.0});
}

TEST_CASE("cycles are errors") {
    StyleResolver::StyleMap styles;
    styles.emplace("a", style_with("b"));
    styles.emplace("b", style_with("c"));
    styles.emplace("c", style_with("a"));

    auto resolved = StyleResolver(styles).resolve("a");
    REQUIRE_FALSE(resolved.has_value());
    CHECK(resolved.error().code == Error::Code::CyclicReference);
    CHECK(resolved.error().message->find("a -> b -> c -> a") != std::string::npos);

    styles.emplace("self", style_with("self"));
    CHECK_FALSE(StyleResolver(styles).resolve("self").has_value());
}

TEST_CASE("unknown ids contribute nothing") {
    StyleResolver::StyleMap styles;
    styles.emplace("orphan", style_with("missing"));
    auto resolved = StyleResolver(styles).resolve("orphan");
    REQUIRE(resolved.has_value());
    CHECK(*resolved == ResolvedStyle{});
    CHECK(StyleResolver(styles).resolve("nowhere").has_value());
}

TEST_CASE("inline style wins over the chain") {
    StyleResolver::StyleMap styles;
    auto card            = style_with();
    card.backgroundColor = "#FFFFFF";
    card.cornerRadius    = 8.0;
    styles.emplace("card", card);

    Document::Style inlineStyle;
    inlineStyle.cornerRadius = 16.0;

    auto resolved = StyleResolver(styles).resolve(std::optional<std::string>{"card"}, std::optional{inlineStyle});
    REQUIRE(resolved.has_value());
    CHECK(resolved->backgroundColor == "#FFFFFF");
    CHECK(resolved->cornerRadius == 16.0);

    auto inlineOnly = StyleResolver(styles).resolve(std::nullopt, std::optional{inlineStyle});
    REQUIRE(inlineOnly.has_value());
    CHECK_FALSE(inlineOnly->backgroundColor.has_value());
}

TEST_CASE("design system references") {
    TokenDesignSystem       tokens;
    StyleResolver::StyleMap styles;
    auto caption     = style_with("@body");
    caption.fontSize = 11.0;
    styles.emplace("caption", caption);

    StyleResolver resolver(styles, &tokens);
    auto direct = resolver.resolve("@body");
    REQUIRE(direct.has_value());
    CHECK(direct->fontSize == 15.0);

    auto inherited = resolver.resolve("caption");
    REQUIRE(inherited.has_value());
    CHECK(inherited->fontSize == 11.0);
    CHECK(inherited->textColor == "#333333");

    auto unknown = resolver.resolve("@headline");
    REQUIRE(unknown.has_value());
    CHECK(*unknown == ResolvedStyle{});
}

TEST_CASE("node padding edges win over style padding") {
    ResolvedStyle style;
    Document::Style source;
    source.padding = Document::Padding{.vertical = 4.0, .all = 2.0};
    style.merge(source);

    Document::Padding node;
    node.leading = 20.0;
    auto insets  = style.padding(node);
    CHECK(insets == IR::EdgeInsets{4.0, 20.0, 4.0, 2.0});
}

TEST_CASE("unparsable colours fall back to defaults") {
    ResolvedStyle style;
    style.textColor       = "not-a-colour";
    style.backgroundColor = "zzz";
    style.borderColor     = "#00FF00";
    style.borderWidth     = 1.0;
    auto appearance = style.toAppearance();
    CHECK(appearance.textColor == IR::ColorBlack);
    CHECK_FALSE(appearance.backgroundColor.has_value());
    REQUIRE(appearance.border.has_value());
    CHECK(appearance.border->color == IR::Color{0.0f, 1.0f, 0.0f, 1.0f});
}

} // TEST_SUITE
