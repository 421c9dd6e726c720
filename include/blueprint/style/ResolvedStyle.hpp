#pragma once

#include <blueprint/document/Document.hpp>
#include <blueprint/ir/RenderTree.hpp>

#include <optional>
#include <string>

namespace BP {

/**
 * ResolvedStyle: the fold of a style inheritance chain.
 *
 * Purpose
 * -------
 * Holds every presentation property as an optional so that absence
 * ("inherit") stays distinct from a concrete value while a chain is folded
 * root to leaf. It is a transient artifact: resolvers convert it to
 * IR::Appearance and IR::EdgeInsets and then drop it.
 *
 * Notes
 * -----
 * - Scalars and dimensions overwrite when present.
 * - Shadow and padding merge per sub-field. A present shadow or padding with
 *   every sub-field absent clears all of its sub-fields; a style folded later
 *   may set them again.
 * - Colours stay as wire text until toAppearance() so that an unparsable
 *   colour degrades to the IR default instead of failing the fold.
 */
struct ResolvedStyle {
    std::optional<std::string>             fontFamily;
    std::optional<double>                  fontSize;
    std::optional<Document::FontWeight>    fontWeight;
    std::optional<std::string>             textColor;
    std::optional<Document::TextAlignment> textAlignment;

    std::optional<std::string> backgroundColor;
    std::optional<double>      cornerRadius;
    std::optional<double>      borderWidth;
    std::optional<std::string> borderColor;
    std::optional<std::string> tintColor;

    std::optional<std::string> shadowColor;
    std::optional<double>      shadowRadius;
    std::optional<double>      shadowX;
    std::optional<double>      shadowY;

    std::optional<Document::DimensionValue> width;
    std::optional<Document::DimensionValue> height;
    std::optional<Document::DimensionValue> minWidth;
    std::optional<Document::DimensionValue> minHeight;
    std::optional<Document::DimensionValue> maxWidth;
    std::optional<Document::DimensionValue> maxHeight;

    std::optional<double> paddingTop;
    std::optional<double> paddingBottom;
    std::optional<double> paddingLeading;
    std::optional<double> paddingTrailing;

    auto merge(Document::Style const& style) -> void;

    [[nodiscard]] auto hasShadow() const -> bool;
    [[nodiscard]] auto hasBorder() const -> bool;
    [[nodiscard]] auto hasPadding() const -> bool;

    [[nodiscard]] auto toAppearance() const -> IR::Appearance;
    [[nodiscard]] auto shadow() const -> std::optional<IR::Shadow>;

    // Node-level padding edges win over the style's; anything unset is 0.
    [[nodiscard]] auto padding(std::optional<Document::Padding> const& nodePadding = std::nullopt) const -> IR::EdgeInsets;

    friend auto operator==(ResolvedStyle const&, ResolvedStyle const&) -> bool = default;
};

[[nodiscard]] auto ToIR(Document::DimensionValue const& value) -> IR::Dimension;
[[nodiscard]] auto ToIR(Document::HorizontalAlignment alignment) -> IR::HorizontalAlignment;
[[nodiscard]] auto ToIR(Document::VerticalAlignment alignment) -> IR::VerticalAlignment;
[[nodiscard]] auto ToIR(Document::Padding const& padding) -> IR::EdgeInsets;

} // namespace BP
