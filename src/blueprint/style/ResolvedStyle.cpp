#include <blueprint/style/ResolvedStyle.hpp>

#include "log/TaggedLogger.hpp"

namespace BP {
namespace {

auto parse_color(std::optional<std::string> const& text) -> std::optional<IR::Color> {
    if (!text) {
        return std::nullopt;
    }
    auto color = IR::ParseColor(*text);
    if (!color) {
        bp_log("Unparsable colour '" + *text + "'", "Style");
    }
    return color;
}

template <typename T>
auto assign_if(std::optional<T>& target, std::optional<T> const& source) -> void {
    if (source) {
        target = source;
    }
}

auto to_ir(std::optional<Document::DimensionValue> const& value) -> std::optional<IR::Dimension> {
    if (!value) {
        return std::nullopt;
    }
    return ToIR(*value);
}

} // namespace

auto ResolvedStyle::merge(Document::Style const& style) -> void {
    assign_if(fontFamily, style.fontFamily);
    assign_if(fontSize, style.fontSize);
    assign_if(fontWeight, style.fontWeight);
    assign_if(textColor, style.textColor);
    assign_if(textAlignment, style.textAlignment);

    assign_if(backgroundColor, style.backgroundColor);
    assign_if(cornerRadius, style.cornerRadius);
    assign_if(borderWidth, style.borderWidth);
    assign_if(borderColor, style.borderColor);
    assign_if(tintColor, style.tintColor);

    if (style.shadow) {
        auto const& shadow = *style.shadow;
        if (shadow.isEmpty()) {
            shadowColor.reset();
            shadowRadius.reset();
            shadowX.reset();
            shadowY.reset();
        } else {
            assign_if(shadowColor, shadow.color);
            assign_if(shadowRadius, shadow.radius);
            assign_if(shadowX, shadow.x);
            assign_if(shadowY, shadow.y);
        }
    }

    assign_if(width, style.width);
    assign_if(height, style.height);
    assign_if(minWidth, style.minWidth);
    assign_if(minHeight, style.minHeight);
    assign_if(maxWidth, style.maxWidth);
    assign_if(maxHeight, style.maxHeight);

    if (style.padding) {
        auto const& padding = *style.padding;
        if (padding.isEmpty()) {
            paddingTop.reset();
            paddingBottom.reset();
            paddingLeading.reset();
            paddingTrailing.reset();
        } else {
            assign_if(paddingTop, padding.topValue());
            assign_if(paddingBottom, padding.bottomValue());
            assign_if(paddingLeading, padding.leadingValue());
            assign_if(paddingTrailing, padding.trailingValue());
        }
    }
}

auto ResolvedStyle::hasShadow() const -> bool {
    return shadowColor || shadowRadius || shadowX || shadowY;
}

auto ResolvedStyle::hasBorder() const -> bool {
    return borderColor && borderWidth && *borderWidth > 0.0;
}

auto ResolvedStyle::hasPadding() const -> bool {
    return paddingTop || paddingBottom || paddingLeading || paddingTrailing;
}

auto ResolvedStyle::shadow() const -> std::optional<IR::Shadow> {
    if (!hasShadow()) {
        return std::nullopt;
    }
    IR::Shadow result;
    result.color  = parse_color(shadowColor).value_or(IR::ColorClear);
    result.radius = shadowRadius.value_or(0.0);
    result.x      = shadowX.value_or(0.0);
    result.y      = shadowY.value_or(0.0);
    return result;
}

auto ResolvedStyle::toAppearance() const -> IR::Appearance {
    IR::Appearance appearance;
    appearance.fontFamily = fontFamily;
    if (fontSize) {
        appearance.fontSize = *fontSize;
    }
    if (fontWeight) {
        appearance.fontWeight = static_cast<IR::FontWeight>(*fontWeight);
    }
    if (auto color = parse_color(textColor)) {
        appearance.textColor = *color;
    }
    if (textAlignment) {
        appearance.textAlignment = static_cast<IR::TextAlignment>(*textAlignment);
    }

    appearance.backgroundColor = parse_color(backgroundColor);
    appearance.cornerRadius    = cornerRadius.value_or(0.0);
    if (hasBorder()) {
        if (auto color = parse_color(borderColor)) {
            appearance.border = IR::Border{*color, *borderWidth};
        }
    }
    appearance.shadow    = shadow();
    appearance.tintColor = parse_color(tintColor);

    appearance.frame.width     = to_ir(width);
    appearance.frame.height    = to_ir(height);
    appearance.frame.minWidth  = to_ir(minWidth);
    appearance.frame.minHeight = to_ir(minHeight);
    appearance.frame.maxWidth  = to_ir(maxWidth);
    appearance.frame.maxHeight = to_ir(maxHeight);
    return appearance;
}

auto ResolvedStyle::padding(std::optional<Document::Padding> const& nodePadding) const -> IR::EdgeInsets {
    auto edge = [&](std::optional<double> nodeValue, std::optional<double> styleValue) {
        return nodeValue.value_or(styleValue.value_or(0.0));
    };
    Document::Padding none;
    auto const&       node = nodePadding ? *nodePadding : none;
    return IR::EdgeInsets{edge(node.topValue(), paddingTop),
                          edge(node.leadingValue(), paddingLeading),
                          edge(node.bottomValue(), paddingBottom),
                          edge(node.trailingValue(), paddingTrailing)};
}

auto ToIR(Document::DimensionValue const& value) -> IR::Dimension {
    return IR::Dimension{value.kind == Document::DimensionValue::Kind::Fractional ? IR::Dimension::Kind::Fractional
                                                                                  : IR::Dimension::Kind::Absolute,
                         value.value};
}

auto ToIR(Document::HorizontalAlignment alignment) -> IR::HorizontalAlignment {
    return static_cast<IR::HorizontalAlignment>(alignment);
}

auto ToIR(Document::VerticalAlignment alignment) -> IR::VerticalAlignment {
    return static_cast<IR::VerticalAlignment>(alignment);
}

auto ToIR(Document::Padding const& padding) -> IR::EdgeInsets {
    return IR::EdgeInsets{padding.topValue().value_or(0.0), padding.leadingValue().value_or(0.0),
                          padding.bottomValue().value_or(0.0), padding.trailingValue().value_or(0.0)};
}

} // namespace BP
