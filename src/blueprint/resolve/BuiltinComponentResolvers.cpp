#include <blueprint/resolve/ComponentResolver.hpp>

#include <blueprint/state/Expressions.hpp>
#include <blueprint/state/KeyPath.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <utility>

namespace BP {

namespace {

[[nodiscard]] auto node_id(Document::Component const& component, ResolutionContext const& context) -> std::string {
    return component.id.value_or(context.path());
}

[[nodiscard]] auto parse_color(std::optional<std::string> const& text, IR::Color fallback) -> IR::Color {
    if (!text) {
        return fallback;
    }
    if (auto parsed = IR::ParseColor(*text)) {
        return *parsed;
    }
    bp_log("Unparsable color '" + *text + "'", "Resolver");
    return fallback;
}

[[nodiscard]] auto placeholder_source(Document::ImagePlaceholder const& placeholder) -> std::optional<IR::ImageSource> {
    if (placeholder.system) {
        return IR::ImageSource{IR::ImageSource::Kind::System, *placeholder.system};
    }
    if (placeholder.asset) {
        return IR::ImageSource{IR::ImageSource::Kind::Asset, *placeholder.asset};
    }
    if (placeholder.url) {
        return IR::ImageSource{IR::ImageSource::Kind::Url, *placeholder.url};
    }
    return std::nullopt;
}

// system > asset > url; a url template is interpolated (and so tracked).
[[nodiscard]] auto image_source(Document::ImageSource const& image, ResolutionContext const& context)
        -> std::optional<IR::ImageSource> {
    if (image.system) {
        return IR::ImageSource{IR::ImageSource::Kind::System, *image.system};
    }
    if (image.asset) {
        return IR::ImageSource{IR::ImageSource::Kind::Asset, *image.asset};
    }
    if (image.url) {
        return IR::ImageSource{IR::ImageSource::Kind::Url, context.interpolate(*image.url)};
    }
    return std::nullopt;
}

// "system:name", "url:..." or an asset name.
[[nodiscard]] auto prefixed_source(std::string const& text) -> IR::ImageSource {
    if (text.starts_with("system:")) {
        return IR::ImageSource{IR::ImageSource::Kind::System, text.substr(7)};
    }
    if (text.starts_with("url:")) {
        return IR::ImageSource{IR::ImageSource::Kind::Url, text.substr(4)};
    }
    return IR::ImageSource{IR::ImageSource::Kind::Asset, text};
}

class TextResolver final : public ComponentResolver {
public:
    auto kind() const -> std::string_view override { return "text"; }

    auto resolve(Document::Component const& component, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        TrackedNode    node(context, node_id(component, context), component.kind, component.state);
        IR::RenderNode render;
        if (auto style = ResolveComponentStyle(component, node.context(), render); !style) {
            return std::unexpected(style.error());
        }
        render.payload = IR::TextNode{node.context().resolveContent(component).content};
        return node.finish(std::move(render));
    }
};

class ButtonResolver final : public ComponentResolver {
public:
    auto kind() const -> std::string_view override { return "button"; }

    auto resolve(Document::Component const& component, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        TrackedNode    node(context, node_id(component, context), component.kind, component.state);
        auto const&    ctx = node.context();
        IR::RenderNode render;
        IR::ButtonNode button;

        // styles.normal stands in for styleId when given.
        auto normalStyleId = component.styleId;
        if (component.styles && component.styles->normal) {
            normalStyleId = component.styles->normal;
        }
        auto style = ctx.resolveStyle(normalStyleId, component.style);
        if (!style) {
            return std::unexpected(style.error());
        }
        render.appearance = style->toAppearance();
        render.padding    = style->padding(component.padding);

        if (component.styles) {
            if (component.styles->selected) {
                auto selected = ctx.resolveStyle(component.styles->selected, std::nullopt);
                if (!selected) {
                    return std::unexpected(selected.error());
                }
                button.selectedAppearance = selected->toAppearance();
            }
            if (component.styles->disabled) {
                auto disabled = ctx.resolveStyle(component.styles->disabled, std::nullopt);
                if (!disabled) {
                    return std::unexpected(disabled.error());
                }
                button.disabledAppearance = disabled->toAppearance();
            }
        }

        button.label = ctx.resolveContent(component).content;
        if (component.isSelectedBinding) {
            button.isSelected = ctx.evaluateCondition(*component.isSelectedBinding);
        }
        if (component.image) {
            button.image = image_source(*component.image, ctx);
        }
        if (component.imagePlacement) {
            auto const& placement = *component.imagePlacement;
            if (placement == "trailing") {
                button.imagePlacement = IR::ImagePlacement::Trailing;
            } else if (placement == "top") {
                button.imagePlacement = IR::ImagePlacement::Top;
            } else if (placement == "bottom") {
                button.imagePlacement = IR::ImagePlacement::Bottom;
            }
        }
        button.imageSpacing = component.imageSpacing.value_or(8.0);
        if (component.buttonShape) {
            auto const& shape = *component.buttonShape;
            if (shape == "capsule") {
                button.shape = IR::ButtonShape::Capsule;
            } else if (shape == "roundedRectangle") {
                button.shape = IR::ButtonShape::RoundedRectangle;
            } else if (shape == "circle") {
                button.shape = IR::ButtonShape::Circle;
            }
        }
        button.fillWidth = component.fillWidth.value_or(false);
        button.onTap     = ctx.resolveAction(component.actions.onTap);

        render.payload = std::move(button);
        return node.finish(std::move(render));
    }
};

class ImageResolver final : public ComponentResolver {
public:
    auto kind() const -> std::string_view override { return "image"; }

    auto resolve(Document::Component const& component, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        TrackedNode    node(context, node_id(component, context), component.kind, component.state);
        auto const&    ctx = node.context();
        IR::RenderNode render;
        if (auto style = ResolveComponentStyle(component, ctx, render); !style) {
            return std::unexpected(style.error());
        }

        IR::ImageNode image;
        image.source = resolve_source(component, ctx, image.activityIndicator);
        if (component.image) {
            if (component.image->placeholder) {
                image.placeholder = placeholder_source(*component.image->placeholder);
            }
            if (component.image->loading) {
                image.loading = placeholder_source(*component.image->loading);
            }
        }
        render.payload = std::move(image);
        return node.finish(std::move(render));
    }

private:
    static auto resolve_source(Document::Component const& component, ResolutionContext const& ctx, bool& activityIndicator)
            -> IR::ImageSource {
        if (component.image) {
            if (component.image->activityIndicator.value_or(false) && !component.image->system && !component.image->asset) {
                activityIndicator = true;
                return IR::ImageSource{};
            }
            if (auto source = image_source(*component.image, ctx)) {
                return *source;
            }
        }
        if (auto it = component.data.find("value"); it != component.data.end()) {
            auto const& reference = it->second;
            if (reference.type == Document::DataReference::Type::Static && reference.value) {
                return prefixed_source(*reference.value);
            }
            if (reference.type == Document::DataReference::Type::Binding && reference.path) {
                auto value = ctx.read(*reference.path);
                return IR::ImageSource{IR::ImageSource::Kind::Url, value ? value->stringify() : std::string{}};
            }
        }
        return IR::ImageSource{IR::ImageSource::Kind::System, "questionmark"};
    }
};

class TextFieldResolver final : public ComponentResolver {
public:
    auto kind() const -> std::string_view override { return "textfield"; }

    auto resolve(Document::Component const& component, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        TrackedNode    node(context, node_id(component, context), component.kind, component.state);
        auto const&    ctx = node.context();
        IR::RenderNode render;
        if (auto style = ResolveComponentStyle(component, ctx, render); !style) {
            return std::unexpected(style.error());
        }
        IR::TextFieldNode field;
        field.binding = ctx.bindingFor(component);
        if (field.binding) {
            auto value = ctx.bindingValue(*field.binding);
            field.text = value && !value->isNull() ? value->stringify() : std::string{};
        } else {
            field.text = ctx.resolveContent(component).content;
        }
        field.placeholder = component.placeholder ? ctx.interpolate(*component.placeholder) : std::string{};
        render.payload    = std::move(field);
        return node.finish(std::move(render));
    }
};

class ToggleResolver final : public ComponentResolver {
public:
    auto kind() const -> std::string_view override { return "toggle"; }

    auto resolve(Document::Component const& component, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        TrackedNode    node(context, node_id(component, context), component.kind, component.state);
        auto const&    ctx = node.context();
        IR::RenderNode render;
        if (auto style = ResolveComponentStyle(component, ctx, render); !style) {
            return std::unexpected(style.error());
        }
        IR::ToggleNode toggle;
        toggle.label   = ctx.resolveContent(component).content;
        toggle.binding = ctx.bindingFor(component);
        if (toggle.binding) {
            auto value  = ctx.bindingValue(*toggle.binding);
            toggle.isOn = value && Expressions::IsTruthy(*value);
        }
        toggle.onValueChanged = ctx.resolveAction(component.actions.onValueChanged);
        render.payload        = std::move(toggle);
        return node.finish(std::move(render));
    }
};

class SliderResolver final : public ComponentResolver {
public:
    auto kind() const -> std::string_view override { return "slider"; }

    auto resolve(Document::Component const& component, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        TrackedNode    node(context, node_id(component, context), component.kind, component.state);
        auto const&    ctx = node.context();
        IR::RenderNode render;
        if (auto style = ResolveComponentStyle(component, ctx, render); !style) {
            return std::unexpected(style.error());
        }
        IR::SliderNode slider;
        slider.minValue = component.minValue.value_or(0.0);
        slider.maxValue = std::max(component.maxValue.value_or(1.0), slider.minValue);
        slider.value    = slider.minValue;
        slider.binding  = ctx.bindingFor(component);
        if (slider.binding) {
            if (auto value = ctx.bindingValue(*slider.binding)) {
                if (auto number = value->asDouble()) {
                    slider.value = std::clamp(*number, slider.minValue, slider.maxValue);
                }
            }
        }
        slider.onValueChanged = ctx.resolveAction(component.actions.onValueChanged);
        render.payload        = std::move(slider);
        return node.finish(std::move(render));
    }
};

class DividerResolver final : public ComponentResolver {
public:
    auto kind() const -> std::string_view override { return "divider"; }

    auto resolve(Document::Component const& component, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        TrackedNode    node(context, node_id(component, context), component.kind, component.state);
        IR::RenderNode render;
        if (auto style = ResolveComponentStyle(component, node.context(), render); !style) {
            return std::unexpected(style.error());
        }
        render.payload = IR::DividerNode{};
        return node.finish(std::move(render));
    }
};

class GradientResolver final : public ComponentResolver {
public:
    auto kind() const -> std::string_view override { return "gradient"; }

    auto resolve(Document::Component const& component, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        TrackedNode    node(context, node_id(component, context), component.kind, component.state);
        IR::RenderNode render;
        if (auto style = ResolveComponentStyle(component, node.context(), render); !style) {
            return std::unexpected(style.error());
        }
        IR::GradientNode gradient;
        gradient.stops.reserve(component.gradientColors.size());
        for (auto const& stop : component.gradientColors) {
            gradient.stops.push_back(IR::GradientStop{parse_color(stop.color, IR::ColorClear),
                                                      std::clamp(stop.location, 0.0, 1.0)});
        }
        std::stable_sort(gradient.stops.begin(), gradient.stops.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.location < rhs.location;
        });
        gradient.start = unit_point(component.gradientStart, IR::UnitPoint{0.5, 0.0});
        gradient.end   = unit_point(component.gradientEnd, IR::UnitPoint{0.5, 1.0});
        render.payload = std::move(gradient);
        return node.finish(std::move(render));
    }

private:
    static auto unit_point(std::optional<std::string> const& name, IR::UnitPoint fallback) -> IR::UnitPoint {
        if (!name) {
            return fallback;
        }
        static constexpr std::pair<std::string_view, IR::UnitPoint> points[] = {
                {"top", {0.5, 0.0}},        {"bottom", {0.5, 1.0}},         {"leading", {0.0, 0.5}},
                {"trailing", {1.0, 0.5}},   {"center", {0.5, 0.5}},         {"topLeading", {0.0, 0.0}},
                {"topTrailing", {1.0, 0.0}}, {"bottomLeading", {0.0, 1.0}}, {"bottomTrailing", {1.0, 1.0}},
        };
        for (auto const& [key, point] : points) {
            if (key == *name) {
                return point;
            }
        }
        bp_log("Unknown gradient point '" + *name + "'", "Resolver");
        return fallback;
    }
};

class ShapeResolver final : public ComponentResolver {
public:
    auto kind() const -> std::string_view override { return "shape"; }

    auto resolve(Document::Component const& component, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        if (!component.shapeType) {
            return std::unexpected(Error{Error::Code::MissingParameter, "shape requires 'shapeType'"});
        }
        IR::ShapeNode shape;
        auto const&   type = *component.shapeType;
        if (type == "rectangle") {
            shape.type = IR::ShapeType::Rectangle;
        } else if (type == "roundedRectangle") {
            shape.type = IR::ShapeType::RoundedRectangle;
        } else if (type == "circle") {
            shape.type = IR::ShapeType::Circle;
        } else if (type == "capsule") {
            shape.type = IR::ShapeType::Capsule;
        } else if (type == "ellipse") {
            shape.type = IR::ShapeType::Ellipse;
        } else {
            return std::unexpected(Error{Error::Code::InvalidType, "Unknown shapeType '" + type + "'"});
        }

        TrackedNode    node(context, node_id(component, context), component.kind, component.state);
        IR::RenderNode render;
        if (auto style = ResolveComponentStyle(component, node.context(), render); !style) {
            return std::unexpected(style.error());
        }
        if (shape.type == IR::ShapeType::RoundedRectangle) {
            shape.cornerRadius = component.cornerRadius.value_or(render.appearance.cornerRadius);
        }
        render.payload = shape;
        return node.finish(std::move(render));
    }
};

// currentPage names the state path holding the zero-based page, bare or as ${path}.
class PageIndicatorResolver final : public ComponentResolver {
public:
    auto kind() const -> std::string_view override { return "pageIndicator"; }

    auto resolve(Document::Component const& component, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        TrackedNode    node(context, node_id(component, context), component.kind, component.state);
        auto const&    ctx = node.context();
        IR::RenderNode render;
        if (auto style = ResolveComponentStyle(component, ctx, render); !style) {
            return std::unexpected(style.error());
        }
        IR::PageIndicatorNode indicator;
        indicator.pageCount = std::max(component.pageCount.value_or(0), 0);
        if (component.currentPage) {
            auto path = Expressions::UnwrapExpression(*component.currentPage).value_or(*component.currentPage);
            if (auto* tracker = ctx.tracker()) {
                tracker->recordWrite(path);
            }
            indicator.binding = IR::StateBinding{IR::StateBinding::Scope::Store, KeyPath::Normalize(path)};
            if (auto value = ctx.read(path)) {
                if (auto page = value->asInt()) {
                    indicator.currentPage = static_cast<int>(*page);
                }
            }
            if (indicator.pageCount > 0) {
                indicator.currentPage = std::clamp(indicator.currentPage, 0, indicator.pageCount - 1);
            }
        }
        indicator.dotSize         = component.dotSize.value_or(8.0);
        indicator.dotSpacing      = component.dotSpacing.value_or(8.0);
        indicator.dotColor        = parse_color(component.dotColor, indicator.dotColor);
        indicator.currentDotColor = parse_color(component.currentDotColor, indicator.currentDotColor);
        render.payload            = std::move(indicator);
        return node.finish(std::move(render));
    }
};

// Hands unknown kinds to the host with their extra properties; string
// properties are interpolated against state.
class CustomComponentResolver final : public ComponentResolver {
public:
    explicit CustomComponentResolver(std::string kind)
        : kind_(std::move(kind)) {}

    auto kind() const -> std::string_view override { return kind_; }

    auto resolve(Document::Component const& component, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        TrackedNode    node(context, node_id(component, context), component.kind, component.state);
        auto const&    ctx = node.context();
        IR::RenderNode render;
        if (auto style = ResolveComponentStyle(component, ctx, render); !style) {
            return std::unexpected(style.error());
        }
        IR::CustomNode custom;
        custom.kind = component.kind;
        for (auto const& [key, value] : component.additionalProperties) {
            if (auto text = value.asString()) {
                custom.properties.emplace(key, Value{ctx.interpolate(*text)});
            } else {
                custom.properties.emplace(key, value);
            }
        }
        if (component.text || component.dataSourceId || component.data.contains("value")) {
            custom.properties.insert_or_assign("text", Value{ctx.resolveContent(component).content});
        }
        render.payload = std::move(custom);
        return node.finish(std::move(render));
    }

private:
    std::string kind_;
};

} // namespace

auto MakeCustomComponentResolver(std::string kind) -> ComponentResolverPtr {
    return std::make_shared<CustomComponentResolver>(std::move(kind));
}

auto MakeDefaultComponentResolvers() -> ComponentResolverRegistry {
    ComponentResolverRegistry registry;
    auto text = std::make_shared<TextResolver>();
    registry.registerResolver(text);
    registry.registerResolver("label", text);
    registry.registerResolver(std::make_shared<ButtonResolver>());
    registry.registerResolver(std::make_shared<ImageResolver>());
    registry.registerResolver(std::make_shared<TextFieldResolver>());
    registry.registerResolver(std::make_shared<ToggleResolver>());
    registry.registerResolver(std::make_shared<SliderResolver>());
    registry.registerResolver(std::make_shared<DividerResolver>());
    registry.registerResolver(std::make_shared<GradientResolver>());
    registry.registerResolver(std::make_shared<ShapeResolver>());
    registry.registerResolver(std::make_shared<PageIndicatorResolver>());
    return registry;
}

} // namespace BP
