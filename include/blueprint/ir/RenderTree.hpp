#pragma once

#include <blueprint/ir/ActionDefinition.hpp>
#include <blueprint/ir/Color.hpp>
#include <blueprint/state/Value.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Canonical render tree handed to renderers. Every property has exactly one
// representation and all defaults are applied; renderers never merge, default
// or compute values. Optional fields are those a platform may legitimately
// leave to its own sizing (frames, placeholders, bindings).
namespace BP::IR {

struct EdgeInsets {
    double top      = 0.0;
    double leading  = 0.0;
    double bottom   = 0.0;
    double trailing = 0.0;

    friend auto operator==(EdgeInsets const&, EdgeInsets const&) -> bool = default;
};

enum class HorizontalAlignment { Leading, Center, Trailing };
enum class VerticalAlignment { Top, Center, Bottom };

struct Alignment {
    HorizontalAlignment horizontal = HorizontalAlignment::Center;
    VerticalAlignment   vertical   = VerticalAlignment::Center;

    friend auto operator==(Alignment const&, Alignment const&) -> bool = default;
};

struct Dimension {
    enum class Kind { Absolute, Fractional };
    Kind   kind  = Kind::Absolute;
    double value = 0.0;

    friend auto operator==(Dimension const&, Dimension const&) -> bool = default;
};

struct Frame {
    std::optional<Dimension> width;
    std::optional<Dimension> height;
    std::optional<Dimension> minWidth;
    std::optional<Dimension> minHeight;
    std::optional<Dimension> maxWidth;
    std::optional<Dimension> maxHeight;

    friend auto operator==(Frame const&, Frame const&) -> bool = default;
};

struct Shadow {
    Color  color  = ColorBlack;
    double radius = 0.0;
    double x      = 0.0;
    double y      = 0.0;

    friend auto operator==(Shadow const&, Shadow const&) -> bool = default;
};

struct Border {
    Color  color = ColorBlack;
    double width = 0.0;

    friend auto operator==(Border const&, Border const&) -> bool = default;
};

enum class FontWeight { UltraLight, Thin, Light, Regular, Medium, Semibold, Bold, Heavy, Black };
enum class TextAlignment { Leading, Center, Trailing };

struct Appearance {
    std::optional<std::string> fontFamily;
    double                     fontSize      = 17.0;
    FontWeight                 fontWeight    = FontWeight::Regular;
    Color                      textColor     = ColorBlack;
    TextAlignment              textAlignment = TextAlignment::Leading;

    std::optional<Color>  backgroundColor;
    double                cornerRadius = 0.0;
    std::optional<Border> border;
    std::optional<Shadow> shadow;
    std::optional<Color>  tintColor;
    Frame                 frame;

    friend auto operator==(Appearance const&, Appearance const&) -> bool = default;
};

// Where a two-way bound primitive writes its value back.
struct StateBinding {
    enum class Scope { Store, Local };
    Scope       scope = Scope::Store;
    std::string path;

    friend auto operator==(StateBinding const&, StateBinding const&) -> bool = default;
};

enum class Axis { Vertical, Horizontal, Depth };

struct ContainerNode {
    Axis      axis = Axis::Vertical;
    Alignment alignment;
    double    spacing = 0.0;

    friend auto operator==(ContainerNode const&, ContainerNode const&) -> bool = default;
};

struct TextNode {
    std::string content;

    friend auto operator==(TextNode const&, TextNode const&) -> bool = default;
};

struct ImageSource {
    enum class Kind { System, Url, Asset };
    Kind        kind = Kind::System;
    std::string name;

    friend auto operator==(ImageSource const&, ImageSource const&) -> bool = default;
};

struct ImageNode {
    ImageSource                source;
    std::optional<ImageSource> placeholder;
    std::optional<ImageSource> loading;
    bool                       activityIndicator = false;

    friend auto operator==(ImageNode const&, ImageNode const&) -> bool = default;
};

enum class ImagePlacement { Leading, Trailing, Top, Bottom };
enum class ButtonShape { Automatic, Capsule, RoundedRectangle, Circle };

struct ButtonNode {
    std::string                    label;
    std::optional<ActionReference> onTap;
    bool                           isSelected = false;
    // Style applied while selected; absent when the button has no selected style.
    std::optional<Appearance>      selectedAppearance;
    std::optional<Appearance>      disabledAppearance;
    std::optional<ImageSource>     image;
    ImagePlacement                 imagePlacement = ImagePlacement::Leading;
    double                         imageSpacing   = 8.0;
    ButtonShape                    shape          = ButtonShape::Automatic;
    bool                           fillWidth      = false;

    friend auto operator==(ButtonNode const&, ButtonNode const&) -> bool = default;
};

struct TextFieldNode {
    std::string                 text;
    std::string                 placeholder;
    std::optional<StateBinding> binding;

    friend auto operator==(TextFieldNode const&, TextFieldNode const&) -> bool = default;
};

struct ToggleNode {
    std::string                    label;
    bool                           isOn = false;
    std::optional<StateBinding>    binding;
    std::optional<ActionReference> onValueChanged;

    friend auto operator==(ToggleNode const&, ToggleNode const&) -> bool = default;
};

struct SliderNode {
    double                         value    = 0.0;
    double                         minValue = 0.0;
    double                         maxValue = 1.0;
    std::optional<StateBinding>    binding;
    std::optional<ActionReference> onValueChanged;

    friend auto operator==(SliderNode const&, SliderNode const&) -> bool = default;
};

struct SpacerNode {
    std::optional<double> minLength;

    friend auto operator==(SpacerNode const&, SpacerNode const&) -> bool = default;
};

struct DividerNode {
    friend auto operator==(DividerNode const&, DividerNode const&) -> bool = default;
};

struct UnitPoint {
    double x = 0.5;
    double y = 0.5;

    friend auto operator==(UnitPoint const&, UnitPoint const&) -> bool = default;
};

struct GradientStop {
    Color  color    = ColorBlack;
    double location = 0.0;

    friend auto operator==(GradientStop const&, GradientStop const&) -> bool = default;
};

struct GradientNode {
    std::vector<GradientStop> stops;
    UnitPoint                 start{0.5, 0.0};
    UnitPoint                 end{0.5, 1.0};

    friend auto operator==(GradientNode const&, GradientNode const&) -> bool = default;
};

enum class ShapeType { Rectangle, RoundedRectangle, Circle, Capsule, Ellipse };

struct ShapeNode {
    ShapeType type         = ShapeType::Rectangle;
    double    cornerRadius = 0.0;

    friend auto operator==(ShapeNode const&, ShapeNode const&) -> bool = default;
};

enum class SectionKind { Horizontal, List, Grid, Flow, Custom };
enum class SnapBehavior { None, ViewAligned, Paging };

struct GridColumns {
    enum class Kind { Fixed, Adaptive };
    Kind   kind     = Kind::Fixed;
    int    count    = 2;
    double minWidth = 0.0;

    friend auto operator==(GridColumns const&, GridColumns const&) -> bool = default;
};

struct SectionConfig {
    SectionKind               kind = SectionKind::List;
    std::string               customKind;
    HorizontalAlignment       alignment   = HorizontalAlignment::Leading;
    double                    itemSpacing = 8.0;
    double                    lineSpacing = 8.0;
    EdgeInsets                contentInsets;
    std::optional<Dimension>  itemWidth;
    std::optional<Dimension>  itemHeight;
    std::optional<double>     aspectRatio;
    bool                      showsIndicators = false;
    bool                      isPagingEnabled = false;
    SnapBehavior              snapBehavior    = SnapBehavior::None;
    GridColumns               columns;
    bool                      showsDividers = false;

    friend auto operator==(SectionConfig const&, SectionConfig const&) -> bool = default;
};

struct SectionLayoutNode {
    double sectionSpacing = 0.0;

    friend auto operator==(SectionLayoutNode const&, SectionLayoutNode const&) -> bool = default;
};

// Children are laid out as [header] items... [footer]; the flags say which
// ends are present.
struct SectionNode {
    SectionConfig config;
    bool          hasHeader    = false;
    bool          hasFooter    = false;
    bool          stickyHeader = false;

    friend auto operator==(SectionNode const&, SectionNode const&) -> bool = default;
};

struct PageIndicatorNode {
    int                         currentPage = 0;
    int                         pageCount   = 0;
    double                      dotSize     = 8.0;
    double                      dotSpacing  = 8.0;
    Color                       dotColor        = Color{0.5f, 0.5f, 0.5f, 1.0f};
    Color                       currentDotColor = ColorBlack;
    std::optional<StateBinding> binding;

    friend auto operator==(PageIndicatorNode const&, PageIndicatorNode const&) -> bool = default;
};

// Placeholder for component kinds the core does not know; carries the raw
// properties for a host renderer.
struct CustomNode {
    std::string   kind;
    Value::Object properties;

    friend auto operator==(CustomNode const&, CustomNode const&) -> bool = default;
};

using NodePayload = std::variant<ContainerNode,
                                 TextNode,
                                 ButtonNode,
                                 ImageNode,
                                 TextFieldNode,
                                 ToggleNode,
                                 SpacerNode,
                                 DividerNode,
                                 GradientNode,
                                 ShapeNode,
                                 SliderNode,
                                 SectionLayoutNode,
                                 SectionNode,
                                 PageIndicatorNode,
                                 CustomNode>;

struct RenderNode {
    std::string   id;
    Appearance    appearance;
    EdgeInsets    padding;
    // Matches the ViewNode that produced this node; 0 when tracking is off.
    std::uint64_t trackingId = 0;
    NodePayload   payload;
    std::vector<RenderNode> children;

    [[nodiscard]] auto kindName() const -> std::string_view;

    template <typename T>
    [[nodiscard]] auto as() const -> T const* {
        return std::get_if<T>(&payload);
    }

    friend auto operator==(RenderNode const&, RenderNode const&) -> bool = default;
};

enum class ColorScheme { Light, Dark, System };

struct RenderTree {
    RenderNode                              root;
    std::optional<Color>                    backgroundColor;
    EdgeInsets                              edgeInsets;
    ColorScheme                             colorScheme = ColorScheme::System;
    std::map<std::string, ActionDefinition> actions;
    std::optional<ActionReference>          onAppear;
    std::optional<ActionReference>          onDisappear;

    friend auto operator==(RenderTree const&, RenderTree const&) -> bool = default;
};

[[nodiscard]] auto FindNode(RenderNode const& root, std::string_view id) -> RenderNode const*;
[[nodiscard]] auto FindTracked(RenderNode const& root, std::uint64_t trackingId) -> RenderNode const*;
[[nodiscard]] auto FindTracked(RenderNode& root, std::uint64_t trackingId) -> RenderNode*;

// Replaces the node carrying `trackingId` with `replacement`. Returns false
// when no such node exists.
auto ReplaceTracked(RenderNode& root, std::uint64_t trackingId, RenderNode replacement) -> bool;

// Number of nodes in the subtree, root included.
[[nodiscard]] auto CountNodes(RenderNode const& root) -> std::size_t;

} // namespace BP::IR
