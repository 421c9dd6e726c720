#pragma once

#include <blueprint/state/Value.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Decoded wire-format document. Immutable once loaded: resolvers hold
// pointers into it for the lifetime of a session.
namespace BP::Document {

inline constexpr int SupportedMajorVersion = 1;

enum class HorizontalAlignment { Leading, Center, Trailing };
enum class VerticalAlignment { Top, Center, Bottom };

// Accepts "center" (horizontal only) or {"horizontal": ..., "vertical": ...}.
struct Alignment {
    std::optional<HorizontalAlignment> horizontal;
    std::optional<VerticalAlignment>   vertical;
};

// Every edge can come from a specific field, an axis shorthand or `all`.
// Precedence: specific > axis > all.
struct Padding {
    std::optional<double> top;
    std::optional<double> bottom;
    std::optional<double> leading;
    std::optional<double> trailing;
    std::optional<double> horizontal;
    std::optional<double> vertical;
    std::optional<double> all;

    // Present but with no field: the clear instruction.
    [[nodiscard]] auto isEmpty() const -> bool {
        return !top && !bottom && !leading && !trailing && !horizontal && !vertical && !all;
    }

    [[nodiscard]] auto topValue() const -> std::optional<double> { return top ? top : vertical ? vertical : all; }
    [[nodiscard]] auto bottomValue() const -> std::optional<double> { return bottom ? bottom : vertical ? vertical : all; }
    [[nodiscard]] auto leadingValue() const -> std::optional<double> { return leading ? leading : horizontal ? horizontal : all; }
    [[nodiscard]] auto trailingValue() const -> std::optional<double> { return trailing ? trailing : horizontal ? horizontal : all; }
};

struct Shadow {
    std::optional<std::string> color;
    std::optional<double>      radius;
    std::optional<double>      x;
    std::optional<double>      y;

    [[nodiscard]] auto isEmpty() const -> bool { return !color && !radius && !x && !y; }
};

// A bare number is absolute; {"fractional": 0.5} is a share of the parent.
struct DimensionValue {
    enum class Kind { Absolute, Fractional };
    Kind   kind  = Kind::Absolute;
    double value = 0.0;

    friend auto operator==(DimensionValue const&, DimensionValue const&) -> bool = default;
};

enum class FontWeight { UltraLight, Thin, Light, Regular, Medium, Semibold, Bold, Heavy, Black };
enum class TextAlignment { Leading, Center, Trailing };

struct Style {
    std::optional<std::string> inherits;

    std::optional<std::string>   fontFamily;
    std::optional<double>        fontSize;
    std::optional<FontWeight>    fontWeight;
    std::optional<std::string>   textColor;
    std::optional<TextAlignment> textAlignment;

    std::optional<std::string> backgroundColor;
    std::optional<double>      cornerRadius;
    std::optional<double>      borderWidth;
    std::optional<std::string> borderColor;
    std::optional<Shadow>      shadow;
    std::optional<std::string> tintColor;

    std::optional<DimensionValue> width;
    std::optional<DimensionValue> height;
    std::optional<DimensionValue> minWidth;
    std::optional<DimensionValue> minHeight;
    std::optional<DimensionValue> maxWidth;
    std::optional<DimensionValue> maxHeight;

    std::optional<Padding> padding;
};

// Loosely typed action as written on the wire: {"type": kind, ...parameters}.
struct Action {
    std::string   type;
    Value::Object parameters;
};

// Either the id of a document-level action or an inline action.
using ActionBinding = std::variant<std::string, Action>;

struct DataReference {
    enum class Type { Static, Binding, LocalBinding };
    Type                       type = Type::Static;
    std::optional<std::string> value;
    std::optional<std::string> path;
    std::optional<std::string> templateText;
};

struct DataSource {
    enum class Type { Static, Binding };
    Type                       type = Type::Static;
    std::optional<std::string> value;
    std::optional<std::string> path;
};

struct ImagePlaceholder {
    std::optional<std::string> system;
    std::optional<std::string> url;
    std::optional<std::string> asset;
};

struct ImageSource {
    std::optional<std::string>      system;
    std::optional<std::string>      url;
    std::optional<std::string>      asset;
    std::optional<bool>             activityIndicator;
    std::optional<ImagePlaceholder> placeholder;
    std::optional<ImagePlaceholder> loading;
};

struct GradientStop {
    std::string color;
    double      location = 0.0;
};

struct ComponentStyles {
    std::optional<std::string> normal;
    std::optional<std::string> selected;
    std::optional<std::string> disabled;
};

struct ComponentActions {
    std::optional<ActionBinding> onTap;
    std::optional<ActionBinding> onValueChanged;
};

struct Component {
    std::string                kind;
    std::optional<std::string> id;
    std::optional<std::string> styleId;
    std::optional<Style>       style;
    std::optional<ComponentStyles> styles;
    std::optional<Padding>     padding;
    std::optional<std::string> isSelectedBinding;
    std::optional<std::string> dataSourceId;
    std::optional<std::string> text;
    std::optional<std::string> placeholder;
    std::optional<std::string> bind;
    std::optional<std::string> localBind;
    std::optional<bool>        fillWidth;
    ComponentActions           actions;
    std::map<std::string, DataReference> data;
    std::optional<Value::Object>         state;

    std::optional<double> minValue;
    std::optional<double> maxValue;

    std::optional<ImageSource> image;
    std::optional<std::string> imagePlacement;
    std::optional<double>      imageSpacing;
    std::optional<std::string> buttonShape;

    std::optional<std::string> shapeType;
    std::optional<double>      cornerRadius;

    std::vector<GradientStop>  gradientColors;
    std::optional<std::string> gradientStart;
    std::optional<std::string> gradientEnd;

    std::optional<std::string> currentPage;
    std::optional<int>         pageCount;
    std::optional<double>      dotSize;
    std::optional<double>      dotSpacing;
    std::optional<std::string> dotColor;
    std::optional<std::string> currentDotColor;

    // Fields this schema does not know; custom component resolvers read them.
    Value::Object additionalProperties;
};

struct LayoutNode;
using LayoutNodePtr = std::shared_ptr<LayoutNode const>;

enum class LayoutType { VStack, HStack, ZStack };

struct Layout {
    LayoutType                   type = LayoutType::VStack;
    std::optional<std::string>   id;
    std::optional<Alignment>     alignment;
    std::optional<double>        spacing;
    std::optional<Padding>       padding;
    std::optional<std::string>   styleId;
    std::optional<Style>         style;
    std::optional<Value::Object> state;
    std::vector<LayoutNode>      children;
};

struct ForEach {
    std::optional<std::string> id;
    std::string                items;
    std::string                itemVariable  = "item";
    std::string                indexVariable = "index";
    LayoutType                 layout        = LayoutType::VStack;
    std::optional<double>      spacing;
    std::optional<Alignment>   alignment;
    std::optional<Padding>     padding;
    LayoutNodePtr              itemTemplate;
    LayoutNodePtr              emptyView;
};

struct ColumnConfig {
    std::optional<int>    fixed;
    std::optional<double> adaptiveMinWidth;
};

struct ItemDimensions {
    std::optional<DimensionValue> width;
    std::optional<DimensionValue> height;
    std::optional<double>         aspectRatio;
};

enum class SnapBehavior { None, ViewAligned, Paging };

struct SectionLayoutConfig {
    // horizontal | list | grid | flow, or a host-registered kind.
    std::string                        type = "list";
    std::optional<HorizontalAlignment> alignment;
    std::optional<double>              itemSpacing;
    std::optional<double>              lineSpacing;
    std::optional<Padding>             contentInsets;
    std::optional<ItemDimensions>      itemDimensions;
    std::optional<bool>                showsIndicators;
    std::optional<bool>                isPagingEnabled;
    std::optional<SnapBehavior>        snapBehavior;
    std::optional<ColumnConfig>        columns;
    std::optional<bool>                showsDividers;
};

struct SectionDefinition {
    std::optional<std::string> id;
    SectionLayoutConfig        layout;
    LayoutNodePtr              header;
    LayoutNodePtr              footer;
    std::optional<bool>        stickyHeader;
    std::vector<LayoutNode>    children;
    // Data-driven sections repeat itemTemplate over the array at dataSource.
    std::optional<std::string> dataSource;
    LayoutNodePtr              itemTemplate;
};

struct SectionLayout {
    std::optional<std::string>     id;
    std::optional<double>          sectionSpacing;
    std::vector<SectionDefinition> sections;
};

struct Spacer {
    std::optional<double>         minLength;
    std::optional<DimensionValue> width;
    std::optional<DimensionValue> height;
};

struct LayoutNode {
    std::variant<Layout, SectionLayout, ForEach, Component, Spacer> node;

    // "vstack", "sectionLayout", "forEach", the component kind, or "spacer".
    [[nodiscard]] auto kindName() const -> std::string;
    [[nodiscard]] auto nodeId() const -> std::optional<std::string>;
};

enum class ColorScheme { Light, Dark, System };

struct RootActions {
    std::optional<ActionBinding> onAppear;
    std::optional<ActionBinding> onDisappear;
};

struct RootComponent {
    std::optional<std::string> backgroundColor;
    std::optional<Padding>     edgeInsets;
    ColorScheme                colorScheme = ColorScheme::System;
    std::optional<std::string> styleId;
    RootActions                actions;
    std::vector<LayoutNode>    children;
};

struct Definition {
    std::string                       id;
    std::optional<std::string>        version;
    Value::Object                     state;
    std::map<std::string, Style>      styles;
    std::map<std::string, DataSource> dataSources;
    std::map<std::string, Action>     actions;
    RootComponent                     root;
};

[[nodiscard]] auto layoutTypeName(LayoutType type) -> std::string_view;

} // namespace BP::Document
