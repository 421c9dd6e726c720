#include <blueprint/document/DocumentLoader.hpp>

#include "document/DocumentDetail.hpp"
#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>

namespace BP::Document {
namespace {

using json = nlohmann::json;

[[nodiscard]] auto opt_string(json const& node, char const* key) -> std::optional<std::string> {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

[[nodiscard]] auto opt_number(json const& node, char const* key) -> std::optional<double> {
    auto it = node.find(key);
    if (it == node.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

[[nodiscard]] auto opt_int(json const& node, char const* key) -> std::optional<int> {
    auto it = node.find(key);
    if (it == node.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<int>();
}

[[nodiscard]] auto opt_bool(json const& node, char const* key) -> std::optional<bool> {
    auto it = node.find(key);
    if (it == node.end() || !it->is_boolean()) {
        return std::nullopt;
    }
    return it->get<bool>();
}

[[nodiscard]] auto opt_object(json const& node, char const* key) -> json const* {
    auto it = node.find(key);
    if (it == node.end() || !it->is_object()) {
        return nullptr;
    }
    return &*it;
}

[[nodiscard]] auto object_values(json const& node) -> Value::Object {
    auto value = Value::FromJson(node);
    if (auto* object = value.asObject()) {
        return std::move(*object);
    }
    return {};
}

template <typename Parser>
[[nodiscard]] auto opt_enum(json const& node, char const* key, Parser&& parser) -> decltype(parser(std::string_view{})) {
    auto text = opt_string(node, key);
    if (!text) {
        return std::nullopt;
    }
    return parser(*text);
}

[[nodiscard]] auto decode_padding(json const& node) -> Padding {
    Padding padding;
    padding.top        = opt_number(node, "top");
    padding.bottom     = opt_number(node, "bottom");
    padding.leading    = opt_number(node, "leading");
    padding.trailing   = opt_number(node, "trailing");
    padding.horizontal = opt_number(node, "horizontal");
    padding.vertical   = opt_number(node, "vertical");
    padding.all        = opt_number(node, "all");
    return padding;
}

[[nodiscard]] auto opt_padding(json const& node, char const* key) -> std::optional<Padding> {
    if (auto const* object = opt_object(node, key)) {
        return decode_padding(*object);
    }
    return std::nullopt;
}

[[nodiscard]] auto opt_dimension(json const& node, char const* key) -> std::optional<DimensionValue> {
    auto it = node.find(key);
    if (it == node.end()) {
        return std::nullopt;
    }
    if (it->is_number()) {
        return DimensionValue{DimensionValue::Kind::Absolute, it->get<double>()};
    }
    if (!it->is_object()) {
        return std::nullopt;
    }
    if (auto fractional = opt_number(*it, "fractional")) {
        return DimensionValue{DimensionValue::Kind::Fractional, *fractional};
    }
    if (auto absolute = opt_number(*it, "absolute")) {
        return DimensionValue{DimensionValue::Kind::Absolute, *absolute};
    }
    return std::nullopt;
}

[[nodiscard]] auto opt_alignment(json const& node, char const* key) -> std::optional<Alignment> {
    auto it = node.find(key);
    if (it == node.end()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return Alignment{Detail::HorizontalAlignmentFromString(it->get_ref<std::string const&>()), std::nullopt};
    }
    if (it->is_object()) {
        return Alignment{opt_enum(*it, "horizontal", Detail::HorizontalAlignmentFromString),
                         opt_enum(*it, "vertical", Detail::VerticalAlignmentFromString)};
    }
    return std::nullopt;
}

[[nodiscard]] auto decode_style(json const& node) -> Style {
    Style style;
    style.inherits      = opt_string(node, "inherits");
    style.fontFamily    = opt_string(node, "fontFamily");
    style.fontSize      = opt_number(node, "fontSize");
    style.fontWeight    = opt_enum(node, "fontWeight", Detail::FontWeightFromString);
    style.textColor     = opt_string(node, "textColor");
    style.textAlignment = opt_enum(node, "textAlignment", Detail::TextAlignmentFromString);

    style.backgroundColor = opt_string(node, "backgroundColor");
    style.cornerRadius    = opt_number(node, "cornerRadius");
    style.borderWidth     = opt_number(node, "borderWidth");
    style.borderColor     = opt_string(node, "borderColor");
    style.tintColor       = opt_string(node, "tintColor");
    if (auto const* shadow = opt_object(node, "shadow")) {
        style.shadow = Shadow{opt_string(*shadow, "color"), opt_number(*shadow, "radius"),
                              opt_number(*shadow, "x"), opt_number(*shadow, "y")};
    }

    style.width     = opt_dimension(node, "width");
    style.height    = opt_dimension(node, "height");
    style.minWidth  = opt_dimension(node, "minWidth");
    style.minHeight = opt_dimension(node, "minHeight");
    style.maxWidth  = opt_dimension(node, "maxWidth");
    style.maxHeight = opt_dimension(node, "maxHeight");

    style.padding = opt_padding(node, "padding");
    return style;
}

[[nodiscard]] auto opt_style(json const& node, char const* key) -> std::optional<Style> {
    if (auto const* object = opt_object(node, key)) {
        return decode_style(*object);
    }
    return std::nullopt;
}

[[nodiscard]] auto decode_action(json const& node) -> Action {
    Action action;
    action.type = opt_string(node, "type").value_or(std::string{});
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (it.key() != "type") {
            action.parameters.emplace(it.key(), Value::FromJson(it.value()));
        }
    }
    return action;
}

[[nodiscard]] auto opt_action_binding(json const& node, char const* key) -> std::optional<ActionBinding> {
    auto it = node.find(key);
    if (it == node.end()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return ActionBinding{it->get<std::string>()};
    }
    if (it->is_object()) {
        return ActionBinding{decode_action(*it)};
    }
    return std::nullopt;
}

[[nodiscard]] auto decode_placeholder(json const& node) -> ImagePlaceholder {
    ImagePlaceholder placeholder;
    placeholder.system = opt_string(node, "system");
    if (!placeholder.system) {
        placeholder.system = opt_string(node, "sfsymbol");
    }
    placeholder.url   = opt_string(node, "url");
    placeholder.asset = opt_string(node, "asset");
    return placeholder;
}

[[nodiscard]] auto decode_image(json const& node) -> ImageSource {
    ImageSource image;
    image.system = opt_string(node, "system");
    if (!image.system) {
        image.system = opt_string(node, "sfsymbol");
    }
    image.url               = opt_string(node, "url");
    image.asset             = opt_string(node, "asset");
    image.activityIndicator = opt_bool(node, "activityIndicator");
    if (auto const* placeholder = opt_object(node, "placeholder")) {
        image.placeholder = decode_placeholder(*placeholder);
    }
    if (auto const* loading = opt_object(node, "loading")) {
        image.loading = decode_placeholder(*loading);
    }
    return image;
}

inline constexpr std::array<std::string_view, 33> ComponentFieldNames{
    "type", "id", "styleId", "style", "styles", "padding", "isSelectedBinding", "dataSourceId", "text",
    "placeholder", "bind", "localBind", "fillWidth", "actions", "data", "state", "minValue", "maxValue",
    "image", "imagePlacement", "imageSpacing", "buttonShape", "shapeType", "cornerRadius", "gradientColors",
    "gradientStart", "gradientEnd", "currentPage", "pageCount", "dotSize", "dotSpacing", "dotColor",
    "currentDotColor"};

class Decoder {
public:
    auto definition(json const& document) -> Definition {
        Definition definition;
        definition.id      = opt_string(document, "id").value_or(std::string{});
        definition.version = opt_string(document, "version");
        if (auto const* state = opt_object(document, "state")) {
            definition.state = object_values(*state);
        }
        if (auto const* styles = opt_object(document, "styles")) {
            for (auto it = styles->begin(); it != styles->end(); ++it) {
                if (it->is_object()) {
                    definition.styles.emplace(it.key(), decode_style(*it));
                }
            }
        }
        if (auto const* sources = opt_object(document, "dataSources")) {
            for (auto it = sources->begin(); it != sources->end(); ++it) {
                if (!it->is_object()) {
                    continue;
                }
                DataSource source;
                source.type  = opt_string(*it, "type") == std::optional<std::string>{"binding"} ? DataSource::Type::Binding
                                                                                                 : DataSource::Type::Static;
                source.value = opt_string(*it, "value");
                source.path  = opt_string(*it, "path");
                definition.dataSources.emplace(it.key(), std::move(source));
            }
        }
        if (auto const* actions = opt_object(document, "actions")) {
            for (auto it = actions->begin(); it != actions->end(); ++it) {
                if (it->is_object()) {
                    definition.actions.emplace(it.key(), decode_action(*it));
                }
            }
        }
        if (auto const* root = opt_object(document, "root")) {
            definition.root = rootComponent(*root);
        }
        return definition;
    }

private:
    auto rootComponent(json const& node) -> RootComponent {
        RootComponent root;
        root.backgroundColor = opt_string(node, "backgroundColor");
        root.edgeInsets      = opt_padding(node, "edgeInsets");
        root.colorScheme     = opt_enum(node, "colorScheme", Detail::ColorSchemeFromString).value_or(ColorScheme::System);
        root.styleId         = opt_string(node, "styleId");
        if (auto const* actions = opt_object(node, "actions")) {
            root.actions.onAppear    = opt_action_binding(*actions, "onAppear");
            root.actions.onDisappear = opt_action_binding(*actions, "onDisappear");
        }
        root.children = children(node, "children");
        return root;
    }

    auto children(json const& node, char const* key) -> std::vector<LayoutNode> {
        std::vector<LayoutNode> out;
        auto                    it = node.find(key);
        if (it == node.end() || !it->is_array()) {
            return out;
        }
        out.reserve(it->size());
        for (auto const& child : *it) {
            if (child.is_object()) {
                out.push_back(layoutNode(child));
            }
        }
        return out;
    }

    auto nodePtr(json const& node, char const* key) -> LayoutNodePtr {
        if (auto const* object = opt_object(node, key)) {
            return std::make_shared<LayoutNode const>(layoutNode(*object));
        }
        return nullptr;
    }

    auto layoutNode(json const& node) -> LayoutNode {
        auto type = opt_string(node, "type").value_or(std::string{});
        if (type == "spacer") {
            return LayoutNode{Spacer{opt_number(node, "minLength"), opt_dimension(node, "width"), opt_dimension(node, "height")}};
        }
        if (auto layoutType = Detail::LayoutTypeFromString(type)) {
            return LayoutNode{layout(node, *layoutType)};
        }
        if (type == "sectionLayout") {
            return LayoutNode{sectionLayout(node)};
        }
        if (type == "forEach") {
            return LayoutNode{forEach(node)};
        }
        return LayoutNode{component(node, std::move(type))};
    }

    auto layout(json const& node, LayoutType type) -> Layout {
        Layout layout;
        layout.type      = type;
        layout.id        = opt_string(node, "id");
        layout.alignment = opt_alignment(node, "alignment");
        layout.spacing   = opt_number(node, "spacing");
        layout.padding   = opt_padding(node, "padding");
        layout.styleId   = opt_string(node, "styleId");
        layout.style     = opt_style(node, "style");
        if (auto const* state = opt_object(node, "state")) {
            layout.state = object_values(*state);
        }
        layout.children = children(node, "children");
        return layout;
    }

    auto forEach(json const& node) -> ForEach {
        ForEach forEach;
        forEach.id            = opt_string(node, "id");
        forEach.items         = opt_string(node, "items").value_or(std::string{});
        forEach.itemVariable  = opt_string(node, "itemVariable").value_or("item");
        forEach.indexVariable = opt_string(node, "indexVariable").value_or("index");
        forEach.layout        = opt_enum(node, "layout", Detail::LayoutTypeFromString).value_or(LayoutType::VStack);
        forEach.spacing       = opt_number(node, "spacing");
        forEach.alignment     = opt_alignment(node, "alignment");
        forEach.padding       = opt_padding(node, "padding");
        forEach.itemTemplate  = nodePtr(node, "template");
        forEach.emptyView     = nodePtr(node, "emptyView");
        return forEach;
    }

    auto sectionConfig(json const& node) -> SectionLayoutConfig {
        SectionLayoutConfig config;
        config.type            = opt_string(node, "type").value_or("list");
        config.alignment       = opt_enum(node, "alignment", Detail::HorizontalAlignmentFromString);
        config.itemSpacing     = opt_number(node, "itemSpacing");
        config.lineSpacing     = opt_number(node, "lineSpacing");
        config.contentInsets   = opt_padding(node, "contentInsets");
        config.showsIndicators = opt_bool(node, "showsIndicators");
        config.isPagingEnabled = opt_bool(node, "isPagingEnabled");
        config.snapBehavior    = opt_enum(node, "snapBehavior", Detail::SnapBehaviorFromString);
        config.showsDividers   = opt_bool(node, "showsDividers");
        if (auto const* dims = opt_object(node, "itemDimensions")) {
            config.itemDimensions = ItemDimensions{opt_dimension(*dims, "width"), opt_dimension(*dims, "height"),
                                                   opt_number(*dims, "aspectRatio")};
        }
        if (auto it = node.find("columns"); it != node.end()) {
            if (it->is_number_integer()) {
                config.columns = ColumnConfig{it->get<int>(), std::nullopt};
            } else if (auto const* adaptive = it->is_object() ? opt_object(*it, "adaptive") : nullptr) {
                config.columns = ColumnConfig{std::nullopt, opt_number(*adaptive, "minWidth")};
            }
        }
        return config;
    }

    auto sectionLayout(json const& node) -> SectionLayout {
        SectionLayout layout;
        layout.id             = opt_string(node, "id");
        layout.sectionSpacing = opt_number(node, "sectionSpacing");
        if (auto it = node.find("sections"); it != node.end() && it->is_array()) {
            for (auto const& entry : *it) {
                if (!entry.is_object()) {
                    continue;
                }
                SectionDefinition section;
                section.id           = opt_string(entry, "id");
                section.stickyHeader = opt_bool(entry, "stickyHeader");
                if (auto const* config = opt_object(entry, "layout")) {
                    section.layout = sectionConfig(*config);
                }
                section.header       = nodePtr(entry, "header");
                section.footer       = nodePtr(entry, "footer");
                section.children     = children(entry, "children");
                section.dataSource   = opt_string(entry, "dataSource");
                section.itemTemplate = nodePtr(entry, "itemTemplate");
                layout.sections.push_back(std::move(section));
            }
        }
        return layout;
    }

    auto component(json const& node, std::string kind) -> Component {
        Component component;
        component.kind              = std::move(kind);
        component.id                = opt_string(node, "id");
        component.styleId           = opt_string(node, "styleId");
        component.style             = opt_style(node, "style");
        component.padding           = opt_padding(node, "padding");
        component.isSelectedBinding = opt_string(node, "isSelectedBinding");
        component.dataSourceId      = opt_string(node, "dataSourceId");
        component.text              = opt_string(node, "text");
        component.placeholder       = opt_string(node, "placeholder");
        component.bind              = opt_string(node, "bind");
        component.localBind         = opt_string(node, "localBind");
        component.fillWidth         = opt_bool(node, "fillWidth");
        if (auto const* styles = opt_object(node, "styles")) {
            component.styles = ComponentStyles{opt_string(*styles, "normal"), opt_string(*styles, "selected"),
                                               opt_string(*styles, "disabled")};
        }
        if (auto const* actions = opt_object(node, "actions")) {
            component.actions.onTap          = opt_action_binding(*actions, "onTap");
            component.actions.onValueChanged = opt_action_binding(*actions, "onValueChanged");
        }
        if (auto const* data = opt_object(node, "data")) {
            for (auto it = data->begin(); it != data->end(); ++it) {
                if (!it->is_object()) {
                    continue;
                }
                DataReference reference;
                reference.type         = opt_enum(*it, "type", Detail::DataReferenceTypeFromString).value_or(DataReference::Type::Static);
                reference.value        = opt_string(*it, "value");
                reference.path         = opt_string(*it, "path");
                reference.templateText = opt_string(*it, "template");
                component.data.emplace(it.key(), std::move(reference));
            }
        }
        if (auto const* state = opt_object(node, "state")) {
            component.state = object_values(*state);
        }

        component.minValue = opt_number(node, "minValue");
        component.maxValue = opt_number(node, "maxValue");

        if (auto const* image = opt_object(node, "image")) {
            component.image = decode_image(*image);
        }
        component.imagePlacement = opt_string(node, "imagePlacement");
        component.imageSpacing   = opt_number(node, "imageSpacing");
        component.buttonShape    = opt_string(node, "buttonShape");
        component.shapeType      = opt_string(node, "shapeType");
        component.cornerRadius   = opt_number(node, "cornerRadius");

        if (auto it = node.find("gradientColors"); it != node.end() && it->is_array()) {
            for (auto const& stop : *it) {
                if (stop.is_object()) {
                    component.gradientColors.push_back(GradientStop{opt_string(stop, "color").value_or(std::string{}),
                                                                    opt_number(stop, "location").value_or(0.0)});
                }
            }
        }
        component.gradientStart = opt_string(node, "gradientStart");
        component.gradientEnd   = opt_string(node, "gradientEnd");

        component.currentPage     = opt_string(node, "currentPage");
        component.pageCount       = opt_int(node, "pageCount");
        component.dotSize         = opt_number(node, "dotSize");
        component.dotSpacing      = opt_number(node, "dotSpacing");
        component.dotColor        = opt_string(node, "dotColor");
        component.currentDotColor = opt_string(node, "currentDotColor");

        for (auto it = node.begin(); it != node.end(); ++it) {
            if (!Detail::IndexOf(ComponentFieldNames, it.key())) {
                component.additionalProperties.emplace(it.key(), Value::FromJson(it.value()));
            }
        }
        return component;
    }
};

} // namespace

auto Decode(nlohmann::json const& json) -> Expected<Definition> {
    if (!json.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "document must be a JSON object"});
    }
    return Decoder{}.definition(json);
}

auto LoadJson(nlohmann::json const& json) -> Expected<Definition> {
    auto validation = Validate(json);
    for ([[maybe_unused]] auto const& warning : validation.warnings) {
        bp_log("Document warning at " + warning.path + ": " + warning.message, "Document");
    }
    if (!validation.isValid()) {
        bp_log("Document rejected: " + validation.summary(), "Document", "Error");
        return std::unexpected(Error{Error::Code::ValidationFailed, validation.summary()});
    }
    return Decode(json);
}

auto Load(std::string_view text) -> Expected<Definition> {
    auto parsed = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "document is not valid JSON"});
    }
    return LoadJson(parsed);
}

} // namespace BP::Document
