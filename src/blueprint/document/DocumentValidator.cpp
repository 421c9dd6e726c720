#include <blueprint/document/DocumentLoader.hpp>
#include <blueprint/ir/Color.hpp>

#include "document/DocumentDetail.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <sstream>

namespace BP::Document {
namespace {

using json = nlohmann::json;
using Kind = ValidationIssue::Kind;

template <std::size_t N>
[[nodiscard]] auto join_names(std::array<std::string_view, N> const& names) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < N; ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(names[i]);
    }
    return out;
}

[[nodiscard]] auto child_path(std::string const& parent, std::string_view key) -> std::string {
    if (parent.empty()) {
        return std::string{key};
    }
    return parent + "." + std::string{key};
}

[[nodiscard]] auto index_path(std::string const& parent, std::size_t index) -> std::string {
    return parent + "[" + std::to_string(index) + "]";
}

class DocumentValidator {
public:
    auto run(json const& document) -> ValidationResult {
        if (!document.is_object()) {
            error(Kind::InvalidType, "", std::string{"document must be an object, found "} + document.type_name());
            return std::move(result_);
        }
        validateDocument(document);
        return std::move(result_);
    }

private:
    auto error(Kind kind, std::string path, std::string message) -> void {
        result_.errors.push_back(ValidationIssue{kind, std::move(path), std::move(message)});
    }

    auto warning(Kind kind, std::string path, std::string message) -> void {
        result_.warnings.push_back(ValidationIssue{kind, std::move(path), std::move(message)});
    }

    // Reports a present field of the wrong JSON type; returns true when the field is present and well typed.
    template <typename Predicate>
    auto expect(json const& node, char const* key, std::string const& path, Predicate&& isType, char const* expected) -> bool {
        auto it = node.find(key);
        if (it == node.end()) {
            return false;
        }
        if (!isType(*it)) {
            error(Kind::InvalidType, child_path(path, key),
                  std::string{"expected "} + expected + ", found " + it->type_name());
            return false;
        }
        return true;
    }

    auto expectString(json const& node, char const* key, std::string const& path) -> bool {
        return expect(node, key, path, [](json const& v) { return v.is_string(); }, "string");
    }

    auto expectNumber(json const& node, char const* key, std::string const& path) -> bool {
        return expect(node, key, path, [](json const& v) { return v.is_number(); }, "number");
    }

    auto expectBool(json const& node, char const* key, std::string const& path) -> bool {
        return expect(node, key, path, [](json const& v) { return v.is_boolean(); }, "boolean");
    }

    auto expectObject(json const& node, char const* key, std::string const& path) -> bool {
        return expect(node, key, path, [](json const& v) { return v.is_object(); }, "object");
    }

    auto expectArray(json const& node, char const* key, std::string const& path) -> bool {
        return expect(node, key, path, [](json const& v) { return v.is_array(); }, "array");
    }

    template <std::size_t N>
    auto expectEnum(json const& node, char const* key, std::string const& path, std::array<std::string_view, N> const& names) -> void {
        if (!expectString(node, key, path)) {
            return;
        }
        auto const& value = node.at(key).get_ref<std::string const&>();
        if (!Detail::IndexOf(names, value)) {
            error(Kind::InvalidEnumValue, child_path(path, key),
                  "'" + value + "' is not one of: " + join_names(names));
        }
    }

    auto requireField(json const& node, char const* key, std::string const& path) -> bool {
        if (!node.contains(key)) {
            error(Kind::MissingRequiredField, child_path(path, key), std::string{"missing required field '"} + key + "'");
            return false;
        }
        return true;
    }

    auto checkColor(json const& node, char const* key, std::string const& path) -> void {
        if (!expectString(node, key, path)) {
            return;
        }
        auto const& value = node.at(key).get_ref<std::string const&>();
        if (value.find("${") == std::string::npos && !IR::ParseColor(value)) {
            warning(Kind::InvalidFormat, child_path(path, key), "'" + value + "' is not a recognized color");
        }
    }

    auto validateDocument(json const& document) -> void {
        if (requireField(document, "id", "")) {
            expectString(document, "id", "");
        }
        if (expectString(document, "version", "")) {
            validateVersion(document.at("version").get_ref<std::string const&>());
        }
        expectObject(document, "state", "");

        if (expectObject(document, "styles", "")) {
            for (auto it = document.at("styles").begin(); it != document.at("styles").end(); ++it) {
                auto path = "styles." + it.key();
                if (!it->is_object()) {
                    error(Kind::InvalidType, path, std::string{"expected object, found "} + it->type_name());
                    continue;
                }
                validateStyle(*it, path);
            }
        }

        if (expectObject(document, "dataSources", "")) {
            for (auto it = document.at("dataSources").begin(); it != document.at("dataSources").end(); ++it) {
                validateDataSource(*it, "dataSources." + it.key());
            }
        }

        if (expectObject(document, "actions", "")) {
            for (auto it = document.at("actions").begin(); it != document.at("actions").end(); ++it) {
                validateAction(*it, "actions." + it.key());
            }
        }

        if (!requireField(document, "root", "")) {
            return;
        }
        if (!expectObject(document, "root", "")) {
            return;
        }
        validateRoot(document.at("root"), "root");
    }

    auto validateVersion(std::string const& version) -> void {
        int  major = 0;
        auto [end, ec] = std::from_chars(version.data(), version.data() + version.size(), major);
        if (ec != std::errc{} || (end != version.data() + version.size() && *end != '.')) {
            error(Kind::InvalidFormat, "version", "'" + version + "' is not a semantic version");
            return;
        }
        if (major > SupportedMajorVersion) {
            error(Kind::UnsupportedVersion, "version",
                  "major version " + std::to_string(major) + " is newer than supported " + std::to_string(SupportedMajorVersion));
        }
    }

    auto validateRoot(json const& root, std::string const& path) -> void {
        checkColor(root, "backgroundColor", path);
        expectEnum(root, "colorScheme", path, Detail::ColorSchemeNames);
        expectString(root, "styleId", path);
        if (expectObject(root, "edgeInsets", path)) {
            validatePadding(root.at("edgeInsets"), child_path(path, "edgeInsets"));
        }
        if (expectObject(root, "actions", path)) {
            auto const& actions = root.at("actions");
            for (char const* key : {"onAppear", "onDisappear"}) {
                if (actions.contains(key)) {
                    validateActionBinding(actions.at(key), child_path(child_path(path, "actions"), key));
                }
            }
        }
        if (!requireField(root, "children", path)) {
            return;
        }
        validateChildren(root, path);
    }

    auto validateChildren(json const& node, std::string const& path) -> void {
        if (!expectArray(node, "children", path)) {
            return;
        }
        auto const& children = node.at("children");
        auto        base     = child_path(path, "children");
        for (std::size_t i = 0; i < children.size(); ++i) {
            validateLayoutNode(children[i], index_path(base, i));
        }
    }

    auto validateLayoutNode(json const& node, std::string const& path) -> void {
        if (!node.is_object()) {
            error(Kind::InvalidType, path, std::string{"expected object, found "} + node.type_name());
            return;
        }
        if (!requireField(node, "type", path) || !expectString(node, "type", path)) {
            return;
        }
        auto const& type = node.at("type").get_ref<std::string const&>();
        if (type == "spacer") {
            expectNumber(node, "minLength", path);
            validateDimension(node, "width", path);
            validateDimension(node, "height", path);
        } else if (Detail::LayoutTypeFromString(type)) {
            validateLayout(node, path);
        } else if (type == "sectionLayout") {
            validateSectionLayout(node, path);
        } else if (type == "forEach") {
            validateForEach(node, path);
        } else {
            validateComponent(node, type, path);
        }
    }

    auto validateAlignment(json const& node, std::string const& path) -> void {
        auto it = node.find("alignment");
        if (it == node.end()) {
            return;
        }
        if (it->is_string()) {
            expectEnum(node, "alignment", path, Detail::HorizontalAlignmentNames);
            return;
        }
        if (!it->is_object()) {
            error(Kind::InvalidType, child_path(path, "alignment"),
                  std::string{"expected string or object, found "} + it->type_name());
            return;
        }
        auto alignmentPath = child_path(path, "alignment");
        expectEnum(*it, "horizontal", alignmentPath, Detail::HorizontalAlignmentNames);
        expectEnum(*it, "vertical", alignmentPath, Detail::VerticalAlignmentNames);
    }

    auto validateLayout(json const& layout, std::string const& path) -> void {
        expectString(layout, "id", path);
        expectNumber(layout, "spacing", path);
        expectString(layout, "styleId", path);
        expectObject(layout, "state", path);
        validateAlignment(layout, path);
        if (expectObject(layout, "padding", path)) {
            validatePadding(layout.at("padding"), child_path(path, "padding"));
        }
        if (expectObject(layout, "style", path)) {
            validateStyle(layout.at("style"), child_path(path, "style"));
        }
        validateChildren(layout, path);
    }

    auto validateSectionLayout(json const& node, std::string const& path) -> void {
        expectString(node, "id", path);
        expectNumber(node, "sectionSpacing", path);
        if (!requireField(node, "sections", path) || !expectArray(node, "sections", path)) {
            return;
        }
        auto const& sections = node.at("sections");
        auto        base     = child_path(path, "sections");
        for (std::size_t i = 0; i < sections.size(); ++i) {
            validateSection(sections[i], index_path(base, i));
        }
    }

    auto validateSection(json const& section, std::string const& path) -> void {
        if (!section.is_object()) {
            error(Kind::InvalidType, path, std::string{"expected object, found "} + section.type_name());
            return;
        }
        expectString(section, "id", path);
        expectBool(section, "stickyHeader", path);
        if (requireField(section, "layout", path) && expectObject(section, "layout", path)) {
            validateSectionConfig(section.at("layout"), child_path(path, "layout"));
        }
        for (char const* key : {"header", "footer", "itemTemplate"}) {
            if (section.contains(key)) {
                validateLayoutNode(section.at(key), child_path(path, key));
            }
        }
        bool const hasChildren   = section.contains("children");
        bool const hasDataSource = section.contains("dataSource");
        if (hasChildren && hasDataSource) {
            error(Kind::MutuallyExclusiveFields, path, "'children' and 'dataSource' cannot both be set");
        }
        if (hasDataSource) {
            expectString(section, "dataSource", path);
            if (!section.contains("itemTemplate")) {
                error(Kind::MissingRequiredField, child_path(path, "itemTemplate"),
                      "a data-driven section needs 'itemTemplate'");
            }
        }
        if (hasChildren) {
            validateChildren(section, path);
        }
    }

    auto validateSectionConfig(json const& config, std::string const& path) -> void {
        if (requireField(config, "type", path) && expectString(config, "type", path)) {
            auto const& type = config.at("type").get_ref<std::string const&>();
            if (!Detail::IndexOf(Detail::SectionTypeNames, type)) {
                warning(Kind::InvalidEnumValue, child_path(path, "type"),
                        "'" + type + "' is not a built-in section type; a registered config resolver is required");
            }
        }
        expectEnum(config, "alignment", path, Detail::HorizontalAlignmentNames);
        expectNumber(config, "itemSpacing", path);
        expectNumber(config, "lineSpacing", path);
        expectBool(config, "showsIndicators", path);
        expectBool(config, "isPagingEnabled", path);
        expectBool(config, "showsDividers", path);
        expectEnum(config, "snapBehavior", path, Detail::SnapBehaviorNames);
        if (expectObject(config, "contentInsets", path)) {
            validatePadding(config.at("contentInsets"), child_path(path, "contentInsets"));
        }
        if (expectObject(config, "itemDimensions", path)) {
            auto const& dims     = config.at("itemDimensions");
            auto        dimsPath = child_path(path, "itemDimensions");
            validateDimension(dims, "width", dimsPath);
            validateDimension(dims, "height", dimsPath);
            if (expectNumber(dims, "aspectRatio", dimsPath) && dims.at("aspectRatio").get<double>() <= 0.0) {
                error(Kind::InvalidRange, child_path(dimsPath, "aspectRatio"), "aspect ratio must be positive");
            }
        }
        if (auto it = config.find("columns"); it != config.end()) {
            auto columnsPath = child_path(path, "columns");
            if (it->is_number_integer()) {
                if (it->get<int>() < 1) {
                    error(Kind::InvalidRange, columnsPath, "column count must be at least 1");
                }
            } else if (it->is_object() && it->contains("adaptive")) {
                auto const& adaptive = it->at("adaptive");
                if (!adaptive.is_object() || !adaptive.contains("minWidth") || !adaptive.at("minWidth").is_number()) {
                    error(Kind::MissingRequiredField, columnsPath + ".adaptive.minWidth", "adaptive columns need a numeric 'minWidth'");
                }
            } else {
                error(Kind::InvalidType, columnsPath, "expected integer or {\"adaptive\": {\"minWidth\": n}}");
            }
        }
    }

    auto validateForEach(json const& node, std::string const& path) -> void {
        expectString(node, "id", path);
        if (requireField(node, "items", path)) {
            expectString(node, "items", path);
        }
        expectString(node, "itemVariable", path);
        expectString(node, "indexVariable", path);
        expectNumber(node, "spacing", path);
        expectEnum(node, "layout", path, Detail::LayoutTypeNames);
        validateAlignment(node, path);
        if (expectObject(node, "padding", path)) {
            validatePadding(node.at("padding"), child_path(path, "padding"));
        }
        if (requireField(node, "template", path)) {
            validateLayoutNode(node.at("template"), child_path(path, "template"));
        }
        if (node.contains("emptyView")) {
            validateLayoutNode(node.at("emptyView"), child_path(path, "emptyView"));
        }
    }

    auto validateComponent(json const& component, std::string const& type, std::string const& path) -> void {
        if (!Detail::IndexOf(Detail::KnownComponentKinds, type)) {
            warning(Kind::UnknownComponentType, path, "unknown component type '" + type + "' requires a registered resolver");
        }
        for (char const* key : {"id", "styleId", "isSelectedBinding", "dataSourceId", "text", "placeholder", "bind",
                                "localBind", "imagePlacement", "buttonShape", "shapeType", "gradientStart", "gradientEnd",
                                "currentPage"}) {
            expectString(component, key, path);
        }
        for (char const* key : {"minValue", "maxValue", "imageSpacing", "cornerRadius", "dotSize", "dotSpacing"}) {
            expectNumber(component, key, path);
        }
        expectBool(component, "fillWidth", path);
        expectObject(component, "state", path);
        checkColor(component, "dotColor", path);
        checkColor(component, "currentDotColor", path);

        if (component.contains("bind") && component.contains("localBind")) {
            error(Kind::MutuallyExclusiveFields, path, "'bind' and 'localBind' cannot both be set");
        }
        auto const minIt = component.find("minValue");
        auto const maxIt = component.find("maxValue");
        if (minIt != component.end() && maxIt != component.end() && minIt->is_number() && maxIt->is_number()) {
            if (component.at("minValue").get<double>() > component.at("maxValue").get<double>()) {
                error(Kind::InvalidRange, child_path(path, "minValue"), "'minValue' is greater than 'maxValue'");
            }
        }
        if (auto it = component.find("pageCount"); it != component.end()) {
            if (!it->is_number_integer()) {
                error(Kind::InvalidType, child_path(path, "pageCount"), std::string{"expected integer, found "} + it->type_name());
            } else if (it->get<int>() < 0) {
                error(Kind::InvalidRange, child_path(path, "pageCount"), "page count cannot be negative");
            }
        }
        if (type == "pageIndicator" && !component.contains("currentPage")) {
            error(Kind::MissingRequiredField, child_path(path, "currentPage"), "a page indicator needs 'currentPage'");
        }

        if (expectObject(component, "style", path)) {
            validateStyle(component.at("style"), child_path(path, "style"));
        }
        if (expectObject(component, "styles", path)) {
            auto stylesPath = child_path(path, "styles");
            for (char const* key : {"normal", "selected", "disabled"}) {
                expectString(component.at("styles"), key, stylesPath);
            }
        }
        if (expectObject(component, "padding", path)) {
            validatePadding(component.at("padding"), child_path(path, "padding"));
        }
        if (expectObject(component, "image", path)) {
            validateImage(component.at("image"), child_path(path, "image"));
        }
        if (expectArray(component, "gradientColors", path)) {
            validateGradient(component.at("gradientColors"), child_path(path, "gradientColors"));
        }
        if (expectObject(component, "data", path)) {
            for (auto it = component.at("data").begin(); it != component.at("data").end(); ++it) {
                validateDataReference(*it, child_path(child_path(path, "data"), it.key()));
            }
        }
        if (expectObject(component, "actions", path)) {
            auto actionsPath = child_path(path, "actions");
            for (auto it = component.at("actions").begin(); it != component.at("actions").end(); ++it) {
                validateActionBinding(*it, child_path(actionsPath, it.key()));
            }
        }
    }

    auto validateImage(json const& image, std::string const& path) -> void {
        int sources = 0;
        for (char const* key : {"system", "sfsymbol", "url", "asset"}) {
            if (expectString(image, key, path)) {
                ++sources;
            }
        }
        if (sources == 0 && !image.contains("activityIndicator")) {
            error(Kind::MissingRequiredField, path, "image needs one of 'system', 'url' or 'asset'");
        } else if (sources > 1) {
            error(Kind::MutuallyExclusiveFields, path, "image sources 'system', 'url' and 'asset' are exclusive");
        }
        expectBool(image, "activityIndicator", path);
        for (char const* key : {"placeholder", "loading"}) {
            if (expectObject(image, key, path)) {
                auto const& placeholder = image.at(key);
                auto        nested      = child_path(path, key);
                for (char const* field : {"system", "sfsymbol", "url", "asset"}) {
                    expectString(placeholder, field, nested);
                }
            }
        }
    }

    auto validateGradient(json const& stops, std::string const& path) -> void {
        for (std::size_t i = 0; i < stops.size(); ++i) {
            auto const& stop     = stops[i];
            auto        stopPath = index_path(path, i);
            if (!stop.is_object()) {
                error(Kind::InvalidType, stopPath, std::string{"expected object, found "} + stop.type_name());
                continue;
            }
            if (requireField(stop, "color", stopPath)) {
                checkColor(stop, "color", stopPath);
            }
            if (requireField(stop, "location", stopPath) && expectNumber(stop, "location", stopPath)) {
                auto location = stop.at("location").get<double>();
                if (location < 0.0 || location > 1.0) {
                    error(Kind::InvalidRange, child_path(stopPath, "location"),
                          "location " + std::to_string(location) + " is outside 0..1");
                }
            }
        }
    }

    auto validateDataReference(json const& reference, std::string const& path) -> void {
        if (!reference.is_object()) {
            error(Kind::InvalidType, path, std::string{"expected object, found "} + reference.type_name());
            return;
        }
        if (requireField(reference, "type", path)) {
            expectEnum(reference, "type", path, Detail::DataReferenceTypeNames);
        }
        expectString(reference, "value", path);
        expectString(reference, "path", path);
        expectString(reference, "template", path);
        if (reference.contains("path") && reference.contains("template")) {
            error(Kind::MutuallyExclusiveFields, path, "'path' and 'template' cannot both be set");
        }
    }

    auto validateDataSource(json const& source, std::string const& path) -> void {
        if (!source.is_object()) {
            error(Kind::InvalidType, path, std::string{"expected object, found "} + source.type_name());
            return;
        }
        if (requireField(source, "type", path) && expectString(source, "type", path)) {
            auto const& type = source.at("type").get_ref<std::string const&>();
            if (type != "static" && type != "binding") {
                error(Kind::InvalidEnumValue, child_path(path, "type"), "'" + type + "' is not one of: static, binding");
            } else if (type == "binding") {
                requireField(source, "path", path);
            }
        }
        expectString(source, "value", path);
        expectString(source, "path", path);
    }

    auto validatePadding(json const& padding, std::string const& path) -> void {
        for (char const* key : {"top", "bottom", "leading", "trailing", "horizontal", "vertical", "all"}) {
            if (expectNumber(padding, key, path) && padding.at(key).get<double>() < 0.0) {
                error(Kind::InvalidRange, child_path(path, key), "padding cannot be negative");
            }
        }
    }

    auto validateDimension(json const& node, char const* key, std::string const& path) -> void {
        auto it = node.find(key);
        if (it == node.end() || it->is_number()) {
            return;
        }
        auto dimensionPath = child_path(path, key);
        if (!it->is_object()) {
            error(Kind::InvalidType, dimensionPath, std::string{"expected number or object, found "} + it->type_name());
            return;
        }
        bool const absolute   = it->contains("absolute");
        bool const fractional = it->contains("fractional");
        if (absolute == fractional) {
            error(Kind::MutuallyExclusiveFields, dimensionPath, "exactly one of 'absolute' or 'fractional' is required");
            return;
        }
        if (fractional && expectNumber(*it, "fractional", dimensionPath)) {
            auto value = it->at("fractional").get<double>();
            if (value < 0.0 || value > 1.0) {
                error(Kind::InvalidRange, child_path(dimensionPath, "fractional"), "fraction is outside 0..1");
            }
        }
        if (absolute) {
            expectNumber(*it, "absolute", dimensionPath);
        }
    }

    auto validateStyle(json const& style, std::string const& path) -> void {
        expectString(style, "inherits", path);
        expectString(style, "fontFamily", path);
        expectNumber(style, "fontSize", path);
        expectNumber(style, "cornerRadius", path);
        expectNumber(style, "borderWidth", path);
        expectEnum(style, "fontWeight", path, Detail::FontWeightNames);
        expectEnum(style, "textAlignment", path, Detail::TextAlignmentNames);
        for (char const* key : {"textColor", "backgroundColor", "borderColor", "tintColor"}) {
            checkColor(style, key, path);
        }
        for (char const* key : {"width", "height", "minWidth", "minHeight", "maxWidth", "maxHeight"}) {
            validateDimension(style, key, path);
        }
        if (expectObject(style, "padding", path)) {
            validatePadding(style.at("padding"), child_path(path, "padding"));
        }
        if (expectObject(style, "shadow", path)) {
            auto const& shadow     = style.at("shadow");
            auto        shadowPath = child_path(path, "shadow");
            checkColor(shadow, "color", shadowPath);
            expectNumber(shadow, "radius", shadowPath);
            expectNumber(shadow, "x", shadowPath);
            expectNumber(shadow, "y", shadowPath);
        }
    }

    auto validateActionBinding(json const& binding, std::string const& path) -> void {
        if (binding.is_string()) {
            return;
        }
        validateAction(binding, path);
    }

    auto validateAction(json const& action, std::string const& path) -> void {
        if (!action.is_object()) {
            error(Kind::InvalidType, path, std::string{"expected object, found "} + action.type_name());
            return;
        }
        if (!requireField(action, "type", path) || !expectString(action, "type", path)) {
            return;
        }
        auto const& type = action.at("type").get_ref<std::string const&>();
        if (type == "dismiss") {
            return;
        }
        if (type == "setState") {
            if (requireField(action, "path", path)) {
                expectString(action, "path", path);
            }
            requireField(action, "value", path);
        } else if (type == "toggleState") {
            if (requireField(action, "path", path)) {
                expectString(action, "path", path);
            }
        } else if (type == "showAlert") {
            expectString(action, "title", path);
            if (auto it = action.find("message"); it != action.end() && !it->is_string()) {
                if (!it->is_object()) {
                    error(Kind::InvalidType, child_path(path, "message"), "expected string or binding object");
                } else {
                    expectString(*it, "template", child_path(path, "message"));
                }
            }
            if (expectArray(action, "buttons", path)) {
                auto const& buttons = action.at("buttons");
                auto        base    = child_path(path, "buttons");
                for (std::size_t i = 0; i < buttons.size(); ++i) {
                    auto buttonPath = index_path(base, i);
                    if (!buttons[i].is_object()) {
                        error(Kind::InvalidType, buttonPath, "expected object");
                        continue;
                    }
                    if (requireField(buttons[i], "label", buttonPath)) {
                        expectString(buttons[i], "label", buttonPath);
                    }
                    expectEnum(buttons[i], "style", buttonPath, Detail::AlertButtonStyleNames);
                    if (buttons[i].contains("action")) {
                        validateActionBinding(buttons[i].at("action"), child_path(buttonPath, "action"));
                    }
                }
            }
        } else if (type == "navigate") {
            if (requireField(action, "destination", path)) {
                expectString(action, "destination", path);
            }
            expectEnum(action, "presentation", path, Detail::PresentationNames);
        } else if (type == "sequence") {
            if (!requireField(action, "steps", path) || !expectArray(action, "steps", path)) {
                return;
            }
            auto const& steps = action.at("steps");
            auto        base  = child_path(path, "steps");
            for (std::size_t i = 0; i < steps.size(); ++i) {
                validateActionBinding(steps[i], index_path(base, i));
            }
        } else if (type == "appendToArray" || type == "removeFromArray" || type == "toggleInArray"
                   || type == "setArrayItem" || type == "clearArray") {
            if (requireField(action, "path", path)) {
                expectString(action, "path", path);
            }
            if (type == "setArrayItem" || type == "appendToArray" || type == "toggleInArray") {
                requireField(action, "value", path);
            }
            if (type == "removeFromArray" && !action.contains("value") && !action.contains("index")) {
                error(Kind::MissingRequiredField, path, "removeFromArray needs 'value' or 'index'");
            }
        } else {
            warning(Kind::UnknownActionType, path, "unknown action type '" + type + "' requires a registered handler");
        }
    }

    ValidationResult result_;
};

} // namespace

auto issueKindName(ValidationIssue::Kind kind) -> std::string_view {
    switch (kind) {
    case Kind::MissingRequiredField:
        return "missing_required_field";
    case Kind::InvalidType:
        return "invalid_type";
    case Kind::InvalidEnumValue:
        return "invalid_enum_value";
    case Kind::InvalidFormat:
        return "invalid_format";
    case Kind::UnknownComponentType:
        return "unknown_component_type";
    case Kind::UnknownActionType:
        return "unknown_action_type";
    case Kind::MutuallyExclusiveFields:
        return "mutually_exclusive_fields";
    case Kind::InvalidRange:
        return "invalid_range";
    case Kind::UnsupportedVersion:
        return "unsupported_version";
    }
    return "invalid_format";
}

auto ValidationResult::summary() const -> std::string {
    std::ostringstream oss;
    oss << errors.size() << " error(s)";
    for (auto const& issue : errors) {
        oss << "; " << issueKindName(issue.kind) << " at " << (issue.path.empty() ? std::string{"<document>"} : issue.path)
            << ": " << issue.message;
    }
    return oss.str();
}

auto Validate(nlohmann::json const& json) -> ValidationResult {
    return DocumentValidator{}.run(json);
}

} // namespace BP::Document
