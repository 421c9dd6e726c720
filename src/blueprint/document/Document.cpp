#include <blueprint/document/Document.hpp>

#include "document/DocumentDetail.hpp"

namespace BP::Document {

auto layoutTypeName(LayoutType type) -> std::string_view {
    return Detail::LayoutTypeNames[static_cast<std::size_t>(type)];
}

auto LayoutNode::kindName() const -> std::string {
    struct Visitor {
        auto operator()(Layout const& layout) const -> std::string { return std::string{layoutTypeName(layout.type)}; }
        auto operator()(SectionLayout const&) const -> std::string { return "sectionLayout"; }
        auto operator()(ForEach const&) const -> std::string { return "forEach"; }
        auto operator()(Component const& component) const -> std::string { return component.kind; }
        auto operator()(Spacer const&) const -> std::string { return "spacer"; }
    };
    return std::visit(Visitor{}, node);
}

auto LayoutNode::nodeId() const -> std::optional<std::string> {
    struct Visitor {
        auto operator()(Layout const& layout) const -> std::optional<std::string> { return layout.id; }
        auto operator()(SectionLayout const& section) const -> std::optional<std::string> { return section.id; }
        auto operator()(ForEach const& forEach) const -> std::optional<std::string> { return forEach.id; }
        auto operator()(Component const& component) const -> std::optional<std::string> { return component.id; }
        auto operator()(Spacer const&) const -> std::optional<std::string> { return std::nullopt; }
    };
    return std::visit(Visitor{}, node);
}

} // namespace BP::Document
