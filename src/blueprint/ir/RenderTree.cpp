#include <blueprint/ir/RenderTree.hpp>

namespace BP::IR {

auto RenderNode::kindName() const -> std::string_view {
    struct Visitor {
        auto operator()(ContainerNode const& node) const -> std::string_view {
            switch (node.axis) {
            case Axis::Vertical:
                return "vstack";
            case Axis::Horizontal:
                return "hstack";
            case Axis::Depth:
                return "zstack";
            }
            return "vstack";
        }
        auto operator()(TextNode const&) const -> std::string_view { return "text"; }
        auto operator()(ButtonNode const&) const -> std::string_view { return "button"; }
        auto operator()(ImageNode const&) const -> std::string_view { return "image"; }
        auto operator()(TextFieldNode const&) const -> std::string_view { return "textfield"; }
        auto operator()(ToggleNode const&) const -> std::string_view { return "toggle"; }
        auto operator()(SpacerNode const&) const -> std::string_view { return "spacer"; }
        auto operator()(DividerNode const&) const -> std::string_view { return "divider"; }
        auto operator()(GradientNode const&) const -> std::string_view { return "gradient"; }
        auto operator()(ShapeNode const&) const -> std::string_view { return "shape"; }
        auto operator()(SliderNode const&) const -> std::string_view { return "slider"; }
        auto operator()(SectionLayoutNode const&) const -> std::string_view { return "sectionLayout"; }
        auto operator()(SectionNode const&) const -> std::string_view { return "section"; }
        auto operator()(PageIndicatorNode const&) const -> std::string_view { return "pageIndicator"; }
        auto operator()(CustomNode const& node) const -> std::string_view { return node.kind; }
    };
    return std::visit(Visitor{}, payload);
}

auto FindNode(RenderNode const& root, std::string_view id) -> RenderNode const* {
    if (root.id == id) {
        return &root;
    }
    for (auto const& child : root.children) {
        if (auto const* found = FindNode(child, id)) {
            return found;
        }
    }
    return nullptr;
}

auto FindTracked(RenderNode const& root, std::uint64_t trackingId) -> RenderNode const* {
    if (trackingId == 0) {
        return nullptr;
    }
    if (root.trackingId == trackingId) {
        return &root;
    }
    for (auto const& child : root.children) {
        if (auto const* found = FindTracked(child, trackingId)) {
            return found;
        }
    }
    return nullptr;
}

auto FindTracked(RenderNode& root, std::uint64_t trackingId) -> RenderNode* {
    return const_cast<RenderNode*>(FindTracked(static_cast<RenderNode const&>(root), trackingId));
}

auto ReplaceTracked(RenderNode& root, std::uint64_t trackingId, RenderNode replacement) -> bool {
    auto* target = FindTracked(root, trackingId);
    if (target == nullptr) {
        return false;
    }
    *target = std::move(replacement);
    return true;
}

auto CountNodes(RenderNode const& root) -> std::size_t {
    std::size_t count = 1;
    for (auto const& child : root.children) {
        count += CountNodes(child);
    }
    return count;
}

} // namespace BP::IR
