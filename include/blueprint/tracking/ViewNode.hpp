#pragma once

#include <blueprint/document/Document.hpp>
#include <blueprint/state/Value.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BP {

// Loop variables bound by a forEach or a data-driven section. Each instance
// gets its own scope whose bindings shadow the enclosing ones.
struct IterationScope {
    std::shared_ptr<IterationScope const> parent;
    Value::Object                         bindings;

    // Looks up the first segment of `path` as a variable, then walks the rest
    // of the path inside the bound value.
    [[nodiscard]] auto lookup(std::string_view path) const -> std::optional<Value>;
    [[nodiscard]] auto binds(std::string_view name) const -> bool;
};

using IterationScopePtr = std::shared_ptr<IterationScope const>;

using PathSet = phmap::flat_hash_set<std::string>;

/**
 * ViewNode: dependency record for one resolved Document node.
 *
 * Purpose
 * -------
 * Exists only when tracking is enabled. Mirrors the shape of the resolved
 * tree: each node owns its children and keeps a raw pointer to its parent.
 * After a pass each node holds the state paths read and written while its own
 * resolver ran (children record their own reads).
 *
 * Notes
 * -----
 * - The tracking id is shared with the IR::RenderNode produced for the same
 *   Document node, which is how re-resolved subtrees are spliced back.
 * - source() points into the immutable Document; scope() captures the loop
 *   variables that were visible and resolutionPath() the document position,
 *   so the subtree can be resolved again alone.
 * - Local state (declared by a layout or component `state` block) lives on
 *   the declaring node and is read through "local." paths by descendants.
 */
class ViewNode {
public:
    ViewNode(std::string id, std::uint64_t trackingId, std::string kind);

    ViewNode(ViewNode const&)            = delete;
    ViewNode& operator=(ViewNode const&) = delete;

    [[nodiscard]] auto id() const -> std::string const& { return id_; }
    [[nodiscard]] auto trackingId() const -> std::uint64_t { return trackingId_; }
    [[nodiscard]] auto kind() const -> std::string const& { return kind_; }

    [[nodiscard]] auto parent() const -> ViewNode* { return parent_; }
    [[nodiscard]] auto children() const -> std::vector<std::unique_ptr<ViewNode>> const& { return children_; }

    // Links a node to its parent before the parent takes ownership, so that
    // upward lookups work while the subtree is still being resolved.
    auto setParent(ViewNode* parent) -> void { parent_ = parent; }
    auto addChild(std::unique_ptr<ViewNode> child) -> ViewNode&;
    // Swaps the child with the same tracking id for `replacement`; returns the old child.
    auto replaceChild(std::uint64_t trackingId, std::unique_ptr<ViewNode> replacement) -> std::unique_ptr<ViewNode>;

    [[nodiscard]] auto readPaths() const -> PathSet const& { return readPaths_; }
    [[nodiscard]] auto writePaths() const -> PathSet const& { return writePaths_; }
    auto setDependencies(PathSet reads, PathSet writes) -> void;

    [[nodiscard]] auto source() const -> Document::LayoutNode const* { return source_; }
    [[nodiscard]] auto scope() const -> IterationScopePtr const& { return scope_; }
    // Position in the document, e.g. "root.children[1].items[3]"; unique per pass.
    [[nodiscard]] auto resolutionPath() const -> std::string const& { return resolutionPath_; }
    auto setSource(Document::LayoutNode const* source, IterationScopePtr scope, std::string resolutionPath) -> void;

    [[nodiscard]] auto hasLocalState() const -> bool { return localState_.has_value(); }
    [[nodiscard]] auto localState() const -> std::optional<Value::Object> const& { return localState_; }
    auto declareLocalState(Value::Object initial) -> void;
    // Only this node's own local state; use nearestLocalStateScope() to search upwards.
    [[nodiscard]] auto localValue(std::string_view path) const -> std::optional<Value>;
    auto setLocalValue(std::string_view path, Value value) -> bool;
    [[nodiscard]] auto nearestLocalStateScope() -> ViewNode*;

    [[nodiscard]] auto findNode(std::string_view id) -> ViewNode*;
    [[nodiscard]] auto findTracked(std::uint64_t trackingId) -> ViewNode*;
    [[nodiscard]] auto allDescendants() const -> std::vector<ViewNode*>;
    [[nodiscard]] auto pathFromRoot() const -> std::vector<ViewNode const*>;
    [[nodiscard]] auto depth() const -> std::size_t;
    [[nodiscard]] auto isDescendantOf(ViewNode const& ancestor) const -> bool;

private:
    std::string                            id_;
    std::uint64_t                          trackingId_;
    std::string                            kind_;
    ViewNode*                              parent_ = nullptr;
    std::vector<std::unique_ptr<ViewNode>> children_;
    PathSet                                readPaths_;
    PathSet                                writePaths_;
    std::optional<Value::Object>           localState_;
    Document::LayoutNode const*            source_ = nullptr;
    IterationScopePtr                      scope_;
    std::string                            resolutionPath_;
};

} // namespace BP
