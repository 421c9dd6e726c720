#pragma once

#include <blueprint/actions/ActionResolver.hpp>
#include <blueprint/document/Document.hpp>
#include <blueprint/ir/RenderTree.hpp>
#include <blueprint/resolve/ComponentResolver.hpp>
#include <blueprint/resolve/LayoutResolver.hpp>
#include <blueprint/resolve/ResolutionContext.hpp>
#include <blueprint/resolve/SectionLayoutConfig.hpp>
#include <blueprint/state/StateStore.hpp>
#include <blueprint/style/StyleResolver.hpp>
#include <blueprint/tracking/ViewNode.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace BP {

// Every registry the Resolver consults. Built once at startup.
struct ResolverRegistries {
    ComponentResolverRegistry   components;
    LayoutResolverRegistry      layouts;
    SectionLayoutConfigRegistry sections;
    ActionResolverRegistry      actions;

    [[nodiscard]] static auto MakeDefault() -> ResolverRegistries;
};

struct ResolverOptions {
    // Build the ViewNode tree and record dependencies.
    bool tracking = false;
    // Resolve unregistered component kinds to IR::CustomNode instead of
    // reporting UnknownKind. A fallback set on the component registry wins.
    bool customFallback = false;
    // Target of "@"-prefixed style references.
    DesignSystemProvider const* designSystem = nullptr;
};

struct ResolveResult {
    IR::RenderTree               tree;
    std::vector<ResolutionError> errors;
    // Present only when tracking; trackingId 1 is the root.
    std::unique_ptr<ViewNode>    viewRoot;
    // First tracking id not handed out by this pass.
    std::uint64_t                nextTrackingId = 1;
};

/**
 * Resolver: Document to IR orchestrator.
 *
 * Purpose
 * -------
 * Walks the document's layout tree, dispatching each node to the component or
 * layout registry by kind, and assembles the RenderTree: root container,
 * document-level actions, root appearance and actions.
 *
 * Notes
 * -----
 * - A node that fails to resolve is dropped together with its subtree and the
 *   failure is recorded with its document path; its siblings and ancestors
 *   still resolve.
 * - Node ids default to the document path ("root.children[0]") so that
 *   repeated passes over the same document and state produce equal trees.
 * - resolveSubtree() re-resolves one tracked node in isolation, reusing its
 *   tracking id and the local state of its subtree.
 * - Not thread-safe per call; run passes on one serial context.
 */
class Resolver {
public:
    explicit Resolver(ResolverRegistries const& registries, ResolverOptions options = {});

    [[nodiscard]] auto resolve(Document::Definition const& document, StateStore& state) const -> ResolveResult;

    // Re-resolves `previous` (which must carry a source) with the current
    // state. New descendants take ids from `nextTrackingId`, which is advanced.
    [[nodiscard]] auto resolveSubtree(Document::Definition const& document,
                                      StateStore&                 state,
                                      ViewNode const&             previous,
                                      std::uint64_t&              nextTrackingId,
                                      std::vector<ResolutionError>& errors) const -> Expected<NodeResolution>;

    // Dispatch for one node; sets the ViewNode's source, scope and path.
    [[nodiscard]] auto resolveNode(Document::LayoutNode const& node,
                                   ResolutionContext const&    context) const -> Expected<NodeResolution>;

    // Resolves `children` under context.parentViewNode(). Child i gets the
    // path "<pathPrefix>[i]"; failures are reported and skipped.
    [[nodiscard]] auto resolveChildren(std::vector<Document::LayoutNode> const& children,
                                       ResolutionContext const&                 context,
                                       std::string_view                         pathPrefix) const -> std::vector<IR::RenderNode>;
    [[nodiscard]] auto resolveChildren(std::vector<Document::LayoutNode> const& children,
                                       ResolutionContext const&                 context) const -> std::vector<IR::RenderNode>;

    [[nodiscard]] auto registries() const -> ResolverRegistries const& { return registries_; }
    [[nodiscard]] auto options() const -> ResolverOptions const& { return options_; }

private:
    [[nodiscard]] auto resolveRoot(Document::RootComponent const& root, ResolutionContext const& context) const
            -> NodeResolution;

    ResolverRegistries const& registries_;
    ResolverOptions           options_;
    ComponentResolverPtr      customResolver_;
};

} // namespace BP
