#include <blueprint/resolve/Resolver.hpp>

#include <blueprint/style/ResolvedStyle.hpp>
#include <blueprint/tracking/DependencyTracker.hpp>

#include "log/TaggedLogger.hpp"

namespace BP {

namespace {

[[nodiscard]] auto to_ir(Document::ColorScheme scheme) -> IR::ColorScheme {
    switch (scheme) {
    case Document::ColorScheme::Light:
        return IR::ColorScheme::Light;
    case Document::ColorScheme::Dark:
        return IR::ColorScheme::Dark;
    case Document::ColorScheme::System:
        return IR::ColorScheme::System;
    }
    return IR::ColorScheme::System;
}

// Local state of every declaring node in the subtree, keyed by resolution path.
auto collect_local_state(ViewNode const& node, phmap::flat_hash_map<std::string, Value::Object>& out) -> void {
    if (node.localState()) {
        out.insert_or_assign(node.resolutionPath(), *node.localState());
    }
    for (auto const& child : node.children()) {
        collect_local_state(*child, out);
    }
}

} // namespace

auto ResolverRegistries::MakeDefault() -> ResolverRegistries {
    ResolverRegistries registries;
    registries.components = MakeDefaultComponentResolvers();
    registries.layouts    = MakeDefaultLayoutResolvers();
    registries.sections   = MakeDefaultSectionLayoutConfigs();
    registries.actions    = MakeDefaultActionResolvers();
    return registries;
}

Resolver::Resolver(ResolverRegistries const& registries, ResolverOptions options)
    : registries_(registries), options_(options) {
    if (options_.customFallback) {
        customResolver_ = MakeCustomComponentResolver();
    }
}

auto Resolver::resolve(Document::Definition const& document, StateStore& state) const -> ResolveResult {
    ResolveResult     result;
    StyleResolver     styles(document.styles, options_.designSystem);
    DependencyTracker tracker;

    ResolutionSession session;
    session.document = &document;
    session.styles   = &styles;
    session.state    = &state;
    session.tracker  = options_.tracking ? &tracker : nullptr;
    session.resolver = this;
    session.actions  = &registries_.actions;
    session.errors   = &result.errors;
    ResolutionContext context(session);

    std::vector<ActionResolutionError> actionErrors;
    result.tree.actions = registries_.actions.resolveAll(document.actions, &actionErrors);
    for (auto& failure : actionErrors) {
        result.errors.push_back(ResolutionError{"actions." + failure.actionId, std::move(failure.error)});
    }

    auto const& root = document.root;
    if (root.backgroundColor) {
        if (auto color = IR::ParseColor(*root.backgroundColor)) {
            result.tree.backgroundColor = *color;
        } else {
            bp_log("Unparsable root backgroundColor '" + *root.backgroundColor + "'", "Resolver");
        }
    }
    if (root.edgeInsets) {
        result.tree.edgeInsets = ToIR(*root.edgeInsets);
    }
    result.tree.colorScheme = to_ir(root.colorScheme);
    result.tree.onAppear    = context.resolveAction(root.actions.onAppear);
    result.tree.onDisappear = context.resolveAction(root.actions.onDisappear);

    auto resolved         = resolveRoot(root, context);
    result.tree.root      = std::move(resolved.render);
    result.viewRoot       = std::move(resolved.view);
    result.nextTrackingId = session.nextTrackingId;
    return result;
}

auto Resolver::resolveRoot(Document::RootComponent const& root, ResolutionContext const& context) const -> NodeResolution {
    TrackedNode    tracked(context, "root", "root", std::nullopt);
    auto const&    ctx = tracked.context();
    IR::RenderNode render;

    if (root.styleId) {
        if (auto style = ctx.resolveStyle(root.styleId, std::nullopt)) {
            render.appearance = style->toAppearance();
            render.padding    = style->padding();
        } else {
            ctx.reportError("root", style.error());
        }
    }
    render.payload  = IR::ContainerNode{IR::Axis::Vertical, IR::Alignment{}, 0.0};
    render.children = resolveChildren(root.children, ctx);
    return tracked.finish(std::move(render));
}

auto Resolver::resolveSubtree(Document::Definition const&   document,
                              StateStore&                   state,
                              ViewNode const&               previous,
                              std::uint64_t&                nextTrackingId,
                              std::vector<ResolutionError>& errors) const -> Expected<NodeResolution> {
    if (previous.source() == nullptr) {
        return std::unexpected(Error{Error::Code::NotSupported, "ViewNode '" + previous.id() + "' has no source node"});
    }

    StyleResolver     styles(document.styles, options_.designSystem);
    DependencyTracker tracker;

    ResolutionSession session;
    session.document           = &document;
    session.styles             = &styles;
    session.state              = &state;
    session.tracker            = &tracker;
    session.resolver           = this;
    session.actions            = &registries_.actions;
    session.errors             = &errors;
    session.nextTrackingId     = nextTrackingId;
    session.reservedTrackingId = previous.trackingId();
    collect_local_state(previous, session.preservedLocalState);

    auto context = ResolutionContext(session)
                           .withParent(previous.parent())
                           .withScope(previous.scope())
                           .withPath(previous.resolutionPath());
    auto result    = resolveNode(*previous.source(), context);
    nextTrackingId = session.nextTrackingId;
    return result;
}

auto Resolver::resolveNode(Document::LayoutNode const& node, ResolutionContext const& context) const
        -> Expected<NodeResolution> {
    Expected<NodeResolution> result = std::unexpected(Error{Error::Code::UnknownError, "unresolved"});
    if (auto const* component = std::get_if<Document::Component>(&node.node)) {
        auto const& components = registries_.components;
        if (customResolver_ && !components.hasResolver(component->kind) && components.fallback() == nullptr) {
            bp_log("Resolving unknown component kind " + component->kind + " as custom", "Resolver");
            result = customResolver_->resolve(*component, context);
        } else {
            result = components.resolve(*component, context);
        }
    } else {
        auto kind = node.kindName();
        if (auto const* layout = registries_.layouts.find(kind)) {
            result = layout->resolve(node, context);
        } else {
            result = std::unexpected(Error{Error::Code::UnknownKind, "No resolver registered for layout kind '" + kind + "'"});
        }
    }
    if (result && result->view) {
        result->view->setSource(&node, context.scope(), context.path());
    }
    return result;
}

auto Resolver::resolveChildren(std::vector<Document::LayoutNode> const& children,
                               ResolutionContext const&                 context,
                               std::string_view                         pathPrefix) const -> std::vector<IR::RenderNode> {
    std::vector<IR::RenderNode> resolved;
    resolved.reserve(children.size());
    for (std::size_t index = 0; index < children.size(); ++index) {
        auto path   = std::string{pathPrefix} + "[" + std::to_string(index) + "]";
        auto result = resolveNode(children[index], context.withPath(path));
        if (!result) {
            context.reportError(std::move(path), result.error());
            continue;
        }
        if (result->view) {
            if (auto* parent = context.parentViewNode()) {
                parent->addChild(std::move(result->view));
            }
        }
        resolved.push_back(std::move(result->render));
    }
    return resolved;
}

auto Resolver::resolveChildren(std::vector<Document::LayoutNode> const& children,
                               ResolutionContext const&                 context) const -> std::vector<IR::RenderNode> {
    return resolveChildren(children, context, context.path() + ".children");
}

} // namespace BP
