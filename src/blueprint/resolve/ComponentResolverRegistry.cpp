#include <blueprint/resolve/ComponentResolver.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace BP {

auto ComponentResolverRegistry::registerResolver(ComponentResolverPtr resolver) -> void {
    if (!resolver) {
        return;
    }
    std::string kind{resolver->kind()};
    registerResolver(std::move(kind), std::move(resolver));
}

auto ComponentResolverRegistry::registerResolver(std::string kind, ComponentResolverPtr resolver) -> void {
    if (!resolver) {
        return;
    }
    if (resolvers_.contains(kind)) {
        bp_log("Replacing component resolver for kind " + kind, "Registry");
    }
    resolvers_[std::move(kind)] = std::move(resolver);
}

auto ComponentResolverRegistry::unregisterResolver(std::string_view kind) -> bool {
    return resolvers_.erase(std::string{kind}) > 0;
}

auto ComponentResolverRegistry::hasResolver(std::string_view kind) const -> bool {
    return resolvers_.contains(std::string{kind});
}

auto ComponentResolverRegistry::find(std::string_view kind) const -> ComponentResolver const* {
    auto it = resolvers_.find(std::string{kind});
    return it == resolvers_.end() ? nullptr : it->second.get();
}

auto ComponentResolverRegistry::registeredKinds() const -> std::vector<std::string> {
    std::vector<std::string> kinds;
    kinds.reserve(resolvers_.size());
    for (auto const& [kind, resolver] : resolvers_) {
        kinds.push_back(kind);
    }
    std::sort(kinds.begin(), kinds.end());
    return kinds;
}

auto ComponentResolverRegistry::resolve(Document::Component const& component,
                                        ResolutionContext const& context) const -> Expected<NodeResolution> {
    if (auto const* resolver = find(component.kind)) {
        return resolver->resolve(component, context);
    }
    if (fallback_) {
        bp_log("No resolver for component kind " + component.kind + ", using fallback", "Registry");
        return fallback_->resolve(component, context);
    }
    return std::unexpected(Error{Error::Code::UnknownKind, "No resolver registered for component kind '" + component.kind + "'"});
}

auto ResolveComponentStyle(Document::Component const& component,
                           ResolutionContext const& context,
                           IR::RenderNode& render) -> Expected<ResolvedStyle> {
    auto style = context.resolveStyle(component.styleId, component.style);
    if (!style) {
        return std::unexpected(style.error());
    }
    render.appearance = style->toAppearance();
    render.padding    = style->padding(component.padding);
    return style;
}

} // namespace BP
