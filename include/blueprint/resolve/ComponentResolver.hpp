#pragma once

#include <blueprint/core/Error.hpp>
#include <blueprint/document/Document.hpp>
#include <blueprint/resolve/ResolutionContext.hpp>

#include <parallel_hashmap/phmap.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace BP {

// Strategy turning one component kind into one IR node.
class ComponentResolver {
public:
    virtual ~ComponentResolver() = default;

    [[nodiscard]] virtual auto kind() const -> std::string_view = 0;
    [[nodiscard]] virtual auto resolve(Document::Component const& component,
                                       ResolutionContext const& context) const -> Expected<NodeResolution> = 0;
};

using ComponentResolverPtr = std::shared_ptr<ComponentResolver const>;

/**
 * ComponentResolverRegistry: component kind to resolver.
 *
 * An explicit object built at startup and handed to the Resolver by
 * reference; there is no process-wide instance. Copies share the resolver
 * objects, which are immutable.
 */
class ComponentResolverRegistry {
public:
    // Registers under resolver->kind().
    auto registerResolver(ComponentResolverPtr resolver) -> void;
    // Registers under an explicit kind, e.g. an alias.
    auto registerResolver(std::string kind, ComponentResolverPtr resolver) -> void;
    auto unregisterResolver(std::string_view kind) -> bool;

    [[nodiscard]] auto hasResolver(std::string_view kind) const -> bool;
    [[nodiscard]] auto find(std::string_view kind) const -> ComponentResolver const*;
    [[nodiscard]] auto registeredKinds() const -> std::vector<std::string>;

    // Used for kinds nobody registered; without one they are UnknownKind errors.
    auto setFallback(ComponentResolverPtr fallback) -> void { fallback_ = std::move(fallback); }
    [[nodiscard]] auto fallback() const -> ComponentResolver const* { return fallback_.get(); }

    [[nodiscard]] auto resolve(Document::Component const& component,
                               ResolutionContext const& context) const -> Expected<NodeResolution>;

private:
    phmap::flat_hash_map<std::string, ComponentResolverPtr> resolvers_;
    ComponentResolverPtr                                    fallback_;
};

// text (and its alias label), button, image, textfield, toggle, slider,
// divider, gradient, shape, pageIndicator.
[[nodiscard]] auto MakeDefaultComponentResolvers() -> ComponentResolverRegistry;

// Produces IR::CustomNode carrying the component's extra properties; usable as
// the registry fallback or registered for a host-rendered kind.
[[nodiscard]] auto MakeCustomComponentResolver(std::string kind = {}) -> ComponentResolverPtr;

// Appearance and padding shared by every built-in: the resolved style chain
// with node padding merged over style padding.
[[nodiscard]] auto ResolveComponentStyle(Document::Component const& component,
                                         ResolutionContext const& context,
                                         IR::RenderNode& render) -> Expected<ResolvedStyle>;

} // namespace BP
