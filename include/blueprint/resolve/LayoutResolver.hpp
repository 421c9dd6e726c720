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

// Strategy for one structural node kind: vstack, hstack, zstack, spacer,
// forEach or sectionLayout. Resolvers recurse through context.resolver().
class LayoutResolver {
public:
    virtual ~LayoutResolver() = default;

    [[nodiscard]] virtual auto kind() const -> std::string_view = 0;
    [[nodiscard]] virtual auto resolve(Document::LayoutNode const& node,
                                       ResolutionContext const& context) const -> Expected<NodeResolution> = 0;
};

using LayoutResolverPtr = std::shared_ptr<LayoutResolver const>;

class LayoutResolverRegistry {
public:
    auto registerResolver(LayoutResolverPtr resolver) -> void;
    auto registerResolver(std::string kind, LayoutResolverPtr resolver) -> void;
    auto unregisterResolver(std::string_view kind) -> bool;

    [[nodiscard]] auto hasResolver(std::string_view kind) const -> bool;
    [[nodiscard]] auto find(std::string_view kind) const -> LayoutResolver const*;
    [[nodiscard]] auto registeredKinds() const -> std::vector<std::string>;

private:
    phmap::flat_hash_map<std::string, LayoutResolverPtr> resolvers_;
};

[[nodiscard]] auto MakeDefaultLayoutResolvers() -> LayoutResolverRegistry;

} // namespace BP
