#pragma once

#include <blueprint/document/Document.hpp>
#include <blueprint/ir/RenderTree.hpp>

#include <parallel_hashmap/phmap.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace BP {

// Produces the canonical IR::SectionConfig for one section layout type.
class SectionLayoutConfigResolver {
public:
    virtual ~SectionLayoutConfigResolver() = default;

    [[nodiscard]] virtual auto type() const -> std::string_view                                       = 0;
    [[nodiscard]] virtual auto resolve(Document::SectionLayoutConfig const& config) const -> IR::SectionConfig = 0;
};

using SectionLayoutConfigResolverPtr = std::shared_ptr<SectionLayoutConfigResolver const>;

// Registered resolvers are consulted first; any other type goes through
// ResolveSectionConfig().
class SectionLayoutConfigRegistry {
public:
    auto registerResolver(SectionLayoutConfigResolverPtr resolver) -> void;
    auto unregisterResolver(std::string_view type) -> bool;

    [[nodiscard]] auto hasResolver(std::string_view type) const -> bool;
    [[nodiscard]] auto registeredTypes() const -> std::vector<std::string>;

    [[nodiscard]] auto resolve(Document::SectionLayoutConfig const& config) const -> IR::SectionConfig;

private:
    phmap::flat_hash_map<std::string, SectionLayoutConfigResolverPtr> resolvers_;
};

// Built-in mapping: horizontal | list | grid | flow; other types become
// SectionKind::Custom with customKind set. Defaults: leading alignment, 8pt
// item and line spacing, two fixed grid columns, dividers shown.
[[nodiscard]] auto ResolveSectionConfig(Document::SectionLayoutConfig const& config) -> IR::SectionConfig;

// An empty registry: the built-in mapping already covers the standard types.
[[nodiscard]] auto MakeDefaultSectionLayoutConfigs() -> SectionLayoutConfigRegistry;

} // namespace BP
