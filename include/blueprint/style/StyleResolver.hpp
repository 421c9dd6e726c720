#pragma once

#include <blueprint/core/Error.hpp>
#include <blueprint/document/Document.hpp>
#include <blueprint/style/ResolvedStyle.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace BP {

// Host-supplied style tokens, addressed from documents as "@reference".
class DesignSystemProvider {
public:
    virtual ~DesignSystemProvider() = default;

    [[nodiscard]] virtual auto identifier() const -> std::string_view                                   = 0;
    [[nodiscard]] virtual auto resolveStyle(std::string_view reference) const -> std::optional<ResolvedStyle> = 0;
};

/**
 * StyleResolver: folds a document style and its ancestors.
 *
 * resolve("c") for the chain a <- b <- c merges a, then b, then c into one
 * ResolvedStyle. A chain that revisits an id is a CyclicReference error.
 * Unknown local ids contribute an empty style. Ids starting with '@' (also as
 * an `inherits` target) are answered by the DesignSystemProvider.
 */
class StyleResolver {
public:
    using StyleMap = std::map<std::string, Document::Style>;

    explicit StyleResolver(StyleMap const& styles, DesignSystemProvider const* designSystem = nullptr);

    [[nodiscard]] auto resolve(std::string_view styleId) const -> Expected<ResolvedStyle>;

    // The inline style is folded last and wins over the chain.
    [[nodiscard]] auto resolve(std::optional<std::string> const& styleId,
                               std::optional<Document::Style> const& inlineStyle) const -> Expected<ResolvedStyle>;

    [[nodiscard]] auto designSystem() const -> DesignSystemProvider const* { return designSystem_; }

private:
    [[nodiscard]] auto designSystemStyle(std::string_view styleId) const -> ResolvedStyle;

    StyleMap const*             styles_;
    DesignSystemProvider const* designSystem_;
};

} // namespace BP
