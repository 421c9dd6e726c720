#include <blueprint/style/StyleResolver.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <vector>

namespace BP {
namespace {

auto is_design_system_id(std::string_view styleId) -> bool {
    return !styleId.empty() && styleId.front() == '@';
}

auto describe_chain(std::vector<std::string> const& chain, std::string const& repeated) -> std::string {
    std::string text;
    for (auto const& id : chain) {
        text += id;
        text += " -> ";
    }
    text += repeated;
    return text;
}

} // namespace

StyleResolver::StyleResolver(StyleMap const& styles, DesignSystemProvider const* designSystem)
    : styles_(&styles), designSystem_(designSystem) {}

auto StyleResolver::designSystemStyle(std::string_view styleId) const -> ResolvedStyle {
    auto const reference = styleId.substr(1);
    if (designSystem_ != nullptr) {
        if (auto style = designSystem_->resolveStyle(reference)) {
            return std::move(*style);
        }
    }
    bp_log("Design system style not found: " + std::string{styleId}, "Style");
    return ResolvedStyle{};
}

auto StyleResolver::resolve(std::string_view styleId) const -> Expected<ResolvedStyle> {
    if (is_design_system_id(styleId)) {
        return designSystemStyle(styleId);
    }

    // Leaf first; folded in reverse below.
    std::vector<std::string>             chain;
    std::vector<Document::Style const*>  styles;
    std::optional<std::string>           base;
    std::string                          current{styleId};
    while (true) {
        if (std::find(chain.begin(), chain.end(), current) != chain.end()) {
            auto message = "Style inheritance cycle: " + describe_chain(chain, current);
            bp_log(message, "Style", "Error");
            return std::unexpected(Error{Error::Code::CyclicReference, std::move(message)});
        }
        auto it = styles_->find(current);
        if (it == styles_->end()) {
            bp_log("Unknown style id: " + current, "Style");
            break;
        }
        chain.push_back(current);
        styles.push_back(&it->second);
        if (!it->second.inherits) {
            break;
        }
        if (is_design_system_id(*it->second.inherits)) {
            base = *it->second.inherits;
            break;
        }
        current = *it->second.inherits;
    }

    ResolvedStyle resolved = base ? designSystemStyle(*base) : ResolvedStyle{};
    for (auto it = styles.rbegin(); it != styles.rend(); ++it) {
        resolved.merge(**it);
    }
    return resolved;
}

auto StyleResolver::resolve(std::optional<std::string> const& styleId,
                            std::optional<Document::Style> const& inlineStyle) const -> Expected<ResolvedStyle> {
    ResolvedStyle resolved;
    if (styleId) {
        auto chain = resolve(*styleId);
        if (!chain) {
            return std::unexpected(chain.error());
        }
        resolved = std::move(*chain);
    }
    if (inlineStyle) {
        resolved.merge(*inlineStyle);
    }
    return resolved;
}

} // namespace BP
