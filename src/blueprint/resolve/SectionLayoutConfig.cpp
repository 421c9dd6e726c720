#include <blueprint/resolve/SectionLayoutConfig.hpp>

#include <blueprint/style/ResolvedStyle.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace BP {

auto SectionLayoutConfigRegistry::registerResolver(SectionLayoutConfigResolverPtr resolver) -> void {
    if (!resolver) {
        return;
    }
    std::string type{resolver->type()};
    resolvers_[std::move(type)] = std::move(resolver);
}

auto SectionLayoutConfigRegistry::unregisterResolver(std::string_view type) -> bool {
    return resolvers_.erase(std::string{type}) > 0;
}

auto SectionLayoutConfigRegistry::hasResolver(std::string_view type) const -> bool {
    return resolvers_.contains(std::string{type});
}

auto SectionLayoutConfigRegistry::registeredTypes() const -> std::vector<std::string> {
    std::vector<std::string> types;
    types.reserve(resolvers_.size());
    for (auto const& [type, resolver] : resolvers_) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

auto SectionLayoutConfigRegistry::resolve(Document::SectionLayoutConfig const& config) const -> IR::SectionConfig {
    if (auto it = resolvers_.find(config.type); it != resolvers_.end()) {
        return it->second->resolve(config);
    }
    return ResolveSectionConfig(config);
}

auto ResolveSectionConfig(Document::SectionLayoutConfig const& config) -> IR::SectionConfig {
    IR::SectionConfig section;
    if (config.type == "horizontal") {
        section.kind = IR::SectionKind::Horizontal;
    } else if (config.type == "list") {
        section.kind = IR::SectionKind::List;
    } else if (config.type == "grid") {
        section.kind = IR::SectionKind::Grid;
    } else if (config.type == "flow") {
        section.kind = IR::SectionKind::Flow;
    } else {
        bp_log("Section type '" + config.type + "' has no built-in mapping", "Resolver");
        section.kind       = IR::SectionKind::Custom;
        section.customKind = config.type;
    }

    if (config.alignment) {
        section.alignment = ToIR(*config.alignment);
    }
    section.itemSpacing = config.itemSpacing.value_or(8.0);
    section.lineSpacing = config.lineSpacing.value_or(8.0);
    if (config.contentInsets) {
        section.contentInsets = ToIR(*config.contentInsets);
    }
    if (config.itemDimensions) {
        if (config.itemDimensions->width) {
            section.itemWidth = ToIR(*config.itemDimensions->width);
        }
        if (config.itemDimensions->height) {
            section.itemHeight = ToIR(*config.itemDimensions->height);
        }
        section.aspectRatio = config.itemDimensions->aspectRatio;
    }
    section.showsIndicators = config.showsIndicators.value_or(false);
    section.isPagingEnabled = config.isPagingEnabled.value_or(false);
    if (config.snapBehavior) {
        switch (*config.snapBehavior) {
        case Document::SnapBehavior::None:
            section.snapBehavior = IR::SnapBehavior::None;
            break;
        case Document::SnapBehavior::ViewAligned:
            section.snapBehavior = IR::SnapBehavior::ViewAligned;
            break;
        case Document::SnapBehavior::Paging:
            section.snapBehavior = IR::SnapBehavior::Paging;
            break;
        }
    }
    if (config.columns) {
        if (config.columns->fixed) {
            section.columns = IR::GridColumns{IR::GridColumns::Kind::Fixed, std::max(*config.columns->fixed, 1), 0.0};
        } else if (config.columns->adaptiveMinWidth) {
            section.columns = IR::GridColumns{IR::GridColumns::Kind::Adaptive, 0, *config.columns->adaptiveMinWidth};
        }
    }
    section.showsDividers = config.showsDividers.value_or(true);
    return section;
}

auto MakeDefaultSectionLayoutConfigs() -> SectionLayoutConfigRegistry {
    return SectionLayoutConfigRegistry{};
}

} // namespace BP
