#include <blueprint/resolve/LayoutResolver.hpp>

#include <blueprint/resolve/Resolver.hpp>
#include <blueprint/style/ResolvedStyle.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <iterator>

namespace BP {

namespace {

[[nodiscard]] auto axis_for(Document::LayoutType type) -> IR::Axis {
    switch (type) {
    case Document::LayoutType::VStack:
        return IR::Axis::Vertical;
    case Document::LayoutType::HStack:
        return IR::Axis::Horizontal;
    case Document::LayoutType::ZStack:
        return IR::Axis::Depth;
    }
    return IR::Axis::Vertical;
}

// A vstack aligns its children horizontally, an hstack vertically, a zstack
// on both axes. Whatever the document leaves out is centred.
[[nodiscard]] auto alignment_for(Document::LayoutType type, std::optional<Document::Alignment> const& alignment)
        -> IR::Alignment {
    IR::Alignment result;
    if (!alignment) {
        return result;
    }
    if (type != Document::LayoutType::HStack && alignment->horizontal) {
        result.horizontal = ToIR(*alignment->horizontal);
    }
    if (type != Document::LayoutType::VStack && alignment->vertical) {
        result.vertical = ToIR(*alignment->vertical);
    }
    return result;
}

// Appends a resolved child under its parent, or records why it failed.
auto append_child(Expected<NodeResolution>     result,
                  ResolutionContext const&     context,
                  std::string                  path,
                  std::vector<IR::RenderNode>& out) -> bool {
    if (!result) {
        context.reportError(std::move(path), result.error());
        return false;
    }
    if (result->view) {
        if (auto* parent = context.parentViewNode()) {
            parent->addChild(std::move(result->view));
        }
    }
    out.push_back(std::move(result->render));
    return true;
}

class StackResolver final : public LayoutResolver {
public:
    explicit StackResolver(Document::LayoutType type)
        : type_(type) {}

    auto kind() const -> std::string_view override { return Document::layoutTypeName(type_); }

    auto resolve(Document::LayoutNode const& node, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        auto const* layout = std::get_if<Document::Layout>(&node.node);
        if (layout == nullptr) {
            return std::unexpected(Error{Error::Code::TypeMismatch, "Stack resolver given a " + node.kindName()});
        }
        TrackedNode    tracked(context, layout->id.value_or(context.path()), std::string{kind()}, layout->state);
        auto const&    ctx = tracked.context();
        IR::RenderNode render;

        auto style = ctx.resolveStyle(layout->styleId, layout->style);
        if (!style) {
            return std::unexpected(style.error());
        }
        render.appearance = style->toAppearance();
        render.padding    = style->padding(layout->padding);
        render.payload    = IR::ContainerNode{axis_for(layout->type), alignment_for(layout->type, layout->alignment),
                                           layout->spacing.value_or(0.0)};
        render.children   = ctx.resolver().resolveChildren(layout->children, ctx);
        return tracked.finish(std::move(render));
    }

private:
    Document::LayoutType type_;
};

class SpacerResolver final : public LayoutResolver {
public:
    auto kind() const -> std::string_view override { return "spacer"; }

    auto resolve(Document::LayoutNode const& node, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        auto const* spacer = std::get_if<Document::Spacer>(&node.node);
        if (spacer == nullptr) {
            return std::unexpected(Error{Error::Code::TypeMismatch, "Spacer resolver given a " + node.kindName()});
        }
        TrackedNode    tracked(context, context.path(), "spacer", std::nullopt);
        IR::RenderNode render;
        render.payload = IR::SpacerNode{spacer->minLength};
        if (spacer->width) {
            render.appearance.frame.width = ToIR(*spacer->width);
        }
        if (spacer->height) {
            render.appearance.frame.height = ToIR(*spacer->height);
        }
        return tracked.finish(std::move(render));
    }
};

/**
 * forEach: repeats itemTemplate once per element of the array at `items`.
 *
 * Each instance resolves in its own iteration scope binding itemVariable and
 * indexVariable; the read of `items` is attributed to the forEach node so a
 * change to the array re-resolves the whole repetition. A missing or empty
 * array yields the container with only emptyView (if any) and the id suffix
 * "_empty".
 */
class ForEachResolver final : public LayoutResolver {
public:
    auto kind() const -> std::string_view override { return "forEach"; }

    auto resolve(Document::LayoutNode const& node, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        auto const* forEach = std::get_if<Document::ForEach>(&node.node);
        if (forEach == nullptr) {
            return std::unexpected(Error{Error::Code::TypeMismatch, "forEach resolver given a " + node.kindName()});
        }
        auto const  baseId = forEach->id.value_or("forEach_" + forEach->items);
        TrackedNode tracked(context, baseId, "forEach", std::nullopt);
        auto const& ctx = tracked.context();

        IR::RenderNode render;
        render.payload = IR::ContainerNode{axis_for(forEach->layout), alignment_for(forEach->layout, forEach->alignment),
                                           forEach->spacing.value_or(0.0)};
        if (forEach->padding) {
            render.padding = ToIR(*forEach->padding);
        }

        auto                items = ctx.read(forEach->items);
        Value::Array const* array = items ? items->asArray() : nullptr;
        if (items && array == nullptr && !items->isNull()) {
            bp_log("forEach items at '" + forEach->items + "' is not an array", "Resolver");
        }

        if (array == nullptr || array->empty()) {
            if (forEach->emptyView) {
                auto path = ctx.path() + ".emptyView";
                append_child(ctx.resolver().resolveNode(*forEach->emptyView, ctx.withPath(path)), ctx, path, render.children);
            }
            auto result      = tracked.finish(std::move(render));
            result.render.id = baseId + "_empty";
            return result;
        }

        if (!forEach->itemTemplate) {
            return std::unexpected(Error{Error::Code::MissingParameter, "forEach requires 'itemTemplate'"});
        }

        render.children.reserve(array->size());
        for (std::size_t index = 0; index < array->size(); ++index) {
            Value::Object bindings;
            bindings.emplace(forEach->itemVariable, (*array)[index]);
            bindings.emplace(forEach->indexVariable, Value{static_cast<std::int64_t>(index)});
            auto path    = ctx.path() + ".items[" + std::to_string(index) + "]";
            auto itemCtx = ctx.withIterationVariables(std::move(bindings)).withPath(path);
            append_child(ctx.resolver().resolveNode(*forEach->itemTemplate, itemCtx), itemCtx, path, render.children);
        }
        return tracked.finish(std::move(render));
    }
};

/**
 * sectionLayout: a list of sections, each with its own layout config.
 *
 * Sections have no ViewNode of their own: reads made while assembling them
 * (a data-driven section's dataSource) belong to the sectionLayout node, and
 * their header, items and footer are ordinary child nodes of it. The section
 * RenderNode lists [header] items... [footer] as its children.
 */
class SectionLayoutResolver final : public LayoutResolver {
public:
    auto kind() const -> std::string_view override { return "sectionLayout"; }

    auto resolve(Document::LayoutNode const& node, ResolutionContext const& context) const
            -> Expected<NodeResolution> override {
        auto const* layout = std::get_if<Document::SectionLayout>(&node.node);
        if (layout == nullptr) {
            return std::unexpected(Error{Error::Code::TypeMismatch, "sectionLayout resolver given a " + node.kindName()});
        }
        TrackedNode tracked(context, layout->id.value_or(context.path()), "sectionLayout", std::nullopt);
        auto const& ctx = tracked.context();

        IR::RenderNode render;
        render.payload = IR::SectionLayoutNode{layout->sectionSpacing.value_or(0.0)};
        render.children.reserve(layout->sections.size());
        for (std::size_t index = 0; index < layout->sections.size(); ++index) {
            auto path = ctx.path() + ".sections[" + std::to_string(index) + "]";
            render.children.push_back(resolveSection(layout->sections[index], ctx, path));
        }
        return tracked.finish(std::move(render));
    }

private:
    static auto resolveSection(Document::SectionDefinition const& section,
                               ResolutionContext const&           ctx,
                               std::string const&                 path) -> IR::RenderNode {
        auto const&     resolver = ctx.resolver();
        IR::RenderNode  render;
        IR::SectionNode payload;
        render.id            = section.id.value_or(path);
        payload.config       = resolver.registries().sections.resolve(section.layout);
        payload.stickyHeader = section.stickyHeader.value_or(false);

        if (section.header) {
            auto headerPath   = path + ".header";
            payload.hasHeader = append_child(resolver.resolveNode(*section.header, ctx.withPath(headerPath)), ctx,
                                             headerPath, render.children);
        }

        if (section.dataSource && section.itemTemplate) {
            auto items = ctx.read(*section.dataSource);
            if (auto const* array = items ? items->asArray() : nullptr) {
                for (std::size_t index = 0; index < array->size(); ++index) {
                    Value::Object bindings;
                    bindings.emplace("item", (*array)[index]);
                    bindings.emplace("index", Value{static_cast<std::int64_t>(index)});
                    auto itemPath = path + ".items[" + std::to_string(index) + "]";
                    auto itemCtx  = ctx.withIterationVariables(std::move(bindings)).withPath(itemPath);
                    append_child(resolver.resolveNode(*section.itemTemplate, itemCtx), itemCtx, itemPath, render.children);
                }
            }
        } else {
            auto items = resolver.resolveChildren(section.children, ctx, path + ".children");
            std::move(items.begin(), items.end(), std::back_inserter(render.children));
        }

        if (section.footer) {
            auto footerPath   = path + ".footer";
            payload.hasFooter = append_child(resolver.resolveNode(*section.footer, ctx.withPath(footerPath)), ctx,
                                             footerPath, render.children);
        }
        render.payload = std::move(payload);
        return render;
    }
};

} // namespace

auto LayoutResolverRegistry::registerResolver(LayoutResolverPtr resolver) -> void {
    if (!resolver) {
        return;
    }
    std::string kind{resolver->kind()};
    registerResolver(std::move(kind), std::move(resolver));
}

auto LayoutResolverRegistry::registerResolver(std::string kind, LayoutResolverPtr resolver) -> void {
    if (!resolver) {
        return;
    }
    resolvers_[std::move(kind)] = std::move(resolver);
}

auto LayoutResolverRegistry::unregisterResolver(std::string_view kind) -> bool {
    return resolvers_.erase(std::string{kind}) > 0;
}

auto LayoutResolverRegistry::hasResolver(std::string_view kind) const -> bool {
    return resolvers_.contains(std::string{kind});
}

auto LayoutResolverRegistry::find(std::string_view kind) const -> LayoutResolver const* {
    auto it = resolvers_.find(std::string{kind});
    return it == resolvers_.end() ? nullptr : it->second.get();
}

auto LayoutResolverRegistry::registeredKinds() const -> std::vector<std::string> {
    std::vector<std::string> kinds;
    kinds.reserve(resolvers_.size());
    for (auto const& [kind, resolver] : resolvers_) {
        kinds.push_back(kind);
    }
    std::sort(kinds.begin(), kinds.end());
    return kinds;
}

auto MakeDefaultLayoutResolvers() -> LayoutResolverRegistry {
    LayoutResolverRegistry registry;
    registry.registerResolver(std::make_shared<StackResolver>(Document::LayoutType::VStack));
    registry.registerResolver(std::make_shared<StackResolver>(Document::LayoutType::HStack));
    registry.registerResolver(std::make_shared<StackResolver>(Document::LayoutType::ZStack));
    registry.registerResolver(std::make_shared<SpacerResolver>());
    registry.registerResolver(std::make_shared<ForEachResolver>());
    registry.registerResolver(std::make_shared<SectionLayoutResolver>());
    return registry;
}

} // namespace BP
