#include <blueprint/resolve/ResolutionContext.hpp>

#include <blueprint/state/Expressions.hpp>
#include <blueprint/state/KeyPath.hpp>

#include "log/TaggedLogger.hpp"

namespace BP {

auto ResolutionSession::takeTrackingId() -> std::uint64_t {
    if (reservedTrackingId) {
        auto id = *reservedTrackingId;
        reservedTrackingId.reset();
        return id;
    }
    return nextTrackingId++;
}

ResolutionContext::ResolutionContext(ResolutionSession& session)
    : session_(&session) {}

auto ResolutionContext::read(std::string_view path) const -> std::optional<Value> {
    if (scope_) {
        auto segments = KeyPath::Split(path);
        if (!segments.empty() && scope_->binds(segments.front())) {
            return scope_->lookup(path);
        }
    }
    if (path.starts_with(LocalPathPrefix)) {
        return readLocal(path.substr(LocalPathPrefix.size()));
    }
    if (auto* tracker = session_->tracker) {
        tracker->recordRead(path);
    }
    return session_->state->get(path);
}

auto ResolutionContext::readLocal(std::string_view path) const -> std::optional<Value> {
    if (auto* tracker = session_->tracker) {
        tracker->recordLocalRead(path);
        auto* scopeNode = parent_ != nullptr ? parent_->nearestLocalStateScope() : nullptr;
        if (scopeNode == nullptr) {
            return std::nullopt;
        }
        return scopeNode->localValue(path);
    }
    if (untrackedLocal_ == nullptr) {
        return std::nullopt;
    }
    auto segments = KeyPath::Split(path);
    if (segments.empty()) {
        return std::nullopt;
    }
    auto it = untrackedLocal_->find(segments.front());
    if (it == untrackedLocal_->end()) {
        return std::nullopt;
    }
    if (auto const* found = KeyPath::Find(it->second, segments, 1)) {
        return *found;
    }
    return std::nullopt;
}

auto ResolutionContext::withParent(ViewNode* parent) const -> ResolutionContext {
    auto copy    = *this;
    copy.parent_ = parent;
    return copy;
}

auto ResolutionContext::withIterationVariables(Value::Object bindings) const -> ResolutionContext {
    auto scope      = std::make_shared<IterationScope>();
    scope->parent   = scope_;
    scope->bindings = std::move(bindings);
    auto copy       = *this;
    copy.scope_     = std::move(scope);
    return copy;
}

auto ResolutionContext::withPath(std::string path) const -> ResolutionContext {
    auto copy  = *this;
    copy.path_ = std::move(path);
    return copy;
}

auto ResolutionContext::withScope(IterationScopePtr scope) const -> ResolutionContext {
    auto copy   = *this;
    copy.scope_ = std::move(scope);
    return copy;
}

auto ResolutionContext::withLocalState(Value::Object const* localState) const -> ResolutionContext {
    auto copy            = *this;
    copy.untrackedLocal_ = localState;
    return copy;
}

auto ResolutionContext::interpolate(std::string_view text) const -> std::string {
    if (!Expressions::ContainsExpression(text)) {
        return std::string{text};
    }
    return Expressions::Interpolate(text, *this);
}

auto ResolutionContext::evaluate(std::string_view expression) const -> Value {
    return Expressions::Evaluate(expression, *this);
}

auto ResolutionContext::evaluateCondition(std::string_view expression) const -> bool {
    return Expressions::EvaluateCondition(expression, *this);
}

auto ResolutionContext::resolveContent(Document::Component const& component) const -> ContentResolution {
    if (component.dataSourceId) {
        auto const& sources = document().dataSources;
        if (auto it = sources.find(*component.dataSourceId); it != sources.end()) {
            auto const& source = it->second;
            if (source.type == Document::DataSource::Type::Static) {
                return ContentResolution{source.value.value_or(std::string{}), std::nullopt, std::nullopt};
            }
            if (source.path) {
                auto value = read(*source.path);
                return ContentResolution{value ? value->stringify() : std::string{}, source.path, std::nullopt};
            }
            if (source.value) {
                return ContentResolution{interpolate(*source.value), std::nullopt, source.value};
            }
            return ContentResolution{};
        }
        bp_log("Unknown data source id: " + *component.dataSourceId, "Resolver");
    }

    if (auto it = component.data.find("value"); it != component.data.end()) {
        auto const& reference = it->second;
        switch (reference.type) {
        case Document::DataReference::Type::Static:
            return ContentResolution{interpolate(reference.value.value_or(std::string{})), std::nullopt, std::nullopt};
        case Document::DataReference::Type::Binding:
            if (reference.path) {
                auto value = read(*reference.path);
                return ContentResolution{value ? value->stringify() : std::string{}, reference.path, std::nullopt};
            }
            if (reference.templateText) {
                return ContentResolution{interpolate(*reference.templateText), std::nullopt, reference.templateText};
            }
            return ContentResolution{};
        case Document::DataReference::Type::LocalBinding:
            if (reference.path) {
                auto value = readLocal(*reference.path);
                return ContentResolution{value ? value->stringify() : std::string{}, std::nullopt, std::nullopt};
            }
            return ContentResolution{};
        }
    }

    return ContentResolution{interpolate(component.text.value_or(std::string{})), std::nullopt, std::nullopt};
}

auto ResolutionContext::bindingFor(Document::Component const& component) const -> std::optional<IR::StateBinding> {
    if (component.bind) {
        if (auto* tracker = session_->tracker) {
            tracker->recordWrite(*component.bind);
        }
        return IR::StateBinding{IR::StateBinding::Scope::Store, KeyPath::Normalize(*component.bind)};
    }
    if (component.localBind) {
        if (auto* tracker = session_->tracker) {
            tracker->recordLocalWrite(*component.localBind);
        }
        return IR::StateBinding{IR::StateBinding::Scope::Local, KeyPath::Normalize(*component.localBind)};
    }
    return std::nullopt;
}

auto ResolutionContext::bindingValue(IR::StateBinding const& binding) const -> std::optional<Value> {
    if (binding.scope == IR::StateBinding::Scope::Local) {
        return readLocal(binding.path);
    }
    // The write was recorded by bindingFor; this read attributes the same path.
    return read(binding.path);
}

auto ResolutionContext::resolveStyle(std::optional<std::string> const& styleId,
                                     std::optional<Document::Style> const& inlineStyle) const -> Expected<ResolvedStyle> {
    return styles().resolve(styleId, inlineStyle);
}

auto ResolutionContext::resolveAction(std::optional<Document::ActionBinding> const& binding) const
        -> std::optional<IR::ActionReference> {
    if (!binding) {
        return std::nullopt;
    }
    if (session_->actions == nullptr) {
        if (auto const* id = std::get_if<std::string>(&*binding)) {
            return IR::ActionReference{*id};
        }
        return std::nullopt;
    }
    auto reference = session_->actions->resolveBinding(*binding);
    if (!reference) {
        reportError(path_, reference.error());
        return std::nullopt;
    }
    return std::move(*reference);
}

auto ResolutionContext::reportError(std::string path, Error error) const -> void {
    bp_log("Resolution error at " + path + ": " + describeError(error), "Resolver", "Error");
    if (session_->errors != nullptr) {
        session_->errors->push_back(ResolutionError{std::move(path), std::move(error)});
    }
}

TrackedNode::TrackedNode(ResolutionContext const& context,
                         std::string id,
                         std::string kind,
                         std::optional<Value::Object> const& localState)
    : id_(std::move(id)), tracker_(context.tracker()), context_(context) {
    if (tracker_ != nullptr) {
        auto& session = context.session();
        view_         = std::make_unique<ViewNode>(id_, session.takeTrackingId(), std::move(kind));
        view_->setParent(context.parentViewNode());
        if (localState) {
            if (auto preserved = session.preservedLocalState.find(context.path()); preserved != session.preservedLocalState.end()) {
                view_->declareLocalState(std::move(preserved->second));
                session.preservedLocalState.erase(preserved);
            } else {
                view_->declareLocalState(*localState);
            }
        }
        // Local lookups from this node's own reads and from its children start here.
        context_ = context.withParent(view_.get());
        tracker_->beginTracking(*view_);
        open_ = true;
    } else if (localState) {
        untrackedState_ = *localState;
        context_        = context.withLocalState(&*untrackedState_);
    }
}

TrackedNode::~TrackedNode() {
    if (open_) {
        tracker_->endTracking();
    }
}

auto TrackedNode::finish(IR::RenderNode render) -> NodeResolution {
    if (open_) {
        tracker_->endTracking();
        open_ = false;
    }
    render.id = id_;
    if (view_) {
        render.trackingId = view_->trackingId();
    }
    return NodeResolution{std::move(render), std::move(view_)};
}

} // namespace BP
