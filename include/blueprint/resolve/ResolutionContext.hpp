#pragma once

#include <blueprint/actions/ActionResolver.hpp>
#include <blueprint/core/Error.hpp>
#include <blueprint/document/Document.hpp>
#include <blueprint/ir/RenderTree.hpp>
#include <blueprint/state/StateStore.hpp>
#include <blueprint/style/StyleResolver.hpp>
#include <blueprint/tracking/DependencyTracker.hpp>
#include <blueprint/tracking/ViewNode.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BP {

class Resolver;

// Output of resolving one Document node: the IR node and, when tracking, the
// ViewNode that recorded its dependencies.
struct NodeResolution {
    IR::RenderNode            render;
    std::unique_ptr<ViewNode> view;
};

struct ResolutionError {
    std::string path; // e.g. "root.children[2].children[0]"
    Error       error;
};

// State shared by every context of one resolution pass.
struct ResolutionSession {
    Document::Definition const*   document = nullptr;
    StyleResolver const*          styles   = nullptr;
    StateStore*                   state    = nullptr;
    DependencyTracker*            tracker  = nullptr; // null when tracking is off
    Resolver const*               resolver = nullptr;
    ActionResolverRegistry const* actions  = nullptr;
    std::vector<ResolutionError>* errors   = nullptr;
    std::uint64_t                 nextTrackingId = 1;
    // Handed to the first node created; keeps a re-resolved subtree root on its old id.
    std::optional<std::uint64_t>  reservedTrackingId;
    // Local state of a replaced subtree, by resolution path, restored on re-resolution.
    phmap::flat_hash_map<std::string, Value::Object> preservedLocalState;

    auto takeTrackingId() -> std::uint64_t;
};

struct ContentResolution {
    std::string                content;
    std::optional<std::string> bindingPath;
    std::optional<std::string> bindingTemplate;

    [[nodiscard]] auto isDynamic() const -> bool { return bindingPath || bindingTemplate; }
};

/**
 * ResolutionContext: what a resolver sees while resolving one node.
 *
 * Purpose
 * -------
 * Carries the session (document, styles, store, tracker, errors) plus the
 * position in the tree: the parent ViewNode, the loop variables in scope and
 * a readable node path. As a StateReader it layers loop variables over
 * "local." bindings over the StateStore, and records each store read on the
 * open tracking bracket.
 *
 * Notes
 * -----
 * - Contexts are cheap values; with*() returns a modified copy.
 * - Untracked passes still see declared local state (its initial values).
 */
class ResolutionContext : public StateReader {
public:
    explicit ResolutionContext(ResolutionSession& session);

    [[nodiscard]] auto read(std::string_view path) const -> std::optional<Value> override;

    [[nodiscard]] auto session() const -> ResolutionSession& { return *session_; }
    [[nodiscard]] auto document() const -> Document::Definition const& { return *session_->document; }
    [[nodiscard]] auto styles() const -> StyleResolver const& { return *session_->styles; }
    [[nodiscard]] auto state() const -> StateStore& { return *session_->state; }
    [[nodiscard]] auto tracker() const -> DependencyTracker* { return session_->tracker; }
    [[nodiscard]] auto isTracking() const -> bool { return session_->tracker != nullptr; }
    [[nodiscard]] auto resolver() const -> Resolver const& { return *session_->resolver; }

    [[nodiscard]] auto parentViewNode() const -> ViewNode* { return parent_; }
    [[nodiscard]] auto scope() const -> IterationScopePtr const& { return scope_; }
    [[nodiscard]] auto path() const -> std::string const& { return path_; }

    [[nodiscard]] auto withParent(ViewNode* parent) const -> ResolutionContext;
    [[nodiscard]] auto withIterationVariables(Value::Object bindings) const -> ResolutionContext;
    [[nodiscard]] auto withPath(std::string path) const -> ResolutionContext;
    [[nodiscard]] auto withScope(IterationScopePtr scope) const -> ResolutionContext;
    [[nodiscard]] auto withLocalState(Value::Object const* localState) const -> ResolutionContext;

    // Reads "local.<path>" against the nearest declaring node.
    [[nodiscard]] auto readLocal(std::string_view path) const -> std::optional<Value>;

    // Template text with ${...} spans, or a plain string.
    [[nodiscard]] auto interpolate(std::string_view text) const -> std::string;
    [[nodiscard]] auto evaluate(std::string_view expression) const -> Value;
    // Truthiness of an expression or bare path ("isOn", "${flag}", "items.isEmpty").
    [[nodiscard]] auto evaluateCondition(std::string_view expression) const -> bool;

    // dataSourceId, then data["value"], then text.
    [[nodiscard]] auto resolveContent(Document::Component const& component) const -> ContentResolution;

    // Two-way binding target for bind/localBind, recording the write.
    [[nodiscard]] auto bindingFor(Document::Component const& component) const -> std::optional<IR::StateBinding>;
    [[nodiscard]] auto bindingValue(IR::StateBinding const& binding) const -> std::optional<Value>;

    // Resolves the node's style chain plus inline style; a cycle is returned as an error.
    [[nodiscard]] auto resolveStyle(std::optional<std::string> const& styleId,
                                    std::optional<Document::Style> const& inlineStyle) const -> Expected<ResolvedStyle>;

    // Ids pass through; inline actions are resolved. A failure is reported and yields nothing.
    [[nodiscard]] auto resolveAction(std::optional<Document::ActionBinding> const& binding) const
            -> std::optional<IR::ActionReference>;

    auto reportError(std::string path, Error error) const -> void;

private:
    ResolutionSession*   session_;
    ViewNode*            parent_ = nullptr;
    IterationScopePtr    scope_;
    Value::Object const* untrackedLocal_ = nullptr;
    std::string          path_           = "root";
};

/**
 * TrackedNode: brackets the resolution of one node.
 *
 * When tracking is on it creates the ViewNode, declares its local state and
 * opens a tracking bracket that stays open until finish(). context() is the
 * context to use for the node's own reads and for its children.
 */
class TrackedNode {
public:
    TrackedNode(ResolutionContext const& context,
                std::string id,
                std::string kind,
                std::optional<Value::Object> const& localState);
    ~TrackedNode();

    TrackedNode(TrackedNode const&)            = delete;
    TrackedNode& operator=(TrackedNode const&) = delete;

    [[nodiscard]] auto context() const -> ResolutionContext const& { return context_; }
    [[nodiscard]] auto viewNode() const -> ViewNode* { return view_.get(); }
    [[nodiscard]] auto id() const -> std::string const& { return id_; }

    // Closes the bracket, stamps the tracking id and packages the result.
    auto finish(IR::RenderNode render) -> NodeResolution;

private:
    std::string                  id_;
    std::unique_ptr<ViewNode>    view_;
    DependencyTracker*           tracker_ = nullptr;
    bool                         open_    = false;
    std::optional<Value::Object> untrackedState_;
    ResolutionContext            context_;
};

} // namespace BP
