#include <blueprint/tracking/ViewNode.hpp>

#include <blueprint/state/KeyPath.hpp>

#include <algorithm>

namespace BP {

auto IterationScope::lookup(std::string_view path) const -> std::optional<Value> {
    auto segments = KeyPath::Split(path);
    if (segments.empty()) {
        return std::nullopt;
    }
    for (auto const* scope = this; scope != nullptr; scope = scope->parent.get()) {
        auto it = scope->bindings.find(segments.front());
        if (it == scope->bindings.end()) {
            continue;
        }
        if (auto const* found = KeyPath::Find(it->second, segments, 1)) {
            return *found;
        }
        // The variable shadows anything outside, even when the sub-path is missing.
        return std::nullopt;
    }
    return std::nullopt;
}

auto IterationScope::binds(std::string_view name) const -> bool {
    for (auto const* scope = this; scope != nullptr; scope = scope->parent.get()) {
        if (scope->bindings.contains(name)) {
            return true;
        }
    }
    return false;
}

ViewNode::ViewNode(std::string id, std::uint64_t trackingId, std::string kind)
    : id_(std::move(id)), trackingId_(trackingId), kind_(std::move(kind)) {}

auto ViewNode::addChild(std::unique_ptr<ViewNode> child) -> ViewNode& {
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

auto ViewNode::replaceChild(std::uint64_t trackingId, std::unique_ptr<ViewNode> replacement) -> std::unique_ptr<ViewNode> {
    auto it = std::find_if(children_.begin(), children_.end(),
                           [trackingId](auto const& child) { return child->trackingId() == trackingId; });
    if (it == children_.end()) {
        return nullptr;
    }
    replacement->parent_ = this;
    auto previous        = std::move(*it);
    *it                  = std::move(replacement);
    previous->parent_    = nullptr;
    return previous;
}

auto ViewNode::setDependencies(PathSet reads, PathSet writes) -> void {
    readPaths_  = std::move(reads);
    writePaths_ = std::move(writes);
}

auto ViewNode::setSource(Document::LayoutNode const* source, IterationScopePtr scope, std::string resolutionPath) -> void {
    source_         = source;
    scope_          = std::move(scope);
    resolutionPath_ = std::move(resolutionPath);
}

auto ViewNode::declareLocalState(Value::Object initial) -> void {
    localState_ = std::move(initial);
}

auto ViewNode::localValue(std::string_view path) const -> std::optional<Value> {
    if (!localState_) {
        return std::nullopt;
    }
    auto segments = KeyPath::Split(path);
    if (segments.empty()) {
        return std::nullopt;
    }
    auto it = localState_->find(segments.front());
    if (it == localState_->end()) {
        return std::nullopt;
    }
    if (auto const* found = KeyPath::Find(it->second, segments, 1)) {
        return *found;
    }
    return std::nullopt;
}

auto ViewNode::setLocalValue(std::string_view path, Value value) -> bool {
    auto segments = KeyPath::Split(path);
    if (segments.empty()) {
        return false;
    }
    if (!localState_) {
        localState_.emplace();
    }
    Value root{std::move(*localState_)};
    auto* slot = KeyPath::Ensure(root, segments);
    if (slot != nullptr) {
        *slot = std::move(value);
    }
    localState_ = std::move(*root.asObject());
    return slot != nullptr;
}

auto ViewNode::nearestLocalStateScope() -> ViewNode* {
    for (auto* node = this; node != nullptr; node = node->parent_) {
        if (node->localState_) {
            return node;
        }
    }
    return nullptr;
}

auto ViewNode::findNode(std::string_view id) -> ViewNode* {
    if (id_ == id) {
        return this;
    }
    for (auto& child : children_) {
        if (auto* found = child->findNode(id)) {
            return found;
        }
    }
    return nullptr;
}

auto ViewNode::findTracked(std::uint64_t trackingId) -> ViewNode* {
    if (trackingId_ == trackingId) {
        return this;
    }
    for (auto& child : children_) {
        if (auto* found = child->findTracked(trackingId)) {
            return found;
        }
    }
    return nullptr;
}

auto ViewNode::allDescendants() const -> std::vector<ViewNode*> {
    std::vector<ViewNode*> result;
    for (auto const& child : children_) {
        result.push_back(child.get());
        auto nested = child->allDescendants();
        result.insert(result.end(), nested.begin(), nested.end());
    }
    return result;
}

auto ViewNode::pathFromRoot() const -> std::vector<ViewNode const*> {
    std::vector<ViewNode const*> path;
    for (auto const* node = this; node != nullptr; node = node->parent_) {
        path.push_back(node);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

auto ViewNode::depth() const -> std::size_t {
    std::size_t depth = 0;
    for (auto const* node = parent_; node != nullptr; node = node->parent_) {
        ++depth;
    }
    return depth;
}

auto ViewNode::isDescendantOf(ViewNode const& ancestor) const -> bool {
    for (auto const* node = parent_; node != nullptr; node = node->parent_) {
        if (node == &ancestor) {
            return true;
        }
    }
    return false;
}

} // namespace BP
