#include <blueprint/tracking/ViewTreeUpdater.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <map>

namespace BP {

auto ViewTreeUpdater::setRoot(ViewNode* root) -> void {
    index_.clear();
    nodes_.clear();
    pending_.clear();
    root_ = root;
    if (root_ != nullptr) {
        registerSubtree(*root_);
    }
}

auto ViewTreeUpdater::registerSubtree(ViewNode& node) -> void {
    index_.registerNode(node);
    nodes_[node.trackingId()] = &node;
    for (auto const& child : node.children()) {
        registerSubtree(*child);
    }
}

auto ViewTreeUpdater::unregisterSubtree(ViewNode const& node) -> void {
    for (auto const& child : node.children()) {
        unregisterSubtree(*child);
    }
    index_.unregisterNode(node.trackingId());
    nodes_.erase(node.trackingId());
    pending_.erase(node.trackingId());
}

auto ViewTreeUpdater::replaceSubtree(ViewNode const& previous, ViewNode& replacement) -> void {
    unregisterSubtree(previous);
    registerSubtree(replacement);
    if (root_ == &previous) {
        root_ = &replacement;
    }
}

auto ViewTreeUpdater::markPending(TrackingIdSet const& ids) -> std::size_t {
    std::size_t marked = 0;
    for (auto id : ids) {
        if (nodes_.contains(id) && pending_.insert(id).second) {
            ++marked;
        }
    }
    return marked;
}

auto ViewTreeUpdater::handleStateChange(std::string_view path) -> std::size_t {
    auto marked = markPending(index_.nodesAffectedBy(path));
    bp_log("ViewTreeUpdater change " + std::string{path} + " marked=" + std::to_string(marked), "ViewTree");
    return marked;
}

auto ViewTreeUpdater::processDirtyPaths(std::vector<std::string> const& paths) -> std::size_t {
    if (paths.empty()) {
        return 0;
    }
    return markPending(index_.nodesAffectedBy(paths));
}

auto ViewTreeUpdater::handleLocalStateChange(ViewNode const& scopeNode, std::string_view path) -> std::size_t {
    auto const    fullPath = std::string{LocalPathPrefix} + std::string{path};
    TrackingIdSet affected;
    for (auto id : index_.nodesAffectedBy(fullPath)) {
        auto it = nodes_.find(id);
        if (it == nodes_.end()) {
            continue;
        }
        // Another scope may declare the same local key.
        if (it->second->nearestLocalStateScope() == &scopeNode) {
            affected.insert(id);
        }
    }
    return markPending(affected);
}

auto ViewTreeUpdater::find(std::uint64_t trackingId) const -> ViewNode* {
    auto it = nodes_.find(trackingId);
    return it == nodes_.end() ? nullptr : it->second;
}

auto ViewTreeUpdater::pendingUpdates() const -> std::vector<ViewNode*> {
    std::vector<ViewNode*> result;
    result.reserve(pending_.size());
    for (auto id : pending_) {
        if (auto* node = find(id)) {
            result.push_back(node);
        }
    }
    std::sort(result.begin(), result.end(),
              [](ViewNode const* lhs, ViewNode const* rhs) { return lhs->trackingId() < rhs->trackingId(); });
    return result;
}

auto ViewTreeUpdater::minimalUpdateSet() const -> std::vector<ViewNode*> {
    std::vector<ViewNode*> minimal;
    for (auto* node : pendingUpdates()) {
        bool hasPendingAncestor = false;
        for (auto* parent = node->parent(); parent != nullptr; parent = parent->parent()) {
            if (pending_.contains(parent->trackingId())) {
                hasPendingAncestor = true;
                break;
            }
        }
        if (!hasPendingAncestor) {
            minimal.push_back(node);
        }
    }
    return minimal;
}

auto ViewTreeUpdater::updatesByDepth() const -> std::vector<std::vector<ViewNode*>> {
    std::map<std::size_t, std::vector<ViewNode*>> byDepth;
    for (auto* node : pendingUpdates()) {
        byDepth[node->depth()].push_back(node);
    }
    std::vector<std::vector<ViewNode*>> result;
    result.reserve(byDepth.size());
    for (auto& [depth, nodes] : byDepth) {
        result.push_back(std::move(nodes));
    }
    return result;
}

auto ViewTreeUpdater::markNodeUpdated(std::uint64_t trackingId) -> void {
    pending_.erase(trackingId);
}

auto ViewTreeUpdater::clearPendingUpdates() -> void {
    pending_.clear();
}

} // namespace BP
