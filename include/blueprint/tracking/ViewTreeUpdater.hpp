#pragma once

#include <blueprint/tracking/DependencyIndex.hpp>
#include <blueprint/tracking/DependencyTracker.hpp>
#include <blueprint/tracking/ViewNode.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace BP {

/**
 * ViewTreeUpdater: turns state changes into the set of view nodes to resolve again.
 *
 * Purpose
 * -------
 * Keeps the DependencyIndex in step with the ViewNode tree and accumulates
 * pending node ids as changed paths arrive. minimalUpdateSet() drops every
 * pending node that has a pending ancestor, since resolving the ancestor
 * resolves the descendant too.
 *
 * Notes
 * -----
 * - Does not own the tree; the owner calls setRoot() after a full pass and
 *   replaceSubtree() after each spliced re-resolution.
 * - Must only be touched from the resolution context.
 */
class ViewTreeUpdater {
public:
    auto setRoot(ViewNode* root) -> void;
    [[nodiscard]] auto root() const -> ViewNode* { return root_; }

    auto registerSubtree(ViewNode& node) -> void;
    auto unregisterSubtree(ViewNode const& node) -> void;
    // Unregisters `previous` and registers `replacement` in its place.
    auto replaceSubtree(ViewNode const& previous, ViewNode& replacement) -> void;

    // Returns the number of nodes newly marked.
    auto handleStateChange(std::string_view path) -> std::size_t;
    auto processDirtyPaths(std::vector<std::string> const& paths) -> std::size_t;
    // "local.<path>" readers below the declaring node.
    auto handleLocalStateChange(ViewNode const& scopeNode, std::string_view path) -> std::size_t;

    [[nodiscard]] auto find(std::uint64_t trackingId) const -> ViewNode*;
    [[nodiscard]] auto pendingUpdates() const -> std::vector<ViewNode*>;
    [[nodiscard]] auto minimalUpdateSet() const -> std::vector<ViewNode*>;
    [[nodiscard]] auto updatesByDepth() const -> std::vector<std::vector<ViewNode*>>;
    [[nodiscard]] auto hasUpdates() const -> bool { return !pending_.empty(); }

    auto markNodeUpdated(std::uint64_t trackingId) -> void;
    auto clearPendingUpdates() -> void;

    [[nodiscard]] auto index() const -> DependencyIndex const& { return index_; }

private:
    auto markPending(TrackingIdSet const& ids) -> std::size_t;

    ViewNode*                                          root_ = nullptr;
    DependencyIndex                                    index_;
    phmap::flat_hash_map<std::uint64_t, ViewNode*>     nodes_;
    TrackingIdSet                                      pending_;
};

} // namespace BP
