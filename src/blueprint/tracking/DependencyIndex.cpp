#include <blueprint/tracking/DependencyIndex.hpp>

#include <blueprint/state/KeyPath.hpp>

#include "log/TaggedLogger.hpp"

namespace BP {

auto DependencyIndex::registerNode(ViewNode const& node) -> void {
    unregisterNode(node.trackingId());
    std::vector<std::string> paths;
    paths.reserve(node.readPaths().size());
    for (auto const& path : node.readPaths()) {
        pathToNodes_[path].insert(node.trackingId());
        paths.push_back(path);
    }
    bp_log("DependencyIndex register " + node.id() + " paths=" + std::to_string(paths.size()), "DependencyIndex");
    nodeToPaths_[node.trackingId()] = std::move(paths);
}

auto DependencyIndex::unregisterNode(std::uint64_t trackingId) -> void {
    auto it = nodeToPaths_.find(trackingId);
    if (it == nodeToPaths_.end()) {
        return;
    }
    for (auto const& path : it->second) {
        auto entry = pathToNodes_.find(path);
        if (entry == pathToNodes_.end()) {
            continue;
        }
        entry->second.erase(trackingId);
        if (entry->second.empty()) {
            pathToNodes_.erase(entry);
        }
    }
    nodeToPaths_.erase(it);
}

auto DependencyIndex::updateRegistration(ViewNode const& node) -> void {
    registerNode(node);
}

auto DependencyIndex::clear() -> void {
    pathToNodes_.clear();
    nodeToPaths_.clear();
}

auto DependencyIndex::nodesAffectedBy(std::string_view changedPath) const -> TrackingIdSet {
    TrackingIdSet affected;
    auto const    normalized = KeyPath::Normalize(changedPath);
    for (auto const& [path, ids] : pathToNodes_) {
        if (KeyPath::Overlaps(path, normalized)) {
            affected.insert(ids.begin(), ids.end());
        }
    }
    return affected;
}

auto DependencyIndex::nodesAffectedBy(std::vector<std::string> const& changedPaths) const -> TrackingIdSet {
    TrackingIdSet affected;
    for (auto const& path : changedPaths) {
        auto ids = nodesAffectedBy(path);
        affected.insert(ids.begin(), ids.end());
    }
    return affected;
}

auto DependencyIndex::nodesReading(std::string_view path) const -> TrackingIdSet {
    auto it = pathToNodes_.find(std::string{path});
    if (it == pathToNodes_.end()) {
        return {};
    }
    return it->second;
}

} // namespace BP
