#pragma once

#include <blueprint/tracking/ViewNode.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace BP {

using TrackingIdSet = phmap::flat_hash_set<std::uint64_t>;

// Reverse index from read path to the view nodes that read it.
class DependencyIndex {
public:
    auto registerNode(ViewNode const& node) -> void;
    auto unregisterNode(std::uint64_t trackingId) -> void;
    auto updateRegistration(ViewNode const& node) -> void;
    auto clear() -> void;

    // Nodes whose read set holds a changed path, an ancestor of it (array
    // count/contains reads) or a descendant of it (whole-object writes).
    [[nodiscard]] auto nodesAffectedBy(std::string_view changedPath) const -> TrackingIdSet;
    [[nodiscard]] auto nodesAffectedBy(std::vector<std::string> const& changedPaths) const -> TrackingIdSet;

    [[nodiscard]] auto nodesReading(std::string_view path) const -> TrackingIdSet;
    [[nodiscard]] auto registeredCount() const -> std::size_t { return nodeToPaths_.size(); }

private:
    phmap::flat_hash_map<std::string, TrackingIdSet>              pathToNodes_;
    phmap::flat_hash_map<std::uint64_t, std::vector<std::string>> nodeToPaths_;
};

} // namespace BP
