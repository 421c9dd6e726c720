#include <blueprint/tracking/DependencyTracker.hpp>

#include <blueprint/state/KeyPath.hpp>

namespace BP {

DependencyTracker::Scope::Scope(DependencyTracker* tracker, ViewNode* node)
    : tracker_(node != nullptr ? tracker : nullptr) {
    if (tracker_ != nullptr) {
        tracker_->beginTracking(*node);
    }
}

DependencyTracker::Scope::~Scope() {
    if (tracker_ != nullptr) {
        tracker_->endTracking();
    }
}

auto DependencyTracker::beginTracking(ViewNode& node) -> void {
    stack_.push_back(Frame{&node, {}, {}});
}

auto DependencyTracker::endTracking() -> void {
    if (stack_.empty()) {
        return;
    }
    auto frame = std::move(stack_.back());
    stack_.pop_back();
    frame.node->setDependencies(std::move(frame.reads), std::move(frame.writes));
}

auto DependencyTracker::recordRead(std::string_view path) -> void {
    if (stack_.empty() || path.empty()) {
        return;
    }
    stack_.back().reads.insert(KeyPath::Normalize(path));
}

auto DependencyTracker::recordWrite(std::string_view path) -> void {
    if (stack_.empty() || path.empty()) {
        return;
    }
    auto normalized = KeyPath::Normalize(path);
    stack_.back().reads.insert(normalized);
    stack_.back().writes.insert(std::move(normalized));
}

auto DependencyTracker::recordLocalRead(std::string_view path) -> void {
    recordRead(std::string{LocalPathPrefix} + std::string{path});
}

auto DependencyTracker::recordLocalWrite(std::string_view path) -> void {
    recordWrite(std::string{LocalPathPrefix} + std::string{path});
}

auto DependencyTracker::current() const -> ViewNode* {
    return stack_.empty() ? nullptr : stack_.back().node;
}

} // namespace BP
