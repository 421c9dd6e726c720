#include <blueprint/resolve/ReactiveDocument.hpp>

#include "log/TaggedLogger.hpp"

namespace BP {

namespace {

// Full passes and writeLocal need tracking; the rest of the options pass through.
[[nodiscard]] auto tracked(ResolverOptions options) -> ResolverOptions {
    options.tracking = true;
    return options;
}

// True for `root` itself and for every path below it ("root.children[0]" is
// below "root", "root.children[0].x" below "root.children[0]").
[[nodiscard]] auto is_within(std::string_view path, std::string_view root) -> bool {
    if (!path.starts_with(root)) {
        return false;
    }
    return path.size() == root.size() || path[root.size()] == '.' || path[root.size()] == '[';
}

} // namespace

ReactiveDocument::ReactiveDocument(Document::Definition      document,
                                   ResolverRegistries const& registries,
                                   Executor*                 executor,
                                   ResolverOptions           options)
    : document_(std::move(document)),
      registries_(registries),
      resolver_(registries_, tracked(options)),
      executor_(executor),
      store_(document_.state) {}

auto ReactiveDocument::Create(Document::Definition      document,
                              ResolverRegistries const& registries,
                              Executor*                 executor,
                              ResolverOptions           options) -> std::shared_ptr<ReactiveDocument> {
    std::shared_ptr<ReactiveDocument> created{new ReactiveDocument(std::move(document), registries, executor, options)};
    std::weak_ptr<ReactiveDocument>   weak = created;
    created->subscription_ = created->store_.observe("", [weak](std::string const& path, auto const&, auto const&) {
        if (auto self = weak.lock()) {
            self->onStateChange(path);
        }
    });
    return created;
}

ReactiveDocument::~ReactiveDocument() {
    subscription_.cancel();
}

auto ReactiveDocument::setObserver(RenderObserver* observer) -> void {
    std::lock_guard<std::recursive_mutex> lock(resolutionMutex_);
    observer_ = observer;
}

auto ReactiveDocument::start() -> void {
    if (executor_ == nullptr) {
        fullPass();
        return;
    }
    std::weak_ptr<ReactiveDocument> weak = weak_from_this();
    if (auto error = executor_->submit([weak] {
            if (auto self = weak.lock()) {
                self->fullPass();
            }
        })) {
        bp_log("ReactiveDocument could not post the first pass: " + describeError(*error), "ReactiveDocument", "Error");
    }
}

auto ReactiveDocument::fullPass() -> void {
    std::lock_guard<std::recursive_mutex> lock(resolutionMutex_);
    {
        // Everything queued so far is covered by this pass.
        std::lock_guard<std::mutex> pendingLock(pendingMutex_);
        pendingPaths_.clear();
    }
    auto result     = resolver_.resolve(document_, store_);
    tree_           = std::move(result.tree);
    viewRoot_       = std::move(result.viewRoot);
    errors_         = std::move(result.errors);
    nextTrackingId_ = result.nextTrackingId;
    updater_.setRoot(viewRoot_.get());
    ++fullPasses_;
    bp_log("ReactiveDocument " + document_.id + " resolved, errors=" + std::to_string(errors_.size()), "ReactiveDocument");
    if (observer_ != nullptr) {
        observer_->treeResolved(tree_);
    }
}

auto ReactiveDocument::onStateChange(std::string const& path) -> void {
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pendingPaths_.push_back(path);
        if (scheduled_) {
            return;
        }
        scheduled_ = true;
    }
    post();
}

auto ReactiveDocument::post() -> void {
    if (executor_ == nullptr) {
        flush();
        return;
    }
    std::weak_ptr<ReactiveDocument> weak = weak_from_this();
    if (auto error = executor_->submit([weak] {
            if (auto self = weak.lock()) {
                self->flush();
            }
        })) {
        bp_log("ReactiveDocument could not post an update: " + describeError(*error), "ReactiveDocument", "Error");
        std::lock_guard<std::mutex> lock(pendingMutex_);
        scheduled_ = false;
    }
}

auto ReactiveDocument::flush() -> std::size_t {
    std::lock_guard<std::recursive_mutex> lock(resolutionMutex_);
    std::vector<std::string>              paths;
    {
        std::lock_guard<std::mutex> pendingLock(pendingMutex_);
        paths.swap(pendingPaths_);
        scheduled_ = false;
    }
    if (!viewRoot_) {
        // Nothing resolved yet; the first pass will read the current state.
        return 0;
    }
    updater_.processDirtyPaths(paths);
    return processPending();
}

auto ReactiveDocument::processPending() -> std::size_t {
    if (!updater_.hasUpdates()) {
        return 0;
    }
    auto nodes = updater_.minimalUpdateSet();
    for (auto* node : nodes) {
        if (node->source() == nullptr) {
            bp_log("Root is pending, resolving the whole document", "ReactiveDocument");
            fullPass();
            return 0;
        }
    }
    std::size_t resolved = 0;
    for (auto* node : nodes) {
        if (resolveAgain(*node)) {
            ++resolved;
        }
    }
    updater_.clearPendingUpdates();
    return resolved;
}

auto ReactiveDocument::resolveAgain(ViewNode& previous) -> bool {
    auto const trackingId = previous.trackingId();
    auto*      parent     = previous.parent();
    // Errors of the previous resolution of this subtree are replaced, not accumulated.
    std::erase_if(errors_, [&](ResolutionError const& error) { return is_within(error.path, previous.resolutionPath()); });
    auto       result     = resolver_.resolveSubtree(document_, store_, previous, nextTrackingId_, errors_);
    if (!result) {
        // The previous output stays on screen.
        bp_log("Re-resolution of " + previous.id() + " failed: " + describeError(result.error()), "ReactiveDocument", "Error");
        errors_.push_back(ResolutionError{previous.resolutionPath(), result.error()});
        updater_.markNodeUpdated(trackingId);
        return false;
    }
    if (parent == nullptr || !result->view) {
        bp_log("Re-resolved node " + previous.id() + " cannot be spliced", "ReactiveDocument", "Error");
        return false;
    }

    updater_.replaceSubtree(previous, *result->view);
    auto replaced = parent->replaceChild(trackingId, std::move(result->view));
    if (!replaced) {
        bp_log("ViewNode " + std::to_string(trackingId) + " vanished from its parent", "ReactiveDocument", "Error");
    }
    if (!IR::ReplaceTracked(tree_.root, trackingId, std::move(result->render))) {
        bp_log("RenderNode " + std::to_string(trackingId) + " not found for splice", "ReactiveDocument", "Error");
        return false;
    }
    ++subtreeResolutions_;
    if (observer_ != nullptr) {
        if (auto const* updated = IR::FindTracked(tree_.root, trackingId)) {
            observer_->subtreeUpdated(*updated);
        }
    }
    return true;
}

auto ReactiveDocument::writeLocal(std::uint64_t trackingId, std::string_view path, Value value) -> Expected<void> {
    std::lock_guard<std::recursive_mutex> lock(resolutionMutex_);
    auto*                                 node = updater_.find(trackingId);
    if (node == nullptr) {
        return std::unexpected(Error{Error::Code::NotFound, "No view node with tracking id " + std::to_string(trackingId)});
    }
    auto* scope = node->nearestLocalStateScope();
    if (scope == nullptr) {
        return std::unexpected(Error{Error::Code::NotFound, "Node " + node->id() + " has no local state in scope"});
    }
    if (!scope->setLocalValue(path, std::move(value))) {
        return std::unexpected(Error{Error::Code::InvalidPath, "Local state path '" + std::string{path} + "' cannot be written"});
    }
    updater_.handleLocalStateChange(*scope, path);
    processPending();
    return {};
}

} // namespace BP
