#pragma once

#include <blueprint/document/Document.hpp>
#include <blueprint/ir/RenderTree.hpp>
#include <blueprint/resolve/Resolver.hpp>
#include <blueprint/state/StateStore.hpp>
#include <blueprint/task/Executor.hpp>
#include <blueprint/tracking/ViewNode.hpp>
#include <blueprint/tracking/ViewTreeUpdater.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace BP {

// Receives render output on the resolution context.
class RenderObserver {
public:
    virtual ~RenderObserver() = default;

    // After the first pass, and after any pass that had to start over from the root.
    virtual auto treeResolved(IR::RenderTree const& tree) -> void = 0;
    // After a re-resolved subtree was spliced into the tree in place.
    virtual auto subtreeUpdated(IR::RenderNode const& node) -> void = 0;
};

/**
 * ReactiveDocument: a document session kept in step with its state.
 *
 * Purpose
 * -------
 * Owns the document, its StateStore, the resolved RenderTree and the ViewNode
 * tree. Every store write is mapped through the dependency index to the nodes
 * that read the written path; only the minimal set of those nodes (no pending
 * ancestor) is resolved again and each result is spliced into the tree by
 * tracking id. Nodes that read nothing affected are never revisited.
 *
 * Notes
 * -----
 * - All resolution runs on the executor given at creation, which must be
 *   serial (a one-thread TaskPool) and outlive the document; without one it
 *   runs inline on the writing thread.
 * - The store may be written from any thread; the change is queued and
 *   re-resolution is posted to the executor.
 * - tree(), viewRoot() and errors() are only meaningful on the resolution
 *   context (or after the executor went idle).
 * - Local state survives re-resolution of the declaring node.
 */
class ReactiveDocument : public std::enable_shared_from_this<ReactiveDocument> {
public:
    [[nodiscard]] static auto Create(Document::Definition      document,
                                     ResolverRegistries const& registries,
                                     Executor*                 executor = nullptr,
                                     ResolverOptions           options  = {}) -> std::shared_ptr<ReactiveDocument>;

    ~ReactiveDocument();

    ReactiveDocument(ReactiveDocument const&)            = delete;
    ReactiveDocument& operator=(ReactiveDocument const&) = delete;

    // Runs the first full pass (posted to the executor when there is one).
    auto start() -> void;
    auto setObserver(RenderObserver* observer) -> void;

    [[nodiscard]] auto document() const -> Document::Definition const& { return document_; }
    [[nodiscard]] auto store() -> StateStore& { return store_; }
    [[nodiscard]] auto tree() const -> IR::RenderTree const& { return tree_; }
    [[nodiscard]] auto viewRoot() const -> ViewNode const* { return viewRoot_.get(); }
    [[nodiscard]] auto errors() const -> std::vector<ResolutionError> const& { return errors_; }
    [[nodiscard]] auto updater() const -> ViewTreeUpdater const& { return updater_; }

    // Writes to the local state visible from the node with `trackingId` (the
    // node itself or its nearest declaring ancestor) and re-resolves the
    // readers of that scope. Must be called on the resolution context.
    auto writeLocal(std::uint64_t trackingId, std::string_view path, Value value) -> Expected<void>;

    // Processes queued changes now. Must be called on the resolution context.
    // Returns the number of subtrees resolved again.
    auto flush() -> std::size_t;

    // Total subtree re-resolutions since start(); a full pass counts as none.
    [[nodiscard]] auto subtreeResolutions() const -> std::size_t { return subtreeResolutions_; }
    [[nodiscard]] auto fullPasses() const -> std::size_t { return fullPasses_; }

private:
    ReactiveDocument(Document::Definition document, ResolverRegistries const& registries, Executor* executor,
                     ResolverOptions options);

    auto onStateChange(std::string const& path) -> void;
    auto post() -> void;
    auto fullPass() -> void;
    auto resolveAgain(ViewNode& previous) -> bool;
    auto processPending() -> std::size_t;

    Document::Definition document_;
    ResolverRegistries   registries_;
    Resolver             resolver_;
    Executor*            executor_;
    StateStore           store_;

    IR::RenderTree               tree_;
    std::unique_ptr<ViewNode>    viewRoot_;
    std::vector<ResolutionError> errors_;
    ViewTreeUpdater              updater_;
    std::uint64_t                nextTrackingId_ = 1;
    RenderObserver*              observer_       = nullptr;
    std::size_t                  subtreeResolutions_ = 0;
    std::size_t                  fullPasses_         = 0;

    // Serializes passes even if the executor runs jobs on several threads.
    std::recursive_mutex resolutionMutex_;

    std::mutex               pendingMutex_;
    std::vector<std::string> pendingPaths_;
    bool                     scheduled_ = false;

    StateStore::Subscription subscription_;
};

} // namespace BP
