#include <doctest/doctest.h>

#include <blueprint/tracking/DependencyIndex.hpp>
#include <blueprint/tracking/DependencyTracker.hpp>
#include <blueprint/tracking/ViewNode.hpp>
#include <blueprint/tracking/ViewTreeUpdater.hpp>

#include <memory>

using namespace BP;

namespace {

// root(1) -> list(2) -> {row(3), row(4)}; root(1) -> footer(5)
struct SampleTree {
    std::unique_ptr<ViewNode> root = std::make_unique<ViewNode>("root", 1, "vstack");
    ViewNode*                 list   = nullptr;
    ViewNode*                 first  = nullptr;
    ViewNode*                 second = nullptr;
    ViewNode*                 footer = nullptr;

    SampleTree() {
        list   = &root->addChild(std::make_unique<ViewNode>("list", 2, "vstack"));
        first  = &list->addChild(std::make_unique<ViewNode>("row0", 3, "text"));
        second = &list->addChild(std::make_unique<ViewNode>("row1", 4, "text"));
        footer = &root->addChild(std::make_unique<ViewNode>("footer", 5, "text"));

        list->setDependencies(PathSet{"items"}, {});
        first->setDependencies(PathSet{"items.0.title"}, {});
        second->setDependencies(PathSet{"items.1.title", "user.name"}, {});
        footer->setDependencies(PathSet{"count"}, {});
    }
};

auto ids(std::vector<ViewNode*> const& nodes) -> std::vector<std::uint64_t> {
    std::vector<std::uint64_t> result;
    for (auto const* node : nodes) {
        result.push_back(node->trackingId());
    }
    return result;
}

} // namespace

TEST_SUITE("tracking.viewnode") {

TEST_CASE("structure queries") {
    SampleTree tree;
    CHECK(tree.second->parent() == tree.list);
    CHECK(tree.second->depth() == 2);
    CHECK(tree.second->isDescendantOf(*tree.root));
    CHECK_FALSE(tree.footer->isDescendantOf(*tree.list));
    CHECK(tree.root->findNode("row1") == tree.second);
    CHECK(tree.root->findTracked(5) == tree.footer);
    CHECK(tree.root->findTracked(77) == nullptr);
    CHECK(tree.root->allDescendants().size() == 4);

    auto path = tree.first->pathFromRoot();
    REQUIRE(path.size() == 3);
    CHECK(path.front() == tree.root.get());
    CHECK(path.back() == tree.first);
}

TEST_CASE("replacing a child hands back the old one detached") {
    SampleTree tree;
    auto previous = tree.list->replaceChild(3, std::make_unique<ViewNode>("row0", 3, "button"));
    REQUIRE(previous != nullptr);
    CHECK(previous->parent() == nullptr);
    CHECK(tree.list->children().front()->kind() == "button");
    CHECK(tree.list->children().front()->parent() == tree.list);
    CHECK(tree.list->replaceChild(99, std::make_unique<ViewNode>("x", 99, "text")) == nullptr);
}

TEST_CASE("local state lives on the declaring node") {
    SampleTree tree;
    tree.list->declareLocalState(Value::Object{{"expanded", Value{false}}});
    CHECK(tree.first->nearestLocalStateScope() == tree.list);
    CHECK(tree.footer->nearestLocalStateScope() == nullptr);
    CHECK(tree.list->localValue("expanded") == Value{false});
    CHECK_FALSE(tree.first->localValue("expanded").has_value());

    tree.list->setLocalValue("draft.text", Value{"hi"});
    CHECK(tree.list->localValue("draft.text") == Value{"hi"});
    CHECK(tree.list->localValue("expanded") == Value{false});
}

TEST_CASE("iteration scopes shadow outer bindings") {
    auto outer = std::make_shared<IterationScope>();
    outer->bindings.emplace("item", Value{Value::Object{{"name", Value{"outer"}}}});
    outer->bindings.emplace("index", Value{0});

    auto inner    = std::make_shared<IterationScope>();
    inner->parent = outer;
    inner->bindings.emplace("item", Value{Value::Object{{"title", Value{"inner"}}}});

    CHECK(inner->lookup("item.title") == Value{"inner"});
    CHECK_FALSE(inner->lookup("item.name").has_value());
    CHECK(inner->lookup("index") == Value{0});
    CHECK(inner->binds("index"));
    CHECK_FALSE(inner->binds("other"));
}

} // TEST_SUITE

TEST_SUITE("tracking.tracker") {

TEST_CASE("reads belong to the innermost bracket") {
    ViewNode          parent("parent", 1, "vstack");
    ViewNode          child("child", 2, "text");
    DependencyTracker tracker;
    CHECK_FALSE(tracker.isTracking());
    {
        DependencyTracker::Scope outer(&tracker, &parent);
        tracker.recordRead("title");
        {
            DependencyTracker::Scope inner(&tracker, &child);
            CHECK(tracker.current() == &child);
            CHECK(tracker.depth() == 2);
            tracker.recordRead("items[0].name");
            tracker.recordWrite("query");
            tracker.recordLocalRead("expanded");
        }
        tracker.recordRead("");
    }
    CHECK_FALSE(tracker.isTracking());
    CHECK(parent.readPaths() == PathSet{"title"});
    CHECK(child.readPaths() == PathSet{"items.0.name", "query", "local.expanded"});
    CHECK(child.writePaths() == PathSet{"query"});
}

TEST_CASE("recording outside a bracket is ignored and a null node opens nothing") {
    DependencyTracker tracker;
    tracker.recordRead("count");
    {
        DependencyTracker::Scope none(&tracker, nullptr);
        CHECK_FALSE(tracker.isTracking());
    }
    tracker.endTracking();
    CHECK(tracker.depth() == 0);
}

} // TEST_SUITE

TEST_SUITE("tracking.index") {

TEST_CASE("overlapping paths in both directions") {
    SampleTree      tree;
    DependencyIndex index;
    for (auto* node : {tree.list, tree.first, tree.second, tree.footer}) {
        index.registerNode(*node);
    }
    CHECK(index.registeredCount() == 4);

    CHECK(index.nodesAffectedBy("items.1.title") == TrackingIdSet{2, 4});
    CHECK(index.nodesAffectedBy("items") == TrackingIdSet{2, 3, 4});
    CHECK(index.nodesAffectedBy("items[0]") == TrackingIdSet{2, 3});
    CHECK(index.nodesAffectedBy("user") == TrackingIdSet{4});
    CHECK(index.nodesAffectedBy("unrelated").empty());
    CHECK(index.nodesAffectedBy(std::vector<std::string>{"count", "user.name"}) == TrackingIdSet{4, 5});
    CHECK(index.nodesReading("count") == TrackingIdSet{5});

    index.unregisterNode(4);
    CHECK(index.nodesAffectedBy("user").empty());
    CHECK(index.registeredCount() == 3);

    tree.footer->setDependencies(PathSet{"total"}, {});
    index.updateRegistration(*tree.footer);
    CHECK(index.nodesReading("count").empty());
    CHECK(index.nodesReading("total") == TrackingIdSet{5});

    index.clear();
    CHECK(index.registeredCount() == 0);
}

} // TEST_SUITE

TEST_SUITE("tracking.updater") {

TEST_CASE("minimal update set drops nodes under a pending ancestor") {
    SampleTree      tree;
    ViewTreeUpdater updater;
    updater.setRoot(tree.root.get());

    CHECK(updater.handleStateChange("items.0.title") == 2);
    CHECK(ids(updater.pendingUpdates()) == std::vector<std::uint64_t>{2, 3});
    CHECK(ids(updater.minimalUpdateSet()) == std::vector<std::uint64_t>{2});

    CHECK(updater.handleStateChange("count") == 1);
    CHECK(updater.handleStateChange("count") == 0);
    CHECK(ids(updater.minimalUpdateSet()) == std::vector<std::uint64_t>{2, 5});

    auto byDepth = updater.updatesByDepth();
    REQUIRE(byDepth.size() == 2);
    CHECK(ids(byDepth[0]) == std::vector<std::uint64_t>{2, 5});
    CHECK(ids(byDepth[1]) == std::vector<std::uint64_t>{3});

    updater.markNodeUpdated(2);
    CHECK(ids(updater.minimalUpdateSet()) == std::vector<std::uint64_t>{3, 5});
    updater.clearPendingUpdates();
    CHECK_FALSE(updater.hasUpdates());
}

TEST_CASE("dirty path batches") {
    SampleTree      tree;
    ViewTreeUpdater updater;
    updater.setRoot(tree.root.get());
    CHECK(updater.processDirtyPaths({}) == 0);
    CHECK(updater.processDirtyPaths({"user", "user.name"}) == 1);
    CHECK(ids(updater.pendingUpdates()) == std::vector<std::uint64_t>{4});
}

TEST_CASE("replacing a subtree re-registers its dependencies") {
    SampleTree      tree;
    ViewTreeUpdater updater;
    updater.setRoot(tree.root.get());
    updater.handleStateChange("items.1.title");

    auto  replacement = std::make_unique<ViewNode>("list", 2, "vstack");
    auto& row         = replacement->addChild(std::make_unique<ViewNode>("row0", 6, "text"));
    replacement->setDependencies(PathSet{"items"}, {});
    row.setDependencies(PathSet{"filter"}, {});

    updater.replaceSubtree(*tree.list, *replacement);
    auto previous = tree.root->replaceChild(2, std::move(replacement));

    CHECK_FALSE(updater.hasUpdates());
    CHECK(updater.find(3) == nullptr);
    CHECK(updater.find(6) == &row);
    CHECK(updater.handleStateChange("items.1.title") == 1);
    updater.clearPendingUpdates();
    CHECK(updater.handleStateChange("filter") == 1);
    CHECK(ids(updater.pendingUpdates()) == std::vector<std::uint64_t>{6});
}

TEST_CASE("local changes only reach readers of the same scope") {
    SampleTree tree;
    tree.list->declareLocalState(Value::Object{{"expanded", Value{true}}});
    tree.root->declareLocalState(Value::Object{{"expanded", Value{false}}});
    tree.first->setDependencies(PathSet{"local.expanded"}, {});
    tree.footer->setDependencies(PathSet{"local.expanded"}, {});

    ViewTreeUpdater updater;
    updater.setRoot(tree.root.get());
    CHECK(updater.handleLocalStateChange(*tree.list, "expanded") == 1);
    CHECK(ids(updater.pendingUpdates()) == std::vector<std::uint64_t>{3});
    CHECK(updater.handleLocalStateChange(*tree.root, "expanded") == 1);
    CHECK(ids(updater.pendingUpdates()) == std::vector<std::uint64_t>{3, 5});
}

} // TEST_SUITE
