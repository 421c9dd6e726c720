#include <blueprint/actions/ActionRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace BP {

namespace {

class ClosureHandler final : public ActionHandler {
public:
    explicit ClosureHandler(ActionClosure closure) : closure_(std::move(closure)) {}

    auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> override {
        return closure_(action, execution);
    }

private:
    ActionClosure closure_;
};

} // namespace

auto ActionRegistry::registerHandler(std::string kind, ActionHandlerPtr handler) -> void {
    if (!handler) {
        bp_log("Ignoring null action handler for " + kind, "ActionRegistry", "Error");
        return;
    }
    if (handlers_.contains(kind)) {
        bp_log("Replacing action handler for " + kind, "ActionRegistry");
    }
    handlers_.insert_or_assign(std::move(kind), std::move(handler));
}

auto ActionRegistry::registerClosure(std::string kind, ActionClosure closure) -> void {
    registerHandler(std::move(kind), std::make_shared<ClosureHandler>(std::move(closure)));
}

auto ActionRegistry::unregisterHandler(std::string_view kind) -> bool {
    return handlers_.erase(std::string{kind}) > 0;
}

auto ActionRegistry::handler(std::string_view kind) const -> ActionHandlerPtr {
    auto it = handlers_.find(std::string{kind});
    return it == handlers_.end() ? nullptr : it->second;
}

auto ActionRegistry::hasHandler(std::string_view kind) const -> bool {
    return handlers_.contains(std::string{kind});
}

auto ActionRegistry::registeredKinds() const -> std::vector<std::string> {
    std::vector<std::string> kinds;
    kinds.reserve(handlers_.size());
    for (auto const& [kind, _] : handlers_) {
        kinds.push_back(kind);
    }
    std::sort(kinds.begin(), kinds.end());
    return kinds;
}

auto ActionRegistry::merge(ActionRegistry const& other) -> void {
    for (auto const& [kind, handler] : other.handlers_) {
        handlers_.insert_or_assign(kind, handler);
    }
}

} // namespace BP
