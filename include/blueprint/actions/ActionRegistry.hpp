#pragma once

#include <blueprint/core/Error.hpp>
#include <blueprint/ir/ActionDefinition.hpp>

#include <parallel_hashmap/phmap.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace BP {

class ActionExecution;

// Execution-time behaviour for one action kind. Handlers run on whatever
// thread the ActionContext executes on and must check
// execution.cancelled() before each effect.
class ActionHandler {
public:
    virtual ~ActionHandler() = default;

    virtual auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> = 0;
};

using ActionHandlerPtr = std::shared_ptr<ActionHandler const>;
using ActionClosure    = std::function<Expected<void>(IR::ActionDefinition const&, ActionExecution&)>;

// Host interception point. Consulted before the registry for custom kinds and
// as the fallback for any kind without a handler.
class ActionDelegate {
public:
    virtual ~ActionDelegate() = default;

    [[nodiscard]] virtual auto shouldHandle(IR::ActionDefinition const& action) const -> bool = 0;
    virtual auto handle(IR::ActionDefinition const& action, ActionExecution& execution) -> void   = 0;
};

/**
 * ActionRegistry: action kind to handler.
 *
 * Keys are IR::ActionDefinition::kindName(): the built-in wire name or the
 * custom kind. Registering a kind again replaces its handler.
 */
class ActionRegistry {
public:
    auto registerHandler(std::string kind, ActionHandlerPtr handler) -> void;
    auto registerClosure(std::string kind, ActionClosure closure) -> void;
    auto unregisterHandler(std::string_view kind) -> bool;

    [[nodiscard]] auto handler(std::string_view kind) const -> ActionHandlerPtr;
    [[nodiscard]] auto hasHandler(std::string_view kind) const -> bool;
    [[nodiscard]] auto registeredKinds() const -> std::vector<std::string>;

    // Copies every handler of `other` into this registry; `other` wins on conflicts.
    auto merge(ActionRegistry const& other) -> void;

private:
    phmap::flat_hash_map<std::string, ActionHandlerPtr> handlers_;
};

// dismiss, setState, toggleState, showAlert, navigate, sequence, plus the
// array handlers appendToArray, removeFromArray, toggleInArray, setArrayItem
// and clearArray.
[[nodiscard]] auto MakeDefaultActionRegistry() -> ActionRegistry;

} // namespace BP
