#include <blueprint/actions/ActionContext.hpp>
#include <blueprint/actions/ActionRegistry.hpp>
#include <blueprint/state/Expressions.hpp>

#include "log/TaggedLogger.hpp"

namespace BP {

namespace {

[[nodiscard]] auto cancelled_error(IR::ActionDefinition const& action) -> Error {
    return Error{Error::Code::Cancelled, action.kindName() + " cancelled"};
}

[[nodiscard]] auto required_index(IR::ActionDefinition const& action) -> Expected<std::size_t> {
    auto index = action.requiredParameter<std::int64_t>("index");
    if (!index) {
        return std::unexpected(index.error());
    }
    if (*index < 0) {
        return std::unexpected(Error{Error::Code::InvalidParameterType,
                                     action.kindName() + " index " + std::to_string(*index) + " is negative"});
    }
    return static_cast<std::size_t>(*index);
}

class DismissHandler final : public ActionHandler {
public:
    auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> override {
        if (execution.cancelled()) {
            return std::unexpected(cancelled_error(action));
        }
        auto* presenter = execution.context().options().presenter;
        if (presenter == nullptr) {
            return std::unexpected(Error{Error::Code::NotSupported, "dismiss has no presenter"});
        }
        presenter->dismiss();
        return {};
    }
};

class SetStateHandler final : public ActionHandler {
public:
    auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> override {
        auto path = action.requiredParameter<std::string>("path");
        if (!path) {
            return std::unexpected(path.error());
        }
        auto value = execution.evaluate(action.parameter<Value>("value").value_or(Value{}));
        if (execution.cancelled()) {
            return std::unexpected(cancelled_error(action));
        }
        execution.store().set(*path, std::move(value));
        return {};
    }
};

class ToggleStateHandler final : public ActionHandler {
public:
    auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> override {
        auto path = action.requiredParameter<std::string>("path");
        if (!path) {
            return std::unexpected(path.error());
        }
        if (execution.cancelled()) {
            return std::unexpected(cancelled_error(action));
        }
        auto current = execution.store().get(*path).value_or(Value{});
        execution.store().set(*path, Value{!Expressions::IsTruthy(current)});
        return {};
    }
};

class ShowAlertHandler final : public ActionHandler {
public:
    auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> override {
        AlertRequest request;
        request.title = action.parameter<std::string>("title").value_or("Alert");
        if (auto templ = action.parameter<std::string>("messageTemplate")) {
            request.message = execution.interpolate(*templ);
        } else if (auto message = action.parameter<std::string>("message")) {
            request.message = std::move(*message);
        }
        for (auto const& entry : action.parameter<Value::Array>("buttons").value_or(Value::Array{})) {
            auto const* object = entry.asObject();
            if (object == nullptr) {
                continue;
            }
            AlertButton button;
            if (auto it = object->find("label"); it != object->end()) {
                button.label = it->second.asString().value_or("");
            }
            if (auto it = object->find("style"); it != object->end()) {
                button.style = it->second.asString().value_or("default");
            }
            if (auto it = object->find("action"); it != object->end()) {
                if (auto binding = ActionFromValue(it->second)) {
                    button.action = std::move(*binding);
                } else {
                    bp_log("Alert button '" + button.label + "' has an invalid action: " + describeError(binding.error()),
                           "ActionHandler", "Error");
                }
            }
            request.buttons.push_back(std::move(button));
        }
        if (request.buttons.empty()) {
            request.buttons.push_back(AlertButton{"OK", "default", std::nullopt});
        }

        if (execution.cancelled()) {
            return std::unexpected(cancelled_error(action));
        }
        auto* presenter = execution.context().options().presenter;
        if (presenter == nullptr) {
            return std::unexpected(Error{Error::Code::NotSupported, "showAlert has no presenter"});
        }
        presenter->presentAlert(request);
        return {};
    }
};

class NavigateHandler final : public ActionHandler {
public:
    auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> override {
        auto destination = action.requiredParameter<std::string>("destination");
        if (!destination) {
            return std::unexpected(destination.error());
        }
        auto presentation = action.parameter<std::string>("presentation").value_or("push");
        if (execution.cancelled()) {
            return std::unexpected(cancelled_error(action));
        }
        auto* presenter = execution.context().options().presenter;
        if (presenter == nullptr) {
            return std::unexpected(Error{Error::Code::NotSupported, "navigate has no presenter"});
        }
        presenter->navigate(execution.interpolate(*destination), presentation);
        return {};
    }
};

// Steps stay raw until their turn so that each one sees the state left by
// the previous step. A failing step is logged and the sequence moves on;
// cancellation ends it.
class SequenceHandler final : public ActionHandler {
public:
    auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> override {
        auto steps = action.requiredParameter<Value::Array>("steps");
        if (!steps) {
            return std::unexpected(steps.error());
        }
        for (std::size_t index = 0; index < steps->size(); ++index) {
            if (execution.cancelled()) {
                bp_log("Sequence cancelled before step " + std::to_string(index), "ActionHandler");
                return std::unexpected(cancelled_error(action));
            }
            auto binding = ActionFromValue((*steps)[index]);
            if (!binding) {
                bp_log("Sequence step " + std::to_string(index) + " is invalid: " + describeError(binding.error()),
                       "ActionHandler", "Error");
                continue;
            }
            auto result = execution.run(*binding);
            if (!result) {
                if (result.error().code == Error::Code::Cancelled) {
                    return result;
                }
                bp_log("Sequence step " + std::to_string(index) + " failed: " + describeError(result.error()),
                       "ActionHandler", "Error");
            }
        }
        return {};
    }
};

class AppendToArrayHandler final : public ActionHandler {
public:
    auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> override {
        auto path  = action.requiredParameter<std::string>("path");
        auto value = action.requiredParameter<Value>("value");
        if (!path) {
            return std::unexpected(path.error());
        }
        if (!value) {
            return std::unexpected(value.error());
        }
        auto evaluated = execution.evaluate(*value);
        if (execution.cancelled()) {
            return std::unexpected(cancelled_error(action));
        }
        execution.store().append(*path, std::move(evaluated));
        return {};
    }
};

// Removes by "index" when given, otherwise every element equal to "value".
class RemoveFromArrayHandler final : public ActionHandler {
public:
    auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> override {
        auto path = action.requiredParameter<std::string>("path");
        if (!path) {
            return std::unexpected(path.error());
        }
        if (action.parameters.contains("index")) {
            auto index = required_index(action);
            if (!index) {
                return std::unexpected(index.error());
            }
            if (execution.cancelled()) {
                return std::unexpected(cancelled_error(action));
            }
            if (!execution.store().removeAt(*path, *index)) {
                bp_log("removeFromArray: no element " + std::to_string(*index) + " at " + *path, "ActionHandler");
            }
            return {};
        }
        auto value = action.requiredParameter<Value>("value");
        if (!value) {
            return std::unexpected(value.error());
        }
        auto evaluated = execution.evaluate(*value);
        if (execution.cancelled()) {
            return std::unexpected(cancelled_error(action));
        }
        execution.store().removeByValue(*path, evaluated);
        return {};
    }
};

class ToggleInArrayHandler final : public ActionHandler {
public:
    auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> override {
        auto path  = action.requiredParameter<std::string>("path");
        auto value = action.requiredParameter<Value>("value");
        if (!path) {
            return std::unexpected(path.error());
        }
        if (!value) {
            return std::unexpected(value.error());
        }
        auto evaluated = execution.evaluate(*value);
        if (execution.cancelled()) {
            return std::unexpected(cancelled_error(action));
        }
        execution.store().toggleMembership(*path, evaluated);
        return {};
    }
};

class SetArrayItemHandler final : public ActionHandler {
public:
    auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> override {
        auto path  = action.requiredParameter<std::string>("path");
        auto index = required_index(action);
        auto value = action.requiredParameter<Value>("value");
        if (!path) {
            return std::unexpected(path.error());
        }
        if (!index) {
            return std::unexpected(index.error());
        }
        if (!value) {
            return std::unexpected(value.error());
        }
        auto evaluated = execution.evaluate(*value);
        if (execution.cancelled()) {
            return std::unexpected(cancelled_error(action));
        }
        if (!execution.store().setArrayItem(*path, *index, std::move(evaluated))) {
            return std::unexpected(Error{Error::Code::NotFound,
                                         "setArrayItem: no element " + std::to_string(*index) + " at " + *path});
        }
        return {};
    }
};

class ClearArrayHandler final : public ActionHandler {
public:
    auto execute(IR::ActionDefinition const& action, ActionExecution& execution) const -> Expected<void> override {
        auto path = action.requiredParameter<std::string>("path");
        if (!path) {
            return std::unexpected(path.error());
        }
        if (execution.cancelled()) {
            return std::unexpected(cancelled_error(action));
        }
        execution.store().clearArray(*path);
        return {};
    }
};

} // namespace

auto MakeDefaultActionRegistry() -> ActionRegistry {
    ActionRegistry registry;
    registry.registerHandler("dismiss", std::make_shared<DismissHandler>());
    registry.registerHandler("setState", std::make_shared<SetStateHandler>());
    registry.registerHandler("toggleState", std::make_shared<ToggleStateHandler>());
    registry.registerHandler("showAlert", std::make_shared<ShowAlertHandler>());
    registry.registerHandler("navigate", std::make_shared<NavigateHandler>());
    registry.registerHandler("sequence", std::make_shared<SequenceHandler>());
    registry.registerHandler("appendToArray", std::make_shared<AppendToArrayHandler>());
    registry.registerHandler("removeFromArray", std::make_shared<RemoveFromArrayHandler>());
    registry.registerHandler("toggleInArray", std::make_shared<ToggleInArrayHandler>());
    registry.registerHandler("setArrayItem", std::make_shared<SetArrayItemHandler>());
    registry.registerHandler("clearArray", std::make_shared<ClearArrayHandler>());
    return registry;
}

} // namespace BP
