#include <blueprint/actions/ActionResolver.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace BP {

namespace {

[[nodiscard]] auto make_definition(IR::ActionKind kind, std::string_view wireType, Value::Object parameters)
        -> IR::ActionDefinition {
    IR::ActionDefinition definition;
    definition.kind = kind;
    if (kind == IR::ActionKind::Custom) {
        definition.customKind = std::string{wireType};
    }
    definition.parameters = std::move(parameters);
    return definition;
}

[[nodiscard]] auto required_string(Document::Action const& action, std::string_view key) -> Expected<std::string> {
    auto it = action.parameters.find(key);
    if (it == action.parameters.end()) {
        return std::unexpected(Error{Error::Code::MissingParameter, action.type + " requires '" + std::string{key} + "'"});
    }
    auto text = it->second.asString();
    if (!text) {
        return std::unexpected(Error{Error::Code::InvalidParameterType,
                                     action.type + " parameter '" + std::string{key} + "' must be a string"});
    }
    return *text;
}

class DismissResolver final : public ActionResolver {
public:
    auto kind() const -> std::string_view override { return "dismiss"; }
    auto resolve(Document::Action const&) const -> Expected<IR::ActionDefinition> override {
        return make_definition(IR::ActionKind::Dismiss, kind(), {});
    }
};

class SetStateResolver final : public ActionResolver {
public:
    auto kind() const -> std::string_view override { return "setState"; }
    auto resolve(Document::Action const& action) const -> Expected<IR::ActionDefinition> override {
        auto path = required_string(action, "path");
        if (!path) {
            return std::unexpected(path.error());
        }
        auto value = action.parameters.find("value");
        if (value == action.parameters.end()) {
            return std::unexpected(Error{Error::Code::MissingParameter, "setState requires 'value'"});
        }
        Value::Object parameters;
        parameters.emplace("path", Value{*path});
        parameters.emplace("value", value->second);
        return make_definition(IR::ActionKind::SetState, kind(), std::move(parameters));
    }
};

class ToggleStateResolver final : public ActionResolver {
public:
    auto kind() const -> std::string_view override { return "toggleState"; }
    auto resolve(Document::Action const& action) const -> Expected<IR::ActionDefinition> override {
        auto path = required_string(action, "path");
        if (!path) {
            return std::unexpected(path.error());
        }
        Value::Object parameters;
        parameters.emplace("path", Value{*path});
        return make_definition(IR::ActionKind::ToggleState, kind(), std::move(parameters));
    }
};

// title defaults to "Alert"; message is plain text or {"type": "binding", "template": ...};
// buttons default to a single "OK".
class ShowAlertResolver final : public ActionResolver {
public:
    auto kind() const -> std::string_view override { return "showAlert"; }
    auto resolve(Document::Action const& action) const -> Expected<IR::ActionDefinition> override {
        Value::Object parameters;

        std::string title = "Alert";
        if (auto it = action.parameters.find("title"); it != action.parameters.end()) {
            if (auto text = it->second.asString()) {
                title = *text;
            }
        }
        parameters.emplace("title", Value{std::move(title)});

        if (auto it = action.parameters.find("message"); it != action.parameters.end()) {
            if (auto text = it->second.asString()) {
                parameters.emplace("message", Value{*text});
            } else if (auto const* object = it->second.asObject()) {
                auto type      = object->find("type");
                auto templ     = object->find("template");
                bool isBinding = type != object->end() && type->second.asString().value_or("") == "binding";
                if (isBinding && templ != object->end() && templ->second.asString()) {
                    parameters.emplace("messageTemplate", templ->second);
                } else {
                    parameters.emplace("message", Value{it->second.stringify()});
                }
            }
        }

        Value::Array buttons;
        if (auto it = action.parameters.find("buttons"); it != action.parameters.end()) {
            if (auto const* array = it->second.asArray()) {
                for (auto const& entry : *array) {
                    auto const* object = entry.asObject();
                    if (object == nullptr) {
                        continue;
                    }
                    auto label = object->find("label");
                    if (label == object->end() || !label->second.asString()) {
                        continue;
                    }
                    Value::Object button;
                    button.emplace("label", label->second);
                    button.emplace("style", Value{normalize_style(*object)});
                    if (auto nested = object->find("action"); nested != object->end()) {
                        button.emplace("action", nested->second);
                    }
                    buttons.emplace_back(std::move(button));
                }
            }
        }
        if (buttons.empty()) {
            Value::Object ok;
            ok.emplace("label", Value{"OK"});
            ok.emplace("style", Value{"default"});
            buttons.emplace_back(std::move(ok));
        }
        parameters.emplace("buttons", Value{std::move(buttons)});
        return make_definition(IR::ActionKind::ShowAlert, kind(), std::move(parameters));
    }

private:
    static auto normalize_style(Value::Object const& button) -> std::string {
        auto it = button.find("style");
        if (it == button.end()) {
            return "default";
        }
        auto style = it->second.asString().value_or("default");
        if (style == "cancel" || style == "destructive") {
            return style;
        }
        return "default";
    }
};

class NavigateResolver final : public ActionResolver {
public:
    auto kind() const -> std::string_view override { return "navigate"; }
    auto resolve(Document::Action const& action) const -> Expected<IR::ActionDefinition> override {
        auto destination = required_string(action, "destination");
        if (!destination) {
            return std::unexpected(destination.error());
        }
        std::string presentation = "push";
        if (auto it = action.parameters.find("presentation"); it != action.parameters.end()) {
            auto text = it->second.asString().value_or("push");
            if (text == "present" || text == "fullScreen") {
                presentation = text;
            } else if (text != "push") {
                bp_log("Unknown navigate presentation '" + text + "', using push", "Action");
            }
        }
        Value::Object parameters;
        parameters.emplace("destination", Value{*destination});
        parameters.emplace("presentation", Value{std::move(presentation)});
        return make_definition(IR::ActionKind::Navigate, kind(), std::move(parameters));
    }
};

// Steps are kept raw and resolved one at a time when the sequence runs, so
// that a later step observes the state written by an earlier one.
class SequenceResolver final : public ActionResolver {
public:
    auto kind() const -> std::string_view override { return "sequence"; }
    auto resolve(Document::Action const& action) const -> Expected<IR::ActionDefinition> override {
        auto it = action.parameters.find("steps");
        if (it == action.parameters.end()) {
            return std::unexpected(Error{Error::Code::MissingParameter, "sequence requires 'steps'"});
        }
        auto const* steps = it->second.asArray();
        if (steps == nullptr) {
            return std::unexpected(Error{Error::Code::InvalidParameterType, "sequence parameter 'steps' must be an array"});
        }
        for (auto const& step : *steps) {
            if (auto parsed = ActionFromValue(step); !parsed) {
                return std::unexpected(parsed.error());
            }
        }
        Value::Object parameters;
        parameters.emplace("steps", Value{*steps});
        return make_definition(IR::ActionKind::Sequence, kind(), std::move(parameters));
    }
};

} // namespace

auto ActionResolverRegistry::registerResolver(ActionResolverPtr resolver) -> void {
    if (!resolver) {
        return;
    }
    std::string kind{resolver->kind()};
    resolvers_[std::move(kind)] = std::move(resolver);
}

auto ActionResolverRegistry::unregisterResolver(std::string_view kind) -> bool {
    return resolvers_.erase(std::string{kind}) > 0;
}

auto ActionResolverRegistry::hasResolver(std::string_view kind) const -> bool {
    return resolvers_.contains(std::string{kind});
}

auto ActionResolverRegistry::registeredKinds() const -> std::vector<std::string> {
    std::vector<std::string> kinds;
    kinds.reserve(resolvers_.size());
    for (auto const& [kind, resolver] : resolvers_) {
        kinds.push_back(kind);
    }
    std::sort(kinds.begin(), kinds.end());
    return kinds;
}

auto ActionResolverRegistry::resolve(Document::Action const& action) const -> Expected<IR::ActionDefinition> {
    if (action.type.empty()) {
        return std::unexpected(Error{Error::Code::MissingParameter, "action requires 'type'"});
    }
    if (auto it = resolvers_.find(action.type); it != resolvers_.end()) {
        return it->second->resolve(action);
    }
    return make_definition(IR::actionKindFromName(action.type), action.type, action.parameters);
}

auto ActionResolverRegistry::resolveAll(std::map<std::string, Document::Action> const& actions,
                                        std::vector<ActionResolutionError>*            errors) const
        -> std::map<std::string, IR::ActionDefinition> {
    std::map<std::string, IR::ActionDefinition> resolved;
    for (auto const& [id, action] : actions) {
        auto definition = resolve(action);
        if (!definition) {
            bp_log("Action '" + id + "' failed to resolve: " + describeError(definition.error()), "Action", "Error");
            if (errors != nullptr) {
                errors->push_back(ActionResolutionError{id, definition.error()});
            }
            continue;
        }
        resolved.emplace(id, std::move(*definition));
    }
    return resolved;
}

auto ActionResolverRegistry::resolveBinding(Document::ActionBinding const& binding) const -> Expected<IR::ActionReference> {
    if (auto const* id = std::get_if<std::string>(&binding)) {
        return IR::ActionReference{*id};
    }
    auto definition = resolve(std::get<Document::Action>(binding));
    if (!definition) {
        return std::unexpected(definition.error());
    }
    return IR::ActionReference{std::move(*definition)};
}

auto MakeDefaultActionResolvers() -> ActionResolverRegistry {
    ActionResolverRegistry registry;
    registry.registerResolver(std::make_shared<DismissResolver>());
    registry.registerResolver(std::make_shared<SetStateResolver>());
    registry.registerResolver(std::make_shared<ToggleStateResolver>());
    registry.registerResolver(std::make_shared<ShowAlertResolver>());
    registry.registerResolver(std::make_shared<NavigateResolver>());
    registry.registerResolver(std::make_shared<SequenceResolver>());
    return registry;
}

auto ActionFromValue(Value const& value) -> Expected<Document::ActionBinding> {
    if (auto id = value.asString()) {
        return Document::ActionBinding{*id};
    }
    auto const* object = value.asObject();
    if (object == nullptr) {
        return std::unexpected(Error{Error::Code::InvalidParameterType, "action must be an id or an object"});
    }
    auto type = object->find("type");
    if (type == object->end() || !type->second.asString()) {
        return std::unexpected(Error{Error::Code::MissingParameter, "action requires 'type'"});
    }
    Document::Action action;
    action.type = *type->second.asString();
    for (auto const& [key, parameter] : *object) {
        if (key != "type") {
            action.parameters.emplace(key, parameter);
        }
    }
    return Document::ActionBinding{std::move(action)};
}

} // namespace BP
