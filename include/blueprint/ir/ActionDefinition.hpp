#pragma once

#include <blueprint/core/Error.hpp>
#include <blueprint/state/Value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace BP::IR {

enum class ActionKind { Dismiss, SetState, ToggleState, ShowAlert, Navigate, Sequence, Custom };

[[nodiscard]] auto actionKindName(ActionKind kind) -> std::string_view;
// Built-in kind for a wire type name; anything else is Custom.
[[nodiscard]] auto actionKindFromName(std::string_view name) -> ActionKind;

/**
 * ActionDefinition: a resolved action ready for dispatch.
 *
 * Built-in kinds carry a normalized parameter bag:
 *   setState     {path, value}           value may still hold {"$expr": ...}
 *   toggleState  {path}
 *   showAlert    {title, message?, messageTemplate?, buttons: [{label, style, action?}]}
 *   navigate     {destination, presentation}
 *   sequence     {steps: [raw wire actions or action ids]}
 * Custom kinds keep the wire parameters untouched and name themselves through
 * customKind.
 */
struct ActionDefinition {
    ActionKind    kind = ActionKind::Custom;
    std::string   customKind;
    Value::Object parameters;

    // The handler key: the built-in wire name or customKind.
    [[nodiscard]] auto kindName() const -> std::string;

    template <typename T>
    [[nodiscard]] auto parameter(std::string_view key) const -> std::optional<T>;

    template <typename T>
    [[nodiscard]] auto requiredParameter(std::string_view key) const -> Expected<T>;

    friend auto operator==(ActionDefinition const&, ActionDefinition const&) -> bool = default;
};

// A renderer-facing action: either an id into RenderTree::actions or an inline definition.
using ActionReference = std::variant<std::string, ActionDefinition>;

namespace Detail {

template <typename T>
auto convertParameter(Value const& value) -> std::optional<T> {
    if constexpr (std::is_same_v<T, Value>) {
        return value;
    } else if constexpr (std::is_same_v<T, bool>) {
        return value.asBool();
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return value.asInt();
    } else if constexpr (std::is_same_v<T, double>) {
        return value.asDouble();
    } else if constexpr (std::is_same_v<T, std::string>) {
        return value.asString();
    } else if constexpr (std::is_same_v<T, Value::Array>) {
        if (auto const* array = value.asArray()) return *array;
        return std::nullopt;
    } else if constexpr (std::is_same_v<T, Value::Object>) {
        if (auto const* object = value.asObject()) return *object;
        return std::nullopt;
    } else {
        static_assert(sizeof(T) == 0, "Unsupported action parameter type");
    }
}

} // namespace Detail

template <typename T>
auto ActionDefinition::parameter(std::string_view key) const -> std::optional<T> {
    auto it = parameters.find(key);
    if (it == parameters.end()) {
        return std::nullopt;
    }
    return Detail::convertParameter<T>(it->second);
}

template <typename T>
auto ActionDefinition::requiredParameter(std::string_view key) const -> Expected<T> {
    auto it = parameters.find(key);
    if (it == parameters.end()) {
        return std::unexpected(Error{Error::Code::MissingParameter, kindName() + " requires '" + std::string{key} + "'"});
    }
    if (auto converted = Detail::convertParameter<T>(it->second)) {
        return std::move(*converted);
    }
    return std::unexpected(Error{Error::Code::InvalidParameterType,
                                 kindName() + " parameter '" + std::string{key} + "' has type "
                                         + std::string{BP::kindName(it->second.kind())}});
}

} // namespace BP::IR
