#include <blueprint/ir/ActionDefinition.hpp>

#include <array>

namespace BP::IR {
namespace {

constexpr std::array<std::string_view, 6> BuiltinActionNames{
    "dismiss", "setState", "toggleState", "showAlert", "navigate", "sequence"};

} // namespace

auto actionKindName(ActionKind kind) -> std::string_view {
    auto const index = static_cast<std::size_t>(kind);
    if (index < BuiltinActionNames.size()) {
        return BuiltinActionNames[index];
    }
    return "custom";
}

auto actionKindFromName(std::string_view name) -> ActionKind {
    for (std::size_t i = 0; i < BuiltinActionNames.size(); ++i) {
        if (BuiltinActionNames[i] == name) {
            return static_cast<ActionKind>(i);
        }
    }
    return ActionKind::Custom;
}

auto ActionDefinition::kindName() const -> std::string {
    if (kind == ActionKind::Custom) {
        return customKind;
    }
    return std::string{actionKindName(kind)};
}

} // namespace BP::IR
