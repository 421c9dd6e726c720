#pragma once

#include <blueprint/document/Document.hpp>

#include <array>
#include <optional>
#include <string_view>

namespace BP::Document::Detail {

inline constexpr std::array<std::string_view, 3> LayoutTypeNames{"vstack", "hstack", "zstack"};
inline constexpr std::array<std::string_view, 3> HorizontalAlignmentNames{"leading", "center", "trailing"};
inline constexpr std::array<std::string_view, 3> VerticalAlignmentNames{"top", "center", "bottom"};
inline constexpr std::array<std::string_view, 3> TextAlignmentNames{"leading", "center", "trailing"};
inline constexpr std::array<std::string_view, 3> ColorSchemeNames{"light", "dark", "system"};
inline constexpr std::array<std::string_view, 3> SnapBehaviorNames{"none", "viewAligned", "paging"};
inline constexpr std::array<std::string_view, 4> SectionTypeNames{"horizontal", "list", "grid", "flow"};
inline constexpr std::array<std::string_view, 3> DataReferenceTypeNames{"static", "binding", "localBinding"};
inline constexpr std::array<std::string_view, 3> AlertButtonStyleNames{"default", "cancel", "destructive"};
inline constexpr std::array<std::string_view, 3> PresentationNames{"push", "present", "fullScreen"};
inline constexpr std::array<std::string_view, 9> FontWeightNames{
    "ultraLight", "thin", "light", "regular", "medium", "semibold", "bold", "heavy", "black"};

inline constexpr std::array<std::string_view, 11> KnownComponentKinds{
    "text", "label", "button", "textfield", "image", "gradient", "toggle", "slider", "divider", "shape", "pageIndicator"};

inline constexpr std::array<std::string_view, 11> KnownActionTypes{
    "dismiss", "setState", "toggleState", "showAlert", "navigate", "sequence",
    "appendToArray", "removeFromArray", "toggleInArray", "setArrayItem", "clearArray"};

template <std::size_t N>
[[nodiscard]] constexpr auto IndexOf(std::array<std::string_view, N> const& names, std::string_view value) -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < N; ++i) {
        if (names[i] == value) {
            return i;
        }
    }
    return std::nullopt;
}

template <typename Enum, std::size_t N>
[[nodiscard]] constexpr auto EnumFromString(std::array<std::string_view, N> const& names, std::string_view value) -> std::optional<Enum> {
    if (auto index = IndexOf(names, value)) {
        return static_cast<Enum>(*index);
    }
    return std::nullopt;
}

[[nodiscard]] inline auto LayoutTypeFromString(std::string_view value) -> std::optional<LayoutType> {
    return EnumFromString<LayoutType>(LayoutTypeNames, value);
}

[[nodiscard]] inline auto HorizontalAlignmentFromString(std::string_view value) -> std::optional<HorizontalAlignment> {
    return EnumFromString<HorizontalAlignment>(HorizontalAlignmentNames, value);
}

[[nodiscard]] inline auto VerticalAlignmentFromString(std::string_view value) -> std::optional<VerticalAlignment> {
    return EnumFromString<VerticalAlignment>(VerticalAlignmentNames, value);
}

[[nodiscard]] inline auto TextAlignmentFromString(std::string_view value) -> std::optional<TextAlignment> {
    return EnumFromString<TextAlignment>(TextAlignmentNames, value);
}

[[nodiscard]] inline auto FontWeightFromString(std::string_view value) -> std::optional<FontWeight> {
    return EnumFromString<FontWeight>(FontWeightNames, value);
}

[[nodiscard]] inline auto ColorSchemeFromString(std::string_view value) -> std::optional<ColorScheme> {
    return EnumFromString<ColorScheme>(ColorSchemeNames, value);
}

[[nodiscard]] inline auto SnapBehaviorFromString(std::string_view value) -> std::optional<SnapBehavior> {
    return EnumFromString<SnapBehavior>(SnapBehaviorNames, value);
}

[[nodiscard]] inline auto DataReferenceTypeFromString(std::string_view value) -> std::optional<DataReference::Type> {
    return EnumFromString<DataReference::Type>(DataReferenceTypeNames, value);
}

} // namespace BP::Document::Detail
