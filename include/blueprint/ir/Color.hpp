#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace BP::IR {

// Straight (non-premultiplied) RGBA, each channel in 0..1.
using Color = std::array<float, 4>;

inline constexpr Color ColorBlack{0.0f, 0.0f, 0.0f, 1.0f};
inline constexpr Color ColorWhite{1.0f, 1.0f, 1.0f, 1.0f};
inline constexpr Color ColorClear{0.0f, 0.0f, 0.0f, 0.0f};

// "#RGB", "#RRGGBB", "#RRGGBBAA" (leading '#' optional) or "rgba(r, g, b, a)"
// with r/g/b in 0..255 and a in 0..1.
[[nodiscard]] auto ParseColor(std::string_view text) -> std::optional<Color>;

} // namespace BP::IR
