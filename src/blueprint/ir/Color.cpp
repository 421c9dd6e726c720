#include <blueprint/ir/Color.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <vector>

namespace BP::IR {
namespace {

[[nodiscard]] auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

[[nodiscard]] auto parse_rgba(std::string_view body) -> std::optional<Color> {
    std::vector<double> channels;
    while (!body.empty()) {
        auto comma = body.find(',');
        auto part  = trim(body.substr(0, comma));
        double value = 0.0;
        auto [end, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (part.empty() || ec != std::errc{} || end != part.data() + part.size()) {
            return std::nullopt;
        }
        channels.push_back(value);
        if (comma == std::string_view::npos) {
            break;
        }
        body.remove_prefix(comma + 1);
    }
    if (channels.size() != 4) {
        return std::nullopt;
    }
    auto channel = [](double v) { return static_cast<float>(std::clamp(v / 255.0, 0.0, 1.0)); };
    return Color{channel(channels[0]), channel(channels[1]), channel(channels[2]),
                 static_cast<float>(std::clamp(channels[3], 0.0, 1.0))};
}

} // namespace

auto ParseColor(std::string_view text) -> std::optional<Color> {
    text = trim(text);
    if (text.size() > 6) {
        std::string prefix{text.substr(0, 5)};
        std::ranges::transform(prefix, prefix.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (prefix == "rgba(" && text.back() == ')') {
            return parse_rgba(text.substr(5, text.size() - 6));
        }
    }

    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }
    if (text.size() != 3 && text.size() != 6 && text.size() != 8) {
        return std::nullopt;
    }
    std::uint32_t bits = 0;
    auto [end, ec]     = std::from_chars(text.data(), text.data() + text.size(), bits, 16);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }

    switch (text.size()) {
    case 3:
        return Color{static_cast<float>((bits >> 8) & 0xF) / 15.0f,
                     static_cast<float>((bits >> 4) & 0xF) / 15.0f,
                     static_cast<float>(bits & 0xF) / 15.0f,
                     1.0f};
    case 6:
        return Color{static_cast<float>((bits >> 16) & 0xFF) / 255.0f,
                     static_cast<float>((bits >> 8) & 0xFF) / 255.0f,
                     static_cast<float>(bits & 0xFF) / 255.0f,
                     1.0f};
    default:
        return Color{static_cast<float>((bits >> 24) & 0xFF) / 255.0f,
                     static_cast<float>((bits >> 16) & 0xFF) / 255.0f,
                     static_cast<float>((bits >> 8) & 0xFF) / 255.0f,
                     static_cast<float>(bits & 0xFF) / 255.0f};
    }
}

} // namespace BP::IR
