/// @file theme.hpp
/// @brief Light/dark color palettes for the dial face.
///
/// The scheme is an explicit input: the host resolves whatever ambient
/// light/dark setting it has into a Theme before composing a scene.

#pragma once

#include <cstdint>
#include <string_view>

namespace analogdial {

/// 8-bit RGBA color, independent of any GUI toolkit
struct Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    [[nodiscard]] bool is_transparent() const { return a == 0; }
};

[[nodiscard]] constexpr bool operator==(const Rgba& lhs, const Rgba& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
}

[[nodiscard]] constexpr bool operator!=(const Rgba& lhs, const Rgba& rhs) {
    return !(lhs == rhs);
}

namespace colors {
constexpr Rgba WHITE = {255, 255, 255, 255};
constexpr Rgba BLACK = {0, 0, 0, 255};
constexpr Rgba CLEAR = {0, 0, 0, 0};

// Accent colors for the hand
constexpr Rgba RED = {255, 59, 48, 255};
constexpr Rgba ORANGE = {255, 149, 0, 255};
constexpr Rgba YELLOW = {255, 204, 0, 255};
constexpr Rgba BLUE = {0, 122, 255, 255};
} // namespace colors

/// Display mode governing the dial's palette
enum class ColorScheme { LIGHT, DARK };

/// Colors of the dial face. The hand uses a separate accent color.
struct Theme {
    Rgba background; ///< Face fill
    Rgba border;     ///< Rim stroke; transparent means no visible stroke
    Rgba text;       ///< Tick labels
    Rgba tick;       ///< Tick marks
};

/// Palette for a scheme:
///   light: white face, black rim, black text and ticks
///   dark:  black face, no rim, white text and ticks
[[nodiscard]] Theme theme_for(ColorScheme scheme);

/// Parses "light" / "dark" (case-insensitive, surrounding blanks ignored).
/// Anything unrecognized is treated as LIGHT.
[[nodiscard]] ColorScheme parse_color_scheme(std::string_view text);

[[nodiscard]] const char* color_scheme_name(ColorScheme scheme);

} // namespace analogdial
