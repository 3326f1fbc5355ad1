/// @file dial_layout.hpp
/// @brief Responsive arrangement of the demo dials for the current window size.
///
/// The window is classified per axis as compact or regular, and each of the
/// four combinations gets its own arrangement: a single dial, a column, a
/// row, or a 2x2 grid.

#pragma once

#include "dial/dial_config.hpp"
#include "geometry/polar.hpp"
#include "rendering/theme.hpp"

#include <vector>

namespace analogdial {

enum class SizeClass { COMPACT, REGULAR };

/// Size classes of both window axes
struct SizeClasses {
    SizeClass horizontal = SizeClass::COMPACT;
    SizeClass vertical = SizeClass::COMPACT;
};

[[nodiscard]] constexpr bool operator==(const SizeClasses& a, const SizeClasses& b) {
    return a.horizontal == b.horizontal && a.vertical == b.vertical;
}

[[nodiscard]] constexpr bool operator!=(const SizeClasses& a, const SizeClasses& b) {
    return !(a == b);
}

/// One dial placed in the window
struct DialSlot {
    Rect area;          ///< Cell the dial is fitted into
    DialConfig config;  ///< Scale of this dial
    ColorScheme scheme; ///< Face palette
    Rgba accent;        ///< Hand color
};

/// Layout tuning in pixels
struct LayoutMetrics {
    float regular_min_width = 800.0f;  ///< Narrower windows are horizontally compact
    float regular_min_height = 600.0f; ///< Shorter windows are vertically compact
    float padding = 16.0f;             ///< Around the whole arrangement
    float spacing = 40.0f;             ///< Between neighbouring dials
};

[[nodiscard]] SizeClasses classify_window(int screen_w, int screen_h,
                                          const LayoutMetrics& metrics = {});

[[nodiscard]] const char* size_classes_name(const SizeClasses& classes);

/// Computes the dial slots for a window.
/// @param screen_w       Window width in pixels
/// @param screen_h       Window height in pixels
/// @param ambient_scheme Scheme of the single dial shown in compact windows;
///                       the multi-dial arrangements pin their own schemes
/// @param top_inset      Pixels reserved at the top for the HUD
[[nodiscard]] std::vector<DialSlot> compute_dial_layout(int screen_w, int screen_h,
                                                        ColorScheme ambient_scheme,
                                                        float top_inset = 0.0f,
                                                        const LayoutMetrics& metrics = {});

} // namespace analogdial
