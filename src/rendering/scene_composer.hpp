#pragma once

/// @file scene_composer.hpp
/// @brief Turns a dial, its current value and a theme into drawable primitives.
///
/// The scene is a flat, paint-ordered list of elements with fully resolved
/// geometry in drawing-surface coordinates. Composition is a pure function:
/// nothing is cached between frames, and the only continuity across frames
/// (the hand's spring) is supplied by the caller as an angle.

#include "dial/dial.hpp"
#include "geometry/polar.hpp"
#include "rendering/theme.hpp"

#include <string>
#include <variant>
#include <vector>

namespace analogdial {

/// Filled circle behind everything else
struct BackgroundDisc {
    Vec2 center;
    double radius = 0.0;
    Rgba color;
};

/// One-unit stroked outline of the face; transparent in the dark scheme
struct BackgroundRing {
    Vec2 center;
    double radius = 0.0;
    Rgba color;
};

enum class TickStyle { MAJOR, MINOR };

/// A thin rectangle centered on `center`, its long side along the radius
struct TickMark {
    TickStyle style = TickStyle::MINOR;
    double value = 0.0;     ///< Scale value the mark stands for
    Vec2 center;            ///< Midpoint of the mark
    double length = 0.0;    ///< Extent along the radius
    double thickness = 0.0; ///< Extent across the radius
    double angle = 0.0;     ///< Rotation, degrees clockwise from east
    Rgba color;
};

/// Numeric label of a major tick, centered on `center`
struct TickLabel {
    std::string text;
    Vec2 center;
    double font_size = 0.0;
    Rgba color;
};

/// The pointer: a rectangle rotated about a pivot near its tail, plus a knob
/// covering the pivot
struct Hand {
    Vec2 pivot;                ///< Rotation center, the dial's center
    double length = 0.0;       ///< Tail end to tip
    double thickness = 0.0;
    double pivot_fraction = 0; ///< Pivot position along the length, from the tail
    double angle = 0.0;        ///< Direction of the tip, degrees clockwise from east
    double knob_radius = 0.0;
    Rgba color;
};

/// Tagged union over everything a dial draws
using SceneElement = std::variant<BackgroundDisc, BackgroundRing, TickMark, TickLabel, Hand>;

/// What assistive technology should announce for the dial
struct AccessibilitySummary {
    std::string label = "Dial";
    std::string value;
    bool is_summary_element = true;
    bool updates_frequently = true;
};

/// A composed dial, ready to rasterize. Later elements paint over earlier ones.
struct Scene {
    Rect bounds; ///< Square the dial occupies
    std::vector<SceneElement> elements;
    AccessibilitySummary accessibility;
};

/// Relative sizes, as fractions of the dial's diameter
struct DialProportions {
    static constexpr double MAJOR_TICK_LENGTH = 0.06;
    static constexpr double MAJOR_TICK_THICKNESS = 0.012;
    static constexpr double MINOR_TICK_LENGTH = 0.04;
    static constexpr double MINOR_TICK_THICKNESS = 0.007;
    static constexpr double LABEL_RADIUS = 0.375;    ///< 75% of the radius
    static constexpr double LABEL_FONT_DIVISOR = 14.0;
    static constexpr double HAND_LENGTH = 0.45;      ///< 90% of the radius
    static constexpr double HAND_THICKNESS = 0.01;
    static constexpr double HAND_PIVOT_FRACTION = 0.1;
    static constexpr double KNOB_RADIUS = 0.03;
};

/// Composes a dial whose hand points at @p hand_angle.
/// @param dial          The validated dial scale
/// @param current_value Value reported to assistive technology
/// @param hand_angle    Rendered hand angle, usually from a HandAnimator
/// @param theme         Face palette, already resolved from the scheme
/// @param accent        Color of the hand and knob
/// @param area          Available drawing area; the dial is fitted as a
///                      centered square
[[nodiscard]] Scene compose_scene(const Dial& dial, double current_value, double hand_angle,
                                  const Theme& theme, Rgba accent, const Rect& area);

/// Composes a dial with the hand resting exactly on @p current_value
[[nodiscard]] Scene compose_scene(const Dial& dial, double current_value, const Theme& theme,
                                  Rgba accent, const Rect& area);

/// Integer text for a tick label: rounded, no fractional digits, no "-0"
[[nodiscard]] std::string format_tick_label(double value);

/// Text announced as the dial's accessibility value: the shortest decimal
/// form that reads back as exactly @p value
[[nodiscard]] std::string format_accessibility_value(double value);

} // namespace analogdial
