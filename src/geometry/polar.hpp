/// @file polar.hpp
/// @brief 2D points, rectangles and polar coordinates on the drawing surface.
///
/// The drawing surface has its origin at the top-left and its y axis pointing
/// down. A polar angle of 0 is "east" and positive angles turn clockwise on
/// screen, which is the ordinary cos/sin convention seen through a flipped
/// y axis. Code targeting a y-up surface must negate the angle.

#pragma once

namespace analogdial {

/// A 2D point or offset in drawing-surface units
struct Vec2 {
    double x = 0.0;
    double y = 0.0;
};

/// An axis-aligned rectangle in drawing-surface units
struct Rect {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
};

/// A polar coordinate relative to some center point
struct Polar {
    double r = 0.0;   ///< Distance from the center
    double phi = 0.0; ///< Angle in degrees, clockwise from east
};

[[nodiscard]] constexpr double deg_to_rad(double degrees) {
    return degrees * 0.017453292519943295;
}

[[nodiscard]] constexpr double rad_to_deg(double radians) {
    return radians * 57.29577951308232;
}

/// Offset of a polar coordinate from its center: x = r cos(phi), y = r sin(phi)
[[nodiscard]] Vec2 to_cartesian(const Polar& polar);

/// Inverse of to_cartesian. phi is returned in (-180, 180]; the origin maps to
/// r = 0, phi = 0.
[[nodiscard]] Polar to_polar(Vec2 offset);

/// Position of a polar coordinate around @p center on the drawing surface
[[nodiscard]] Vec2 place_polar(Vec2 center, const Polar& polar);

[[nodiscard]] Vec2 rect_center(const Rect& rect);

/// Largest square that fits inside @p area, centered in it
[[nodiscard]] Rect fit_square(const Rect& area);

} // namespace analogdial
