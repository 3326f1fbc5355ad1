/// @file polar.cpp
/// @brief Polar/cartesian conversion and square fitting

#include "geometry/polar.hpp"

#include <algorithm>
#include <cmath>

namespace analogdial {

Vec2 to_cartesian(const Polar& polar) {
    double p = deg_to_rad(polar.phi);
    return {polar.r * std::cos(p), polar.r * std::sin(p)};
}

Polar to_polar(Vec2 offset) {
    double r = std::hypot(offset.x, offset.y);
    if (r == 0.0) {
        return {0.0, 0.0};
    }
    return {r, rad_to_deg(std::atan2(offset.y, offset.x))};
}

Vec2 place_polar(Vec2 center, const Polar& polar) {
    Vec2 offset = to_cartesian(polar);
    return {center.x + offset.x, center.y + offset.y};
}

Vec2 rect_center(const Rect& rect) {
    return {rect.x + rect.w / 2.0, rect.y + rect.h / 2.0};
}

Rect fit_square(const Rect& area) {
    double side = std::max(0.0, std::min(area.w, area.h));
    return {area.x + (area.w - side) / 2.0, area.y + (area.h - side) / 2.0, side, side};
}

} // namespace analogdial
