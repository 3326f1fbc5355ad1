#pragma once

/// @file angle_mapper.hpp
/// @brief Maps scale values onto angular positions of the dial face

namespace analogdial {

/// Linear interpolation fraction of @p value within [min_value, max_value].
/// Not clamped: values outside the range give fractions outside [0, 1].
/// @throws InvalidConfiguration if min_value == max_value
[[nodiscard]] double interpolate(double value, double min_value, double max_value);

/// Returns the angle (degrees, clockwise from east) at which @p value sits on
/// a scale spanning [start_angle, end_angle].
///
/// The mapping is affine and deliberately unclamped, so a value past the end
/// of the scale points past the last tick instead of sticking to it.
/// min_value maps to exactly start_angle and max_value to exactly end_angle.
///
/// @throws InvalidConfiguration if min_value == max_value
[[nodiscard]] double angle_for(double value, double min_value, double max_value,
                               double start_angle, double end_angle);

} // namespace analogdial
