#pragma once

/// @file dial_config.hpp
/// @brief Construction-time configuration of a dial and its validation rules

#include <stdexcept>
#include <string>

namespace analogdial {

/// Thrown when a dial is configured with a malformed range, step, subdivision
/// count or angular span. Detected once, at construction time.
class InvalidConfiguration : public std::invalid_argument {
  public:
    explicit InvalidConfiguration(const std::string& what) : std::invalid_argument(what) {}
};

/// Upper bound on labeled ticks per dial: (max_value - min_value) / major_step
constexpr double MAX_MAJOR_TICKS = 1000.0;

/// Upper bound on subdivisions per major interval
constexpr int MAX_SUBDIVISIONS = 100;

/// Immutable description of a dial's scale.
///
/// Angles are in degrees, measured from "east" (positive x axis) with positive
/// angles turning clockwise, because the drawing surface's y axis points down.
/// Examples:
///   -  0  east, straight right of the center
///   - -90 straight up
///   - -180 west
///   - -225 bottom-left corner, 45 bottom-right corner
///   - -270 .. 90 spans the full circle
struct DialConfig {
    double min_value = 0.0;      ///< Lowest value on the scale
    double max_value = 100.0;    ///< Highest value on the scale
    double major_step = 20.0;    ///< Distance between labeled major ticks
    int subdivisions = 4;        ///< Equal parts each major interval is split into
    double start_angle = -225.0; ///< Angle of min_value, degrees
    double end_angle = 45.0;     ///< Angle of max_value, degrees; must exceed start_angle
};

/// Checks every invariant of a configuration, including that the span is
/// finite and the scale stays within MAX_MAJOR_TICKS and MAX_SUBDIVISIONS.
/// @throws InvalidConfiguration naming the first violated field
void validate_config(const DialConfig& config);

/// Checks the range, step and subdivision count of a scale.
/// @throws InvalidConfiguration naming the first violated field
void validate_scale(double min_value, double max_value, double major_step, int subdivisions);

} // namespace analogdial
