/// @file angle_mapper.cpp
/// @brief Value-to-angle interpolation

#include "dial/angle_mapper.hpp"

#include "dial/dial_config.hpp"

namespace analogdial {

double interpolate(double value, double min_value, double max_value) {
    if (min_value == max_value) {
        throw InvalidConfiguration("Cannot interpolate over an empty range");
    }
    return (value - min_value) / (max_value - min_value);
}

double angle_for(double value, double min_value, double max_value, double start_angle,
                 double end_angle) {
    double normalized = interpolate(value, min_value, max_value);
    // start + (end - start) may round away from end
    if (value == max_value) {
        return end_angle;
    }
    return start_angle + (end_angle - start_angle) * normalized;
}

} // namespace analogdial
