/// @file dial_config.cpp
/// @brief Validation of dial configurations

#include "dial/dial_config.hpp"

#include <cmath>

namespace analogdial {

void validate_scale(double min_value, double max_value, double major_step, int subdivisions) {
    if (!std::isfinite(min_value) || !std::isfinite(max_value)) {
        throw InvalidConfiguration("min_value and max_value must be finite");
    }
    if (min_value >= max_value) {
        throw InvalidConfiguration("min_value must be less than max_value");
    }
    const double span = max_value - min_value;
    if (!std::isfinite(span)) {
        throw InvalidConfiguration("max_value - min_value must be finite");
    }
    if (!std::isfinite(major_step) || major_step <= 0.0) {
        throw InvalidConfiguration("major_step must be a positive finite number");
    }
    if (span / major_step > MAX_MAJOR_TICKS) {
        throw InvalidConfiguration("major_step is too small for the range (more than 1000 ticks)");
    }
    if (subdivisions < 0) {
        throw InvalidConfiguration("subdivisions must not be negative");
    }
    if (subdivisions > MAX_SUBDIVISIONS) {
        throw InvalidConfiguration("subdivisions must not exceed 100");
    }
}

void validate_config(const DialConfig& config) {
    validate_scale(config.min_value, config.max_value, config.major_step, config.subdivisions);
    if (!std::isfinite(config.start_angle) || !std::isfinite(config.end_angle)) {
        throw InvalidConfiguration("start_angle and end_angle must be finite");
    }
    if (config.start_angle >= config.end_angle) {
        throw InvalidConfiguration("start_angle must be less than end_angle");
    }
}

} // namespace analogdial
