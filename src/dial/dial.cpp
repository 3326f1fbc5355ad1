/// @file dial.cpp
/// @brief Dial construction and value mapping

#include "dial/dial.hpp"

#include "dial/angle_mapper.hpp"

namespace analogdial {

namespace {

/// Validates before the ticks are computed so no geometry is ever derived
/// from a degenerate configuration.
const DialConfig& validated(const DialConfig& config) {
    validate_config(config);
    return config;
}

} // namespace

Dial::Dial(const DialConfig& config)
    : config_(validated(config)),
      ticks_(compute_ticks(config_.min_value, config_.max_value, config_.major_step,
                           config_.subdivisions)) {}

double Dial::angle_for(double value) const {
    return analogdial::angle_for(value, config_.min_value, config_.max_value,
                                 config_.start_angle, config_.end_angle);
}

} // namespace analogdial
