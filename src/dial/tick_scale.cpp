/// @file tick_scale.cpp
/// @brief Major/minor tick generation for a dial scale

#include "dial/tick_scale.hpp"

#include "dial/dial_config.hpp"

#include <cstddef>

namespace analogdial {

namespace {

/// Relative slack (in units of major_step) for a major tick that lands on
/// max_value up to floating-point error.
constexpr double END_TOLERANCE = 1e-9;

} // namespace

TickSet compute_ticks(double min_value, double max_value, double major_step, int subdivisions) {
    validate_scale(min_value, max_value, major_step, subdivisions);

    TickSet ticks;

    // Index multiplication keeps long scales free of accumulated error
    const double slack = major_step * END_TOLERANCE;
    for (std::size_t i = 0;; i++) {
        double value = min_value + static_cast<double>(i) * major_step;
        if (value > max_value + slack) {
            break;
        }
        if (value > max_value) {
            value = max_value;
        }
        ticks.major_ticks.push_back(value);
    }

    if (subdivisions > 1 && ticks.major_ticks.size() > 1) {
        const double minor_step = major_step / static_cast<double>(subdivisions);
        ticks.minor_ticks.reserve((ticks.major_ticks.size() - 1) *
                                  static_cast<std::size_t>(subdivisions - 1));
        for (std::size_t m = 0; m + 1 < ticks.major_ticks.size(); m++) {
            const double major = ticks.major_ticks[m];
            for (int k = 1; k < subdivisions; k++) {
                ticks.minor_ticks.push_back(major + static_cast<double>(k) * minor_step);
            }
        }
    }

    return ticks;
}

} // namespace analogdial
