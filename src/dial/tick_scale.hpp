/// @file tick_scale.hpp
/// @brief Computes the values at which major and minor tick marks are drawn.

#pragma once

#include <vector>

namespace analogdial {

/// Tick values of a dial scale, in ascending order.
struct TickSet {
    std::vector<double> major_ticks; ///< Labeled graduations, min_value first
    std::vector<double> minor_ticks; ///< Unlabeled graduations between majors
};

/// Generates the tick values for a scale.
///
/// Major ticks run from @p min_value in steps of @p major_step up to and
/// including @p max_value. If the range is not a whole number of steps the
/// last major tick falls short of @p max_value; it is never clamped.
///
/// Each full major interval is split into @p subdivisions equal parts and a
/// minor tick is placed at every inner division point, so an interval receives
/// `subdivisions - 1` minor ticks. The next major tick is never repeated as a
/// minor tick, and nothing is placed after the last major tick.
///
/// @throws InvalidConfiguration if the range is empty, inverted or not finite,
///         the step is not positive or yields more than MAX_MAJOR_TICKS ticks,
///         or @p subdivisions is negative or above MAX_SUBDIVISIONS
[[nodiscard]] TickSet compute_ticks(double min_value, double max_value, double major_step,
                                    int subdivisions);

} // namespace analogdial
