#pragma once

/// @file dial.hpp
/// @brief A validated dial scale: configuration plus its precomputed ticks

#include "dial/dial_config.hpp"
#include "dial/tick_scale.hpp"

namespace analogdial {

/// A circular analog dial scale (like an analog speedometer).
///
///          .───────.
///        ,'   30    `.
///      ,'             `.
///     ;   20       40   :
///     │                 │
///     │  10──────    50 │
///     :                 ;
///      ╲   0       60  ╱
///       `.           ,'
///          `───────'
///
/// Construction validates the configuration and computes the tick values
/// once; the object is immutable afterwards. A new configuration needs a new
/// Dial. The current value is not owned here: it is passed in per frame.
class Dial {
  public:
    /// @throws InvalidConfiguration if @p config violates any invariant
    explicit Dial(const DialConfig& config);

    /// Angle (degrees, clockwise from east) at which @p value sits on this
    /// dial. Unclamped: values outside the range point past the scale ends.
    [[nodiscard]] double angle_for(double value) const;

    [[nodiscard]] const DialConfig& config() const { return config_; }
    [[nodiscard]] const TickSet& ticks() const { return ticks_; }

  private:
    DialConfig config_;
    TickSet ticks_;
};

} // namespace analogdial
