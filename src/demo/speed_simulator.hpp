/// @file speed_simulator.hpp
/// @brief Simulated sensor that nudges the demo value on a fixed cadence.
///
/// Every tick interval the value moves by a bounded random amount with a
/// bias back toward the middle of its range: upward while low, downward
/// while high. The result is clamped into [MIN_SPEED, MAX_SPEED].

#pragma once

#include "demo/value_store.hpp"

#include <cstdint>
#include <random>

namespace analogdial {

class SpeedSimulator {
  public:
    static constexpr double TICK_INTERVAL = 0.2; ///< Seconds between perturbations
    static constexpr double MIN_SPEED = 0.0;
    static constexpr double MAX_SPEED = 60.0;
    static constexpr double LOW_THRESHOLD = 20.0;  ///< At or below: drift upward
    static constexpr double HIGH_THRESHOLD = 40.0; ///< At or above: drift downward

    /// @param store Non-owning pointer to the value being driven
    /// @param seed  Seed for the random source
    SpeedSimulator(ValueStore* store, uint32_t seed);

    /// Accumulates frame time and applies one perturbation per elapsed
    /// TICK_INTERVAL.
    /// @return Number of perturbations applied
    int tick(float delta_time);

    /// Computes the value following @p current: one biased random step,
    /// clamped into range. Does not touch the store.
    [[nodiscard]] double next_value(double current);

    void set_paused(bool paused) { paused_ = paused; }
    [[nodiscard]] bool paused() const { return paused_; }

  private:
    ValueStore* store_;
    std::mt19937 rng_;
    double accumulator_ = 0.0;
    bool paused_ = false;
};

} // namespace analogdial
