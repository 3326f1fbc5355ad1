/// @file speed_simulator.cpp
/// @brief Mean-reverting random walk driving the demo dials

#include "demo/speed_simulator.hpp"

#include <algorithm>

namespace analogdial {

SpeedSimulator::SpeedSimulator(ValueStore* store, uint32_t seed) : store_(store), rng_(seed) {}

int SpeedSimulator::tick(float delta_time) {
    if (paused_ || delta_time <= 0.0f) {
        return 0;
    }
    accumulator_ += static_cast<double>(delta_time);

    int steps = 0;
    while (accumulator_ >= TICK_INTERVAL) {
        accumulator_ -= TICK_INTERVAL;
        store_->set_value(next_value(store_->value()));
        steps++;
    }
    return steps;
}

double SpeedSimulator::next_value(double current) {
    double low = -2.0;
    double high = 2.0;
    if (current <= LOW_THRESHOLD) {
        low = -1.0;
        high = 3.0;
    } else if (current >= HIGH_THRESHOLD) {
        low = -3.0;
        high = 1.0;
    }
    std::uniform_real_distribution<double> change(low, high);
    return std::clamp(current + change(rng_), MIN_SPEED, MAX_SPEED);
}

} // namespace analogdial
