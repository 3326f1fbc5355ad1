/// @file hand_animation.cpp
/// @brief Damped spring integration for the dial hand

#include "rendering/hand_animation.hpp"

#include <algorithm>
#include <cmath>

namespace analogdial {

namespace {

constexpr double MAX_SUBSTEP = 1.0 / 240.0; ///< Keeps the stiff spring stable
constexpr double MAX_STEP = 1.0;            ///< Longer frame hitches are cut to this
constexpr double TWO_PI = 6.283185307179586;

bool at_rest(const SpringState& s, const SpringParams& params) {
    return std::abs(s.angle - s.target) <= params.position_tolerance &&
           std::abs(s.velocity) <= params.velocity_tolerance;
}

} // namespace

SpringStep step_spring(const SpringState& state, double target_angle, double delta_time,
                       const SpringParams& params) {
    SpringState next = state;
    next.target = target_angle;

    // Unit mass: stiffness from the response period, damping from the fraction
    const double omega = TWO_PI / params.response;
    const double stiffness = omega * omega;
    const double damping = 2.0 * params.damping_fraction * omega;

    double remaining = std::clamp(delta_time, 0.0, MAX_STEP);
    while (remaining > 0.0 && !at_rest(next, params)) {
        double h = std::min(remaining, MAX_SUBSTEP);
        double accel = -stiffness * (next.angle - next.target) - damping * next.velocity;
        // Semi-implicit Euler: velocity first, then position with the new velocity
        next.velocity += accel * h;
        next.angle += next.velocity * h;
        remaining -= h;
    }

    bool settled = at_rest(next, params);
    if (settled) {
        next.angle = next.target;
        next.velocity = 0.0;
    }
    return {next.angle, next, settled};
}

HandAnimator::HandAnimator(double initial_angle, const SpringParams& params)
    : params_(params), origin_(initial_angle) {
    state_.angle = initial_angle;
    state_.target = initial_angle;
}

void HandAnimator::retarget(double target_angle) {
    if (target_angle == state_.target) {
        return;
    }
    state_.target = target_angle;
    origin_ = state_.angle;
    elapsed_ = 0.0;
    phase_ = HandPhase::SETTLING;
}

void HandAnimator::update(double delta_time) {
    if (phase_ == HandPhase::IDLE) {
        return;
    }
    elapsed_ += std::max(0.0, delta_time);
    SpringStep step = step_spring(state_, state_.target, delta_time, params_);
    state_ = step.state;
    if (step.settled) {
        phase_ = HandPhase::IDLE;
        elapsed_ = 0.0;
    }
}

void HandAnimator::snap_to(double angle) {
    state_ = {angle, 0.0, angle};
    origin_ = angle;
    elapsed_ = 0.0;
    phase_ = HandPhase::IDLE;
}

} // namespace analogdial
