/// @file hand_animation.hpp
/// @brief Spring-damped motion of the dial hand between angles.
///
/// The hand never jumps to a new angle. It is pulled toward its target by a
/// damped spring advanced once per frame by the host's clock. Retargeting
/// mid-flight keeps the current angle and velocity, so a stream of updates
/// arriving faster than the spring settles produces one continuous motion.

#pragma once

namespace analogdial {

/// Spring tuning. The defaults match a common UI spring: a 0.55 s response
/// with slight underdamping, so the hand overshoots a little and settles.
struct SpringParams {
    double response = 0.55;           ///< Period of the undamped oscillation, seconds
    double damping_fraction = 0.825;  ///< 1 = critically damped, < 1 overshoots
    double position_tolerance = 0.01; ///< Degrees from target counted as arrived
    double velocity_tolerance = 0.1;  ///< Degrees per second counted as at rest
};

/// Continuation of the spring between frames
struct SpringState {
    double angle = 0.0;    ///< Currently rendered angle, degrees
    double velocity = 0.0; ///< Degrees per second
    double target = 0.0;   ///< Angle the spring is pulling toward
};

/// Result of advancing the spring by one frame
struct SpringStep {
    double angle = 0.0;
    SpringState state;
    bool settled = false; ///< True once the hand rests exactly on the target
};

/// Advances the spring toward @p target_angle by @p delta_time seconds.
///
/// Uses the incoming angle and velocity as they are, so changing the target
/// re-parents the motion rather than restarting it. Once within both
/// tolerances the state snaps exactly onto the target with zero velocity.
/// Negative @p delta_time counts as zero.
[[nodiscard]] SpringStep step_spring(const SpringState& state, double target_angle,
                                     double delta_time, const SpringParams& params = {});

/// Animation phase of the hand
enum class HandPhase { IDLE, SETTLING };

/// Owns the spring state of one hand and exposes it as a small state machine:
/// IDLE(angle) -> retarget -> SETTLING(from, to, elapsed) -> IDLE(to).
class HandAnimator {
  public:
    /// Starts idle at @p initial_angle
    explicit HandAnimator(double initial_angle, const SpringParams& params = {});

    /// Points the hand at a new angle. Starts settling unless already resting
    /// there; a retarget while settling continues from the current motion.
    void retarget(double target_angle);

    /// Advances the animation by @p delta_time seconds
    void update(double delta_time);

    /// Jumps straight to @p angle and goes idle (no animation)
    void snap_to(double angle);

    [[nodiscard]] double angle() const { return state_.angle; }
    [[nodiscard]] double target() const { return state_.target; }
    [[nodiscard]] double velocity() const { return state_.velocity; }
    [[nodiscard]] HandPhase phase() const { return phase_; }

    /// Angle the current settle started from (the angle at the last retarget)
    [[nodiscard]] double settle_origin() const { return origin_; }

    /// Seconds spent in the current settle; 0 while idle
    [[nodiscard]] double elapsed() const { return elapsed_; }

  private:
    SpringParams params_;
    SpringState state_;
    HandPhase phase_ = HandPhase::IDLE;
    double origin_ = 0.0;
    double elapsed_ = 0.0;
};

} // namespace analogdial
