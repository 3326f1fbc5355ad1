#pragma once

/// @file dial_widget.hpp
/// @brief Binds one dial to the value store and carries its hand animation.

#include "demo/value_store.hpp"
#include "dial/dial.hpp"
#include "rendering/hand_animation.hpp"
#include "rendering/scene_composer.hpp"
#include "rendering/theme.hpp"

namespace analogdial {

/// A dial on screen: the scale, its palette and accent, and the spring that
/// carries the hand across frames.
///
/// Subscribes to the store on construction and unsubscribes on destruction.
/// Each store change retargets the hand; the store is never written to.
class DialWidget {
  public:
    /// The hand starts at rest on the store's current value.
    /// @throws InvalidConfiguration if @p config is invalid
    DialWidget(ValueStore* store, const DialConfig& config, ColorScheme scheme, Rgba accent);
    ~DialWidget();

    DialWidget(const DialWidget&) = delete;
    DialWidget& operator=(const DialWidget&) = delete;

    /// Advances the hand's spring
    /// @param delta_time Seconds since last frame
    void update(double delta_time);

    /// Composes this frame's scene, fitted into @p area
    [[nodiscard]] Scene compose(const Rect& area) const;

    [[nodiscard]] const Dial& dial() const { return dial_; }
    [[nodiscard]] const HandAnimator& hand() const { return hand_; }
    [[nodiscard]] ColorScheme scheme() const { return scheme_; }
    [[nodiscard]] double current_value() const { return value_; }

  private:
    ValueStore* store_;
    ValueStore::ListenerId listener_id_;
    Dial dial_;
    ColorScheme scheme_;
    Theme theme_;
    Rgba accent_;
    double value_;
    HandAnimator hand_;
};

} // namespace analogdial
