/// @file dial_widget.cpp
/// @brief Store subscription and per-frame update of a dial

#include "ui/dial_widget.hpp"

namespace analogdial {

DialWidget::DialWidget(ValueStore* store, const DialConfig& config, ColorScheme scheme,
                       Rgba accent)
    : store_(store), listener_id_(0), dial_(config), scheme_(scheme), theme_(theme_for(scheme)),
      accent_(accent), value_(store->value()), hand_(dial_.angle_for(value_)) {
    // Subscribe last: the dial above may throw, and nothing must dangle then
    listener_id_ = store_->subscribe([this](double value) {
        value_ = value;
        hand_.retarget(dial_.angle_for(value));
    });
}

DialWidget::~DialWidget() {
    (void)store_->release(listener_id_);
}

void DialWidget::update(double delta_time) {
    hand_.update(delta_time);
}

Scene DialWidget::compose(const Rect& area) const {
    return compose_scene(dial_, value_, hand_.angle(), theme_, accent_, area);
}

} // namespace analogdial
