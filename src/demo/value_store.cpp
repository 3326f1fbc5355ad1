/// @file value_store.cpp
/// @brief Change notification for the demo's value

#include "demo/value_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace analogdial {

void ValueStore::set_value(double value) {
    if (value == value_) {
        return;
    }
    value_ = value;
    // Copy so a listener may unsubscribe itself while being notified
    std::vector<Subscription> snapshot = listeners_;
    for (const Subscription& sub : snapshot) {
        sub.listener(value_);
    }
}

ValueStore::ListenerId ValueStore::subscribe(Listener listener) {
    ListenerId id = next_id_++;
    listeners_.push_back({id, std::move(listener)});
    return id;
}

void ValueStore::unsubscribe(ListenerId id) {
    if (!release(id)) {
        throw std::out_of_range("No listener subscribed with this id");
    }
}

bool ValueStore::release(ListenerId id) noexcept {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const Subscription& sub) { return sub.id == id; });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

} // namespace analogdial
