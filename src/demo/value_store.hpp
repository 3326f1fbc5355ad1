#pragma once

/// @file value_store.hpp
/// @brief Observable numeric value feeding the demo dials.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace analogdial {

/// Holds a single value and tells subscribers when it changes.
/// Dials only read from the store; nothing writes back through a listener.
class ValueStore {
  public:
    using Listener = std::function<void(double)>;
    using ListenerId = uint32_t;

    explicit ValueStore(double initial_value = 0.0) : value_(initial_value) {}

    // Listeners capture addresses of their owners, so the store stays put
    ValueStore(const ValueStore&) = delete;
    ValueStore& operator=(const ValueStore&) = delete;

    [[nodiscard]] double value() const { return value_; }

    /// Stores @p value and notifies every listener, in subscription order.
    /// Setting the value it already holds is a no-op.
    void set_value(double value);

    /// Registers a listener called with each new value
    [[nodiscard]] ListenerId subscribe(Listener listener);

    /// Removes a listener.
    /// @throws std::out_of_range if @p id is not subscribed
    void unsubscribe(ListenerId id);

    /// Removes a listener if it is subscribed.
    /// @return false if @p id was unknown
    [[nodiscard]] bool release(ListenerId id) noexcept;

    [[nodiscard]] std::size_t listener_count() const { return listeners_.size(); }

  private:
    struct Subscription {
        ListenerId id;
        Listener listener;
    };

    double value_;
    ListenerId next_id_ = 0;
    std::vector<Subscription> listeners_;
};

} // namespace analogdial
