#pragma once

/// @file pin.hpp
/// @brief Pin model — a connection point owned by one element

#include "simulation/signal.hpp"

#include <cstdint>
#include <string>

namespace gatesim {

class Element; // Forward declaration
class Net;     // Forward declaration

/// Direction of a pin as seen from its owning element
enum class PinDirection { Input, Output, Bidirectional };

/// A pin belongs to exactly one element and, once the model is finalized, to
/// exactly one net.
///
/// Output and bidirectional pins hold the value the element drives onto the
/// net. Input and bidirectional pins read the net's combined value.
class Pin {
  public:
    Pin(uint32_t id, Element* owner, std::string name, PinDirection direction);

    [[nodiscard]] uint32_t get_id() const { return id_; }
    [[nodiscard]] Element* get_owner() const { return owner_; }
    [[nodiscard]] const std::string& get_name() const { return name_; }
    [[nodiscard]] PinDirection get_direction() const { return direction_; }
    [[nodiscard]] Net* get_net() const { return net_; }
    [[nodiscard]] int get_number() const { return number_; }
    [[nodiscard]] Signal get_driven() const { return driven_; }

    /// True if this pin contributes a driver value to its net
    [[nodiscard]] bool drives() const { return direction_ != PinDirection::Input; }

    /// True if this pin observes its net's value
    [[nodiscard]] bool reads() const { return direction_ != PinDirection::Output; }

    void set_net(Net* net) { net_ = net; }
    void set_number(int number) { number_ = number; }

    /// Updates the driven value. Returns true if it changed.
    bool set_driven(Signal value);

    /// Value of the net this pin belongs to (Floating if not yet attached)
    [[nodiscard]] Signal read() const;

  private:
    uint32_t id_;
    Element* owner_;
    std::string name_;
    PinDirection direction_;
    Net* net_ = nullptr;
    int number_ = -1;
    // Outputs drive a defined level until their element is first evaluated
    Signal driven_ = Signal::Zero;
};

} // namespace gatesim
