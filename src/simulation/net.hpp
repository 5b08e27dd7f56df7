#pragma once

/// @file net.hpp
/// @brief Net model — a set of electrically joined pins carrying one value

#include "simulation/pin.hpp"
#include "simulation/signal.hpp"

#include <cstdint>
#include <vector>

namespace gatesim {

class Element; // Forward declaration

/// A net joins every pin that the wiring connects.
///
/// Its value is the combination of all driver pins. A net without any active
/// driver reads Floating; conflicting drivers make it read Unknown and set the
/// short-circuit flag. Reader pins observe the cached value.
class Net {
  public:
    /// Construct a net with a unique ID
    explicit Net(uint32_t id);

    [[nodiscard]] uint32_t get_id() const { return id_; }
    [[nodiscard]] Signal get_value() const { return value_; }
    [[nodiscard]] bool has_short_circuit() const { return short_circuit_; }
    [[nodiscard]] const std::vector<Pin*>& get_drivers() const { return drivers_; }
    [[nodiscard]] const std::vector<Pin*>& get_readers() const { return readers_; }

    /// Adds a pin that drives a value onto this net
    void add_driver(Pin* pin);

    /// Removes one occurrence of a driver pin
    void remove_driver(Pin* pin);

    /// Adds a pin that reads this net's value
    void add_reader(Pin* pin);

    /// Folds the driver values into a new net value.
    /// If the value changed, every reader's owning element that is not already
    /// dirty is flagged dirty and appended to @p worklist.
    /// @return true if the value changed
    bool recompute_value(std::vector<Element*>& worklist);

  private:
    uint32_t id_;
    Signal value_ = Signal::Floating;
    bool short_circuit_ = false;
    std::vector<Pin*> drivers_;
    std::vector<Pin*> readers_;
};

} // namespace gatesim
