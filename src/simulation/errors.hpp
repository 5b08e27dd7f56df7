#pragma once

/// @file errors.hpp
/// @brief Exceptions raised by model construction and settling

#include <cstdint>
#include <stdexcept>
#include <string>

namespace gatesim {

/// Thrown when a settle exceeds its pass bound without reaching a steady state.
/// Names the lowest-id net still changing in the last pass and an element
/// driving it.
class OscillationError : public std::runtime_error {
  public:
    OscillationError(uint32_t net_id, uint32_t element_id, int passes)
        : std::runtime_error("Circuit oscillates: net " + std::to_string(net_id) +
                             " driven by element " + std::to_string(element_id) +
                             " still changing after " + std::to_string(passes) + " passes"),
          net_id_(net_id), element_id_(element_id), passes_(passes) {}

    [[nodiscard]] uint32_t net_id() const { return net_id_; }
    [[nodiscard]] uint32_t element_id() const { return element_id_; }
    [[nodiscard]] int passes() const { return passes_; }

  private:
    uint32_t net_id_;
    uint32_t element_id_;
    int passes_;
};

/// Thrown for structural errors in the circuit description: unknown element
/// kinds, bad options, pin count mismatches, duplicate labels.
class NetlistError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

} // namespace gatesim
