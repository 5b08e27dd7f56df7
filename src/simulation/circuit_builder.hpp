#pragma once

/// @file circuit_builder.hpp
/// @brief Factory functions that construct standard circuits from primitive elements
///
/// Every builder returns a finalized, initialized Model whose terminals are
/// labelled as listed, ready for set_input() / get_output() or a test vector.

#include "simulation/model.hpp"

#include <memory>
#include <string_view>

namespace gatesim {

/// Half adder.
/// Inputs: A, B
/// Outputs: S (A XOR B), C (A AND B)
[[nodiscard]] std::unique_ptr<Model> build_half_adder(SimulationConfig config = {});

/// Full adder built from two half adders and an OR gate.
/// Inputs: A, B, Ci
/// Outputs: S, Co
[[nodiscard]] std::unique_ptr<Model> build_full_adder(SimulationConfig config = {});

/// JK flip-flop with active-low asynchronous preset and clear, falling-edge
/// clock. With both Pre and Clr low both outputs are forced high.
/// Inputs: Clr, Pre, J, K, clock C
/// Outputs: Q, ~Q
[[nodiscard]] std::unique_ptr<Model> build_jk_device(SimulationConfig config = {});

/// Rising-edge D flip-flop.
/// Inputs: D, clock C
/// Outputs: Q
[[nodiscard]] std::unique_ptr<Model> build_d_register(SimulationConfig config = {});

/// Set/reset latch from two cross-coupled NOR gates.
/// Inputs: S, R
/// Outputs: Q, ~Q
[[nodiscard]] std::unique_ptr<Model> build_sr_latch(SimulationConfig config = {});

/// NAND gate whose output feeds back into its second input. Stable while EN
/// is 0; setting EN to 1 makes it oscillate.
/// Inputs: EN
/// Outputs: Y
[[nodiscard]] std::unique_ptr<Model> build_gated_oscillator(SimulationConfig config = {});

/// Two input terminals driving the same net, observed by one output.
/// Inputs: A, B
/// Outputs: Y
[[nodiscard]] std::unique_ptr<Model> build_shorted_outputs(SimulationConfig config = {});

/// Exhaustive truth table for build_half_adder()
[[nodiscard]] std::string_view half_adder_test_vector();

/// Exhaustive truth table for build_full_adder()
[[nodiscard]] std::string_view full_adder_test_vector();

/// Device table for build_jk_device(): asynchronous inputs, then J/K modes
[[nodiscard]] std::string_view jk_device_test_vector();

/// Load and hold sequence for build_d_register()
[[nodiscard]] std::string_view d_register_test_vector();

} // namespace gatesim
