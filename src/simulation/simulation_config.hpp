#pragma once

/// @file simulation_config.hpp
/// @brief Tunables for a Model instance

namespace gatesim {

/// Settle parameters. Defaults match interactive use; tests shrink the pass
/// bound to make oscillation reports quick.
struct SimulationConfig {
    int max_settle_passes = 1000;   ///< Oscillation guard for one settle call
    bool sequential_startup = true; ///< Evaluate one element at a time during init()
    bool report_short_circuits = true; ///< Log a warning when a net becomes shorted
};

} // namespace gatesim
