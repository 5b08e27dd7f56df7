#pragma once

/// @file model.hpp
/// @brief Simulation model — owns elements, pins and nets, settles the circuit

#include "simulation/element.hpp"
#include "simulation/errors.hpp"
#include "simulation/net.hpp"
#include "simulation/simulation_config.hpp"
#include "simulation/union_find.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gatesim {

/// Idle between external calls, Settling while the fixed-point loop runs
enum class ModelState { IDLE, SETTLING };

/// One external value change, applied through Model::set_inputs()
struct InputAssignment {
    Element* terminal;
    Signal value;
};

/// Outcome of one successful settle
struct SettleResult {
    int passes = 0;                       ///< Evaluation passes until no element was dirty
    std::vector<uint32_t> short_circuits; ///< Ids of nets with conflicting drivers
};

/// One circuit instance and the unit of simulation.
///
/// Construction follows a builder pattern:
///   1. Create elements with add_element() (pins are created from the kind's layout)
///   2. Join pins with connect()
///   3. Call finalize() to merge connected pins into nets and index labels
///   4. Call init() to compute the startup steady state
///
/// Afterwards drive it with set_input() / pulse_clock() and read it with
/// get_output(). Every mutation settles before returning.
class Model {
  public:
    explicit Model(SimulationConfig config = {});

    // Non-copyable, movable
    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;
    Model(Model&&) = default;
    Model& operator=(Model&&) = default;

    /// Creates an element and its pins; returns a non-owning pointer
    /// @throws std::invalid_argument for an invalid configuration
    /// @throws NetlistError after finalize()
    Element* add_element(ElementKind kind, ElementConfig config = {});

    /// Puts two pins on the same net
    /// @throws NetlistError after finalize() or for a null pin
    void connect(Pin* a, Pin* b);

    /// Builds the nets from the accumulated connections and indexes terminal labels.
    /// @throws NetlistError on duplicate labels or if already finalized
    void finalize();

    /// Evaluates every element once and settles. With sequential_startup the
    /// startup settle visits one element at a time in id order.
    /// @throws OscillationError if no steady state is reached
    SettleResult init();

    /// Runs the fixed-point loop until no element is dirty. After an
    /// oscillation the elements still pending are resumed, so a circuit that
    /// keeps oscillating throws again.
    /// @throws OscillationError if the pass bound is exceeded
    SettleResult settle();

    /// Sets an IN/CLOCK terminal by label and settles.
    /// @throws std::out_of_range if no terminal has this label
    /// @throws std::invalid_argument if the terminal is not an input
    SettleResult set_input(std::string_view label, Signal value);

    /// Sets an IN/CLOCK terminal element directly and settles
    SettleResult set_input(Element* terminal, Signal value);

    /// Applies several input changes at once, then settles a single time
    /// @throws std::invalid_argument if any target is not an IN/CLOCK terminal
    SettleResult set_inputs(const std::vector<InputAssignment>& assignments);

    /// Value of the net attached to the labelled terminal
    /// @throws std::out_of_range if no terminal has this label
    [[nodiscard]] Signal get_output(std::string_view label) const;

    /// Drives the labelled input to the opposite level, settles, drives it
    /// back and settles again. A level other than One counts as low.
    SettleResult pulse_clock(std::string_view label);

    /// Restores terminal defaults and sequential state, then re-runs init()
    SettleResult reset();

    /// Terminal element with this label, or nullptr
    [[nodiscard]] Element* find_terminal(std::string_view label) const;

    /// Snapshot of every net value, indexed by net id
    [[nodiscard]] std::vector<Signal> net_values() const;

    /// Ids of nets currently driven by conflicting values
    [[nodiscard]] std::vector<uint32_t> short_circuits() const;

    // --- Accessors ---
    [[nodiscard]] const std::vector<std::unique_ptr<Element>>& elements() const { return elements_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Pin>>& pins() const { return pins_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Net>>& nets() const { return nets_; }
    [[nodiscard]] const SimulationConfig& config() const { return config_; }
    [[nodiscard]] ModelState state() const { return state_; }
    [[nodiscard]] bool is_finalized() const { return finalized_; }
    [[nodiscard]] bool is_initialized() const { return initialized_; }

    /// True after an oscillation until the next successful settle
    [[nodiscard]] bool is_faulted() const { return faulted_; }

  private:
    void require_ready(const char* operation) const;
    void mark_dirty(Element* element);
    SettleResult run_settle(bool sequential);
    [[noreturn]] void fail_oscillation(const std::vector<Net*>& changed, int passes);
    void collect_short_circuits(SettleResult& result);

    SimulationConfig config_;
    uint32_t next_element_id_ = 0;
    uint32_t next_pin_id_ = 0;

    std::vector<std::unique_ptr<Element>> elements_;
    std::vector<std::unique_ptr<Pin>> pins_;
    std::vector<std::unique_ptr<Net>> nets_;
    std::unordered_map<std::string, Element*> terminals_;
    UnionFind connections_;

    std::vector<Element*> worklist_;
    std::vector<bool> reported_shorts_;

    ModelState state_ = ModelState::IDLE;
    bool finalized_ = false;
    bool initialized_ = false;
    bool faulted_ = false;
};

} // namespace gatesim
