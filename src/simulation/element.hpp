#pragma once

/// @file element.hpp
/// @brief Circuit element model — kinds, static configuration, evaluation

#include "simulation/pin.hpp"
#include "simulation/signal.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gatesim {

/// Closed set of element kinds known to the simulator
enum class ElementKind {
    // Combinational
    AND,
    NAND,
    OR,
    NOR,
    XOR,
    XNOR,
    NOT,
    BUFFER,
    DRIVER,
    // Sequential
    JK_FLIP_FLOP,
    D_FLIP_FLOP,
    T_FLIP_FLOP,
    D_LATCH,
    // Terminals
    IN,
    CLOCK,
    OUT,
    POWER_SUPPLY,
    GROUND
};

/// Returns the human-readable name of an element kind
[[nodiscard]] constexpr std::string_view element_kind_name(ElementKind kind) {
    switch (kind) {
    case ElementKind::AND:
        return "AND";
    case ElementKind::NAND:
        return "NAND";
    case ElementKind::OR:
        return "OR";
    case ElementKind::NOR:
        return "NOR";
    case ElementKind::XOR:
        return "XOR";
    case ElementKind::XNOR:
        return "XNOR";
    case ElementKind::NOT:
        return "NOT";
    case ElementKind::BUFFER:
        return "BUFFER";
    case ElementKind::DRIVER:
        return "DRIVER";
    case ElementKind::JK_FLIP_FLOP:
        return "JK_FLIP_FLOP";
    case ElementKind::D_FLIP_FLOP:
        return "D_FLIP_FLOP";
    case ElementKind::T_FLIP_FLOP:
        return "T_FLIP_FLOP";
    case ElementKind::D_LATCH:
        return "D_LATCH";
    case ElementKind::IN:
        return "IN";
    case ElementKind::CLOCK:
        return "CLOCK";
    case ElementKind::OUT:
        return "OUT";
    case ElementKind::POWER_SUPPLY:
        return "POWER_SUPPLY";
    case ElementKind::GROUND:
        return "GROUND";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool is_sequential(ElementKind kind) {
    return kind == ElementKind::JK_FLIP_FLOP || kind == ElementKind::D_FLIP_FLOP ||
           kind == ElementKind::T_FLIP_FLOP || kind == ElementKind::D_LATCH;
}

[[nodiscard]] constexpr bool is_terminal(ElementKind kind) {
    return kind == ElementKind::IN || kind == ElementKind::CLOCK || kind == ElementKind::OUT ||
           kind == ElementKind::POWER_SUPPLY || kind == ElementKind::GROUND;
}

[[nodiscard]] constexpr bool is_combinational(ElementKind kind) {
    return !is_sequential(kind) && !is_terminal(kind);
}

/// True for terminals whose value is set from outside the circuit
[[nodiscard]] constexpr bool is_settable(ElementKind kind) {
    return kind == ElementKind::IN || kind == ElementKind::CLOCK;
}

/// Clock transition that triggers an edge-triggered flip-flop
enum class ClockEdge { RISING, FALLING };

/// Static per-element configuration, fixed when the element is created
struct ElementConfig {
    int inputs = 2;                      ///< Input count for AND/NAND/OR/NOR/XOR/XNOR
    uint32_t input_inversion = 0;        ///< Bit i inverts input pin i
    uint32_t output_inversion = 0;       ///< Bit i inverts output pin i
    std::string label;                   ///< Terminal label, used as pin reference
    int pin_number = -1;                 ///< Loader-assigned pin number
    Signal default_value = Signal::Zero; ///< Start value of IN/CLOCK terminals
    ClockEdge edge = ClockEdge::FALLING;
    bool async_set_clear = false;        ///< Adds "Set" and "Clr" inputs to flip-flops

    // Output pair forced while Set and Clr are both asserted. Device specific.
    Signal both_asserted_q = Signal::One;
    Signal both_asserted_q_bar = Signal::One;

    bool bidirectional = false; ///< IN terminal pin also reads back its net
};

/// Name and direction of one pin in an element's layout
struct PinSpec {
    std::string name;
    PinDirection direction;
};

/// Returns the ordered pin layout for an element of the given kind.
/// Input inversion bits index the input pins in this order.
/// @throws std::invalid_argument if the configured input count is invalid, or
///         for asynchronous set/clear on a latch
[[nodiscard]] std::vector<PinSpec> pin_layout(ElementKind kind, const ElementConfig& config);

/// Evaluates a combinational element from its (already inverted) input values.
/// This is a pure function with no side effects. A dominant input decides the
/// result even when other inputs are undefined: AND with a Zero is Zero.
/// @throws std::invalid_argument if the kind is not combinational or the input
///         count is wrong for the kind
[[nodiscard]] Signal evaluate_combinational(ElementKind kind, const std::vector<Signal>& inputs);

/// Stored bit of a sequential element plus the clock level seen last time
struct SequentialState {
    Signal q = Signal::Zero;
    Signal q_bar = Signal::One;
    Signal last_clock = Signal::Floating;
};

/// A single circuit element: gate, flip-flop, latch or terminal.
///
/// The element does not own its pins; the Model keeps them in an arena and
/// attaches them here in layout order.
class Element {
  public:
    explicit Element(uint32_t id, ElementKind kind, ElementConfig config);

    [[nodiscard]] uint32_t get_id() const { return id_; }
    [[nodiscard]] ElementKind get_kind() const { return kind_; }
    [[nodiscard]] const ElementConfig& get_config() const { return config_; }
    [[nodiscard]] const std::string& get_label() const { return config_.label; }
    [[nodiscard]] bool is_dirty() const { return dirty_; }
    [[nodiscard]] const std::vector<Pin*>& get_pins() const { return pins_; }
    [[nodiscard]] const std::vector<Pin*>& get_inputs() const { return inputs_; }
    [[nodiscard]] const std::vector<Pin*>& get_outputs() const { return outputs_; }
    [[nodiscard]] const SequentialState& get_state() const { return state_; }

    /// Current external value of an IN/CLOCK terminal
    [[nodiscard]] Signal get_value() const { return value_; }

    void set_dirty(bool dirty) { dirty_ = dirty; }

    /// Appends a pin; it is listed as input and/or output per its direction
    void attach_pin(Pin* pin);

    /// Looks up a pin by name, nullptr if absent
    [[nodiscard]] Pin* find_pin(std::string_view name) const;

    /// Sets the external value of an IN/CLOCK terminal.
    /// @return true if the value changed
    /// @throws std::logic_error for any other kind
    bool set_value(Signal value);

    /// Restores terminal defaults and clears sequential state
    void reset();

    /// Reads the input nets, computes new outputs and writes them to the
    /// output pins. Sequential kinds update their stored bit.
    /// @return true if any output pin changed its driven value
    bool evaluate();

  private:
    [[nodiscard]] Signal read_input(size_t index) const;
    bool write_output(size_t index, Signal value);
    void step_sequential();

    uint32_t id_;
    ElementKind kind_;
    ElementConfig config_;
    std::vector<Pin*> pins_;
    std::vector<Pin*> inputs_;
    std::vector<Pin*> outputs_;
    SequentialState state_;
    Signal value_;
    bool dirty_ = true;
};

} // namespace gatesim
