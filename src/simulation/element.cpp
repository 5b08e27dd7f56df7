/// @file element.cpp
/// @brief Element evaluation logic and Element class implementation

#include "simulation/element.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace gatesim {

namespace {

constexpr int MAX_INPUTS = 32; // One inversion bit per input

constexpr size_t CLOCK_INPUT = 1; // "C" is the second input of every sequential kind

/// Number of synchronous inputs (data + clock) before the optional Set/Clr pair
size_t sync_input_count(ElementKind kind) {
    return kind == ElementKind::JK_FLIP_FLOP ? 3 : 2;
}

bool is_variable_arity(ElementKind kind) {
    switch (kind) {
    case ElementKind::AND:
    case ElementKind::NAND:
    case ElementKind::OR:
    case ElementKind::NOR:
    case ElementKind::XOR:
    case ElementKind::XNOR:
        return true;
    default:
        return false;
    }
}

/// Maps Floating data inputs to Unknown; a flip-flop cannot store high impedance
Signal as_logic(Signal s) {
    return s == Signal::Floating ? Signal::Unknown : s;
}

Signal fold(const std::vector<Signal>& inputs, Signal (*op)(Signal, Signal)) {
    Signal result = inputs[0];
    for (size_t i = 1; i < inputs.size(); i++) {
        result = op(result, inputs[i]);
    }
    // A single undefined input must not pass through unchanged
    return as_logic(result);
}

void require_arity(ElementKind kind, const std::vector<Signal>& inputs, size_t expected) {
    if (inputs.size() != expected) {
        throw std::invalid_argument(std::string(element_kind_name(kind)) + " requires exactly " +
                                    std::to_string(expected) + " input(s)");
    }
}

} // namespace

std::vector<PinSpec> pin_layout(ElementKind kind, const ElementConfig& config) {
    std::vector<PinSpec> pins;

    if (is_variable_arity(kind)) {
        if (config.inputs < 2 || config.inputs > MAX_INPUTS) {
            throw std::invalid_argument(std::string(element_kind_name(kind)) +
                                        " requires between 2 and 32 inputs");
        }
        for (int i = 1; i <= config.inputs; i++) {
            pins.push_back({"In_" + std::to_string(i), PinDirection::Input});
        }
        pins.push_back({"out", PinDirection::Output});
        return pins;
    }

    switch (kind) {
    case ElementKind::NOT:
    case ElementKind::BUFFER:
        pins.push_back({"in", PinDirection::Input});
        pins.push_back({"out", PinDirection::Output});
        break;
    case ElementKind::DRIVER:
        pins.push_back({"in", PinDirection::Input});
        pins.push_back({"sel", PinDirection::Input});
        pins.push_back({"out", PinDirection::Output});
        break;
    case ElementKind::JK_FLIP_FLOP:
        pins.push_back({"J", PinDirection::Input});
        pins.push_back({"C", PinDirection::Input});
        pins.push_back({"K", PinDirection::Input});
        break;
    case ElementKind::D_FLIP_FLOP:
    case ElementKind::D_LATCH:
        pins.push_back({"D", PinDirection::Input});
        pins.push_back({"C", PinDirection::Input});
        break;
    case ElementKind::T_FLIP_FLOP:
        pins.push_back({"T", PinDirection::Input});
        pins.push_back({"C", PinDirection::Input});
        break;
    case ElementKind::IN:
    case ElementKind::CLOCK:
        pins.push_back(
            {"out", config.bidirectional ? PinDirection::Bidirectional : PinDirection::Output});
        break;
    case ElementKind::OUT:
        pins.push_back({"in", PinDirection::Input});
        break;
    case ElementKind::POWER_SUPPLY:
    case ElementKind::GROUND:
        pins.push_back({"out", PinDirection::Output});
        break;
    default:
        break;
    }

    if (config.async_set_clear && kind == ElementKind::D_LATCH) {
        throw std::invalid_argument("Asynchronous set/clear requires an edge-triggered element");
    }
    if (is_sequential(kind)) {
        if (config.async_set_clear) {
            pins.push_back({"Set", PinDirection::Input});
            pins.push_back({"Clr", PinDirection::Input});
        }
        pins.push_back({"Q", PinDirection::Output});
        pins.push_back({"~Q", PinDirection::Output});
    }
    return pins;
}

Signal evaluate_combinational(ElementKind kind, const std::vector<Signal>& inputs) {
    switch (kind) {
    case ElementKind::NOT:
        require_arity(kind, inputs, 1);
        return logic_not(inputs[0]);

    case ElementKind::BUFFER:
        require_arity(kind, inputs, 1);
        return as_logic(inputs[0]);

    case ElementKind::DRIVER:
        require_arity(kind, inputs, 2);
        // inputs: in, sel
        if (inputs[1] == Signal::One) {
            return as_logic(inputs[0]);
        }
        if (inputs[1] == Signal::Zero) {
            return Signal::Floating;
        }
        return Signal::Unknown;

    case ElementKind::AND:
    case ElementKind::NAND:
    case ElementKind::OR:
    case ElementKind::NOR:
    case ElementKind::XOR:
    case ElementKind::XNOR:
        break;

    default:
        throw std::invalid_argument(std::string(element_kind_name(kind)) +
                                    " is not a combinational element");
    }

    if (inputs.size() < 2) {
        throw std::invalid_argument(std::string(element_kind_name(kind)) +
                                    " requires at least 2 inputs");
    }

    switch (kind) {
    case ElementKind::AND:
        return fold(inputs, logic_and);
    case ElementKind::NAND:
        return logic_not(fold(inputs, logic_and));
    case ElementKind::OR:
        return fold(inputs, logic_or);
    case ElementKind::NOR:
        return logic_not(fold(inputs, logic_or));
    case ElementKind::XOR:
        return fold(inputs, logic_xor);
    case ElementKind::XNOR:
        return logic_not(fold(inputs, logic_xor));
    default:
        break;
    }
    throw std::invalid_argument("Unknown element kind");
}

Element::Element(uint32_t id, ElementKind kind, ElementConfig config)
    : id_(id), kind_(kind), config_(std::move(config)), value_(config_.default_value) {}

void Element::attach_pin(Pin* pin) {
    pins_.push_back(pin);
    if (pin->reads()) {
        inputs_.push_back(pin);
    }
    if (pin->drives()) {
        outputs_.push_back(pin);
    }
}

Pin* Element::find_pin(std::string_view name) const {
    for (Pin* pin : pins_) {
        if (pin->get_name() == name) {
            return pin;
        }
    }
    return nullptr;
}

bool Element::set_value(Signal value) {
    if (!is_settable(kind_)) {
        throw std::logic_error(std::string("Cannot set the value of a ") +
                               std::string(element_kind_name(kind_)) + " element");
    }
    if (value_ == value) {
        return false;
    }
    value_ = value;
    return true;
}

void Element::reset() {
    value_ = config_.default_value;
    state_ = SequentialState{};
    dirty_ = true;
}

Signal Element::read_input(size_t index) const {
    Signal value = inputs_[index]->read();
    if ((config_.input_inversion >> index) & 1U) {
        return logic_not(value);
    }
    return value;
}

bool Element::write_output(size_t index, Signal value) {
    if ((config_.output_inversion >> index) & 1U) {
        value = logic_not(value);
    }
    return outputs_[index]->set_driven(value);
}

void Element::step_sequential() {
    Signal clock = read_input(CLOCK_INPUT);
    Signal previous = state_.last_clock;
    state_.last_clock = clock;

    if (config_.async_set_clear) {
        size_t set_index = sync_input_count(kind_);
        Signal set = read_input(set_index);
        Signal clear = read_input(set_index + 1);

        if (set == Signal::One && clear == Signal::One) {
            state_.q = config_.both_asserted_q;
            state_.q_bar = config_.both_asserted_q_bar;
            return;
        }
        if (set == Signal::One) {
            state_.q = Signal::One;
            state_.q_bar = Signal::Zero;
            return;
        }
        if (clear == Signal::One) {
            state_.q = Signal::Zero;
            state_.q_bar = Signal::One;
            return;
        }
        if (set == Signal::Unknown || clear == Signal::Unknown) {
            state_.q = Signal::Unknown;
            state_.q_bar = Signal::Unknown;
            return;
        }
    }

    Signal q = state_.q;
    if (kind_ == ElementKind::D_LATCH) {
        Signal d = as_logic(read_input(0));
        if (clock == Signal::One) {
            q = d;
        } else if (clock != Signal::Zero && d != q) {
            q = Signal::Unknown;
        }
    } else {
        bool edge = config_.edge == ClockEdge::RISING
                        ? (previous == Signal::Zero && clock == Signal::One)
                        : (previous == Signal::One && clock == Signal::Zero);
        if (edge) {
            switch (kind_) {
            case ElementKind::JK_FLIP_FLOP: {
                Signal j = as_logic(read_input(0));
                Signal k = as_logic(read_input(2));
                if (j == Signal::Unknown || k == Signal::Unknown) {
                    q = Signal::Unknown;
                } else if (j == Signal::One && k == Signal::One) {
                    q = logic_not(q);
                } else if (j == Signal::One) {
                    q = Signal::One;
                } else if (k == Signal::One) {
                    q = Signal::Zero;
                }
                break;
            }
            case ElementKind::D_FLIP_FLOP:
                q = as_logic(read_input(0));
                break;
            case ElementKind::T_FLIP_FLOP: {
                Signal t = as_logic(read_input(0));
                if (t == Signal::One) {
                    q = logic_not(q);
                } else if (t == Signal::Unknown) {
                    q = Signal::Unknown;
                }
                break;
            }
            default:
                break;
            }
        }
    }

    state_.q = q;
    state_.q_bar = logic_not(q);
}

bool Element::evaluate() {
    bool changed = false;

    switch (kind_) {
    case ElementKind::IN:
    case ElementKind::CLOCK:
        changed = write_output(0, value_);
        break;

    case ElementKind::POWER_SUPPLY:
        changed = write_output(0, Signal::One);
        break;

    case ElementKind::GROUND:
        changed = write_output(0, Signal::Zero);
        break;

    case ElementKind::OUT:
        // Observed through its net, drives nothing
        break;

    case ElementKind::JK_FLIP_FLOP:
    case ElementKind::D_FLIP_FLOP:
    case ElementKind::T_FLIP_FLOP:
    case ElementKind::D_LATCH:
        step_sequential();
        changed = write_output(0, state_.q);
        changed = write_output(1, state_.q_bar) || changed;
        break;

    default: {
        std::vector<Signal> values;
        values.reserve(inputs_.size());
        for (size_t i = 0; i < inputs_.size(); i++) {
            values.push_back(read_input(i));
        }
        changed = write_output(0, evaluate_combinational(kind_, values));
        break;
    }
    }

    dirty_ = false;
    return changed;
}

} // namespace gatesim
