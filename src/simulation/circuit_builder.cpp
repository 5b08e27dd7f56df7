/// @file circuit_builder.cpp
/// @brief Implementation of standard circuit builder functions

#include "simulation/circuit_builder.hpp"

#include <string>
#include <utility>

namespace gatesim {

namespace {

Element* add_input(Model& model, std::string label, Signal default_value = Signal::Zero) {
    ElementConfig config;
    config.label = std::move(label);
    config.default_value = default_value;
    return model.add_element(ElementKind::IN, std::move(config));
}

Element* add_clock(Model& model, std::string label) {
    ElementConfig config;
    config.label = std::move(label);
    return model.add_element(ElementKind::CLOCK, std::move(config));
}

Element* add_output(Model& model, std::string label) {
    ElementConfig config;
    config.label = std::move(label);
    return model.add_element(ElementKind::OUT, std::move(config));
}

/// Connects pin @p from_pin of @p from to pin @p to_pin of @p to
void wire(Model& model, Element* from, const char* from_pin, Element* to, const char* to_pin) {
    model.connect(from->find_pin(from_pin), to->find_pin(to_pin));
}

std::unique_ptr<Model> finish(std::unique_ptr<Model> model) {
    model->finalize();
    (void)model->init();
    return model;
}

} // namespace

std::unique_ptr<Model> build_half_adder(SimulationConfig config) {
    auto model = std::make_unique<Model>(config);

    Element* in_a = add_input(*model, "A");
    Element* in_b = add_input(*model, "B");

    Element* xor_gate = model->add_element(ElementKind::XOR); // S = A XOR B
    Element* and_gate = model->add_element(ElementKind::AND); // C = A AND B

    Element* out_s = add_output(*model, "S");
    Element* out_c = add_output(*model, "C");

    wire(*model, in_a, "out", xor_gate, "In_1");
    wire(*model, in_b, "out", xor_gate, "In_2");
    wire(*model, in_a, "out", and_gate, "In_1");
    wire(*model, in_b, "out", and_gate, "In_2");
    wire(*model, xor_gate, "out", out_s, "in");
    wire(*model, and_gate, "out", out_c, "in");

    return finish(std::move(model));
}

std::unique_ptr<Model> build_full_adder(SimulationConfig config) {
    auto model = std::make_unique<Model>(config);

    Element* in_a = add_input(*model, "A");
    Element* in_b = add_input(*model, "B");
    Element* in_ci = add_input(*model, "Ci");

    // Half adder 1: A XOR B, A AND B
    Element* xor1 = model->add_element(ElementKind::XOR);
    Element* and1 = model->add_element(ElementKind::AND);
    wire(*model, in_a, "out", xor1, "In_1");
    wire(*model, in_b, "out", xor1, "In_2");
    wire(*model, in_a, "out", and1, "In_1");
    wire(*model, in_b, "out", and1, "In_2");

    // Half adder 2: (A XOR B) XOR Ci, (A XOR B) AND Ci
    Element* xor2 = model->add_element(ElementKind::XOR);
    Element* and2 = model->add_element(ElementKind::AND);
    wire(*model, xor1, "out", xor2, "In_1");
    wire(*model, in_ci, "out", xor2, "In_2");
    wire(*model, xor1, "out", and2, "In_1");
    wire(*model, in_ci, "out", and2, "In_2");

    // Co = (A AND B) OR ((A XOR B) AND Ci)
    Element* or_gate = model->add_element(ElementKind::OR);
    wire(*model, and1, "out", or_gate, "In_1");
    wire(*model, and2, "out", or_gate, "In_2");

    Element* out_s = add_output(*model, "S");
    Element* out_co = add_output(*model, "Co");
    wire(*model, xor2, "out", out_s, "in");
    wire(*model, or_gate, "out", out_co, "in");

    return finish(std::move(model));
}

std::unique_ptr<Model> build_jk_device(SimulationConfig config) {
    auto model = std::make_unique<Model>(config);

    // Asynchronous inputs idle high
    Element* in_clr = add_input(*model, "Clr", Signal::One);
    Element* in_pre = add_input(*model, "Pre", Signal::One);
    Element* in_j = add_input(*model, "J");
    Element* in_k = add_input(*model, "K");
    Element* clock = add_clock(*model, "C");

    ElementConfig ff_config;
    ff_config.async_set_clear = true;
    ff_config.edge = ClockEdge::FALLING;
    ff_config.input_inversion = (1U << 3) | (1U << 4); // Set and Clr are active low
    ff_config.both_asserted_q = Signal::One;
    ff_config.both_asserted_q_bar = Signal::One;
    Element* flip_flop = model->add_element(ElementKind::JK_FLIP_FLOP, ff_config);

    Element* out_q = add_output(*model, "Q");
    Element* out_q_bar = add_output(*model, "~Q");

    wire(*model, in_j, "out", flip_flop, "J");
    wire(*model, clock, "out", flip_flop, "C");
    wire(*model, in_k, "out", flip_flop, "K");
    wire(*model, in_pre, "out", flip_flop, "Set");
    wire(*model, in_clr, "out", flip_flop, "Clr");
    wire(*model, flip_flop, "Q", out_q, "in");
    wire(*model, flip_flop, "~Q", out_q_bar, "in");

    return finish(std::move(model));
}

std::unique_ptr<Model> build_d_register(SimulationConfig config) {
    auto model = std::make_unique<Model>(config);

    Element* in_d = add_input(*model, "D");
    Element* clock = add_clock(*model, "C");

    ElementConfig ff_config;
    ff_config.edge = ClockEdge::RISING;
    Element* flip_flop = model->add_element(ElementKind::D_FLIP_FLOP, ff_config);

    Element* out_q = add_output(*model, "Q");

    wire(*model, in_d, "out", flip_flop, "D");
    wire(*model, clock, "out", flip_flop, "C");
    wire(*model, flip_flop, "Q", out_q, "in");

    return finish(std::move(model));
}

std::unique_ptr<Model> build_sr_latch(SimulationConfig config) {
    auto model = std::make_unique<Model>(config);

    Element* in_s = add_input(*model, "S");
    Element* in_r = add_input(*model, "R");

    Element* nor_q = model->add_element(ElementKind::NOR);     // Q = NOR(R, ~Q)
    Element* nor_q_bar = model->add_element(ElementKind::NOR); // ~Q = NOR(S, Q)

    Element* out_q = add_output(*model, "Q");
    Element* out_q_bar = add_output(*model, "~Q");

    wire(*model, in_r, "out", nor_q, "In_1");
    wire(*model, nor_q_bar, "out", nor_q, "In_2");
    wire(*model, in_s, "out", nor_q_bar, "In_1");
    wire(*model, nor_q, "out", nor_q_bar, "In_2");
    wire(*model, nor_q, "out", out_q, "in");
    wire(*model, nor_q_bar, "out", out_q_bar, "in");

    return finish(std::move(model));
}

std::unique_ptr<Model> build_gated_oscillator(SimulationConfig config) {
    auto model = std::make_unique<Model>(config);

    Element* in_en = add_input(*model, "EN");
    Element* nand_gate = model->add_element(ElementKind::NAND);
    Element* out_y = add_output(*model, "Y");

    wire(*model, in_en, "out", nand_gate, "In_1");
    wire(*model, nand_gate, "out", nand_gate, "In_2");
    wire(*model, nand_gate, "out", out_y, "in");

    return finish(std::move(model));
}

std::unique_ptr<Model> build_shorted_outputs(SimulationConfig config) {
    auto model = std::make_unique<Model>(config);

    Element* in_a = add_input(*model, "A");
    Element* in_b = add_input(*model, "B");
    Element* out_y = add_output(*model, "Y");

    wire(*model, in_a, "out", in_b, "out");
    wire(*model, in_a, "out", out_y, "in");

    return finish(std::move(model));
}

std::string_view half_adder_test_vector() {
    return "# half adder truth table\n"
           "A B S C\n"
           "0 0 0 0\n"
           "0 1 1 0\n"
           "1 0 1 0\n"
           "1 1 0 1\n";
}

std::string_view full_adder_test_vector() {
    return "A B Ci S Co\n"
           "0 0 0  0 0\n"
           "0 0 1  1 0\n"
           "0 1 0  1 0\n"
           "0 1 1  0 1\n"
           "1 0 0  1 0\n"
           "1 0 1  0 1\n"
           "1 1 0  0 1\n"
           "1 1 1  1 1\n";
}

std::string_view jk_device_test_vector() {
    return "Clr Pre J K C Q ~Q\n"
           "# asynchronous clear and preset\n"
           "0   1   X X X 0 1\n"
           "1   0   X X X 1 0\n"
           "0   0   X X X 1 1\n"
           "\n"
           "# clocked J/K modes\n"
           "1   1   1 0 C 1 0\n"
           "1   1   0 1 C 0 1\n"
           "1   1   1 1 C 1 0\n"
           "1   1   1 1 C 0 1\n"
           "1   1   0 0 C 0 1\n";
}

std::string_view d_register_test_vector() {
    return "D C Q\n"
           "1 C 1\n"
           "0 X 1\n"
           "0 C 0\n"
           "1 0 0\n"
           "1 1 1\n"
           "0 0 1\n";
}

} // namespace gatesim
