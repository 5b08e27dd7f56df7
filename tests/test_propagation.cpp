/// @file test_propagation.cpp
/// @brief Tests for the settle loop — multi-pass settling, feedback and oscillation

#include <catch2/catch.hpp>

#include "simulation/circuit_builder.hpp"
#include "simulation/model.hpp"

#include <vector>

using namespace gatesim;

namespace {

ElementConfig labelled(const char* label) {
    ElementConfig config;
    config.label = label;
    return config;
}

/// 2:1 multiplexer Y = (A AND NOT S) OR (B AND S). Gates are added in the
/// given order so two models can differ only in element ids.
std::unique_ptr<Model> build_mux(bool reversed) {
    auto model = std::make_unique<Model>();

    Element* in_a = model->add_element(ElementKind::IN, labelled("A"));
    Element* in_b = model->add_element(ElementKind::IN, labelled("B"));
    Element* in_s = model->add_element(ElementKind::IN, labelled("S"));

    Element* gates[4] = {};
    const ElementKind kinds[4] = {ElementKind::NOT, ElementKind::AND, ElementKind::AND,
                                  ElementKind::OR};
    for (int i = 0; i < 4; i++) {
        int slot = reversed ? 3 - i : i;
        gates[slot] = model->add_element(kinds[slot]);
    }
    Element* not_s = gates[0];
    Element* and_a = gates[1];
    Element* and_b = gates[2];
    Element* or_gate = gates[3];

    Element* out_y = model->add_element(ElementKind::OUT, labelled("Y"));

    model->connect(in_s->find_pin("out"), not_s->find_pin("in"));
    model->connect(in_a->find_pin("out"), and_a->find_pin("In_1"));
    model->connect(not_s->find_pin("out"), and_a->find_pin("In_2"));
    model->connect(in_b->find_pin("out"), and_b->find_pin("In_1"));
    model->connect(in_s->find_pin("out"), and_b->find_pin("In_2"));
    model->connect(and_a->find_pin("out"), or_gate->find_pin("In_1"));
    model->connect(and_b->find_pin("out"), or_gate->find_pin("In_2"));
    model->connect(or_gate->find_pin("out"), out_y->find_pin("in"));

    model->finalize();
    (void)model->init();
    return model;
}

} // namespace

TEST_CASE("A chain settles over several passes", "[propagation]") {
    Model model;
    Element* input = model.add_element(ElementKind::IN, labelled("A"));
    Pin* previous = input->find_pin("out");
    for (int i = 0; i < 4; i++) {
        Element* not_gate = model.add_element(ElementKind::NOT);
        model.connect(previous, not_gate->find_pin("in"));
        previous = not_gate->find_pin("out");
    }
    Element* output = model.add_element(ElementKind::OUT, labelled("Y"));
    model.connect(previous, output->find_pin("in"));
    model.finalize();
    (void)model.init();

    CHECK(model.get_output("Y") == Signal::Zero);

    SettleResult result = model.set_input("A", Signal::One);
    CHECK(result.passes >= 5); // terminal plus one pass per inverter
    CHECK(model.get_output("Y") == Signal::One);
}

TEST_CASE("Results do not depend on element creation order", "[propagation]") {
    auto forward = build_mux(false);
    auto backward = build_mux(true);

    const Signal levels[] = {Signal::Zero, Signal::One};
    for (Signal a : levels) {
        for (Signal b : levels) {
            for (Signal s : levels) {
                for (Model* model : {forward.get(), backward.get()}) {
                    (void)model->set_inputs({{model->find_terminal("A"), a},
                                             {model->find_terminal("B"), b},
                                             {model->find_terminal("S"), s}});
                }
                Signal expected = s == Signal::One ? b : a;
                CHECK(forward->get_output("Y") == expected);
                CHECK(backward->get_output("Y") == expected);
            }
        }
    }
}

TEST_CASE("Static hazard settles to the logical value", "[propagation]") {
    // Y = A XOR NOT A, briefly 0 while the inverter catches up
    Model model;
    Element* input = model.add_element(ElementKind::IN, labelled("A"));
    Element* not_gate = model.add_element(ElementKind::NOT);
    Element* xor_gate = model.add_element(ElementKind::XOR);
    Element* output = model.add_element(ElementKind::OUT, labelled("Y"));

    model.connect(input->find_pin("out"), not_gate->find_pin("in"));
    model.connect(input->find_pin("out"), xor_gate->find_pin("In_1"));
    model.connect(not_gate->find_pin("out"), xor_gate->find_pin("In_2"));
    model.connect(xor_gate->find_pin("out"), output->find_pin("in"));
    model.finalize();
    (void)model.init();

    CHECK(model.get_output("Y") == Signal::One);
    (void)model.set_input("A", Signal::One);
    CHECK(model.get_output("Y") == Signal::One);
    (void)model.set_input("A", Signal::Zero);
    CHECK(model.get_output("Y") == Signal::One);
}

TEST_CASE("SR latch holds its state through feedback", "[propagation]") {
    auto model = build_sr_latch();

    // Startup resolves the symmetric loop deterministically
    CHECK(model->get_output("Q") == Signal::One);
    CHECK(model->get_output("~Q") == Signal::Zero);

    (void)model->set_input("R", Signal::One);
    CHECK(model->get_output("Q") == Signal::Zero);
    CHECK(model->get_output("~Q") == Signal::One);

    (void)model->set_input("R", Signal::Zero);
    CHECK(model->get_output("Q") == Signal::Zero);

    (void)model->set_input("S", Signal::One);
    CHECK(model->get_output("Q") == Signal::One);
    (void)model->set_input("S", Signal::Zero);
    CHECK(model->get_output("Q") == Signal::One);
    CHECK(model->get_output("~Q") == Signal::Zero);
}

TEST_CASE("Releasing S and R together oscillates", "[propagation]") {
    SimulationConfig config;
    config.max_settle_passes = 50;
    auto model = build_sr_latch(config);

    Element* s = model->find_terminal("S");
    Element* r = model->find_terminal("R");
    (void)model->set_inputs({{s, Signal::One}, {r, Signal::One}});
    CHECK(model->get_output("Q") == Signal::Zero);
    CHECK(model->get_output("~Q") == Signal::Zero);

    CHECK_THROWS_AS(model->set_inputs({{s, Signal::Zero}, {r, Signal::Zero}}), OscillationError);
    CHECK(model->is_faulted());

    // reset() restarts from the defaults and recovers
    (void)model->reset();
    CHECK_FALSE(model->is_faulted());
    CHECK(model->get_output("Q") == Signal::One);
}

TEST_CASE("Symmetric latch startup needs sequential evaluation", "[propagation]") {
    SimulationConfig config;
    config.max_settle_passes = 50;
    config.sequential_startup = false;
    CHECK_THROWS_AS(build_sr_latch(config), OscillationError);
}

TEST_CASE("Gated oscillator", "[propagation]") {
    SimulationConfig config;
    config.max_settle_passes = 100;
    auto model = build_gated_oscillator(config);

    CHECK(model->get_output("Y") == Signal::One);

    try {
        (void)model->set_input("EN", Signal::One);
        FAIL("expected OscillationError");
    } catch (const OscillationError& e) {
        CHECK(e.passes() == 100);
        CHECK(e.net_id() == 1);    // NAND output
        CHECK(e.element_id() == 1); // the NAND gate
    }
    CHECK(model->is_faulted());

    // Disabling the gate brings it back to a steady state
    (void)model->set_input("EN", Signal::Zero);
    CHECK_FALSE(model->is_faulted());
    CHECK(model->get_output("Y") == Signal::One);
}

TEST_CASE("Logic behind an oscillation is current once it stops", "[propagation]") {
    // Both parities of the pass bound leave the NAND at a different level
    int bound = GENERATE(10, 11);
    SimulationConfig config;
    config.max_settle_passes = bound;
    Model model(config);

    Element* in_en = model.add_element(ElementKind::IN, labelled("EN"));
    Element* nand_gate = model.add_element(ElementKind::NAND);
    Element* not_gate = model.add_element(ElementKind::NOT);
    Element* out_y = model.add_element(ElementKind::OUT, labelled("Y"));

    model.connect(in_en->find_pin("out"), nand_gate->find_pin("In_1"));
    model.connect(nand_gate->find_pin("out"), nand_gate->find_pin("In_2"));
    model.connect(nand_gate->find_pin("out"), not_gate->find_pin("in"));
    model.connect(not_gate->find_pin("out"), out_y->find_pin("in"));
    model.finalize();
    (void)model.init();

    CHECK(model.get_output("Y") == Signal::Zero);

    INFO("max_settle_passes=" << bound);
    CHECK_THROWS_AS(model.set_input("EN", Signal::One), OscillationError);
    CHECK(model.is_faulted());

    (void)model.set_input("EN", Signal::Zero);
    CHECK_FALSE(model.is_faulted());
    CHECK(nand_gate->find_pin("out")->get_net()->get_value() == Signal::One);
    CHECK(model.get_output("Y") == Signal::Zero);
}

TEST_CASE("Settling a still-oscillating circuit keeps failing", "[propagation]") {
    SimulationConfig config;
    config.max_settle_passes = 10;
    Model model(config);

    Element* not_gate = model.add_element(ElementKind::NOT);
    model.connect(not_gate->find_pin("out"), not_gate->find_pin("in"));
    model.finalize();

    CHECK_THROWS_AS(model.init(), OscillationError);
    REQUIRE(model.is_faulted());

    // No input changed, the loop is still pending
    CHECK_THROWS_AS(model.settle(), OscillationError);
    CHECK(model.is_faulted());
    CHECK_THROWS_AS(model.settle(), OscillationError);
    CHECK(model.is_faulted());
}
