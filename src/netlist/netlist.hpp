#pragma once

/// @file netlist.hpp
/// @brief Resolved netlist handed over by the schematic loader, and the
///        factory that turns it into a simulation Model

#include "simulation/element.hpp"
#include "simulation/model.hpp"
#include "simulation/simulation_config.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gatesim {

/// Grid coordinate of a pin or wire endpoint
struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator<(const Point& other) const { return x < other.x || (x == other.x && y < other.y); }
};

/// Named element options as written by the schematic ("Inputs" -> "3")
using AttributeMap = std::map<std::string, std::string>;

/// One placed element.
///
/// pin_positions lists the absolute location of every pin in the kind's
/// layout order (see pin_layout()); the loader resolves shapes and rotation.
/// position is kept for round-tripping only and ignored by the simulator.
struct ElementDescription {
    std::string kind;
    AttributeMap attributes;
    Point position;
    std::vector<Point> pin_positions;
};

/// A straight wire segment. Only its endpoints matter for connectivity.
struct WireDescription {
    Point a;
    Point b;
};

struct Netlist {
    std::vector<ElementDescription> elements;
    std::vector<WireDescription> wires;
};

/// Maps a schematic kind tag ("And", "NAnd", "JK_FF", "In", "VDD", ...) to an element kind.
/// @throws NetlistError for unknown tags
[[nodiscard]] ElementKind parse_element_kind(std::string_view tag);

/// Translates the schematic options of one element into its static configuration.
///
/// Recognized keys: Inputs, inverterConfig, outputInverterConfig, Label,
/// pinNumber, Default, edge, asyncSetClear, bothAssertedQ, bothAssertedNotQ,
/// bidirectional. Inversion masks are given either as a number (decimal, 0x
/// or 0b prefixed) or as a comma-separated list of pin names. Other keys are
/// layout-only and ignored.
/// @throws NetlistError for malformed values
[[nodiscard]] ElementConfig parse_element_config(ElementKind kind, const AttributeMap& attributes);

/// Builds, finalizes and initializes a Model from a netlist. Pins sharing a
/// coordinate, or joined through a chain of wires, end up on one net.
/// @throws NetlistError naming the offending element for structural errors
/// @throws OscillationError if the startup settle does not converge
[[nodiscard]] std::unique_ptr<Model> build_model(const Netlist& netlist, SimulationConfig config = {});

} // namespace gatesim
