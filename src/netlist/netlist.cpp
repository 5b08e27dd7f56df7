/// @file netlist.cpp
/// @brief Netlist ingestion: kind/option decoding and coordinate-based net merging

#include "netlist/netlist.hpp"

#include "simulation/union_find.hpp"
#include "util/log.hpp"

#include <cctype>
#include <charconv>
#include <stdexcept>
#include <utility>

namespace gatesim {

namespace {

struct KindTag {
    std::string_view tag;
    ElementKind kind;
};

constexpr KindTag KIND_TAGS[] = {
    {"And", ElementKind::AND},
    {"NAnd", ElementKind::NAND},
    {"Or", ElementKind::OR},
    {"NOr", ElementKind::NOR},
    {"XOr", ElementKind::XOR},
    {"XNOr", ElementKind::XNOR},
    {"Not", ElementKind::NOT},
    {"Buffer", ElementKind::BUFFER},
    {"Driver", ElementKind::DRIVER},
    {"JK_FF", ElementKind::JK_FLIP_FLOP},
    {"D_FF", ElementKind::D_FLIP_FLOP},
    {"T_FF", ElementKind::T_FLIP_FLOP},
    {"D_Latch", ElementKind::D_LATCH},
    {"In", ElementKind::IN},
    {"Clock", ElementKind::CLOCK},
    {"Out", ElementKind::OUT},
    {"VDD", ElementKind::POWER_SUPPLY},
    {"Ground", ElementKind::GROUND},
};

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

/// Parses a decimal, 0x-prefixed hex or 0b-prefixed binary number
bool parse_unsigned(std::string_view text, uint32_t& value) {
    text = trim(text);
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        text.remove_prefix(2);
    } else if (text.size() > 2 && text[0] == '0' && (text[1] == 'b' || text[1] == 'B')) {
        base = 2;
        text.remove_prefix(2);
    }
    if (text.empty()) {
        return false;
    }
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    return ec == std::errc() && end == text.data() + text.size();
}

int parse_int(const std::string& key, const std::string& text) {
    std::string_view view = trim(text);
    int value = 0;
    auto [end, ec] = std::from_chars(view.data(), view.data() + view.size(), value);
    if (view.empty() || ec != std::errc() || end != view.data() + view.size()) {
        throw NetlistError("Option " + key + ": '" + text + "' is not an integer");
    }
    return value;
}

bool parse_bool(const std::string& key, const std::string& text) {
    std::string_view view = trim(text);
    if (view == "true" || view == "1") {
        return true;
    }
    if (view == "false" || view == "0") {
        return false;
    }
    throw NetlistError("Option " + key + ": '" + text + "' is not a boolean");
}

Signal parse_signal(const std::string& key, const std::string& text) {
    std::string_view view = trim(text);
    if (view.size() != 1) {
        throw NetlistError("Option " + key + ": '" + text + "' is not a signal value");
    }
    try {
        return signal_from_char(view[0]);
    } catch (const std::invalid_argument& e) {
        throw NetlistError("Option " + key + ": " + e.what());
    }
}

/// Decodes an inversion mask. Names are looked up among @p pins, which are
/// either the input or the output pins of the layout.
uint32_t parse_mask(const std::string& key, const std::string& text,
                    const std::vector<std::string>& pins) {
    uint32_t mask = 0;
    if (parse_unsigned(text, mask)) {
        return mask;
    }

    std::string_view rest = text;
    while (!rest.empty()) {
        size_t comma = rest.find(',');
        std::string_view name = trim(rest.substr(0, comma));
        rest = comma == std::string_view::npos ? std::string_view() : rest.substr(comma + 1);
        if (name.empty()) {
            continue;
        }

        bool found = false;
        for (size_t i = 0; i < pins.size(); i++) {
            if (pins[i] == name) {
                mask |= 1U << i;
                found = true;
                break;
            }
        }
        if (!found) {
            throw NetlistError("Option " + key + ": no pin named '" + std::string(name) + "'");
        }
    }
    return mask;
}

std::string describe(size_t index, const ElementDescription& description) {
    return "element " + std::to_string(index) + " (" + description.kind + ")";
}

} // namespace

ElementKind parse_element_kind(std::string_view tag) {
    for (const KindTag& entry : KIND_TAGS) {
        if (entry.tag == tag) {
            return entry.kind;
        }
    }
    throw NetlistError("Unknown element kind '" + std::string(tag) + "'");
}

ElementConfig parse_element_config(ElementKind kind, const AttributeMap& attributes) {
    ElementConfig config;

    // Options that change the pin layout come first; mask names depend on them
    if (auto it = attributes.find("Inputs"); it != attributes.end()) {
        config.inputs = parse_int(it->first, it->second);
    }
    if (auto it = attributes.find("asyncSetClear"); it != attributes.end()) {
        config.async_set_clear = parse_bool(it->first, it->second);
    }
    if (auto it = attributes.find("bidirectional"); it != attributes.end()) {
        config.bidirectional = parse_bool(it->first, it->second);
    }

    std::vector<std::string> input_names;
    std::vector<std::string> output_names;
    try {
        for (const PinSpec& spec : pin_layout(kind, config)) {
            if (spec.direction != PinDirection::Output) {
                input_names.push_back(spec.name);
            }
            if (spec.direction != PinDirection::Input) {
                output_names.push_back(spec.name);
            }
        }
    } catch (const std::invalid_argument& e) {
        throw NetlistError(e.what());
    }

    for (const auto& [key, value] : attributes) {
        if (key == "inverterConfig") {
            config.input_inversion = parse_mask(key, value, input_names);
        } else if (key == "outputInverterConfig") {
            config.output_inversion = parse_mask(key, value, output_names);
        } else if (key == "Label") {
            config.label = std::string(trim(value));
        } else if (key == "pinNumber") {
            config.pin_number = parse_int(key, value);
        } else if (key == "Default") {
            config.default_value = parse_signal(key, value);
        } else if (key == "edge") {
            std::string_view edge = trim(value);
            if (edge == "rising") {
                config.edge = ClockEdge::RISING;
            } else if (edge == "falling") {
                config.edge = ClockEdge::FALLING;
            } else {
                throw NetlistError("Option edge: expected 'rising' or 'falling', got '" + value + "'");
            }
        } else if (key == "bothAssertedQ") {
            config.both_asserted_q = parse_signal(key, value);
        } else if (key == "bothAssertedNotQ") {
            config.both_asserted_q_bar = parse_signal(key, value);
        }
    }
    return config;
}

std::unique_ptr<Model> build_model(const Netlist& netlist, SimulationConfig config) {
    auto model = std::make_unique<Model>(config);

    std::vector<Element*> created;
    created.reserve(netlist.elements.size());
    for (size_t i = 0; i < netlist.elements.size(); i++) {
        const ElementDescription& description = netlist.elements[i];
        Element* element = nullptr;
        try {
            ElementKind kind = parse_element_kind(description.kind);
            element = model->add_element(kind, parse_element_config(kind, description.attributes));
        } catch (const NetlistError& e) {
            throw NetlistError(describe(i, description) + ": " + e.what());
        } catch (const std::invalid_argument& e) {
            throw NetlistError(describe(i, description) + ": " + e.what());
        }

        if (description.pin_positions.size() != element->get_pins().size()) {
            throw NetlistError(describe(i, description) + ": expected " +
                               std::to_string(element->get_pins().size()) + " pin positions, got " +
                               std::to_string(description.pin_positions.size()));
        }
        created.push_back(element);
    }

    // Merge connection points: coordinates are interned, wires join their endpoints
    std::map<Point, size_t> point_index;
    UnionFind points;
    auto intern = [&](const Point& p) {
        auto [it, inserted] = point_index.emplace(p, points.size());
        if (inserted) {
            (void)points.add();
        }
        return it->second;
    };

    for (const WireDescription& wire : netlist.wires) {
        points.unite(intern(wire.a), intern(wire.b));
    }

    std::map<size_t, Pin*> anchor_by_root;
    for (size_t i = 0; i < created.size(); i++) {
        const std::vector<Point>& positions = netlist.elements[i].pin_positions;
        const std::vector<Pin*>& pins = created[i]->get_pins();
        for (size_t j = 0; j < pins.size(); j++) {
            size_t root = points.find(intern(positions[j]));
            auto [it, inserted] = anchor_by_root.emplace(root, pins[j]);
            if (!inserted) {
                model->connect(it->second, pins[j]);
            }
        }
    }

    model->finalize();
    log_message(LogLevel::VERBOSE, "Built model from netlist: %zu elements, %zu wires, %zu nets",
                netlist.elements.size(), netlist.wires.size(), model->nets().size());

    (void)model->init();
    return model;
}

} // namespace gatesim
