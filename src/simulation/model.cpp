/// @file model.cpp
/// @brief Model construction, net formation (union-find) and the settle loop

#include "simulation/model.hpp"

#include "util/log.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace gatesim {

namespace {

bool by_id(const Element* a, const Element* b) {
    return a->get_id() < b->get_id();
}

} // namespace

Model::Model(SimulationConfig config) : config_(config) {}

Element* Model::add_element(ElementKind kind, ElementConfig config) {
    if (finalized_) {
        throw NetlistError("Cannot add elements to a finalized model");
    }

    std::vector<PinSpec> layout = pin_layout(kind, config);
    elements_.push_back(std::make_unique<Element>(next_element_id_++, kind, std::move(config)));
    Element* element = elements_.back().get();

    for (size_t i = 0; i < layout.size(); i++) {
        const PinSpec& spec = layout[i];
        pins_.push_back(std::make_unique<Pin>(next_pin_id_++, element, spec.name, spec.direction));
        Pin* pin = pins_.back().get();
        // Terminals carry the package pin number, other elements their layout index
        pin->set_number(is_terminal(kind) ? element->get_config().pin_number : static_cast<int>(i));
        element->attach_pin(pin);
        (void)connections_.add();
    }
    return element;
}

void Model::connect(Pin* a, Pin* b) {
    if (finalized_) {
        throw NetlistError("Cannot connect pins of a finalized model");
    }
    if (a == nullptr || b == nullptr) {
        throw NetlistError("connect() requires two non-null pins");
    }
    connections_.unite(a->get_id(), b->get_id());
}

void Model::finalize() {
    if (finalized_) {
        throw NetlistError("Model is already finalized");
    }

    for (auto& element : elements_) {
        if (!is_terminal(element->get_kind()) || element->get_label().empty()) {
            continue;
        }
        if (!terminals_.emplace(element->get_label(), element.get()).second) {
            throw NetlistError("Duplicate terminal label '" + element->get_label() + "' on element " +
                               std::to_string(element->get_id()));
        }
    }

    // Pins are visited in id order, so net ids follow the lowest pin id of
    // each connected group and do not depend on union-find internals.
    std::unordered_map<size_t, Net*> net_by_root;
    for (auto& pin : pins_) {
        size_t root = connections_.find(pin->get_id());
        auto it = net_by_root.find(root);
        Net* net = nullptr;
        if (it == net_by_root.end()) {
            nets_.push_back(std::make_unique<Net>(static_cast<uint32_t>(nets_.size())));
            net = nets_.back().get();
            net_by_root.emplace(root, net);
        } else {
            net = it->second;
        }

        pin->set_net(net);
        if (pin->drives()) {
            net->add_driver(pin.get());
        }
        if (pin->reads()) {
            net->add_reader(pin.get());
        }
    }

    reported_shorts_.assign(nets_.size(), false);
    finalized_ = true;

    log_message(LogLevel::VERBOSE, "Finalized model: %zu elements, %zu pins, %zu nets",
                elements_.size(), pins_.size(), nets_.size());
}

SettleResult Model::init() {
    if (!finalized_) {
        throw NetlistError("Model must be finalized before init()");
    }

    worklist_.clear();
    for (auto& element : elements_) {
        element->set_dirty(true);
        worklist_.push_back(element.get());
    }

    // Bring every net in line with the drivers' current values. Readers are
    // already dirty, so the scratch list stays empty.
    std::vector<Element*> scratch;
    for (auto& net : nets_) {
        (void)net->recompute_value(scratch);
    }

    initialized_ = true;
    return run_settle(config_.sequential_startup);
}

SettleResult Model::settle() {
    require_ready("settle()");
    return run_settle(false);
}

void Model::require_ready(const char* operation) const {
    if (!finalized_ || !initialized_) {
        throw std::runtime_error(std::string("Model must be finalized and initialized before ") +
                                 operation);
    }
}

void Model::mark_dirty(Element* element) {
    if (!element->is_dirty()) {
        element->set_dirty(true);
        worklist_.push_back(element);
    }
}

SettleResult Model::run_settle(bool sequential) {
    state_ = ModelState::SETTLING;
    SettleResult result;

    std::vector<Element*> batch;
    std::vector<Net*> pending;
    std::vector<Net*> changed;

    while (!worklist_.empty()) {
        if (result.passes >= config_.max_settle_passes) {
            fail_oscillation(changed, result.passes);
        }
        result.passes++;

        batch.swap(worklist_);
        worklist_.clear();
        std::sort(batch.begin(), batch.end(), by_id);
        changed.clear();

        if (sequential) {
            // Each element sees the nets updated by the elements before it
            for (Element* element : batch) {
                if (!element->evaluate()) {
                    continue;
                }
                for (Pin* out : element->get_outputs()) {
                    if (out->get_net()->recompute_value(worklist_)) {
                        changed.push_back(out->get_net());
                    }
                }
            }
        } else {
            // Phase 1: every element reads the nets as left by the previous pass
            pending.clear();
            for (Element* element : batch) {
                if (!element->evaluate()) {
                    continue;
                }
                for (Pin* out : element->get_outputs()) {
                    pending.push_back(out->get_net());
                }
            }

            // Phase 2: fold the new driver values into the nets
            std::sort(pending.begin(), pending.end(),
                      [](const Net* a, const Net* b) { return a->get_id() < b->get_id(); });
            pending.erase(std::unique(pending.begin(), pending.end()), pending.end());
            for (Net* net : pending) {
                if (net->recompute_value(worklist_)) {
                    changed.push_back(net);
                }
            }
        }
        batch.clear();
    }

    state_ = ModelState::IDLE;
    faulted_ = false;
    collect_short_circuits(result);
    return result;
}

void Model::fail_oscillation(const std::vector<Net*>& changed, int passes) {
    uint32_t net_id = 0;
    uint32_t element_id = 0;

    const Net* culprit = nullptr;
    for (const Net* net : changed) {
        if (culprit == nullptr || net->get_id() < culprit->get_id()) {
            culprit = net;
        }
    }
    if (culprit != nullptr) {
        net_id = culprit->get_id();
        if (!culprit->get_drivers().empty()) {
            element_id = culprit->get_drivers().front()->get_owner()->get_id();
        }
    } else if (!worklist_.empty()) {
        element_id = worklist_.front()->get_id();
    }

    // Pending elements stay dirty and queued; the next settle resumes them
    state_ = ModelState::IDLE;
    faulted_ = true;

    OscillationError error(net_id, element_id, passes);
    log_message(LogLevel::ERROR, "%s", error.what());
    throw error;
}

void Model::collect_short_circuits(SettleResult& result) {
    for (auto& net : nets_) {
        bool shorted = net->has_short_circuit();
        if (shorted) {
            result.short_circuits.push_back(net->get_id());
            if (!reported_shorts_[net->get_id()] && config_.report_short_circuits) {
                log_message(LogLevel::WARNING, "Short circuit on net %u (%zu drivers)",
                            net->get_id(), net->get_drivers().size());
            }
        }
        reported_shorts_[net->get_id()] = shorted;
    }
}

SettleResult Model::set_input(std::string_view label, Signal value) {
    Element* terminal = find_terminal(label);
    if (terminal == nullptr) {
        throw std::out_of_range("No terminal labelled '" + std::string(label) + "'");
    }
    return set_input(terminal, value);
}

SettleResult Model::set_input(Element* terminal, Signal value) {
    return set_inputs({{terminal, value}});
}

SettleResult Model::set_inputs(const std::vector<InputAssignment>& assignments) {
    require_ready("set_input()");
    for (const InputAssignment& assignment : assignments) {
        if (assignment.terminal == nullptr || !is_settable(assignment.terminal->get_kind())) {
            throw std::invalid_argument("set_input() requires an IN or CLOCK terminal");
        }
    }
    for (const InputAssignment& assignment : assignments) {
        if (assignment.terminal->set_value(assignment.value)) {
            mark_dirty(assignment.terminal);
        }
    }
    return run_settle(false);
}

Signal Model::get_output(std::string_view label) const {
    const Element* terminal = find_terminal(label);
    if (terminal == nullptr) {
        throw std::out_of_range("No terminal labelled '" + std::string(label) + "'");
    }
    return terminal->get_pins().front()->read();
}

SettleResult Model::pulse_clock(std::string_view label) {
    Element* terminal = find_terminal(label);
    if (terminal == nullptr) {
        throw std::out_of_range("No terminal labelled '" + std::string(label) + "'");
    }

    bool high = terminal->get_value() == Signal::One;
    SettleResult first = set_input(terminal, to_signal(!high));
    SettleResult second = set_input(terminal, to_signal(high));
    second.passes += first.passes;
    return second;
}

SettleResult Model::reset() {
    if (!finalized_) {
        throw NetlistError("Model must be finalized before reset()");
    }
    for (auto& element : elements_) {
        element->reset();
    }
    for (auto& pin : pins_) {
        (void)pin->set_driven(Signal::Zero);
    }
    faulted_ = false;
    return init();
}

Element* Model::find_terminal(std::string_view label) const {
    auto it = terminals_.find(std::string(label));
    return it != terminals_.end() ? it->second : nullptr;
}

std::vector<Signal> Model::net_values() const {
    std::vector<Signal> values;
    values.reserve(nets_.size());
    for (const auto& net : nets_) {
        values.push_back(net->get_value());
    }
    return values;
}

std::vector<uint32_t> Model::short_circuits() const {
    std::vector<uint32_t> ids;
    for (const auto& net : nets_) {
        if (net->has_short_circuit()) {
            ids.push_back(net->get_id());
        }
    }
    return ids;
}

} // namespace gatesim
