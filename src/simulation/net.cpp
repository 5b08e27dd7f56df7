/// @file net.cpp
/// @brief Pin and Net implementation

#include "simulation/net.hpp"

#include "simulation/element.hpp"

#include <algorithm>
#include <utility>

namespace gatesim {

Pin::Pin(uint32_t id, Element* owner, std::string name, PinDirection direction)
    : id_(id), owner_(owner), name_(std::move(name)), direction_(direction) {}

bool Pin::set_driven(Signal value) {
    if (driven_ == value) {
        return false;
    }
    driven_ = value;
    return true;
}

Signal Pin::read() const {
    return net_ != nullptr ? net_->get_value() : Signal::Floating;
}

Net::Net(uint32_t id) : id_(id) {}

void Net::add_driver(Pin* pin) {
    drivers_.push_back(pin);
}

void Net::remove_driver(Pin* pin) {
    auto it = std::find(drivers_.begin(), drivers_.end(), pin);
    if (it != drivers_.end()) {
        drivers_.erase(it);
    }
}

void Net::add_reader(Pin* pin) {
    readers_.push_back(pin);
}

bool Net::recompute_value(std::vector<Element*>& worklist) {
    Signal value = Signal::Floating;
    bool seen_zero = false;
    bool seen_one = false;
    for (const Pin* driver : drivers_) {
        Signal driven = driver->get_driven();
        seen_zero = seen_zero || driven == Signal::Zero;
        seen_one = seen_one || driven == Signal::One;
        value = combine(value, driven);
    }
    short_circuit_ = seen_zero && seen_one;

    if (value == value_) {
        return false;
    }
    value_ = value;

    for (Pin* reader : readers_) {
        Element* owner = reader->get_owner();
        if (!owner->is_dirty()) {
            owner->set_dirty(true);
            worklist.push_back(owner);
        }
    }
    return true;
}

} // namespace gatesim
