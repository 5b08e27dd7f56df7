/// @file signal.cpp
/// @brief Signal combination and logic operators

#include "simulation/signal.hpp"

#include <stdexcept>
#include <string>

namespace gatesim {

Signal combine(Signal a, Signal b) {
    if (a == Signal::Floating) {
        return b;
    }
    if (b == Signal::Floating) {
        return a;
    }
    if (a == b) {
        return a;
    }
    // Zero vs One, or Unknown against anything driven
    return Signal::Unknown;
}

Signal logic_not(Signal a) {
    switch (a) {
    case Signal::Zero:
        return Signal::One;
    case Signal::One:
        return Signal::Zero;
    default:
        return Signal::Unknown;
    }
}

Signal logic_and(Signal a, Signal b) {
    if (a == Signal::Zero || b == Signal::Zero) {
        return Signal::Zero;
    }
    if (a == Signal::One && b == Signal::One) {
        return Signal::One;
    }
    return Signal::Unknown;
}

Signal logic_or(Signal a, Signal b) {
    if (a == Signal::One || b == Signal::One) {
        return Signal::One;
    }
    if (a == Signal::Zero && b == Signal::Zero) {
        return Signal::Zero;
    }
    return Signal::Unknown;
}

Signal logic_xor(Signal a, Signal b) {
    if (is_unknown_or_floating(a) || is_unknown_or_floating(b)) {
        return Signal::Unknown;
    }
    return to_signal(a != b);
}

char signal_to_char(Signal s) {
    switch (s) {
    case Signal::Zero:
        return '0';
    case Signal::One:
        return '1';
    case Signal::Floating:
        return 'Z';
    case Signal::Unknown:
        return 'X';
    }
    return 'X';
}

Signal signal_from_char(char c) {
    switch (c) {
    case '0':
        return Signal::Zero;
    case '1':
        return Signal::One;
    case 'z':
    case 'Z':
        return Signal::Floating;
    case 'x':
    case 'X':
        return Signal::Unknown;
    default:
        throw std::invalid_argument(std::string("Not a signal character: '") + c + "'");
    }
}

} // namespace gatesim
