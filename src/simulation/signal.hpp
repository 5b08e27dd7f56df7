#pragma once

/// @file signal.hpp
/// @brief Four-valued logic signal and the rules for combining drivers

#include <string_view>

namespace gatesim {

/// Value carried by a pin or net.
///
/// Floating means no active driver (high impedance). Unknown means the value
/// is undefined, either from contention or from an undefined input.
enum class Signal { Zero, One, Floating, Unknown };

/// Returns the human-readable name of a signal value
[[nodiscard]] constexpr std::string_view signal_name(Signal s) {
    switch (s) {
    case Signal::Zero:
        return "Zero";
    case Signal::One:
        return "One";
    case Signal::Floating:
        return "Floating";
    case Signal::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

/// Converts a bool to a driven signal
[[nodiscard]] constexpr Signal to_signal(bool value) {
    return value ? Signal::One : Signal::Zero;
}

/// True for values that are neither Zero nor One
[[nodiscard]] constexpr bool is_unknown_or_floating(Signal s) {
    return s == Signal::Floating || s == Signal::Unknown;
}

/// True when two drivers fight each other (one drives Zero, the other One)
[[nodiscard]] constexpr bool is_short(Signal a, Signal b) {
    return (a == Signal::Zero && b == Signal::One) || (a == Signal::One && b == Signal::Zero);
}

/// Merges two drivers of the same net.
///   same value      -> that value
///   Floating + x    -> x
///   Zero + One      -> Unknown (short circuit)
///   Unknown + x     -> Unknown unless x is Floating
[[nodiscard]] Signal combine(Signal a, Signal b);

[[nodiscard]] Signal logic_not(Signal a);

/// AND with Zero dominance: a Zero input decides the result even if the other
/// input is undefined.
[[nodiscard]] Signal logic_and(Signal a, Signal b);

/// OR with One dominance
[[nodiscard]] Signal logic_or(Signal a, Signal b);

[[nodiscard]] Signal logic_xor(Signal a, Signal b);

/// '0', '1', 'Z' or 'X'
[[nodiscard]] char signal_to_char(Signal s);

/// Parses '0', '1', 'Z'/'z' and 'X'/'x'.
/// @throws std::invalid_argument for any other character
[[nodiscard]] Signal signal_from_char(char c);

} // namespace gatesim
