#pragma once

/// @file log.hpp
/// @brief Minimal leveled diagnostics on stderr, prefixed with "[gatesim]"

namespace gatesim {

enum class LogLevel { VERBOSE, INFO, WARNING, ERROR };

/// Messages below this level are dropped. Default: WARNING. Safe to call
/// while other threads are logging.
void set_log_level(LogLevel level);

[[nodiscard]] LogLevel log_level();

/// printf-style message to stderr, one line, prefixed with the tool name and level
#if defined(__GNUC__)
__attribute__((format(printf, 2, 3)))
#endif
void log_message(LogLevel level, const char* format, ...);

} // namespace gatesim
