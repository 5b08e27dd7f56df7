/// @file log.cpp
/// @brief stderr diagnostics

#include "util/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace gatesim {

namespace {

std::atomic<LogLevel> g_level{LogLevel::WARNING};

const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::VERBOSE:
        return "verbose";
    case LogLevel::INFO:
        return "info";
    case LogLevel::WARNING:
        return "warning";
    case LogLevel::ERROR:
        return "error";
    }
    return "?";
}

} // namespace

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

void log_message(LogLevel level, const char* format, ...) {
    if (level < g_level.load()) {
        return;
    }
    std::fprintf(stderr, "[gatesim] %s: ", level_tag(level));
    va_list args;
    va_start(args, format);
    std::vfprintf(stderr, format, args);
    va_end(args);
    std::fputc('\n', stderr);
}

} // namespace gatesim
