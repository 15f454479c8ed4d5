#include <pmat/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <string>

#include <unistd.h>

namespace pmat::log {

static std::atomic<int> s_level{Info};
static std::atomic<int> s_color{-1};  // -1 = not yet detected

void set_level(Level lvl) {
    s_level.store(lvl);
}

Level get_level() {
    return static_cast<Level>(s_level.load());
}

Level level_for_verbosity(int verbosity, Level fallback) {
    if (verbosity <= 0) return fallback;
    if (verbosity == 1) return Debug;
    return Trace;
}

void set_color_enabled(bool enabled) {
    s_color.store(enabled ? 1 : 0);
}

bool is_color_enabled() {
    int c = s_color.load();
    if (c < 0) {
        c = isatty(fileno(stderr)) ? 1 : 0;
        s_color.store(c);
    }
    return c == 1;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
        case Off:   return "off";
    }
    return "unknown";
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
        case Off:   return "";
    }
    return "";
}

// Lines are assembled first and written with one call so worker threads
// do not interleave partial lines.
static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < get_level()) return;

    std::string line;
    if (is_color_enabled()) {
        line += level_color(lvl);
        line += level_name(lvl);
        line += "\033[0m: ";
    } else {
        line += level_name(lvl);
        line += ": ";
    }

    char buf[1024];
    va_list copy;
    va_copy(copy, args);
    int n = std::vsnprintf(buf, sizeof(buf), fmt, copy);
    va_end(copy);
    if (n >= 0 && static_cast<size_t>(n) >= sizeof(buf)) {
        std::string big(static_cast<size_t>(n) + 1, '\0');
        std::vsnprintf(&big[0], big.size(), fmt, args);
        big.resize(static_cast<size_t>(n));
        line += big;
    } else if (n > 0) {
        line.append(buf, static_cast<size_t>(n));
    }
    line += '\n';

    std::fwrite(line.data(), 1, line.size(), stderr);
}

#define PMAT_LOG_FN(name, lvl)          \
    void name(const char* fmt, ...) {   \
        va_list args;                   \
        va_start(args, fmt);            \
        log_message(lvl, fmt, args);    \
        va_end(args);                   \
    }

PMAT_LOG_FN(trace, Trace)
PMAT_LOG_FN(debug, Debug)
PMAT_LOG_FN(info, Info)
PMAT_LOG_FN(warn, Warn)
PMAT_LOG_FN(error, Error)

#undef PMAT_LOG_FN

} // namespace pmat::log
