#pragma once

#include <string>
#include <cstdio>

// All output goes to stderr; stdout belongs to the RPC transport and CLI results.
namespace pmat::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();

// -v => Debug, -vv and above => Trace, 0 => the caller's default
Level level_for_verbosity(int verbosity, Level fallback);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

const char* level_name(Level lvl);

} // namespace pmat::log
