#pragma once

#include <string>
#include <cstdio>

namespace aarc::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parse "trace" / "debug" / "info" / "warn" / "error". Returns false on
// an unknown name and leaves out untouched.
bool parse_level(const std::string& name, Level& out);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (default stderr). Passing nullptr restores stderr.
void set_output(std::FILE* out);

// Each call writes exactly one line; safe to call from worker threads.
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace aarc::log
