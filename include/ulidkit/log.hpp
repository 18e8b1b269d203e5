#pragma once

#include <ulidkit/result.hpp>
#include <string>
#include <cstdio>

namespace ulidkit::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parses a level name as written in config files ("trace" .. "error").
// Case-insensitive; "warning" is accepted for Warn.
Result<Level> parse_level(const std::string& name);

} // namespace ulidkit::log
