#pragma once

#include <string>
#include <cstdio>

namespace pgbranch::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Apply PGBRANCH_LOG (trace|debug|info|warn|error) if it is set
void init_from_env();

// Parse a level name, case-insensitive. Returns false if unrecognized.
bool parse_level(const std::string& name, Level& out);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace pgbranch::log
