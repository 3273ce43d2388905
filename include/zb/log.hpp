#pragma once

#include <optional>
#include <string>
#include <cstdio>

namespace zb::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (default stderr). Passing nullptr restores stderr.
void set_sink(std::FILE* sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// "trace" / "debug" / ... -> Level; nullopt for anything else
std::optional<Level> parse_level(const std::string& name);

// Apply $ZB_LOG if set and valid
void init_from_env();

} // namespace zb::log
