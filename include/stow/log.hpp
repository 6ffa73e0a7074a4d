#pragma once

#include <string>
#include <cstdio>

namespace stow::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Parse "trace", "debug", "info", "warn" or "error" (case-insensitive).
bool parse_level(const std::string& name, Level& out);

// Apply STOW_LOG from the environment, if set and valid.
void init_from_env();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace stow::log
