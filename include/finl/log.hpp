#pragma once

#include <string>
#include <cstdio>

namespace finl::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();

// Cheap check so hot paths can skip building log arguments
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination for log lines; nullptr restores stderr
void set_output(std::FILE* out);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parses "trace", "debug", "info", "warn", "error" or "off"
bool level_from_name(const std::string& name, Level& out);

} // namespace finl::log
