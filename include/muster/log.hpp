#pragma once

#include <string>
#include <cstdio>

namespace muster::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

void set_color_enabled(bool on);
bool is_color_enabled();

// Destination stream, stderr unless redirected. Passing nullptr restores stderr.
void set_sink(std::FILE* sink);
std::FILE* get_sink();

void write(Level lvl, const char* fmt, ...);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parses "trace".."error" and "off"; returns false and leaves out untouched otherwise
bool parse_level(const std::string& name, Level& out);

} // namespace muster::log
