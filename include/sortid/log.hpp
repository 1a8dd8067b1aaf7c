#pragma once

#include <optional>
#include <string>
#include <cstdio>

namespace sortid::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Apply a level and an optional color override in one step; an empty
// color re-detects whether stderr is a terminal
void configure(Level lvl, std::optional<bool> color);

// Text printed before the level tag, e.g. "sortid" -> "sortid: warn: ...".
// Empty by default.
void set_prefix(const std::string& prefix);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace sortid::log
