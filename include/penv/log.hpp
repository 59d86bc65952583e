#pragma once

#include <penv/result.hpp>
#include <string>
#include <cstdio>

namespace penv::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Safe to call from installer worker threads; lines are never interleaved.
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Accepts the names printed by level_name(), case-sensitive
Result<Level> parse_level(const std::string& name);

} // namespace penv::log
