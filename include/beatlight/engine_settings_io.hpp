#pragma once

#include "engine_settings.hpp"

#include <string>

namespace beatlight {

// Reads a JSON file written by save_settings. Absent keys keep their current
// value. Returns false (st untouched) and fills error naming the key when the
// file cannot be read or a present value does not parse.
bool load_settings(const char* path, EngineSettings& st, std::string& error);
bool save_settings(const char* path, const EngineSettings& st);

// Applies BEATLIGHT_<KEY> environment variables (upper-cased settings keys,
// plus BEATLIGHT_DEVICE) on top of st. A malformed value fails the whole call
// with error naming the variable; applied receives the number of variables used.
bool apply_environment_overrides(EngineSettings& st, std::string& error, int* applied = nullptr);

// Named parameter sets matching the older detector variants:
// "default", "ai_analyzer", "live_song", "rhythm_demo".
bool apply_preset(const std::string& name, EngineSettings& st);

// Returns false and fills error with a message naming the offending field.
bool validate_settings(const EngineSettings& st, std::string& error);

}
