#pragma once
/*
 * Config
 *
 * Purpose: compile-time defaults and the runtime SessionConfig (prompts, color, history).
 * Usage: load_config(path, cfg, msg) applies an rc file on top of the defaults.
 */
#include <cstddef>
#include <filesystem>
#include <string>

/*indent group inserted by Tab and removed as one unit by Backspace*/
#define ML_INDENT "    "

#ifndef ML_HISTORY_CAPACITY
#define ML_HISTORY_CAPACITY 200
#endif

/*longest CSI parameter run buffered before the sequence is dropped*/
#define ML_CSI_MAX_LEN 16

#define ML_ERROR_COLOR "\x1b[91m"

struct SessionConfig {
  std::string color = "\x1b[33m";
  std::string begin = " >";
  std::string again = " ?";
  size_t history_capacity = ML_HISTORY_CAPACITY;
};

// Reads `key = value` lines (color, begin, again, history) into cfg.
// Returns false with msg set on the first bad line; earlier lines stay applied.
bool load_config(const std::filesystem::path& path, SessionConfig& cfg, std::string& msg);

// Expands \e, \x1b, \033, \t, \\ and strips one pair of surrounding double quotes.
bool unescape_value(const std::string& raw, std::string& out);
