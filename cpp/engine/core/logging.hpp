#pragma once
/*
================================================================================
Core: Logging
FILE: cpp/engine/core/logging.hpp

Purpose:
  - Minimal, dependency-free logging used by the CLI and tools.
  - Keeps stdout free for results: every level is written to stderr.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - One line per call: "<UTC time with ms> rowshade <LEVEL>: <message>".

Notes:
  - The shading kernels never log; they are called per sample.
================================================================================
*/

#include <string>

namespace rowshade {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default WARN).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Short uppercase tag ("DEBUG", "INFO", ...).
const char* to_string(LogLevel lvl) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

inline void log_debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
inline void log_info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
inline void log_warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
inline void log_error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }

} // namespace rowshade
