/*
================================================================================
Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp

  - One line per call on stderr: "<utc-ms> rowshade <LEVEL>: <message>".
  - Lines are formatted before the lock is taken.
  - Output failures are dropped; the caller never sees an exception.
================================================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace rowshade {

static std::atomic<int> g_level{static_cast<int>(LogLevel::WARN)};
static std::mutex g_log_mu;

const char* to_string(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

namespace {

// ISO-8601 UTC with milliseconds, e.g. 2024-03-01T12:00:00.125Z
std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const std::time_t tt = clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << ms << 'Z';
  return oss.str();
}

} // namespace

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;

  try {
    std::ostringstream line;
    line << utc_timestamp() << " rowshade " << to_string(lvl) << ": " << msg << '\n';
    const std::string text = line.str();

    // stdout is reserved for results.
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::cerr << text;
    std::cerr.flush();
  } catch (const std::exception&) {
    // dropped
  }
}

} // namespace rowshade
