#include "clipscan/log/log.hpp"

#include <atomic>
#include <iostream>

namespace clipscan::log {
namespace {
std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Warn)};

std::string_view level_tag(LogVerbosity level) noexcept {
  switch (level) {
    case LogVerbosity::Error:
      return "error";
    case LogVerbosity::Warn:
      return "warn";
    case LogVerbosity::Info:
      return "info";
    case LogVerbosity::Debug:
      return "debug";
  }
  return "debug";
}

void write_line(LogVerbosity level, std::string_view line, const char* file,
                int lineno, const char* func) {
  // Build the whole line first so concurrent writers do not interleave.
  std::ostringstream out;
  out << "[clipscan][" << level_tag(level) << "]";
  if (level == LogVerbosity::Error)
    out << "[" << (file ? file : "?") << ":" << lineno << " "
        << (func ? func : "?") << "]";
  out << " " << line << "\n";
  std::cerr << out.str();
}
} // namespace

void set_log_verbosity(LogVerbosity level) noexcept {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() noexcept {
  return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

LogVerbosity verbosity_from_count(int count) noexcept {
  if (count >= 2) return LogVerbosity::Debug;
  if (count == 1) return LogVerbosity::Info;
  return LogVerbosity::Warn;
}

bool should_log(LogVerbosity level) noexcept {
  return static_cast<int>(level) <= g_log_level.load(std::memory_order_relaxed);
}

void write(LogVerbosity level, std::string_view message, const char* file,
           int line, const char* func) {
  if (message.empty()) {
    write_line(level, message, file, line, func);
    return;
  }
  std::size_t start = 0;
  while (start <= message.size()) {
    const std::size_t end = message.find('\n', start);
    const std::size_t len =
        (end == std::string_view::npos) ? (message.size() - start) : (end - start);
    const std::string_view part = message.substr(start, len);
    if (!part.empty()) write_line(level, part, file, line, func);
    if (end == std::string_view::npos) break;
    start = end + 1;
  }
}
} // namespace clipscan::log
