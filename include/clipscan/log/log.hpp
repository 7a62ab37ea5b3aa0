#pragma once
#include <sstream>
#include <string>
#include <string_view>

namespace clipscan::log {
/**
 * Logging level policy.
 *  - Error: hard failures that abort the requested operation
 *  - Warn: recoverable problems (e.g. a skipped source window)
 *  - Info: high-level progress and match summaries
 *  - Debug: per-window / per-reference diagnostics
 *
 * Visibility is controlled only by the global verbosity; call sites must not
 * add their own gating for Warn and Error.
 */
enum class LogVerbosity {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

/** Set the process-wide verbosity. Thread-safe. */
void set_log_verbosity(LogVerbosity level) noexcept;

/** Current process-wide verbosity (default Warn). Thread-safe. */
LogVerbosity get_log_verbosity() noexcept;

/** Map "-v" repeat count to a verbosity (0 = Warn, 1 = Info, >=2 = Debug). */
LogVerbosity verbosity_from_count(int count) noexcept;

/** True if messages at `level` are currently emitted. */
bool should_log(LogVerbosity level) noexcept;

/**
 * Emit one message to stderr as `[clipscan][level] message`.
 * Error messages also carry `file:line function`. Multi-line messages are
 * split so every line carries the prefix. Thread-safe (one write per line).
 */
void write(LogVerbosity level, std::string_view message, const char* file,
           int line, const char* func);
} // namespace clipscan::log

#define CLIPSCAN_LOG(level, message)                                           \
  do {                                                                         \
    if (::clipscan::log::should_log(level)) {                                  \
      std::ostringstream _clipscan_log_stream;                                 \
      _clipscan_log_stream << message;                                         \
      ::clipscan::log::write(level, _clipscan_log_stream.str(), __FILE__,      \
                             __LINE__, __func__);                              \
    }                                                                          \
  } while (0)

#define CLIPSCAN_LOG_ERROR(message) \
  CLIPSCAN_LOG(::clipscan::log::LogVerbosity::Error, message)
#define CLIPSCAN_LOG_WARN(message) \
  CLIPSCAN_LOG(::clipscan::log::LogVerbosity::Warn, message)
#define CLIPSCAN_LOG_INFO(message) \
  CLIPSCAN_LOG(::clipscan::log::LogVerbosity::Info, message)
#define CLIPSCAN_LOG_DEBUG(message) \
  CLIPSCAN_LOG(::clipscan::log::LogVerbosity::Debug, message)
