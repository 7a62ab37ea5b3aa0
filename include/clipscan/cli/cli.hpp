#pragma once
#include <string>
#include <string_view>

#include "clipscan/scan/scan.hpp"
#include "clipscan/source/source.hpp"
#include "clipscan/util/util.hpp"

namespace clipscan::cli {
enum class Command { Scan, Index, Help };

/** Parsed `clipscan-cli` command line. */
struct Args {
  Command command{Command::Scan};
  std::string source{"input.mp4"};
  std::string fingerprints{"fingerprints"};
  std::string catalog_out{};
  bool from_catalog{false};
  int verbosity{0};
  scan::ScanParams scan{};
  source::FpcalcParams tools{};
};

/** Usage text printed for -h and after a usage error. */
std::string_view usage() noexcept;

/**
 * Purpose: Parse argv (argv[0] is skipped).
 * Errors: InvalidArgument for an unknown option, a missing or malformed
 *   value, or `index` without `-o`; the reason is written to stderr.
 */
util::Expected<Args> parse_args(int argc, const char* const* argv);
} // namespace clipscan::cli
