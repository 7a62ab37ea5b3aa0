#include "clipscan/cli/cli.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <system_error>

namespace clipscan::cli {
using clipscan::util::Expected;
using clipscan::util::ScanError;

namespace {
constexpr std::string_view kUsage =
    "usage: clipscan-cli scan  [-s FILE] [-f DIR|CATALOG] [--catalog] [options]\n"
    "       clipscan-cli index -f DIR -o CATALOG\n"
    "\n"
    "  -s, --search-file FILE   recording to search (default input.mp4)\n"
    "  -f, --fingerprints PATH  .fpcalc directory or LMDB catalog (default fingerprints)\n"
    "      --catalog            read references from an LMDB catalog\n"
    "  -o, --output CATALOG     catalog directory written by 'index'\n"
    "      --window SEC         window length in seconds (500)\n"
    "      --window-step SEC    seconds between windows (10)\n"
    "      --span FRAMES        maximum offset swept (150)\n"
    "      --step FRAMES        offset step (10)\n"
    "      --min-overlap FRAMES minimum overlap for a score (20)\n"
    "      --threshold X        score needed to count an offset (0.60)\n"
    "      --min-consistent N   offsets needed in one cluster (1)\n"
    "      --max-deviation N    cluster width in frames (5)\n"
    "      --threads N          worker threads, 0 = all cores (0)\n"
    "      --fpcalc PATH        fpcalc executable (fpcalc)\n"
    "      --ffmpeg PATH        ffmpeg executable for video/other containers (ffmpeg)\n"
    "      --ffprobe PATH       ffprobe executable (ffprobe)\n"
    "  -v                       more logging (repeatable)\n";

template <typename T>
bool parse_number(const std::string& s, T& out) {
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

// std::from_chars for double is missing on some standard libraries.
bool parse_real(const std::string& s, double& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  out = std::strtod(s.c_str(), &end);
  return end == s.c_str() + s.size();
}

// Options followed by a value. `set` returns false for a malformed value.
struct ValueOption {
  std::string_view short_name;
  std::string_view long_name;
  bool (*set)(Args&, const std::string&);
};

constexpr ValueOption kValueOptions[] = {
    {"-s", "--search-file", [](Args& a, const std::string& v) { a.source = v; return true; }},
    {"-f", "--fingerprints", [](Args& a, const std::string& v) { a.fingerprints = v; return true; }},
    {"-o", "--output", [](Args& a, const std::string& v) { a.catalog_out = v; return true; }},
    {"", "--fpcalc", [](Args& a, const std::string& v) { a.tools.fpcalc_path = v; return true; }},
    {"", "--ffmpeg", [](Args& a, const std::string& v) { a.tools.ffmpeg_path = v; return true; }},
    {"", "--ffprobe", [](Args& a, const std::string& v) { a.tools.ffprobe_path = v; return true; }},
    {"", "--window", [](Args& a, const std::string& v) { return parse_number(v, a.scan.window_s); }},
    {"", "--window-step", [](Args& a, const std::string& v) { return parse_number(v, a.scan.window_step_s); }},
    {"", "--span", [](Args& a, const std::string& v) { return parse_number(v, a.scan.search_span); }},
    {"", "--step", [](Args& a, const std::string& v) { return parse_number(v, a.scan.search_step); }},
    {"", "--min-overlap", [](Args& a, const std::string& v) { return parse_number(v, a.scan.min_overlap); }},
    {"", "--threshold", [](Args& a, const std::string& v) { return parse_real(v, a.scan.match.threshold); }},
    {"", "--min-consistent",
     [](Args& a, const std::string& v) { return parse_number(v, a.scan.match.min_consistent_offsets); }},
    {"", "--max-deviation",
     [](Args& a, const std::string& v) { return parse_number(v, a.scan.match.max_offset_deviation); }},
    {"", "--threads", [](Args& a, const std::string& v) { return parse_number(v, a.scan.threads); }},
};

const ValueOption* find_value_option(std::string_view arg) {
  for (const auto& opt : kValueOptions) {
    if (arg == opt.long_name || (!opt.short_name.empty() && arg == opt.short_name)) return &opt;
  }
  return nullptr;
}
} // namespace

std::string_view usage() noexcept { return kUsage; }

Expected<Args> parse_args(int argc, const char* const* argv) {
  Args a;
  int i = 1;
  if (i < argc) {
    const std::string_view cmd(argv[i]);
    if (cmd == "scan") { a.command = Command::Scan; ++i; }
    else if (cmd == "index") { a.command = Command::Index; ++i; }
    else if (cmd == "-h" || cmd == "--help") { a.command = Command::Help; return a; }
  }

  for (; i < argc; ++i) {
    const std::string arg(argv[i]);

    if (arg == "-h" || arg == "--help") { a.command = Command::Help; return a; }
    if (arg == "-v") { ++a.verbosity; continue; }
    if (arg == "-vv") { a.verbosity += 2; continue; }
    if (arg == "--catalog") { a.from_catalog = true; continue; }

    const ValueOption* opt = find_value_option(arg);
    if (!opt) {
      std::cerr << "unknown option " << arg << "\n";
      return tl::unexpected(ScanError::InvalidArgument);
    }
    if (i + 1 >= argc) {
      std::cerr << "missing value for " << arg << "\n";
      return tl::unexpected(ScanError::InvalidArgument);
    }
    const std::string v(argv[++i]);
    if (!opt->set(a, v)) {
      std::cerr << "invalid value for " << arg << ": " << v << "\n";
      return tl::unexpected(ScanError::InvalidArgument);
    }
  }

  if (a.command == Command::Index && a.catalog_out.empty()) {
    std::cerr << "index needs -o CATALOG\n";
    return tl::unexpected(ScanError::InvalidArgument);
  }
  return a;
}
} // namespace clipscan::cli
