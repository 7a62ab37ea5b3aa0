#include "clipscan/report/report.hpp"

#include <cstdio>
#include <optional>
#include <utility>

namespace clipscan::report {
namespace {
constexpr std::string_view kMp3Suffix = ".mp3";

inline std::string two_digits(std::uint32_t v) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02u", v);
  return buf;
}
} // namespace

std::string format_timestamp(util::Seconds seconds) {
  const std::uint32_t days = seconds / 86400u;
  const std::uint32_t hours = (seconds / 3600u) % 24u;
  const std::uint32_t minutes = (seconds / 60u) % 60u;
  const std::uint32_t secs = seconds % 60u;

  // Inner components stay once an outer one is shown: 3605 -> "01:00:05".
  std::string out = two_digits(secs);
  if (minutes > 0 || hours > 0 || days > 0) out = two_digits(minutes) + ":" + out;
  if (hours > 0 || days > 0) out = two_digits(hours) + ":" + out;
  if (days > 0) out = two_digits(days) + ":" + out;
  return out;
}

std::string display_title(std::string_view reference_id) {
  if (reference_id.size() >= kMp3Suffix.size() &&
      reference_id.substr(reference_id.size() - kMp3Suffix.size()) == kMp3Suffix)
    reference_id.remove_suffix(kMp3Suffix.size());
  return std::string(reference_id);
}

std::string make_songlist(std::span<const util::MatchCandidate> candidates) {
  std::string out;
  std::optional<std::string> last;
  for (const auto& c : candidates) {
    std::string title = display_title(c.reference_id);
    if (last && *last == title) continue;
    if (!out.empty()) out += '\n';
    out += format_timestamp(c.source_offset_s) + " - " + title;
    last = std::move(title);
  }
  return out;
}
} // namespace clipscan::report
