#include "clipscan/match/match.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace clipscan::match_ {
using clipscan::util::Expected;
using clipscan::util::FrameOffset;
using clipscan::util::ScanError;
using clipscan::util::ScoreEntry;

// ------------------------------------------------------
// Detector implementation
// ------------------------------------------------------

class AnchorClusterDetector final : public IMatchDetector {
public:
  Expected<BestOffset>
  best_offset(std::span<const std::optional<double>> scores,
              std::int32_t span, std::int32_t step) const override {
    if (scores.empty()) return tl::unexpected(ScanError::EmptyInput);

    std::optional<std::size_t> best;
    double best_value = 0.0;
    for (std::size_t i = 0; i < scores.size(); ++i) {
      if (!scores[i]) continue;
      if (!best || *scores[i] > best_value) {
        best = i;
        best_value = *scores[i];
      }
    }
    if (!best) return tl::unexpected(ScanError::NotFound);

    const std::int64_t off = -static_cast<std::int64_t>(span) +
                             static_cast<std::int64_t>(*best) * step;
    return BestOffset{*best, static_cast<FrameOffset>(off)};
  }

  bool is_match(std::span<const ScoreEntry> profile,
                const MatchParams& mp) const override {
    // 1) High-correlation offsets
    std::vector<FrameOffset> high;
    high.reserve(profile.size());
    for (const auto& e : profile) {
      if (e.score && *e.score >= mp.threshold) high.push_back(e.offset);
    }
    if (high.size() < mp.min_consistent_offsets) return false;

    // 2) Anchor-relative clusters over sorted offsets
    std::stable_sort(high.begin(), high.end());
    for (std::size_t i = 0; i < high.size(); ++i) {
      const std::int64_t anchor = high[i];
      std::size_t cluster = 1;
      for (std::size_t j = i + 1; j < high.size(); ++j) {
        if (static_cast<std::int64_t>(high[j]) - anchor > mp.max_offset_deviation)
          break;
        ++cluster;
      }
      if (cluster >= mp.min_consistent_offsets) return true;
    }
    return false;
  }
};

// ------------------------------------------------------
// Factory
// ------------------------------------------------------

class DefaultMatchFactory final : public IMatchFactory {
public:
  std::unique_ptr<IMatchDetector> create_detector() override {
    return std::make_unique<AnchorClusterDetector>();
  }
};

std::unique_ptr<IMatchFactory> make_default_match_factory() {
  return std::make_unique<DefaultMatchFactory>();
}

std::vector<std::optional<double>> scores_of(std::span<const ScoreEntry> profile) {
  std::vector<std::optional<double>> out;
  out.reserve(profile.size());
  for (const auto& e : profile) out.push_back(e.score);
  return out;
}
} // namespace clipscan::match_
