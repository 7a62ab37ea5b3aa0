#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "clipscan/util/util.hpp"

namespace clipscan::match_ {
/**
 * Match decision configuration.
 * Units:
 *  - threshold: similarity score in [0, 1] a profile point must reach
 *  - min_consistent_offsets: high-scoring offsets required in one cluster
 *  - max_offset_deviation: frames a cluster member may lie above its anchor
 */
struct MatchParams {
  double threshold{0.75};
  std::uint32_t min_consistent_offsets{3};
  std::int32_t max_offset_deviation{5};
};

/** Position of the best score in a profile. */
struct BestOffset {
  std::size_t index{};
  util::FrameOffset offset{};
};

/**
 * Turns a score profile into a match verdict.
 *
 * Thread-safety: YES (stateless; all temporaries are local).
 */
class IMatchDetector {
public:
  virtual ~IMatchDetector() = default;

  /**
   * Purpose:
   *   Index of the maximum score, scanning left to right and replacing the
   *   current best only on a strictly greater value (first occurrence wins
   *   ties), and its offset -span + index * step.
   *
   * Preconditions:
   *   - scores non-empty (ScanError::EmptyInput otherwise).
   *   - scores[i] belongs to offset -span + i * step.
   *
   * Postconditions:
   *   - Absent scores never win; if every score is absent the result is
   *     ScanError::NotFound.
   */
  [[nodiscard]] virtual util::Expected<BestOffset>
  best_offset(std::span<const std::optional<double>> scores,
              std::int32_t span, std::int32_t step) const = 0;

  /**
   * Purpose:
   *   Decide whether enough high-scoring offsets agree.
   *     (1) keep entries whose score is present and >= threshold,
   *     (2) fewer than min_consistent_offsets -> false,
   *     (3) sort by offset, then for every start index grow a cluster
   *         forward while (offset - anchor offset) <= max_offset_deviation,
   *         stopping at the first entry that does not fit,
   *     (4) true as soon as one cluster reaches min_consistent_offsets.
   *
   *   The deviation is measured from the cluster's first (smallest) offset,
   *   not between neighbours: {0, 5, 10} with deviation 5 never forms a
   *   cluster of three.
   *
   * Complexity: O(H log H + H^2) worst case, H = high-scoring entries.
   */
  [[nodiscard]] virtual bool
  is_match(std::span<const util::ScoreEntry> profile,
           const MatchParams& mp) const = 0;
};

/** Factory for match detectors (stateless). */
class IMatchFactory {
public:
  virtual ~IMatchFactory() = default;

  virtual std::unique_ptr<IMatchDetector> create_detector() = 0;
};

/** Default detector factory (anchor-relative offset clustering). */
std::unique_ptr<IMatchFactory> make_default_match_factory();

/** Score column of a profile, aligned with its offsets. */
std::vector<std::optional<double>> scores_of(std::span<const util::ScoreEntry> profile);
} // namespace clipscan::match_
