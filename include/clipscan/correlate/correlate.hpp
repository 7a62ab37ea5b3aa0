#pragma once
#include <cstdint>
#include <memory>
#include <optional>

#include "clipscan/util/util.hpp"

namespace clipscan::correlate {
/**
 * Correlation configuration.
 * Units:
 *  - min_overlap: fingerprint frames that must remain after a shift for a
 *    score to be reported
 */
struct CorrelationParams {
  std::uint32_t min_overlap{20};
};

/**
 * Bitwise fingerprint correlation: popcount similarity, shifted similarity
 * and the offset sweep built on top of them.
 *
 * Thread-safety: YES (stateless apart from immutable params; all temporaries local).
 */
class ICorrelator {
public:
  virtual ~ICorrelator() = default;

  /**
   * Purpose:
   *   Mean bit agreement of two fingerprints. The longer input is truncated
   *   to the length of the shorter one (aligned from the start); each
   *   aligned frame contributes (32 - popcount(x ^ y)) / 32.
   *
   * Preconditions:
   *   - x and y are non-empty, otherwise ScanError::EmptyInput.
   *
   * Postconditions:
   *   - Result in [0, 1]; 1 for bitwise identical prefixes.
   *   - similarity(x, y) == similarity(y, x).
   *
   * Complexity: O(min(|x|, |y|)).
   */
  [[nodiscard]] virtual util::Expected<double>
  similarity(util::FingerprintView x, util::FingerprintView y) const = 0;

  /**
   * Purpose:
   *   Similarity with y shifted against x by `offset` frames.
   *     offset > 0: the first `offset` frames of x are dropped
   *     offset < 0: the first `-offset` frames of y are dropped
   *
   * Postconditions:
   *   - Returns std::nullopt (not an error) when the remaining overlap
   *     min(|x'|, |y'|) is below min_overlap.
   *   - shifted_similarity(x, y, 0) == similarity(x, y).
   *
   * Errors: those of similarity() when the overlap is sufficient.
   */
  [[nodiscard]] virtual util::Expected<std::optional<double>>
  shifted_similarity(util::FingerprintView x, util::FingerprintView y,
                     util::FrameOffset offset) const = 0;

  /**
   * Purpose:
   *   Score profile over offsets -span, -span + step, ... up to +span
   *   (inclusive where reachable), ordered by increasing offset.
   *
   * Preconditions:
   *   - span >= 0, step > 0 (ScanError::InvalidArgument otherwise).
   *   - span <= min(|x|, |y|) (ScanError::SpanTooLarge otherwise).
   *
   * Postconditions:
   *   - floor(2 * span / step) + 1 entries, offsets strictly increasing.
   *
   * Complexity: O(entries * min(|x|, |y|)).
   */
  [[nodiscard]] virtual util::Expected<util::ScoreProfile>
  sweep(util::FingerprintView x, util::FingerprintView y,
        std::int32_t span, std::int32_t step) const = 0;
};

/** Factory for correlators. */
class ICorrelatorFactory {
public:
  virtual ~ICorrelatorFactory() = default;

  virtual std::unique_ptr<ICorrelator>
  create_correlator(const CorrelationParams& cp) = 0;
};

/** Default factory (std::popcount over 32-bit frame words). */
std::unique_ptr<ICorrelatorFactory> make_default_correlator_factory();
} // namespace clipscan::correlate
