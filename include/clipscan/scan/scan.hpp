#pragma once
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "clipscan/match/match.hpp"
#include "clipscan/source/source.hpp"
#include "clipscan/util/util.hpp"

namespace clipscan::scan {
/**
 * Scan configuration.
 * Units:
 *  - window_s / window_step_s: seconds of source audio per window / between windows
 *  - search_span / search_step: fingerprint frames swept on either side / between offsets
 *  - min_overlap: frames; pairs whose clamped span falls below it are skipped
 *  - threads: worker threads (0 = hardware concurrency)
 */
struct ScanParams {
  util::Seconds window_s{500};
  util::Seconds window_step_s{10};
  std::int32_t search_span{150};
  std::int32_t search_step{10};
  std::uint32_t min_overlap{20};
  match_::MatchParams match{.threshold = 0.60,
                            .min_consistent_offsets = 1,
                            .max_offset_deviation = 5};
  std::uint32_t threads{0};
};

/**
 * Sliding-window search for reference clips in a source recording.
 *
 * Thread-safety: YES (const; per-call state only). The scan itself runs
 * window fingerprinting and (window, reference) comparisons on a worker pool.
 */
class IScanner {
public:
  virtual ~IScanner() = default;

  /**
   * Purpose:
   *   For every window start 0, step, ... <= total_duration_s - window_s:
   *     (1) fingerprint [start, start + window_s) through `source`; a failing
   *         window is logged and skipped,
   *     (2) for every reference: skip empty fingerprints; clamp
   *         span = min(search_span, min(|window|, |reference|) - 1) and skip
   *         the pair if span < min_overlap; sweep with search_step,
   *     (3) on is_match, emit (reference id, best score * 100, start).
   *
   * Preconditions:
   *   - window_s > 0, window_step_s > 0, search_step > 0, search_span >= 0
   *     (InvalidArgument otherwise).
   *
   * Postconditions:
   *   - Candidates ordered by window start, then by reference order; no
   *     deduplication across windows.
   *   - A source shorter than one window yields no candidates.
   *
   * Errors:
   *   - Errors of the correlation layer (EmptyInput, SpanTooLarge, ...)
   *     abort the scan; they indicate an internal inconsistency.
   */
  [[nodiscard]] virtual util::Expected<std::vector<util::MatchCandidate>>
  scan(const source::ISourceFingerprinter& source,
       util::Seconds total_duration_s,
       std::span<const util::ReferenceFingerprint> references,
       const ScanParams& sp) const = 0;
};

/** Factory for scanners. */
class IScanFactory {
public:
  virtual ~IScanFactory() = default;

  virtual std::unique_ptr<IScanner> create_scanner() = 0;
};

/** Default scanner: popcount correlator + anchor-cluster detector on std::thread workers. */
std::unique_ptr<IScanFactory> make_default_scan_factory();

/** Window starts 0, step, ... up to total - window inclusive (empty if total < window). */
std::vector<util::Seconds> window_offsets(util::Seconds total_s, util::Seconds window_s,
                                          util::Seconds step_s);

/** Resolve a requested worker count (0 = hardware concurrency, at least 1). */
unsigned worker_count(std::uint32_t requested) noexcept;
} // namespace clipscan::scan
