#include "clipscan/scan/scan.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <thread>
#include <vector>

#include "clipscan/correlate/correlate.hpp"
#include "clipscan/log/log.hpp"
#include "worker_pool.hpp"

namespace clipscan::scan {
using clipscan::util::Expected;
using clipscan::util::Fingerprint;
using clipscan::util::MatchCandidate;
using clipscan::util::ReferenceFingerprint;
using clipscan::util::ScanError;
using clipscan::util::Seconds;

std::vector<Seconds> window_offsets(Seconds total_s, Seconds window_s, Seconds step_s) {
  std::vector<Seconds> out;
  if (step_s == 0 || total_s < window_s) return out;
  const std::uint64_t last = total_s - window_s;
  out.reserve(static_cast<std::size_t>(last / step_s) + 1);
  for (std::uint64_t off = 0; off <= last; off += step_s)
    out.push_back(static_cast<Seconds>(off));
  return out;
}

unsigned worker_count(std::uint32_t requested) noexcept {
  if (requested > 0) return requested;
  const unsigned detected = std::thread::hardware_concurrency();
  return detected > 0 ? detected : 1u;
}

namespace {
// Per-window fingerprint slot; filled by phase 1.
struct WindowSlot {
  Seconds offset_s{};
  bool ok{false};
  Fingerprint fingerprint;
};

// Per-(window, reference) result slot; filled by phase 2.
struct PairSlot {
  ScanError error{ScanError::None};
  std::optional<MatchCandidate> match;
};
} // namespace

// ------------------------------------------------------
// Scanner implementation
// ------------------------------------------------------

class ParallelScanner final : public IScanner {
public:
  ParallelScanner()
    : detector_(match_::make_default_match_factory()->create_detector()) {}

  Expected<std::vector<MatchCandidate>>
  scan(const source::ISourceFingerprinter& source, Seconds total_duration_s,
       std::span<const ReferenceFingerprint> references,
       const ScanParams& sp) const override {
    if (sp.window_s == 0 || sp.window_step_s == 0 || sp.search_step <= 0 ||
        sp.search_span < 0)
      return tl::unexpected(ScanError::InvalidArgument);

    const auto offsets = window_offsets(total_duration_s, sp.window_s, sp.window_step_s);
    if (offsets.empty()) {
      CLIPSCAN_LOG_INFO("source (" << total_duration_s << "s) is shorter than one window ("
                        << sp.window_s << "s); nothing to scan");
      return std::vector<MatchCandidate>{};
    }

    const unsigned workers = worker_count(sp.threads);
    const auto correlator = correlate::make_default_correlator_factory()->create_correlator(
        correlate::CorrelationParams{sp.min_overlap});

    // 1) Window fingerprints, one slot per window
    std::vector<WindowSlot> windows(offsets.size());
    detail::parallel_for(offsets.size(), workers, [&](std::size_t w) {
      auto& slot = windows[w];
      slot.offset_s = offsets[w];
      CLIPSCAN_LOG_DEBUG("fingerprinting source at offset " << slot.offset_s << "s");
      auto fp = source.fingerprint(slot.offset_s, sp.window_s);
      if (!fp) {
        CLIPSCAN_LOG_WARN("failed to fingerprint window at offset " << slot.offset_s
                          << "s: " << util::error_description(fp.error()) << "; skipping");
        return;
      }
      slot.fingerprint = std::move(*fp);
      slot.ok = true;
    });

    // 2) Independent (window, reference) comparisons, slot = w * R + r
    const std::size_t R = references.size();
    std::vector<PairSlot> pairs(windows.size() * R);
    detail::parallel_for(pairs.size(), workers, [&](std::size_t t) {
      const auto& win = windows[t / R];
      if (!win.ok) return;
      auto res = compare(win, references[t % R], sp, *correlator);
      if (!res) pairs[t].error = res.error();
      else pairs[t].match = std::move(*res);
    });

    // 3) Concatenate in slot order
    std::vector<MatchCandidate> found;
    for (std::size_t t = 0; t < pairs.size(); ++t) {
      if (pairs[t].error != ScanError::None) {
        CLIPSCAN_LOG_ERROR("comparison of window " << windows[t / R].offset_s << "s with "
                           << references[t % R].id << " failed: "
                           << util::error_name(pairs[t].error));
        return tl::unexpected(pairs[t].error);
      }
      if (!pairs[t].match) continue;
      const auto& m = *pairs[t].match;
      CLIPSCAN_LOG_INFO("match: " << m.reference_id << " at " << m.source_offset_s
                        << "s, correlation " << std::fixed << std::setprecision(2)
                        << m.confidence_pct << "% at offset " << m.best_offset);
      found.push_back(m);
    }
    return found;
  }

private:
  // Returns no candidate for skipped or non-matching pairs.
  Expected<std::optional<MatchCandidate>>
  compare(const WindowSlot& win, const ReferenceFingerprint& ref, const ScanParams& sp,
          const correlate::ICorrelator& correlator) const {
    const auto x = util::as_view(win.fingerprint);
    const auto y = util::as_view(ref.fingerprint);
    if (x.empty() || y.empty()) return std::optional<MatchCandidate>{};

    const std::int64_t shortest = static_cast<std::int64_t>(std::min(x.size(), y.size()));
    const auto span = static_cast<std::int32_t>(
        std::min<std::int64_t>(sp.search_span, shortest - 1));
    if (span < static_cast<std::int64_t>(sp.min_overlap)) {
      CLIPSCAN_LOG_DEBUG("skipping " << ref.id << " at " << win.offset_s
                         << "s: span " << span << " below minimum overlap " << sp.min_overlap);
      return std::optional<MatchCandidate>{};
    }

    auto profile = correlator.sweep(x, y, span, sp.search_step);
    if (!profile) return tl::unexpected(profile.error());

    if (!detector_->is_match(*profile, sp.match)) {
      CLIPSCAN_LOG_DEBUG("no match for " << ref.id << " at offset " << win.offset_s << "s");
      return std::optional<MatchCandidate>{};
    }

    const auto scores = match_::scores_of(*profile);
    auto best = detector_->best_offset(scores, span, sp.search_step);
    if (!best) return tl::unexpected(best.error());

    return std::optional<MatchCandidate>{MatchCandidate{
        ref.id, *scores[best->index] * 100.0, win.offset_s, best->offset}};
  }

  std::unique_ptr<match_::IMatchDetector> detector_;
};

// ------------------------------------------------------
// Factory
// ------------------------------------------------------

class DefaultScanFactory final : public IScanFactory {
public:
  std::unique_ptr<IScanner> create_scanner() override {
    return std::make_unique<ParallelScanner>();
  }
};

std::unique_ptr<IScanFactory> make_default_scan_factory() {
  return std::make_unique<DefaultScanFactory>();
}
} // namespace clipscan::scan
