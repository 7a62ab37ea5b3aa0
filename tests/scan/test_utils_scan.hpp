#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "clipscan/scan/scan.hpp"
#include "clipscan/source/source.hpp"
#include "correlate/test_utils_fp.hpp"

namespace testscan {
  using clipscan::util::Expected;
  using clipscan::util::Fingerprint;
  using clipscan::util::Seconds;

  /**
   * In-memory source: scripted fingerprints per window start, failures on
   * request, and deterministic noise (seeded by the start) everywhere else.
   */
  class FakeSource final : public clipscan::source::ISourceFingerprinter {
  public:
    explicit FakeSource(Seconds duration, size_t frames_per_window = 150)
      : duration_(duration), frames_(frames_per_window) {}

    void set_window(Seconds start, Fingerprint fp) { windows_[start] = std::move(fp); }
    void fail_window(Seconds start) { failing_.insert(start); }

    Seconds duration_s() const noexcept override { return duration_; }

    Expected<Fingerprint> fingerprint(Seconds start_s, Seconds duration_s) const override {
      calls_.fetch_add(1, std::memory_order_relaxed);
      if (duration_s == 0 || start_s >= duration_)
        return tl::unexpected(clipscan::util::ScanError::InvalidArgument);
      if (failing_.count(start_s))
        return tl::unexpected(clipscan::util::ScanError::ExternalFingerprint);
      if (auto it = windows_.find(start_s); it != windows_.end())
        return clipscan::util::to_fingerprint(clipscan::util::as_view(it->second));
      return noise(start_s);
    }

    size_t calls() const { return calls_.load(); }

  private:
    Fingerprint noise(Seconds start_s) const {
      std::mt19937 gen(1000u + start_s);
      Fingerprint fp(frames_);
      for (size_t i = 0; i < frames_; ++i) fp[i] = static_cast<uint32_t>(gen());
      return fp;
    }

    Seconds duration_;
    size_t frames_;
    std::map<Seconds, Fingerprint> windows_;
    std::set<Seconds> failing_;
    mutable std::atomic<size_t> calls_{0};
  };

  // Window fingerprint with `ref` embedded `lead` frames in, padded to `frames`.
  inline Fingerprint window_with(const Fingerprint &ref, size_t lead, size_t frames = 150) {
    Fingerprint fp = testfp::random_fp(frames);
    for (size_t i = 0; i < ref.size() && lead + i < frames; ++i) fp[lead + i] = ref[i];
    return fp;
  }

  inline clipscan::scan::ScanParams small_params() {
    clipscan::scan::ScanParams sp{};
    sp.window_s = 10;
    sp.window_step_s = 10;
    sp.search_span = 30;
    sp.search_step = 5;
    sp.min_overlap = 20;
    sp.threads = 1;
    return sp;
  }

  inline std::unique_ptr<clipscan::scan::IScanner> new_scanner() {
    return clipscan::scan::make_default_scan_factory()->create_scanner();
  }
} // namespace testscan
