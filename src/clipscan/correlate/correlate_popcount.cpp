#include "clipscan/correlate/correlate.hpp"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>

#include "clipscan/log/log.hpp"

namespace clipscan::correlate {
using clipscan::util::Expected;
using clipscan::util::FingerprintView;
using clipscan::util::FrameOffset;
using clipscan::util::ScanError;
using clipscan::util::ScoreEntry;
using clipscan::util::ScoreProfile;
using clipscan::util::kFrameBits;

namespace {
// Drop the first n frames; an over-long shift leaves an empty view.
inline FingerprintView drop_front(FingerprintView v, std::size_t n) noexcept {
  return (n >= v.size()) ? FingerprintView{} : v.subspan(n);
}
} // namespace

class PopcountCorrelator final : public ICorrelator {
public:
  explicit PopcountCorrelator(CorrelationParams cp) : cp_(cp) {}

  Expected<double> similarity(FingerprintView x,
                              FingerprintView y) const override {
    if (x.empty() || y.empty()) return tl::unexpected(ScanError::EmptyInput);

    const std::size_t n = std::min(x.size(), y.size());
    std::uint64_t agree = 0;
    for (std::size_t i = 0; i < n; ++i)
      agree += kFrameBits - static_cast<std::uint32_t>(std::popcount(x[i] ^ y[i]));

    const double per_frame = static_cast<double>(agree) / static_cast<double>(n);
    return per_frame / static_cast<double>(kFrameBits);
  }

  Expected<std::optional<double>>
  shifted_similarity(FingerprintView x, FingerprintView y,
                     FrameOffset offset) const override {
    if (offset > 0) {
      x = drop_front(x, static_cast<std::size_t>(offset));
    } else if (offset < 0) {
      // Widen before negating so INT32_MIN does not overflow.
      y = drop_front(y, static_cast<std::size_t>(-static_cast<std::int64_t>(offset)));
    }

    const std::size_t overlap = std::min(x.size(), y.size());
    if (overlap < cp_.min_overlap) return std::optional<double>{};

    auto s = similarity(x, y);
    if (!s) return tl::unexpected(s.error());
    return std::optional<double>{*s};
  }

  Expected<ScoreProfile> sweep(FingerprintView x, FingerprintView y,
                               std::int32_t span,
                               std::int32_t step) const override {
    if (span < 0 || step <= 0) return tl::unexpected(ScanError::InvalidArgument);

    const std::size_t limit = std::min(x.size(), y.size());
    if (static_cast<std::size_t>(span) > limit) {
      CLIPSCAN_LOG_ERROR("span >= sample size: " << span << " >= " << limit
                         << "; reduce span or increase the window duration");
      return tl::unexpected(ScanError::SpanTooLarge);
    }

    ScoreProfile out;
    out.reserve(static_cast<std::size_t>(2 * static_cast<std::int64_t>(span) / step) + 1);

    // 64-bit loop variable: span + step may exceed INT32_MAX.
    for (std::int64_t off = -static_cast<std::int64_t>(span); off <= span; off += step) {
      const auto o = static_cast<FrameOffset>(off);
      auto s = shifted_similarity(x, y, o);
      if (!s) return tl::unexpected(s.error());
      out.push_back(ScoreEntry{*s, o});
    }
    return out;
  }

private:
  CorrelationParams cp_{};
};

// -----------------------------
// Factory
// -----------------------------

class DefaultCorrelatorFactory final : public ICorrelatorFactory {
public:
  std::unique_ptr<ICorrelator>
  create_correlator(const CorrelationParams& cp) override {
    return std::make_unique<PopcountCorrelator>(cp);
  }
};

std::unique_ptr<ICorrelatorFactory> make_default_correlator_factory() {
  return std::make_unique<DefaultCorrelatorFactory>();
}
} // namespace clipscan::correlate
