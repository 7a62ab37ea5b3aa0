#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <kfr/all.hpp>          // KFR: univector (owning, SIMD-aligned buffers)
#include <tl/expected.hpp>      // tl::expected

namespace clipscan::util {
// -----------------------------
// Error domain (no exceptions)
// -----------------------------

/**
 * Recoverable errors for all clipscan operations.
 * No exceptions are thrown by this library.
 *
 * Meanings:
 *  - InvalidArgument: argument value/range preconditions violated
 *  - EmptyInput: a fingerprint passed to a comparison is empty
 *  - SpanTooLarge: sweep span exceeds the shorter fingerprint length
 *  - SizeMismatch: shape/length/buffer size mismatch
 *  - IOError: file or device I/O failure
 *  - DecodeError: codec/parse error at I/O boundary
 *  - UnsupportedFormat: format/container not supported by current build
 *  - ExternalFingerprint: external fingerprinter failed or produced no output
 *  - CatalogCorrupt: on-disk reference catalog corruption detected
 *  - NotFound: resource/key missing (not a hard failure in many lookups)
 *  - Unavailable: subsystem not initialized/open or currently unavailable
 *  - Internal: invariant broken or unexpected state (bug)
 *  - ResourceExhausted: map/disk/thread resources exhausted
 */
enum class ScanError : std::uint16_t {
  None = 0,
  InvalidArgument,
  EmptyInput,
  SpanTooLarge,
  SizeMismatch,
  IOError,
  DecodeError,
  UnsupportedFormat,
  ExternalFingerprint,
  CatalogCorrupt,
  NotFound,
  Unavailable,
  Internal,
  ResourceExhausted
};

/** Short, stable name for an error. Thread-safe. */
std::string_view error_name(ScanError) noexcept;

/** Human-friendly description. Thread-safe. */
std::string_view error_description(ScanError) noexcept;

/** Project-wide expected alias. Prefer returning this in APIs that can fail. */
template <typename T>
using Expected = tl::expected<T, ScanError>;

// -----------------------------
// Scalar/time aliases
// -----------------------------

using Seconds = std::uint32_t; // whole seconds into the source recording
using SampleRateHz = std::uint32_t; // Hertz
using FrameOffset = std::int32_t; // fingerprint frames; < 0: reference leads

/** Bits per fingerprint frame word. */
inline constexpr std::uint32_t kFrameBits = 32;

// -----------------------------
// Buffer/view conventions
// -----------------------------
//
// Policy:
//  * Own sample and fingerprint buffers with kfr::univector<T>.
//  * Accept std::span<const T> on public boundaries (zero copy).
//  * No global state; all types are movable; thread-safe when treated as immutable.
//

/** Owning fingerprint: one 32-bit word per fingerprint frame. */
using Fingerprint = kfr::univector<std::uint32_t>;

/** Non-owning fingerprint view; lifetime managed by caller. */
using FingerprintView = std::span<const std::uint32_t>;

/** Owning mono PCM buffer (float32 normalized to [-1, 1]). */
struct PcmBuffer {
  kfr::univector<float> samples; // owning, contiguous
  SampleRateHz sample_rate_hz{};
  // Thread-safety: safe for concurrent const access; mutations must be external.
};

/** Non-owning API boundary view of mono PCM. */
struct PcmSpan {
  SampleRateHz sample_rate_hz{};
  std::span<const float> samples; // no ownership; lifetime managed by caller
};

// -----------------------------
// Correlation / match types
// -----------------------------

/**
 * One point of a score profile. `score` is empty when the shifted overlap
 * was shorter than the configured minimum.
 */
struct ScoreEntry {
  std::optional<double> score;
  FrameOffset offset{};
};

/** Scores ordered by increasing offset (output of a sweep). */
using ScoreProfile = std::vector<ScoreEntry>;

/** A reference clip fingerprint with its catalog identifier. */
struct ReferenceFingerprint {
  std::string id;
  Fingerprint fingerprint;
};

/** A detected occurrence of a reference clip in the source. */
struct MatchCandidate {
  std::string reference_id;
  double confidence_pct{}; // winning score * 100
  Seconds source_offset_s{}; // start of the window the match was found in
  FrameOffset best_offset{}; // alignment of the winning score
};

// -----------------------------
// Zero-copy helpers (header-only, noexcept)
// -----------------------------

/** View over an owning fingerprint. */
inline FingerprintView as_view(const Fingerprint& fp) noexcept {
  return FingerprintView(fp.data(), fp.size());
}

/** Convenience: view over PcmBuffer samples (const). */
inline std::span<const float> as_span(const PcmBuffer& b) noexcept {
  return std::span<const float>(b.samples.data(), b.samples.size());
}

/** Copy a view into an owning fingerprint. */
inline Fingerprint to_fingerprint(FingerprintView v) {
  Fingerprint fp(v.size());
  for (std::size_t i = 0; i < v.size(); ++i) fp[i] = v[i];
  return fp;
}
} // namespace clipscan::util
