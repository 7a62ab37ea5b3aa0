#pragma once
#include <memory>
#include <string>
#include <string_view>

#include "clipscan/util/util.hpp"

namespace clipscan::source {
/**
 * External tool configuration. Bare names are looked up on PATH.
 *  - fpcalc_path: Chromaprint `fpcalc` executable
 *  - ffmpeg_path / ffprobe_path: used for containers dr_libs cannot read
 *  - temp_dir: directory for per-window WAV files (empty = system temp dir)
 */
struct FpcalcParams {
  std::string fpcalc_path{"fpcalc"};
  std::string ffmpeg_path{"ffmpeg"};
  std::string ffprobe_path{"ffprobe"};
  std::string temp_dir{};
};

/**
 * Fingerprints windows of one source recording.
 */
class ISourceFingerprinter {
public:
  virtual ~ISourceFingerprinter() = default;

  /** Length of the recording in whole seconds. */
  [[nodiscard]] virtual util::Seconds duration_s() const noexcept = 0;

  /**
   * Purpose: Fingerprint [start_s, start_s + duration_s) of the recording.
   * Preconditions: start_s < duration_s() (InvalidArgument otherwise).
   * Errors: ExternalFingerprint if ffmpeg or the fingerprinter cannot be
   *   run, exits non-zero or prints no fingerprint; IOError/DecodeError if
   *   the window cannot be read or staged.
   * Thread-safety: YES; scans call this concurrently for different windows.
   */
  [[nodiscard]] virtual util::Expected<util::Fingerprint>
  fingerprint(util::Seconds start_s, util::Seconds duration_s) const = 0;
};

/**
 * Serve windows of the recording at `path` through `fpcalc -raw`.
 * WAV/MP3/FLAC are read window by window with dr_libs; anything else
 * (video containers, AAC, ...) is cut per window by ffmpeg.
 * Errors: DecodeError if neither backend can read the recording.
 */
util::Expected<std::unique_ptr<ISourceFingerprinter>>
open_fpcalc_source(std::string_view path, const FpcalcParams& params);

/**
 * ffmpeg backend: duration from `ffprobe`, each window extracted with
 * `ffmpeg -ss <start> -t <duration>` to a mono WAV.
 * Errors: DecodeError if ffprobe fails or reports no duration.
 */
util::Expected<std::unique_ptr<ISourceFingerprinter>>
open_ffmpeg_source(std::string_view path, const FpcalcParams& params);

/** fpcalc over already decoded mono PCM held in memory. */
util::Expected<std::unique_ptr<ISourceFingerprinter>>
make_fpcalc_source(util::PcmBuffer pcm, const FpcalcParams& params);

/** Quote `arg` for /bin/sh (single quotes, embedded quotes escaped). */
std::string shell_quote(std::string_view arg);
} // namespace clipscan::source
