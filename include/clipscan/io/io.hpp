#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include <tl/expected.hpp>

#include "clipscan/util/util.hpp"

namespace clipscan::io {
  /**
   * Downmix multi-channel PCM to mono (energy-preserving).
   * Implementations should average channels or use energy weights.
   */
  class IDownmixer {
  public:
    virtual ~IDownmixer() = default;

    /**
     * Purpose: Convert >=1 channel PCM streams to mono.
     * Preconditions:
     *  - channels.size() >= 1
     *  - All channels have identical sample_rate_hz and length
     * Postconditions:
     *  - Returned PcmBuffer contains mono float32 samples in [-1, 1]
     *  - sample_rate_hz preserved from inputs
     * Complexity: O(N * C) over total samples (N frames, C channels)
     * Thread-safety: YES (stateless, no shared mutable state)
     */
    [[nodiscard]] virtual util::Expected<util::PcmBuffer>
    to_mono(std::span<const util::PcmSpan> channels) const = 0;
  };

  /**
   * Decode audio from file or memory into mono float32 PCM (owning).
   * Used for whole clips; long recordings go through IWindowReader.
   */
  class IAudioDecoder {
  public:
    virtual ~IAudioDecoder() = default;

    /**
     * Purpose: Decode an entire file to mono float32 PCM.
     * Preconditions: path is a readable file.
     * Postconditions: On success, returns mono PCM in [-1, 1] with sample_rate_hz set.
     * Errors: DecodeError for unreadable or unsupported content.
     * Complexity: O(N) over decoded sample frames
     * Thread-safety: NO (decoder instances keep internal scratch); use one instance per thread
     */
    virtual util::Expected<util::PcmBuffer>
    decode_file(std::string_view path) = 0;

    /**
     * Purpose: Decode from an in-memory container (entire encoded stream).
     * Postconditions: Same as decode_file.
     * Thread-safety: NO
     */
    virtual util::Expected<util::PcmBuffer>
    decode_bytes(std::span<const std::byte> data) = 0;
  };

  /**
   * Random access to one recording on disk by time range. Only the requested
   * range is decoded, so memory stays bounded by the window length.
   */
  class IWindowReader {
  public:
    virtual ~IWindowReader() = default;

    [[nodiscard]] virtual util::SampleRateHz sample_rate_hz() const noexcept = 0;

    /** Length of the recording in sample frames. */
    [[nodiscard]] virtual std::uint64_t frame_count() const noexcept = 0;

    /**
     * Purpose: Decode [start_s, start_s + duration_s) to mono float32 PCM.
     * Postconditions: the range is clamped to the end of the recording.
     * Errors: InvalidArgument if duration_s == 0 or start_s lies at or past
     *   the end; DecodeError if the file can no longer be read.
     * Complexity: O(window) for WAV/FLAC; MP3 seeks decode from the start.
     * Thread-safety: YES (every call opens its own decoder handle).
     */
    [[nodiscard]] virtual util::Expected<util::PcmBuffer>
    read_window(util::Seconds start_s, util::Seconds duration_s) const = 0;
  };

  /**
   * Encode mono PCM as a 16-bit PCM RIFF/WAVE file, the input format handed
   * to the external fingerprinter.
   */
  class IWavWriter {
  public:
    virtual ~IWavWriter() = default;

    /**
     * Purpose: Write `pcm` to `path`, replacing any existing file.
     * Preconditions: pcm.sample_rate_hz > 0, pcm.samples non-empty.
     * Errors: InvalidArgument for bad input, IOError when the file cannot be written.
     * Thread-safety: YES (no instance state).
     */
    [[nodiscard]] virtual util::Expected<void>
    write_file(std::string_view path, util::PcmSpan pcm) const = 0;
  };

  /**
   * Abstract factory for decoders, window readers and writers.
   */
  class IDecoderFactory {
  public:
    virtual ~IDecoderFactory() = default;

    /**
     * Purpose: Create a decoder suitable for WAV/MP3/FLAC based on internal strategy.
     * Postconditions: Returned pointer is non-null; each instance is independent.
     * Thread-safety: YES.
     */
    [[nodiscard]] virtual std::unique_ptr<IAudioDecoder> create_decoder() const = 0;

    [[nodiscard]] virtual std::unique_ptr<IWavWriter> create_wav_writer() const = 0;

    /**
     * Purpose: Open `path` for windowed reads. The format comes from the
     *   extension, or from the file header when the extension is unknown.
     * Errors: Unavailable if the format is none of WAV/MP3/FLAC;
     *   DecodeError if the file cannot be opened or carries no audio.
     */
    [[nodiscard]] virtual util::Expected<std::unique_ptr<IWindowReader>>
    open_window_reader(std::string_view path) const = 0;
  };

  /**
   * Create a default, composite-decoder factory that supports:
   *  - WAV via dr_wav (PCM 8/16/24/32-bit, float32)
   *  - MP3 via dr_mp3 (MPEG-1/2 Layer III)
   *  - FLAC via dr_flac (16/24-bit)
   * The decoder picks a backend by file extension or header sniffing and
   * falls back to trying each one.
   */
  std::unique_ptr<IDecoderFactory> make_default_decoder_factory();

  /**
   * Create a default downmixer that averages channels (energy-preserving).
   */
  std::unique_ptr<IDownmixer> make_default_downmixer();

  /**
   * Slice [start_s, start_s + duration_s) seconds out of `pcm`, clamped to
   * its end. Returns an empty span when start_s lies past the end.
   */
  util::PcmSpan slice_seconds(const util::PcmBuffer& pcm, util::Seconds start_s,
                              util::Seconds duration_s) noexcept;
} // namespace clipscan::io
