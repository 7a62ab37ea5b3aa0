#include "clipscan/io/io.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

#define DR_MP3_IMPLEMENTATION
#include <dr_mp3.h>

#define DR_FLAC_IMPLEMENTATION
#include <dr_flac.h>

namespace clipscan::io {
using clipscan::util::Expected;
using clipscan::util::PcmBuffer;
using clipscan::util::PcmSpan;
using clipscan::util::SampleRateHz;
using clipscan::util::ScanError;
using clipscan::util::Seconds;

// -------------------------------
// Helpers (internal, file-scope)
// -------------------------------

namespace {

inline bool iequals_ascii(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    char ca = a[i], cb = b[i];
    if ('A' <= ca && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
    if ('A' <= cb && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
    if (ca != cb) return false;
  }
  return true;
}

enum class SniffedFormat { Wav, Mp3, Flac, Unknown };

SniffedFormat sniff_header(std::span<const std::byte> data) {
  if (data.size() >= 12) {
    const char* p = reinterpret_cast<const char*>(data.data());
    if (std::memcmp(p, "RIFF", 4) == 0 && std::memcmp(p + 8, "WAVE", 4) == 0) return SniffedFormat::Wav;
  }
  if (data.size() >= 4) {
    const char* p = reinterpret_cast<const char*>(data.data());
    if (std::memcmp(p, "fLaC", 4) == 0) return SniffedFormat::Flac;
    if (std::memcmp(p, "ID3", 3) == 0) return SniffedFormat::Mp3;
    // MPEG audio frame sync 0xFFEx
    const unsigned char b0 = static_cast<unsigned char>(p[0]);
    const unsigned char b1 = static_cast<unsigned char>(p[1]);
    if (b0 == 0xFF && (b1 & 0xE0) == 0xE0) return SniffedFormat::Mp3;
  }
  return SniffedFormat::Unknown;
}

SniffedFormat sniff_extension(std::string_view path) {
  const auto ext = std::filesystem::path(path).extension().string();
  if (ext.empty()) return SniffedFormat::Unknown;
  if (iequals_ascii(ext, ".wav"))  return SniffedFormat::Wav;
  if (iequals_ascii(ext, ".mp3"))  return SniffedFormat::Mp3;
  if (iequals_ascii(ext, ".flac")) return SniffedFormat::Flac;
  return SniffedFormat::Unknown;
}

SniffedFormat sniff_file(const std::string& path) {
  std::array<std::byte, 12> head{};
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return SniffedFormat::Unknown;
  const size_t got = std::fread(head.data(), 1, head.size(), f);
  std::fclose(f);
  return sniff_header(std::span<const std::byte>(head.data(), got));
}

constexpr size_t kChunkFrames = size_t{1} << 14;

// Collects mono PCM from interleaved chunks. Only the current chunk is ever
// split into channels, so memory stays at one mono copy plus one chunk.
class MonoAccumulator {
public:
  MonoAccumulator(std::uint32_t channels, SampleRateHz sr, const IDownmixer& downmixer)
    : channels_(channels), downmixer_(downmixer), planar_(channels) {
    out_.sample_rate_hz = sr;
  }

  void reserve(size_t frames) { out_.samples.reserve(frames); }

  Expected<void> push(const float* interleaved, size_t frames) {
    if (frames == 0) return {};
    for (auto& ch : planar_) ch.resize(frames);
    for (size_t i = 0; i < frames; ++i) {
      const float* row = interleaved + i * channels_;
      for (uint32_t c = 0; c < channels_; ++c) planar_[c][i] = row[c];
    }

    std::vector<PcmSpan> spans;
    spans.reserve(channels_);
    for (const auto& ch : planar_)
      spans.push_back(PcmSpan{out_.sample_rate_hz, std::span<const float>(ch.data(), ch.size())});

    auto mono = downmixer_.to_mono(spans);
    if (!mono) return tl::unexpected(mono.error());

    const size_t prev = out_.samples.size();
    out_.samples.resize(prev + frames);
    std::memcpy(out_.samples.data() + prev, mono->samples.data(), sizeof(float) * frames);
    return {};
  }

  // DecodeError when nothing was pushed.
  Expected<PcmBuffer> finish() {
    if (out_.samples.empty()) return tl::unexpected(ScanError::DecodeError);
    return std::move(out_);
  }

private:
  std::uint32_t channels_;
  const IDownmixer& downmixer_;
  std::vector<kfr::univector<float>> planar_;
  PcmBuffer out_;
};

// Pull up to `max_frames` frames through `read(frames, dst) -> got` in chunks.
template <typename ReadFn>
Expected<PcmBuffer> read_mono(std::uint32_t channels, SampleRateHz sr, const IDownmixer& downmixer,
                              std::uint64_t max_frames, ReadFn&& read) {
  MonoAccumulator acc(channels, sr, downmixer);
  if (max_frames != UINT64_MAX) acc.reserve(static_cast<size_t>(max_frames));

  kfr::univector<float> chunk(kChunkFrames * channels);
  std::uint64_t left = max_frames;
  while (left > 0) {
    const std::uint64_t want = std::min<std::uint64_t>(left, kChunkFrames);
    const std::uint64_t got = read(want, chunk.data());
    if (got == 0) break;
    if (auto r = acc.push(chunk.data(), static_cast<size_t>(got)); !r) return tl::unexpected(r.error());
    left -= got;
  }
  return acc.finish();
}

} // namespace

// -------------------------------
// Default Downmixer
// -------------------------------

class EnergyPreservingDownmixer final : public IDownmixer {
public:
  [[nodiscard]] Expected<PcmBuffer> to_mono(std::span<const PcmSpan> channels) const override {
    if (channels.empty()) return tl::unexpected(ScanError::InvalidArgument);

    const SampleRateHz sr = channels[0].sample_rate_hz;
    const size_t N = channels[0].samples.size();
    for (const auto& ch : channels) {
      if (ch.sample_rate_hz != sr) return tl::unexpected(ScanError::SizeMismatch);
      if (ch.samples.size() != N)   return tl::unexpected(ScanError::SizeMismatch);
    }

    PcmBuffer out;
    out.sample_rate_hz = sr;
    out.samples.resize(N);

    const float invC = 1.0f / static_cast<float>(channels.size());
    for (size_t i = 0; i < N; ++i) {
      float acc = 0.0f;
      for (const auto& ch : channels) acc += ch.samples[i];
      out.samples[i] = acc * invC;
    }
    return out;
  }
};

std::unique_ptr<IDownmixer> make_default_downmixer() {
  return std::make_unique<EnergyPreservingDownmixer>();
}

// -------------------------------
// WAV Decoder (dr_wav)
// -------------------------------
//
// Formats: PCM 8/16/24/32-bit, IEEE float32; channels downmixed to mono.
// Thread-safety: instance NOT thread-safe.
//

class DrWavDecoder final : public IAudioDecoder {
public:
  explicit DrWavDecoder(std::unique_ptr<IDownmixer> dm)
    : downmixer_(std::move(dm)) {}

  Expected<PcmBuffer> decode_file(std::string_view path) override {
    drwav wav{};
    if (!drwav_init_file(&wav, std::string(path).c_str(), nullptr))
      return tl::unexpected(ScanError::DecodeError);

    Expected<PcmBuffer> res = decode_impl(wav);
    drwav_uninit(&wav);
    return res;
  }

  Expected<PcmBuffer> decode_bytes(std::span<const std::byte> data) override {
    drwav wav{};
    if (!drwav_init_memory(&wav, data.data(), data.size(), nullptr))
      return tl::unexpected(ScanError::DecodeError);

    Expected<PcmBuffer> res = decode_impl(wav);
    drwav_uninit(&wav);
    return res;
  }

private:
  Expected<PcmBuffer> decode_impl(drwav& wav) {
    const uint32_t channels = wav.channels;
    const uint32_t sr       = wav.sampleRate;
    if (channels == 0 || sr == 0) return tl::unexpected(ScanError::DecodeError);

    // Streams with an unknown length report 0 frames and are read to the end.
    const std::uint64_t frames = wav.totalPCMFrameCount > 0 ? wav.totalPCMFrameCount : UINT64_MAX;
    return read_mono(channels, sr, *downmixer_, frames, [&](std::uint64_t n, float* dst) {
      return static_cast<std::uint64_t>(drwav_read_pcm_frames_f32(&wav, n, dst));
    });
  }

  std::unique_ptr<IDownmixer> downmixer_;
};

// -------------------------------
// MP3 Decoder (dr_mp3)
// -------------------------------
//
// Codec: MPEG-1/2 Layer III (CBR/VBR); channels downmixed to mono.
// Thread-safety: instance NOT thread-safe.
//

class DrMp3Decoder final : public IAudioDecoder {
public:
  explicit DrMp3Decoder(std::unique_ptr<IDownmixer> dm)
    : downmixer_(std::move(dm)) {}

  Expected<PcmBuffer> decode_file(std::string_view path) override {
    drmp3 mp3{};
    if (!drmp3_init_file(&mp3, std::string(path).c_str(), nullptr))
      return tl::unexpected(ScanError::DecodeError);

    Expected<PcmBuffer> res = decode_impl(mp3);
    drmp3_uninit(&mp3);
    return res;
  }

  Expected<PcmBuffer> decode_bytes(std::span<const std::byte> data) override {
    drmp3 mp3{};
    if (!drmp3_init_memory(&mp3, data.data(), data.size(), nullptr))
      return tl::unexpected(ScanError::DecodeError);

    Expected<PcmBuffer> res = decode_impl(mp3);
    drmp3_uninit(&mp3);
    return res;
  }

private:
  Expected<PcmBuffer> decode_impl(drmp3& mp3) {
    const uint32_t channels = mp3.channels;
    const uint32_t sr       = mp3.sampleRate;
    if (channels == 0 || sr == 0) return tl::unexpected(ScanError::DecodeError);

    return read_mono(channels, sr, *downmixer_, UINT64_MAX, [&](std::uint64_t n, float* dst) {
      return static_cast<std::uint64_t>(drmp3_read_pcm_frames_f32(&mp3, n, dst));
    });
  }

  std::unique_ptr<IDownmixer> downmixer_;
};

// -------------------------------
// FLAC Decoder (dr_flac)
// -------------------------------
//
// Bit depths: 16/24-bit typical; channels downmixed to mono.
// Thread-safety: instance NOT thread-safe.
//

class DrFlacDecoder final : public IAudioDecoder {
public:
  explicit DrFlacDecoder(std::unique_ptr<IDownmixer> dm)
    : downmixer_(std::move(dm)) {}

  Expected<PcmBuffer> decode_file(std::string_view path) override {
    drflac* flac = drflac_open_file(std::string(path).c_str(), nullptr);
    if (!flac) return tl::unexpected(ScanError::DecodeError);
    Expected<PcmBuffer> res = decode_impl(*flac);
    drflac_close(flac);
    return res;
  }

  Expected<PcmBuffer> decode_bytes(std::span<const std::byte> data) override {
    drflac* flac = drflac_open_memory(data.data(), data.size(), nullptr);
    if (!flac) return tl::unexpected(ScanError::DecodeError);
    Expected<PcmBuffer> res = decode_impl(*flac);
    drflac_close(flac);
    return res;
  }

private:
  Expected<PcmBuffer> decode_impl(drflac& flac) {
    const uint32_t channels = flac.channels;
    const uint32_t sr       = flac.sampleRate;
    if (channels == 0 || sr == 0) return tl::unexpected(ScanError::DecodeError);

    const std::uint64_t frames = flac.totalPCMFrameCount > 0 ? flac.totalPCMFrameCount : UINT64_MAX;
    return read_mono(channels, sr, *downmixer_, frames, [&](std::uint64_t n, float* dst) {
      return static_cast<std::uint64_t>(drflac_read_pcm_frames_f32(&flac, n, dst));
    });
  }

  std::unique_ptr<IDownmixer> downmixer_;
};

// -------------------------------
// Composite decoder
// -------------------------------

class CompositeDecoder final : public IAudioDecoder {
public:
  CompositeDecoder() {
    decoders_.reserve(3);
    // Each concrete decoder gets its own downmixer instance.
    decoders_.push_back(std::make_unique<DrWavDecoder>(make_default_downmixer()));
    decoders_.push_back(std::make_unique<DrMp3Decoder>(make_default_downmixer()));
    decoders_.push_back(std::make_unique<DrFlacDecoder>(make_default_downmixer()));
  }

  Expected<PcmBuffer> decode_file(std::string_view path) override {
    if (auto out = try_by_kind(sniff_extension(path), path)) return out;

    for (auto& d : decoders_) {
      if (auto out = d->decode_file(path)) return out;
    }
    return tl::unexpected(ScanError::DecodeError);
  }

  Expected<PcmBuffer> decode_bytes(std::span<const std::byte> data) override {
    if (auto out = try_by_kind(sniff_header(data), data)) return out;

    for (auto& d : decoders_) {
      if (auto out = d->decode_bytes(data)) return out;
    }
    return tl::unexpected(ScanError::DecodeError);
  }

private:
  IAudioDecoder* decoder_for(SniffedFormat kind) {
    switch (kind) {
      case SniffedFormat::Wav:  return decoders_[0].get();
      case SniffedFormat::Mp3:  return decoders_[1].get();
      case SniffedFormat::Flac: return decoders_[2].get();
      default: break;
    }
    return nullptr;
  }

  Expected<PcmBuffer> try_by_kind(SniffedFormat kind, std::string_view path) {
    if (auto* d = decoder_for(kind)) return d->decode_file(path);
    return tl::unexpected(ScanError::Unavailable);
  }

  Expected<PcmBuffer> try_by_kind(SniffedFormat kind, std::span<const std::byte> data) {
    if (auto* d = decoder_for(kind)) return d->decode_bytes(data);
    return tl::unexpected(ScanError::Unavailable);
  }

  std::vector<std::unique_ptr<IAudioDecoder>> decoders_;
};

// -------------------------------
// Windowed readers (dr_libs seek + read)
// -------------------------------

namespace {
// One open dr_libs file handle, released on destruction. Heap-allocated and
// never moved: the dr_libs structs are initialised in place.
class DrStream {
public:
  virtual ~DrStream() = default;
  virtual bool open(const std::string& path) = 0;
  [[nodiscard]] virtual std::uint32_t channels() const noexcept = 0;
  [[nodiscard]] virtual SampleRateHz sample_rate() const noexcept = 0;
  // 0 when the container does not record a length.
  virtual std::uint64_t total_frames() = 0;
  virtual bool seek(std::uint64_t frame) = 0;
  virtual std::uint64_t read(std::uint64_t frames, float* dst) = 0;
};

class WavStream final : public DrStream {
public:
  ~WavStream() override { if (open_) drwav_uninit(&wav_); }
  bool open(const std::string& path) override {
    open_ = drwav_init_file(&wav_, path.c_str(), nullptr);
    return open_;
  }
  std::uint32_t channels() const noexcept override { return wav_.channels; }
  SampleRateHz sample_rate() const noexcept override { return wav_.sampleRate; }
  std::uint64_t total_frames() override { return wav_.totalPCMFrameCount; }
  bool seek(std::uint64_t frame) override { return drwav_seek_to_pcm_frame(&wav_, frame); }
  std::uint64_t read(std::uint64_t frames, float* dst) override {
    return drwav_read_pcm_frames_f32(&wav_, frames, dst);
  }

private:
  drwav wav_{};
  bool open_{false};
};

class Mp3Stream final : public DrStream {
public:
  ~Mp3Stream() override { if (open_) drmp3_uninit(&mp3_); }
  bool open(const std::string& path) override {
    open_ = drmp3_init_file(&mp3_, path.c_str(), nullptr);
    return open_;
  }
  std::uint32_t channels() const noexcept override { return mp3_.channels; }
  SampleRateHz sample_rate() const noexcept override { return mp3_.sampleRate; }
  // Decodes the whole stream once, then rewinds.
  std::uint64_t total_frames() override { return drmp3_get_pcm_frame_count(&mp3_); }
  bool seek(std::uint64_t frame) override { return drmp3_seek_to_pcm_frame(&mp3_, frame); }
  std::uint64_t read(std::uint64_t frames, float* dst) override {
    return drmp3_read_pcm_frames_f32(&mp3_, frames, dst);
  }

private:
  drmp3 mp3_{};
  bool open_{false};
};

class FlacStream final : public DrStream {
public:
  ~FlacStream() override { if (flac_) drflac_close(flac_); }
  bool open(const std::string& path) override {
    flac_ = drflac_open_file(path.c_str(), nullptr);
    return flac_ != nullptr;
  }
  std::uint32_t channels() const noexcept override { return flac_->channels; }
  SampleRateHz sample_rate() const noexcept override { return flac_->sampleRate; }
  std::uint64_t total_frames() override { return flac_->totalPCMFrameCount; }
  bool seek(std::uint64_t frame) override { return drflac_seek_to_pcm_frame(flac_, frame); }
  std::uint64_t read(std::uint64_t frames, float* dst) override {
    return drflac_read_pcm_frames_f32(flac_, frames, dst);
  }

private:
  drflac* flac_{nullptr};
};

// nullptr if the file cannot be opened as `kind` or carries no audio.
std::unique_ptr<DrStream> open_stream(SniffedFormat kind, const std::string& path) {
  std::unique_ptr<DrStream> s;
  switch (kind) {
    case SniffedFormat::Wav:  s = std::make_unique<WavStream>(); break;
    case SniffedFormat::Mp3:  s = std::make_unique<Mp3Stream>(); break;
    case SniffedFormat::Flac: s = std::make_unique<FlacStream>(); break;
    default: return nullptr;
  }
  if (!s->open(path) || s->channels() == 0 || s->sample_rate() == 0) return nullptr;
  return s;
}

std::uint64_t count_frames(DrStream& s) {
  kfr::univector<float> chunk(kChunkFrames * s.channels());
  std::uint64_t total = 0;
  for (;;) {
    const std::uint64_t got = s.read(kChunkFrames, chunk.data());
    if (got == 0) break;
    total += got;
  }
  return total;
}
} // namespace

class DrWindowReader final : public IWindowReader {
public:
  DrWindowReader(std::string path, SniffedFormat kind, SampleRateHz sr, std::uint64_t frames)
    : path_(std::move(path)), kind_(kind), sr_(sr), frames_(frames),
      downmixer_(make_default_downmixer()) {}

  SampleRateHz sample_rate_hz() const noexcept override { return sr_; }
  std::uint64_t frame_count() const noexcept override { return frames_; }

  Expected<PcmBuffer> read_window(Seconds start_s, Seconds duration_s) const override {
    if (duration_s == 0) return tl::unexpected(ScanError::InvalidArgument);
    const std::uint64_t first = static_cast<std::uint64_t>(start_s) * sr_;
    if (first >= frames_) return tl::unexpected(ScanError::InvalidArgument);
    const std::uint64_t count =
        std::min<std::uint64_t>(frames_ - first, static_cast<std::uint64_t>(duration_s) * sr_);

    auto s = open_stream(kind_, path_);
    if (!s || !s->seek(first)) return tl::unexpected(ScanError::DecodeError);
    return read_mono(s->channels(), sr_, *downmixer_, count, [&](std::uint64_t n, float* dst) {
      return s->read(n, dst);
    });
  }

private:
  std::string path_;
  SniffedFormat kind_;
  SampleRateHz sr_;
  std::uint64_t frames_;
  std::unique_ptr<IDownmixer> downmixer_;
};

// -------------------------------
// WAV writer (dr_wav, 16-bit PCM mono)
// -------------------------------

class DrWavWriter final : public IWavWriter {
public:
  Expected<void> write_file(std::string_view path, PcmSpan pcm) const override {
    if (pcm.sample_rate_hz == 0 || pcm.samples.empty())
      return tl::unexpected(ScanError::InvalidArgument);

    std::vector<drwav_int16> s16(pcm.samples.size());
    drwav_f32_to_s16(s16.data(), pcm.samples.data(), pcm.samples.size());

    drwav_data_format fmt{};
    fmt.container = drwav_container_riff;
    fmt.format = DR_WAVE_FORMAT_PCM;
    fmt.channels = 1;
    fmt.sampleRate = pcm.sample_rate_hz;
    fmt.bitsPerSample = 16;

    drwav wav{};
    if (!drwav_init_file_write(&wav, std::string(path).c_str(), &fmt, nullptr))
      return tl::unexpected(ScanError::IOError);

    const drwav_uint64 written = drwav_write_pcm_frames(&wav, s16.size(), s16.data());
    drwav_uninit(&wav);
    if (written != s16.size()) return tl::unexpected(ScanError::IOError);
    return {};
  }
};

// -------------------------------
// Factory & helpers
// -------------------------------

class DefaultDecoderFactory final : public IDecoderFactory {
public:
  [[nodiscard]] std::unique_ptr<IAudioDecoder> create_decoder() const override {
    return std::make_unique<CompositeDecoder>();
  }

  [[nodiscard]] std::unique_ptr<IWavWriter> create_wav_writer() const override {
    return std::make_unique<DrWavWriter>();
  }

  [[nodiscard]] Expected<std::unique_ptr<IWindowReader>>
  open_window_reader(std::string_view path) const override {
    const std::string p(path);
    SniffedFormat kind = sniff_extension(path);
    if (kind == SniffedFormat::Unknown) kind = sniff_file(p);
    if (kind == SniffedFormat::Unknown) return tl::unexpected(ScanError::Unavailable);

    auto s = open_stream(kind, p);
    if (!s) return tl::unexpected(ScanError::DecodeError);
    std::uint64_t frames = s->total_frames();
    if (frames == 0) frames = count_frames(*s);
    if (frames == 0) return tl::unexpected(ScanError::DecodeError);

    return std::unique_ptr<IWindowReader>(
        std::make_unique<DrWindowReader>(p, kind, s->sample_rate(), frames));
  }
};

std::unique_ptr<IDecoderFactory> make_default_decoder_factory() {
  return std::make_unique<DefaultDecoderFactory>();
}

PcmSpan slice_seconds(const PcmBuffer& pcm, Seconds start_s, Seconds duration_s) noexcept {
  const std::uint64_t sr = pcm.sample_rate_hz;
  const std::uint64_t total = pcm.samples.size();
  const std::uint64_t begin = static_cast<std::uint64_t>(start_s) * sr;
  if (sr == 0 || begin >= total) return PcmSpan{pcm.sample_rate_hz, {}};
  const std::uint64_t end = std::min(total, begin + static_cast<std::uint64_t>(duration_s) * sr);
  return PcmSpan{pcm.sample_rate_hz,
                 std::span<const float>(pcm.samples.data() + begin,
                                        static_cast<size_t>(end - begin))};
}
} // namespace clipscan::io
