#pragma once
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

namespace testio {
  inline std::vector<float> make_sine(float freq_hz, float sr, size_t frames, float amp = 0.5f) {
    std::vector<float> x(frames);
    const float w = 2.0f * float(M_PI) * (freq_hz / sr);
    for (size_t n = 0; n < frames; ++n) x[n] = amp * std::sin(w * float(n));
    return x;
  }

  inline std::vector<float> make_silence(size_t frames) { return std::vector<float>(frames, 0.0f); }

  // interleave planar channels into interleaved buffer
  inline std::vector<float> interleave(const std::vector<std::vector<float> > &ch) {
    if (ch.empty()) return {};
    const size_t C = ch.size();
    const size_t N = ch[0].size();
    std::vector<float> out(C * N);
    for (size_t n = 0; n < N; ++n)
      for (size_t c = 0; c < C; ++c)
        out[n * C + c] = ch[c][n];
    return out;
  }

  // --- temp file helpers ---
  class TempFile {
  public:
    explicit TempFile(std::string stem = "clipscan_test", std::string ext = ".bin") {
      auto dir = std::filesystem::temp_directory_path();
      path_ = (dir / (stem + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter_++) + ext)).string();
    }

    ~TempFile() {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }

    const std::string &path() const { return path_; }

    void write(const void *data, size_t bytes) {
      std::ofstream ofs(path_, std::ios::binary | std::ios::trunc);
      ofs.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(bytes));
    }

  private:
    inline static std::atomic<uint64_t> counter_{0};
    std::string path_;
  };

  // --- tiny WAV writers (PCM16 / float32 interleaved) ---
#pragma pack(push, 1)
  struct RiffHeader {
    char riff[4];
    uint32_t size;
    char wave[4];
  };

  struct FmtChunk {
    char id[4];
    uint32_t size;
    uint16_t audio_fmt;
    uint16_t ch;
    uint32_t sr;
    uint32_t br;
    uint16_t ba;
    uint16_t bits;
  };

  struct DataChunk {
    char id[4];
    uint32_t size;
  };
#pragma pack(pop)

  inline std::vector<uint8_t> wav_bytes(const void *payload, uint32_t data_bytes, uint16_t fmt_tag,
                                        uint16_t ch, uint32_t sr, uint16_t bits) {
    const uint16_t bytes_per_sample = bits / 8;
    RiffHeader rh{
      {'R', 'I', 'F', 'F'}, 4 + 8 + static_cast<uint32_t>(sizeof(FmtChunk)) + 8 + data_bytes, {'W', 'A', 'V', 'E'}
    };
    FmtChunk fmt{
      {'f', 'm', 't', ' '}, 16, fmt_tag, ch, sr, sr * ch * bytes_per_sample,
      (uint16_t) (ch * bytes_per_sample), bits
    };
    DataChunk dc{{'d', 'a', 't', 'a'}, data_bytes};

    std::vector<uint8_t> out(sizeof(rh) + sizeof(fmt) + sizeof(dc) + data_bytes);
    uint8_t *p = out.data();
    std::memcpy(p, &rh, sizeof(rh));
    p += sizeof(rh);
    std::memcpy(p, &fmt, sizeof(fmt));
    p += sizeof(fmt);
    std::memcpy(p, &dc, sizeof(dc));
    p += sizeof(dc);
    if (data_bytes) std::memcpy(p, payload, data_bytes);
    return out;
  }

  inline std::vector<uint8_t> write_wav_f32(const std::vector<float> &interleaved, uint16_t ch, uint32_t sr) {
    const uint32_t frames = ch ? (uint32_t) (interleaved.size() / ch) : 0u;
    return wav_bytes(interleaved.data(), frames * ch * 4u, 3 /*IEEE float*/, ch, sr, 32);
  }

  inline std::vector<uint8_t> write_wav_s16(const std::vector<float> &interleaved, uint16_t ch, uint32_t sr) {
    const uint32_t frames = ch ? (uint32_t) (interleaved.size() / ch) : 0u;
    std::vector<int16_t> s16(size_t(frames) * ch);
    // convert float [-1,1] -> int16
    for (size_t i = 0; i < s16.size(); ++i) {
      float v = std::clamp(interleaved[i], -1.0f, 1.0f);
      s16[i] = (int16_t) std::lrintf(v * 32767.0f);
    }
    return wav_bytes(s16.data(), frames * ch * 2u, 1 /*PCM*/, ch, sr, 16);
  }

  inline std::span<const std::byte> as_bytes(const std::vector<uint8_t> &v) {
    return std::span<const std::byte>(reinterpret_cast<const std::byte *>(v.data()), v.size());
  }
} // namespace testio
