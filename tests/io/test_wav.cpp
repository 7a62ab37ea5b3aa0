#include <gtest/gtest.h>
#include "clipscan/io/io.hpp"
#include "clipscan/util/util.hpp"
#include "test_utils_io.hpp"

using clipscan::util::PcmBuffer;
using clipscan::util::PcmSpan;
using clipscan::util::ScanError;

static std::unique_ptr<clipscan::io::IAudioDecoder> new_decoder() {
  auto f = clipscan::io::make_default_decoder_factory();
  return f->create_decoder();
}

TEST(WavDecode, Pcm16Mono_BytesAndFile) {
  const uint32_t sr = 22050;
  auto mono = testio::make_sine(440.f, float(sr), 400, 0.5f);
  auto wav = testio::write_wav_s16(testio::interleave({mono}), 1, sr);

  auto d = new_decoder();

  // bytes
  auto outE = d->decode_bytes(testio::as_bytes(wav));
  ASSERT_TRUE(outE.has_value());
  EXPECT_EQ(outE->sample_rate_hz, sr);
  EXPECT_EQ(outE->samples.size(), mono.size());

  // file
  testio::TempFile tf("wav16mono", ".wav");
  tf.write(wav.data(), wav.size());
  auto outF = d->decode_file(tf.path());
  ASSERT_TRUE(outF.has_value());
  EXPECT_EQ(outF->sample_rate_hz, sr);
  EXPECT_EQ(outF->samples.size(), mono.size());
}

TEST(WavDecode, Float32Mono_ValuesPreserved) {
  const uint32_t sr = 16000;
  auto mono = testio::make_sine(1000.f, float(sr), 256, 0.25f);
  auto wav = testio::write_wav_f32(testio::interleave({mono}), 1, sr);

  auto outE = new_decoder()->decode_bytes(testio::as_bytes(wav));
  ASSERT_TRUE(outE.has_value());
  ASSERT_EQ(outE->samples.size(), mono.size());

  for (size_t i = 0; i < mono.size(); ++i)
    ASSERT_NEAR(outE->samples[i], mono[i], 1e-6f);
}

TEST(WavDecode, StereoDownmixAverage) {
  const uint32_t sr = 44100;
  auto L = testio::make_sine(500.f, float(sr), 512, 0.5f);
  auto R = testio::make_sine(700.f, float(sr), 512, -0.5f);
  auto wav = testio::write_wav_s16(testio::interleave({L, R}), 2, sr);

  auto outE = new_decoder()->decode_bytes(testio::as_bytes(wav));
  ASSERT_TRUE(outE.has_value());
  ASSERT_EQ(outE->samples.size(), L.size());

  // s16 quantization adds about one LSB per channel.
  const float tol = 2e-4f;
  for (size_t i = 0; i < L.size(); ++i)
    ASSERT_NEAR(outE->samples[i], 0.5f * (L[i] + R[i]), tol);
}

TEST(WavDecode, CorruptionTruncatedHeader) {
  auto wav = testio::write_wav_s16(testio::make_silence(64), 1, 16000);
  wav.resize(8); // too short
  auto out = new_decoder()->decode_bytes(testio::as_bytes(wav));
  ASSERT_FALSE(out.has_value());
  ASSERT_EQ(out.error(), ScanError::DecodeError);
}

TEST(WavDecode, MissingFile) {
  auto out = new_decoder()->decode_file("/nonexistent/clipscan/none.wav");
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), ScanError::DecodeError);
}

TEST(WavDecode, UnknownBytesRejected) {
  std::vector<uint8_t> junk(256, 0x11);
  auto out = new_decoder()->decode_bytes(testio::as_bytes(junk));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), ScanError::DecodeError);
}

TEST(WavWrite, Pcm16RoundTrip) {
  const uint32_t sr = 11025;
  auto mono = testio::make_sine(300.f, float(sr), 1000, 0.4f);
  auto writer = clipscan::io::make_default_decoder_factory()->create_wav_writer();

  testio::TempFile tf("wavwrite", ".wav");
  auto w = writer->write_file(tf.path(), PcmSpan{sr, std::span<const float>(mono)});
  ASSERT_TRUE(w.has_value());

  auto back = new_decoder()->decode_file(tf.path());
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->sample_rate_hz, sr);
  ASSERT_EQ(back->samples.size(), mono.size());
  for (size_t i = 0; i < mono.size(); ++i)
    ASSERT_NEAR(back->samples[i], mono[i], 1e-4f);
}

TEST(WavWrite, RejectsEmptyAndZeroRate) {
  auto writer = clipscan::io::make_default_decoder_factory()->create_wav_writer();
  testio::TempFile tf("wavwrite_bad", ".wav");
  std::vector<float> one{0.1f};

  auto empty = writer->write_file(tf.path(), PcmSpan{8000, {}});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), ScanError::InvalidArgument);

  auto zero_sr = writer->write_file(tf.path(), PcmSpan{0, std::span<const float>(one)});
  ASSERT_FALSE(zero_sr.has_value());
  EXPECT_EQ(zero_sr.error(), ScanError::InvalidArgument);
}

TEST(WavWrite, UnwritableDirectory) {
  auto writer = clipscan::io::make_default_decoder_factory()->create_wav_writer();
  std::vector<float> x(100, 0.0f);
  auto w = writer->write_file("/nonexistent/clipscan/out.wav", PcmSpan{8000, std::span<const float>(x)});
  ASSERT_FALSE(w.has_value());
  EXPECT_EQ(w.error(), ScanError::IOError);
}

TEST(SliceSeconds, ClampsToEnd) {
  PcmBuffer pcm;
  pcm.sample_rate_hz = 10;
  pcm.samples.resize(55); // 5.5 s
  for (size_t i = 0; i < pcm.samples.size(); ++i) pcm.samples[i] = float(i);

  auto a = clipscan::io::slice_seconds(pcm, 1, 2);
  ASSERT_EQ(a.samples.size(), 20u);
  EXPECT_FLOAT_EQ(a.samples[0], 10.0f);
  EXPECT_EQ(a.sample_rate_hz, 10u);

  auto tail = clipscan::io::slice_seconds(pcm, 4, 10);
  ASSERT_EQ(tail.samples.size(), 15u);
  EXPECT_FLOAT_EQ(tail.samples.back(), 54.0f);

  auto past = clipscan::io::slice_seconds(pcm, 6, 1);
  EXPECT_TRUE(past.samples.empty());
}
