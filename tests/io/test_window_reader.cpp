#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "clipscan/io/io.hpp"
#include "test_utils_io.hpp"

using clipscan::util::ScanError;

namespace {
// Slow ramp so each frame's value identifies its position.
std::vector<float> ramp(size_t frames) {
  std::vector<float> x(frames);
  for (size_t i = 0; i < frames; ++i) x[i] = -0.9f + 1.8f * float(i) / float(frames);
  return x;
}

auto open_reader(const std::string& path) {
  return clipscan::io::make_default_decoder_factory()->open_window_reader(path);
}
} // namespace

TEST(WindowReader, ReadsOnlyTheWindow) {
  const uint32_t sr = 8000;
  const auto x = ramp(5 * sr);
  auto wav = testio::write_wav_f32(testio::interleave({x}), 1, sr);
  testio::TempFile tf("clipscan_window", ".wav");
  tf.write(wav.data(), wav.size());

  auto r = open_reader(tf.path());
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ((*r)->sample_rate_hz(), sr);
  EXPECT_EQ((*r)->frame_count(), x.size());

  // Crosses the decoder's internal chunk boundary.
  auto w = (*r)->read_window(1, 3);
  ASSERT_TRUE(w.has_value());
  EXPECT_EQ(w->sample_rate_hz, sr);
  ASSERT_EQ(w->samples.size(), size_t(3 * sr));
  for (size_t i : {size_t(0), size_t(1), size_t(16383), size_t(16384), size_t(3 * sr - 1)})
    EXPECT_FLOAT_EQ(w->samples[i], x[sr + i]) << "at " << i;
}

TEST(WindowReader, ClampsToEnd) {
  const uint32_t sr = 8000;
  const auto x = ramp(3 * sr + sr / 2);
  auto wav = testio::write_wav_f32(testio::interleave({x}), 1, sr);
  testio::TempFile tf("clipscan_window", ".wav");
  tf.write(wav.data(), wav.size());

  auto r = open_reader(tf.path());
  ASSERT_TRUE(r.has_value());
  auto w = (*r)->read_window(2, 10);
  ASSERT_TRUE(w.has_value());
  ASSERT_EQ(w->samples.size(), size_t(sr + sr / 2));
  EXPECT_FLOAT_EQ(w->samples.back(), x.back());
}

TEST(WindowReader, StereoDownmixedPerWindow) {
  const uint32_t sr = 8000;
  std::vector<float> l(4 * sr, 0.5f), rch(4 * sr, -0.25f);
  auto wav = testio::write_wav_f32(testio::interleave({l, rch}), 2, sr);
  testio::TempFile tf("clipscan_window", ".wav");
  tf.write(wav.data(), wav.size());

  auto r = open_reader(tf.path());
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ((*r)->frame_count(), size_t(4 * sr));
  auto w = (*r)->read_window(1, 2);
  ASSERT_TRUE(w.has_value());
  ASSERT_EQ(w->samples.size(), size_t(2 * sr));
  for (float v : w->samples) ASSERT_NEAR(v, 0.125f, 1e-6f);
}

TEST(WindowReader, WindowsAreIndependent) {
  const uint32_t sr = 8000;
  const auto x = ramp(6 * sr);
  auto wav = testio::write_wav_s16(testio::interleave({x}), 1, sr);
  testio::TempFile tf("clipscan_window", ".wav");
  tf.write(wav.data(), wav.size());

  auto r = open_reader(tf.path());
  ASSERT_TRUE(r.has_value());
  auto late = (*r)->read_window(4, 1);
  auto early = (*r)->read_window(0, 1);
  ASSERT_TRUE(late.has_value());
  ASSERT_TRUE(early.has_value());
  EXPECT_NEAR(late->samples[0], x[4 * sr], 1e-4f);
  EXPECT_NEAR(early->samples[0], x[0], 1e-4f);
}

TEST(WindowReader, OutOfRange) {
  const uint32_t sr = 8000;
  auto wav = testio::write_wav_s16(testio::make_silence(2 * sr), 1, sr);
  testio::TempFile tf("clipscan_window", ".wav");
  tf.write(wav.data(), wav.size());

  auto r = open_reader(tf.path());
  ASSERT_TRUE(r.has_value());
  auto past = (*r)->read_window(2, 1);
  ASSERT_FALSE(past.has_value());
  EXPECT_EQ(past.error(), ScanError::InvalidArgument);
  auto zero = (*r)->read_window(0, 0);
  ASSERT_FALSE(zero.has_value());
  EXPECT_EQ(zero.error(), ScanError::InvalidArgument);
}

TEST(WindowReader, FormatFromHeaderWhenExtensionUnknown) {
  const uint32_t sr = 8000;
  auto wav = testio::write_wav_s16(testio::make_silence(sr), 1, sr);
  testio::TempFile tf("clipscan_window", ".audio");
  tf.write(wav.data(), wav.size());

  auto r = open_reader(tf.path());
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ((*r)->frame_count(), size_t(sr));
}

TEST(WindowReader, UnknownContainerUnavailable) {
  // ISO base media header ("ftyp" box), as in .mp4 files.
  const std::vector<uint8_t> mp4{0, 0, 0, 0x18, 'f', 't', 'y', 'p', 'i', 's', 'o', 'm', 0, 0, 2, 0};
  testio::TempFile tf("clipscan_window", ".mp4");
  tf.write(mp4.data(), mp4.size());

  auto r = open_reader(tf.path());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ScanError::Unavailable);
}

TEST(WindowReader, BrokenOrMissingWav) {
  const std::vector<uint8_t> junk{'R', 'I', 'F', 'F', 1, 2, 3};
  testio::TempFile tf("clipscan_window", ".wav");
  tf.write(junk.data(), junk.size());

  auto broken = open_reader(tf.path());
  ASSERT_FALSE(broken.has_value());
  EXPECT_EQ(broken.error(), ScanError::DecodeError);

  auto missing = open_reader("/nonexistent/clipscan/source.wav");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), ScanError::DecodeError);
}
