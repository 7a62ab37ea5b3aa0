#include <gtest/gtest.h>
#include <vector>

#include "clipscan/scan/scan.hpp"

using clipscan::scan::window_offsets;
using clipscan::util::Seconds;

TEST(WindowOffsets, EvenlyDivisible) {
  EXPECT_EQ(window_offsets(40, 10, 10), (std::vector<Seconds>{0, 10, 20, 30}));
}

TEST(WindowOffsets, LastWindowMustFit) {
  EXPECT_EQ(window_offsets(45, 10, 10), (std::vector<Seconds>{0, 10, 20, 30}));
  EXPECT_EQ(window_offsets(1000, 500, 10).back(), 500u);
  EXPECT_EQ(window_offsets(1000, 500, 10).size(), 51u);
}

TEST(WindowOffsets, ExactlyOneWindow) {
  EXPECT_EQ(window_offsets(10, 10, 10), (std::vector<Seconds>{0}));
}

TEST(WindowOffsets, ShorterThanWindow) {
  EXPECT_TRUE(window_offsets(9, 10, 10).empty());
  EXPECT_TRUE(window_offsets(0, 10, 10).empty());
}

TEST(WindowOffsets, ZeroStep) {
  EXPECT_TRUE(window_offsets(100, 10, 0).empty());
}

TEST(WorkerCount, ExplicitAndDetected) {
  EXPECT_EQ(clipscan::scan::worker_count(3), 3u);
  EXPECT_GE(clipscan::scan::worker_count(0), 1u);
}

TEST(ScanParams, Defaults) {
  clipscan::scan::ScanParams sp{};
  EXPECT_EQ(sp.window_s, 500u);
  EXPECT_EQ(sp.window_step_s, 10u);
  EXPECT_EQ(sp.search_span, 150);
  EXPECT_EQ(sp.search_step, 10);
  EXPECT_EQ(sp.min_overlap, 20u);
  EXPECT_DOUBLE_EQ(sp.match.threshold, 0.60);
  EXPECT_EQ(sp.match.min_consistent_offsets, 1u);
  EXPECT_EQ(sp.match.max_offset_deviation, 5);
  EXPECT_EQ(sp.threads, 0u);
}
