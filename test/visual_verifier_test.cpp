#include "visual_verifier.hpp"

#include <gtest/gtest.h>

using namespace pdf_a11y;

namespace {

RasterImage solid(int w, int h, uint32_t argb) {
  RasterImage img;
  img.width = w;
  img.height = h;
  img.valid = true;
  img.pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), argb);
  return img;
}

}  // namespace

TEST(PixelDiff, IdenticalRastersDoNotDiffer) {
  auto a = solid(10, 10, 0xffffffff);
  EXPECT_DOUBLE_EQ(pixel_diff_percent(a, a), 0.0);
}

TEST(PixelDiff, CountsChangedPixels) {
  auto a = solid(10, 10, 0xffffffff);
  auto b = a;
  for (int i = 0; i < 25; ++i) b.pixels[static_cast<size_t>(i)] = 0xff000000;
  EXPECT_DOUBLE_EQ(pixel_diff_percent(a, b), 25.0);
}

TEST(PixelDiff, IgnoresChangesWithinThreshold) {
  auto a = solid(4, 4, 0xff808080);
  auto b = solid(4, 4, 0xff838383);
  EXPECT_DOUBLE_EQ(pixel_diff_percent(a, b, 5), 0.0);
  EXPECT_DOUBLE_EQ(pixel_diff_percent(a, b, 2), 100.0);

  // alpha is not compared
  auto c = solid(4, 4, 0x00808080);
  EXPECT_DOUBLE_EQ(pixel_diff_percent(a, c), 0.0);
}

TEST(PixelDiff, MismatchedOrInvalidRastersCountAsFullDifference) {
  auto a = solid(4, 4, 0xffffffff);
  EXPECT_DOUBLE_EQ(pixel_diff_percent(a, solid(4, 5, 0xffffffff)), 100.0);
  EXPECT_DOUBLE_EQ(pixel_diff_percent(a, RasterImage()), 100.0);

  RasterImage empty;
  empty.valid = true;
  EXPECT_DOUBLE_EQ(pixel_diff_percent(empty, empty), 0.0);
}
