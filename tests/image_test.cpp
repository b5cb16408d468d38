#include <gtest/gtest.h>
#include "errors.hpp"
#include "image.hpp"
#include "test_support.hpp"

using namespace photolink;
using photolink::test::gradient;
using photolink::test::jpeg_of;

TEST(Image, EncodeProducesJpegMarkers) {
  ImageBuffer out;
  ASSERT_FALSE(encode_jpeg(gradient(64, 48), 80, out));
  ASSERT_GT(out.size(), 4u);
  EXPECT_EQ(out[0], 0xFF);
  EXPECT_EQ(out[1], 0xD8);
  EXPECT_EQ(out[out.size() - 2], 0xFF);
  EXPECT_EQ(out[out.size() - 1], 0xD9);
}

TEST(Image, WideImageIsScaledTo1280) {
  ImageBuffer out;
  ASSERT_FALSE(normalize_image(jpeg_of(2000, 1000), out));
  Bitmap back;
  ASSERT_FALSE(decode_jpeg(out, back));
  EXPECT_EQ(back.width, 1280);
  EXPECT_EQ(back.height, 640);
}

TEST(Image, AspectRatioHeightIsTruncated) {
  Bitmap scaled = scale_to_width(gradient(3000, 1001), 1280);
  EXPECT_EQ(scaled.width, 1280);
  EXPECT_EQ(scaled.height, 427);  // 1001 * 1280 / 3000 = 427.09
  EXPECT_EQ(scaled.rgb.size(), 1280u * 427 * 3);
}

TEST(Image, NarrowImageKeepsDimensions) {
  ImageBuffer out;
  ASSERT_FALSE(normalize_image(jpeg_of(640, 480), out));
  Bitmap back;
  ASSERT_FALSE(decode_jpeg(out, back));
  EXPECT_EQ(back.width, 640);
  EXPECT_EQ(back.height, 480);
}

TEST(Image, ExactlyMaxWidthIsNotScaled) {
  Bitmap b = gradient(1280, 20);
  ImageBuffer out;
  ASSERT_FALSE(normalize_bitmap(std::move(b), out));
  Bitmap back;
  ASSERT_FALSE(decode_jpeg(out, back));
  EXPECT_EQ(back.width, 1280);
  EXPECT_EQ(back.height, 20);
}

TEST(Image, NormalizeReleasesInputBitmap) {
  Bitmap b = gradient(1600, 100);
  ImageBuffer out;
  ASSERT_FALSE(normalize_bitmap(std::move(b), out));
  EXPECT_TRUE(b.empty());
  EXPECT_EQ(b.rgb.capacity(), 0u);
}

TEST(Image, ScalingKeepsFlatColour) {
  Bitmap b;
  b.width = 300;
  b.height = 30;
  b.rgb.assign(300 * 30 * 3, 200);
  Bitmap s = scale_to_width(b, 100);
  ASSERT_EQ(s.width, 100);
  ASSERT_EQ(s.height, 10);
  for (uint8_t v : s.rgb)
    ASSERT_EQ(v, 200);
}

TEST(Image, GarbageIsDecodeError) {
  std::vector<uint8_t> junk(512, 0x42);
  ImageBuffer out;
  EXPECT_EQ(normalize_image(junk, out), TransferErrc::decode_error);
  EXPECT_TRUE(out.empty());
}

TEST(Image, EmptyAndTruncatedInputAreDecodeErrors) {
  ImageBuffer out;
  EXPECT_EQ(normalize_image({}, out), TransferErrc::decode_error);
  auto jpg = jpeg_of(32, 32);
  jpg.resize(20);
  EXPECT_EQ(normalize_image(jpg, out), TransferErrc::decode_error);
}

TEST(Image, EmptyBitmapIsRejected) {
  ImageBuffer out;
  EXPECT_EQ(normalize_bitmap(Bitmap(), out), TransferErrc::decode_error);
}

TEST(Image, ImplausibleHeaderDimensionsAreDecodeError) {
  auto jpg = jpeg_of(16, 16);
  size_t sof = 0;
  for (size_t i = 0; i + 8 < jpg.size(); i++)
    if (jpg[i] == 0xFF && jpg[i + 1] == 0xC0) {
      sof = i;
      break;
    }
  ASSERT_NE(sof, 0u);
  // FFC0, length(2), precision(1), height(2), width(2)
  jpg[sof + 5] = 0xFF;
  jpg[sof + 6] = 0xDC;
  jpg[sof + 7] = 0xFF;
  jpg[sof + 8] = 0xDC;
  ImageBuffer out;
  EXPECT_EQ(normalize_image(jpg, out), TransferErrc::decode_error);
  EXPECT_TRUE(out.empty());
}
