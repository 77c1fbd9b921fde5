#include <hiereval/core/error.hpp>
#include <hiereval/core/frame.hpp>
#include <hiereval/vision/letterbox_stage.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

namespace hv = hiereval::vision;
namespace hc = hiereval::core;

namespace {

hc::Frame uniform_bgr(std::uint32_t w, std::uint32_t h, std::uint8_t value) {
  std::vector<std::byte> buf(hc::Frame::min_bytes(w, h, hc::PixelFormat::BGR8),
                             std::byte{value});
  return hc::Frame(w, h, hc::PixelFormat::BGR8, std::move(buf));
}

std::uint8_t pixel(const hc::Frame& f, std::uint32_t x, std::uint32_t y) {
  return std::to_integer<std::uint8_t>(f.data()[(static_cast<std::size_t>(y) * f.width() + x) * 3]);
}

}  // namespace

TEST(LetterboxStage, PlanWideImage) {
  const hv::LetterboxStage stage(850, 114);
  const auto info = stage.plan({200, 100});
  EXPECT_EQ(info.pad_width, 850u);
  EXPECT_EQ(info.pad_height, 850u);
  EXPECT_EQ(info.scaled_width, 850u);
  EXPECT_EQ(info.scaled_height, 425u);
  EXPECT_EQ(info.original_width, 200u);
  EXPECT_EQ(info.original_height, 100u);

  const auto dims = info.as_dims_input();
  EXPECT_FLOAT_EQ(dims[0], 850.f);
  EXPECT_FLOAT_EQ(dims[3], 425.f);
  EXPECT_FLOAT_EQ(dims[4], 200.f);
  EXPECT_FLOAT_EQ(dims[5], 100.f);
}

TEST(LetterboxStage, PlanTallImage) {
  const hv::LetterboxStage stage(100, 0);
  const auto info = stage.plan({30, 60});
  EXPECT_EQ(info.scaled_width, 50u);
  EXPECT_EQ(info.scaled_height, 100u);
}

TEST(LetterboxStage, PadsShorterAxisEvenly) {
  hv::LetterboxStage stage(16, 114);
  auto out = stage.process(uniform_bgr(8, 4, 200));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 16u);
  EXPECT_EQ(out->height(), 16u);
  EXPECT_EQ(out->format(), hc::PixelFormat::BGR8);

  // Scaled image is 16x8, centered: rows 4..11 hold the image.
  EXPECT_EQ(pixel(*out, 0, 0), 114);
  EXPECT_EQ(pixel(*out, 8, 3), 114);
  EXPECT_EQ(pixel(*out, 8, 4), 200);
  EXPECT_EQ(pixel(*out, 8, 11), 200);
  EXPECT_EQ(pixel(*out, 8, 12), 114);
  EXPECT_EQ(pixel(*out, 15, 15), 114);
}

TEST(LetterboxStage, SquareImageIsOnlyScaled) {
  hv::LetterboxStage stage(12, 114);
  auto out = stage.process(uniform_bgr(6, 6, 50));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 12u);
  EXPECT_EQ(pixel(*out, 0, 0), 50);
  EXPECT_EQ(pixel(*out, 11, 11), 50);
}

TEST(LetterboxStage, RejectsEmptyAndFloatFrames) {
  hv::LetterboxStage stage(16, 114);
  auto empty = stage.process(hc::Frame{});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), hc::EvalError::InvalidFrame);

  std::vector<std::byte> buf(hc::Frame::min_bytes(4, 4, hc::PixelFormat::Float32Planar));
  auto fl = stage.process(hc::Frame(4, 4, hc::PixelFormat::Float32Planar, std::move(buf)));
  ASSERT_FALSE(fl.has_value());
  EXPECT_EQ(fl.error(), hc::EvalError::InvalidFrame);
}
