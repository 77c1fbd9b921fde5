#include <hiereval/core/box.hpp>
#include <hiereval/core/frame.hpp>
#include <hiereval/vision/load_image.hpp>
#include <hiereval/vision/visualizer.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace hv = hiereval::vision;
namespace hc = hiereval::core;

namespace {

hc::Frame black_bgr(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(hc::Frame::min_bytes(w, h, hc::PixelFormat::BGR8), std::byte{0});
  return hc::Frame(w, h, hc::PixelFormat::BGR8, std::move(buf));
}

std::uint8_t blue(const hc::Frame& f, std::uint32_t x, std::uint32_t y) {
  return std::to_integer<std::uint8_t>(f.data()[(static_cast<std::size_t>(y) * f.width() + x) * 3]);
}

}  // namespace

TEST(Visualizer, DrawsRectangleOutline) {
  auto frame = black_bgr(40, 40);
  const std::vector<hc::Box> boxes{{5.f, 5.f, 30.f, 30.f}};
  EXPECT_EQ(hv::draw_boxes(frame, boxes, ""), 1u);
  EXPECT_EQ(blue(frame, 5, 5), 255);
  EXPECT_EQ(blue(frame, 30, 17), 255);
  EXPECT_EQ(blue(frame, 17, 17), 0);  // inside stays untouched
}

TEST(Visualizer, ClampsOutOfBoundsAndSkipsEmpty) {
  auto frame = black_bgr(20, 20);
  const std::vector<hc::Box> boxes{{-5.f, -5.f, 50.f, 50.f}, {25.f, 25.f, 40.f, 40.f}};
  EXPECT_EQ(hv::draw_boxes(frame, boxes, "fruit"), 1u);
  EXPECT_EQ(blue(frame, 0, 10), 255);
  EXPECT_EQ(blue(frame, 19, 10), 255);
}

TEST(Visualizer, IgnoresNonBgrFrames) {
  std::vector<std::byte> buf(16);
  hc::Frame gray(4, 4, hc::PixelFormat::Grayscale8, std::move(buf));
  const std::vector<hc::Box> boxes{{0.f, 0.f, 3.f, 3.f}};
  EXPECT_EQ(hv::draw_boxes(gray, boxes, ""), 0u);
}

TEST(LoadImage, SaveAndReload) {
  auto frame = black_bgr(24, 16);
  const std::vector<hc::Box> boxes{{2.f, 2.f, 20.f, 12.f}};
  ASSERT_EQ(hv::draw_boxes(frame, boxes, ""), 1u);

  const auto path = std::filesystem::temp_directory_path() / "hiereval_visualizer_test.png";
  ASSERT_TRUE(hv::save_frame_to_image(frame, path.string()));
  auto loaded = hv::load_frame_from_image(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->width(), 24u);
  EXPECT_EQ(loaded->height(), 16u);
  EXPECT_EQ(loaded->format(), hc::PixelFormat::BGR8);
  EXPECT_EQ(blue(*loaded, 2, 2), 255);

  EXPECT_FALSE(hv::load_frame_from_image("/nonexistent/image.png").has_value());
}
