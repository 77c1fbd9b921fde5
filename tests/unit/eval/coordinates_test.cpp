#include <hiereval/eval/coordinates.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

namespace he = hiereval::eval;
namespace hc = hiereval::core;

namespace {

void expect_box_near(const hc::Box& a, const hc::Box& b, float tol = 1e-4f) {
  EXPECT_NEAR(a.xmin, b.xmin, tol);
  EXPECT_NEAR(a.ymin, b.ymin, tol);
  EXPECT_NEAR(a.xmax, b.xmax, tol);
  EXPECT_NEAR(a.ymax, b.ymax, tol);
}

}  // namespace

TEST(Coordinates, NormalizeAndScale) {
  const hc::Box px{20.f, 10.f, 100.f, 50.f};
  const hc::Box rel = he::normalize_absolute(px, {200, 100});
  expect_box_near(rel, {0.1f, 0.1f, 0.5f, 0.5f});
  expect_box_near(he::scale_to_absolute(rel, {200, 100}), px);
}

TEST(Coordinates, PaddingWideImage) {
  const hc::Box full{0.f, 0.f, 1.f, 1.f};
  const hc::Box padded = he::apply_padding(full, {200, 100});
  expect_box_near(padded, {0.f, 0.25f, 1.f, 0.75f});
  expect_box_near(he::remove_padding(padded, {200, 100}), full);
}

TEST(Coordinates, PaddingTallImage) {
  const hc::Box b{0.5f, 0.2f, 1.f, 0.4f};
  const hc::Box padded = he::apply_padding(b, {100, 400});
  expect_box_near(padded, {0.5f, 0.2f, 0.625f, 0.4f});
  expect_box_near(he::remove_padding(padded, {100, 400}), b);
}

TEST(Coordinates, PaddingSquareIsIdentity) {
  const hc::Box b{0.1f, 0.2f, 0.3f, 0.4f};
  EXPECT_EQ(he::apply_padding(b, {64, 64}), b);
  EXPECT_EQ(he::remove_padding(b, {64, 64}), b);
}

TEST(Coordinates, AbsoluteToInput) {
  he::CoordinateOptions opts;
  opts.is_absolute = true;
  opts.image_dims = hc::ImageDims{200, 100};
  opts.input_dims = hc::ImageDims{100, 100};
  expect_box_near(he::to_image_input_coordinates(hc::Box{0.f, 0.f, 200.f, 100.f}, opts),
                  {0.f, 25.f, 100.f, 75.f});
}

TEST(Coordinates, CenterFormInput) {
  he::CoordinateOptions opts;
  opts.relative = true;
  opts.needs_padding_adaption = false;
  opts.input_dims = hc::ImageDims{100, 50};
  expect_box_near(he::to_image_input_coordinates(hc::CenterBox{0.5f, 0.5f, 0.2f, 0.4f}, opts),
                  {40.f, 15.f, 60.f, 35.f});
}

TEST(Coordinates, MissingDimsThrow) {
  he::CoordinateOptions opts;
  opts.is_absolute = true;
  EXPECT_THROW((void)he::to_image_input_coordinates(hc::Box{}, opts), std::invalid_argument);

  he::CoordinateOptions rel;
  rel.relative = true;
  EXPECT_THROW((void)he::to_image_input_coordinates(hc::Box{}, rel), std::invalid_argument);
}

TEST(Coordinates, InputBackToOriginal) {
  const hc::Box original{30.f, 10.f, 150.f, 90.f};
  he::CoordinateOptions opts;
  opts.is_absolute = true;
  opts.image_dims = hc::ImageDims{200, 100};
  opts.input_dims = hc::ImageDims{850, 850};
  const hc::Box input = he::to_image_input_coordinates(original, opts);
  expect_box_near(he::to_original_image_coordinates(input, {200, 100}, {850, 850}), original,
                  1e-3f);
}
