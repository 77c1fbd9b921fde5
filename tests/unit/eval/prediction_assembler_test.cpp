#include "hierarchy/test_hierarchy.hpp"
#include <hiereval/core/error.hpp>
#include <hiereval/eval/prediction_assembler.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

namespace he = hiereval::eval;
namespace hh = hiereval::hierarchy;
namespace hc = hiereval::core;
using hiereval::testing::make_mapper;

namespace {

// Root picks fruit (0.7), fruit group picks orange (0.5).
const hh::ClassVector kOrange{0.1f, 0.7f, 0.1f, 0.1f, 0.2f, 0.3f, 0.5f, 0.5f, 0.5f};
const hh::ClassVector kBackground{0.9f, 0.05f, 0.03f, 0.02f, 0.3f, 0.3f, 0.4f, 0.5f, 0.5f};

}  // namespace

TEST(PredictionAssembler, RegionYieldsPathClasses) {
  const auto mapper = make_mapper();
  const he::PredictionAssembler assembler(mapper, mapper.num_classes());
  const hc::Box roi{5.f, 5.f, 50.f, 50.f};

  const auto dets = assembler.assemble_region(kOrange, roi);
  ASSERT_EQ(dets.size(), 2u);
  EXPECT_EQ(dets[0].label, 1);  // fruit
  EXPECT_FLOAT_EQ(dets[0].detection.score, 0.7f);
  EXPECT_EQ(dets[1].label, 3);  // orange
  EXPECT_FLOAT_EQ(dets[1].detection.score, 0.35f);
  EXPECT_EQ(dets[1].detection.box, roi);
}

TEST(PredictionAssembler, BackgroundRegionYieldsNothing) {
  const auto mapper = make_mapper();
  const he::PredictionAssembler assembler(mapper, mapper.num_classes());
  EXPECT_TRUE(assembler.assemble_region(kBackground, hc::Box{}).empty());
}

TEST(PredictionAssembler, ClassCountMismatchIsFatal) {
  const auto mapper = make_mapper();
  const he::PredictionAssembler assembler(mapper, mapper.num_classes() - 1);
  EXPECT_THROW((void)assembler.assemble_region(kOrange, hc::Box{}),
               hc::HierarchyConsistencyError);
}

TEST(PredictionAssembler, SortsPerClassAndImage) {
  const auto mapper = make_mapper();
  const he::PredictionAssembler assembler(mapper, mapper.num_classes());
  const hc::Box r1{0.f, 0.f, 10.f, 10.f};
  const hc::Box r2{10.f, 10.f, 20.f, 20.f};

  std::vector<he::ImagePredictions> images(2);
  images[0].raw_outputs = {kOrange, kBackground};
  images[0].rois = {r1, r2};
  images[1].raw_outputs = {kOrange};
  images[1].rois = {r2};

  const auto all = assembler.assemble(images);
  ASSERT_EQ(all.size(), mapper.num_classes());
  for (const auto& per_image : all) EXPECT_EQ(per_image.size(), 2u);
  EXPECT_TRUE(all[0][0].empty());
  EXPECT_TRUE(all[0][1].empty());
  ASSERT_EQ(all[3][0].size(), 1u);
  EXPECT_EQ(all[3][0][0].box, r1);
  ASSERT_EQ(all[3][1].size(), 1u);
  EXPECT_EQ(all[3][1][0].box, r2);
  EXPECT_TRUE(all[2][0].empty());  // apple

  // Deterministic: same input, same output.
  const auto again = assembler.assemble(images);
  for (std::size_t c = 0; c < all.size(); ++c) {
    for (std::size_t i = 0; i < all[c].size(); ++i) {
      ASSERT_EQ(all[c][i].size(), again[c][i].size());
      for (std::size_t d = 0; d < all[c][i].size(); ++d) {
        EXPECT_EQ(all[c][i][d].box, again[c][i][d].box);
        EXPECT_EQ(all[c][i][d].score, again[c][i][d].score);
      }
    }
  }
}

TEST(PredictionAssembler, OutputsAndRoisMustAlign) {
  const auto mapper = make_mapper();
  const he::PredictionAssembler assembler(mapper, mapper.num_classes());
  std::vector<he::ImagePredictions> images(1);
  images[0].raw_outputs = {kOrange, kOrange};
  images[0].rois = {hc::Box{}};
  EXPECT_THROW((void)assembler.assemble(images), std::invalid_argument);
}
