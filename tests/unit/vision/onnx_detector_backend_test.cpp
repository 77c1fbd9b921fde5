// Unit tests for OnnxDetectorBackend.
// One test runs without a model. The rest need an exported hierarchical Faster R-CNN:
// set HIEREVAL_TEST_ONNX_MODEL to its path. They are skipped if the variable is unset or
// the file is missing.
#include <hiereval/core/error.hpp>
#include <hiereval/core/frame.hpp>
#include <hiereval/vision/onnx_detector_backend.hpp>
#include <onnxruntime_cxx_api.h>
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace hv = hiereval::vision;
namespace hc = hiereval::core;

static std::string get_test_model_path() {
  const char* env = std::getenv("HIEREVAL_TEST_ONNX_MODEL");
  if (env && env[0] != '\0' && std::filesystem::exists(env)) {
    return env;
  }
  return "";
}

static constexpr std::uint32_t kInputSize = 850u;

static hc::Frame make_float_frame(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buffer(hc::Frame::min_bytes(w, h, hc::PixelFormat::Float32Planar),
                                std::byte{0});
  return hc::Frame(w, h, hc::PixelFormat::Float32Planar, std::move(buffer));
}

TEST(OnnxDetectorBackend, ConstructorThrowsWhenFileMissing) {
  EXPECT_THROW(
      { hv::OnnxDetectorBackend backend("nonexistent_hiereval_model_should_not_exist.onnx"); },
      Ort::Exception);
}

TEST(OnnxDetectorBackend, ValidateInputRejectsWrongFrames) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set HIEREVAL_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  hv::OnnxDetectorBackend backend(path);

  auto empty = backend.validate_input(hc::Frame{});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), hc::EvalError::InvalidFrame);

  std::vector<std::byte> buf(kInputSize * kInputSize * 3);
  hc::Frame bgr(kInputSize, kInputSize, hc::PixelFormat::BGR8, std::move(buf));
  auto wrong_format = backend.validate_input(bgr);
  ASSERT_FALSE(wrong_format.has_value());
  EXPECT_EQ(wrong_format.error(), hc::EvalError::InvalidFrame);
}

TEST(OnnxDetectorBackend, InferReturnsAlignedOutputs) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set HIEREVAL_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  hv::OnnxDetectorBackend backend(path);
  backend.warmup();

  const hv::LetterboxInfo dims{kInputSize, kInputSize, kInputSize, kInputSize,
                               kInputSize, kInputSize};
  auto result = backend.infer(make_float_frame(kInputSize, kInputSize), dims);
  ASSERT_TRUE(result.has_value()) << hc::to_string(result.error());
  EXPECT_EQ(result->cls_pred.rows, result->num_rois());
  EXPECT_EQ(result->bbox_regr.rows, result->num_rois());
  EXPECT_EQ(result->rpn_rois.cols, 4u);
}
