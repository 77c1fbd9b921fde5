#include <hiereval/vision/onnx_detector_backend.hpp>
#include <onnxruntime_cxx_api.h>
#include <array>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace hiereval::vision {

namespace {

constexpr int64_t kNumChannels = 3;
constexpr int64_t kDimsInputSize = 6;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t src_idx = (static_cast<std::size_t>(y) * w + x) * kNumChannels;
      const std::size_t dst_idx = static_cast<std::size_t>(y) * w + x;
      nchw[0 * hw + dst_idx] = hwc[src_idx + 0];
      nchw[1 * hw + dst_idx] = hwc[src_idx + 1];
      nchw[2 * hw + dst_idx] = hwc[src_idx + 2];
    }
  }
}

/// Flattens any float output to rows x last-dimension.
Tensor2D ToTensor2D(Ort::Value& value) {
  const auto info = value.GetTensorTypeAndShapeInfo();
  const std::vector<int64_t> shape = info.GetShape();
  const std::size_t count = info.GetElementCount();

  Tensor2D t;
  t.cols = shape.empty() ? 1u : static_cast<std::size_t>(shape.back());
  t.rows = t.cols == 0 ? 0u : count / t.cols;
  const float* data = value.GetTensorData<float>();
  t.values.assign(data, data + count);
  return t;
}

}  // namespace

struct OnnxDetectorBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "hiereval"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  OutputNames output_names;
  std::string image_input_name;
  std::string dims_input_name;  // empty if the model takes no dims input
  std::vector<std::string> model_output_names;
  std::vector<const char*> output_name_ptrs;

  std::uint32_t input_height{0};  // 0 = dynamic
  std::uint32_t input_width{0};
  bool input_is_nchw{true};

  std::vector<float> nchw_buffer;  // scratch for HWC -> NCHW

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxDetectorBackend::OnnxDetectorBackend(std::string model_path, OutputNames output_names)
    : impl_(std::make_unique<Impl>()) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);
  impl_->output_names = std::move(output_names);

  Ort::AllocatorWithDefaultOptions allocator;
  const size_t num_inputs = impl_->session.GetInputCount();
  if (num_inputs == 0 || num_inputs > 2) {
    throw std::runtime_error("OnnxDetectorBackend: expected an image input and an optional dims input");
  }
  impl_->image_input_name = impl_->session.GetInputNameAllocated(0, allocator).get();

  const std::vector<int64_t> dims =
      impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxDetectorBackend: expected 4D image input");
  }
  auto to_extent = [](int64_t d) { return d > 0 ? static_cast<std::uint32_t>(d) : 0u; };
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = to_extent(dims[2]);
    impl_->input_width = to_extent(dims[3]);
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = to_extent(dims[1]);
    impl_->input_width = to_extent(dims[2]);
  } else {
    throw std::runtime_error("OnnxDetectorBackend: expected image input [1,3,H,W] or [1,H,W,3]");
  }

  if (num_inputs == 2u) {
    impl_->dims_input_name = impl_->session.GetInputNameAllocated(1, allocator).get();
  }

  const size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs == 0) {
    throw std::runtime_error("OnnxDetectorBackend: model has no outputs");
  }
  for (size_t i = 0; i < num_outputs; ++i) {
    impl_->model_output_names.emplace_back(impl_->session.GetOutputNameAllocated(i, allocator).get());
  }
  for (const auto& name : impl_->model_output_names) {
    impl_->output_name_ptrs.push_back(name.c_str());
  }
}

OnnxDetectorBackend::~OnnxDetectorBackend() = default;

std::expected<void, core::EvalError> OnnxDetectorBackend::validate_input(
    const core::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(core::EvalError::InvalidFrame);
  }
  if (input.format() != core::PixelFormat::Float32Planar) {
    return std::unexpected(core::EvalError::InvalidFrame);
  }
  if ((impl_->input_width != 0 && input.width() != impl_->input_width) ||
      (impl_->input_height != 0 && input.height() != impl_->input_height)) {
    return std::unexpected(core::EvalError::InvalidFrame);
  }
  if (input.size_bytes() < core::Frame::min_bytes(input.width(), input.height(),
                                                   core::PixelFormat::Float32Planar)) {
    return std::unexpected(core::EvalError::InvalidFrame);
  }
  return {};
}

std::expected<DetectorOutputs, core::EvalError> OnnxDetectorBackend::infer(
    const core::Frame& input, const LetterboxInfo& dims) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const std::uint32_t h = input.height();
  const std::uint32_t w = input.width();
  const float* src = reinterpret_cast<const float*>(input.data().data());
  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  std::vector<Ort::Value> inputs;
  std::vector<const char*> input_names{impl_->image_input_name.c_str()};

  if (impl_->input_is_nchw) {
    impl_->nchw_buffer.resize(num_floats);
    HwcToNchw(src, h, w, impl_->nchw_buffer.data());
    const std::array<int64_t, 4> shape{1, kNumChannels, static_cast<int64_t>(h),
                                       static_cast<int64_t>(w)};
    inputs.push_back(Ort::Value::CreateTensor<float>(
        mem_info, impl_->nchw_buffer.data(), num_floats, shape.data(), shape.size()));
  } else {
    const std::array<int64_t, 4> shape{1, static_cast<int64_t>(h), static_cast<int64_t>(w),
                                       kNumChannels};
    inputs.push_back(Ort::Value::CreateTensor<float>(
        mem_info, const_cast<float*>(src), num_floats, shape.data(), shape.size()));
  }

  std::array<float, kDimsInputSize> dims_values = dims.as_dims_input();
  if (!impl_->dims_input_name.empty()) {
    const std::array<int64_t, 2> shape{1, kDimsInputSize};
    inputs.push_back(Ort::Value::CreateTensor<float>(
        mem_info, dims_values.data(), dims_values.size(), shape.data(), shape.size()));
    input_names.push_back(impl_->dims_input_name.c_str());
  }

  Ort::RunOptions run_options;
  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names.data(), inputs.data(), inputs.size(),
                                 impl_->output_name_ptrs.data(), impl_->output_name_ptrs.size());
  } catch (const Ort::Exception& e) {
    std::cerr << "ONNX Runtime inference failed: " << e.what() << "\n";
    return std::unexpected(core::EvalError::InferenceFailed);
  }

  NamedTensors named;
  for (std::size_t i = 0; i < outputs.size(); ++i) {
    if (outputs[i].GetTensorTypeAndShapeInfo().GetElementType() !=
        ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
      continue;
    }
    named.emplace(impl_->model_output_names[i], ToTensor2D(outputs[i]));
  }
  return DetectorOutputs::from_named(std::move(named), impl_->output_names);
}

void OnnxDetectorBackend::warmup() {
  const std::uint32_t w = impl_->input_width;
  const std::uint32_t h = impl_->input_height;
  if (w == 0 || h == 0) return;  // dynamic input: nothing sensible to warm up with

  std::vector<std::byte> buffer(core::Frame::min_bytes(w, h, core::PixelFormat::Float32Planar),
                                std::byte{0});
  core::Frame frame(w, h, core::PixelFormat::Float32Planar, std::move(buffer));
  LetterboxInfo dims{w, h, w, h, w, h};
  if (auto result = infer(frame, dims); !result) {
    std::cerr << "ONNX warmup failed: " << core::to_string(result.error()) << "\n";
  }
}

}  // namespace hiereval::vision
