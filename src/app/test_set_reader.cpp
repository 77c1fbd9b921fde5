#include <hiereval/app/test_set_reader.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string_view>
#include <unordered_map>

namespace hiereval::app {

namespace {

constexpr std::string_view kRoiField = "|roiAndLabel";
constexpr std::size_t kValuesPerRoi = 5;

void report(const std::string& file, std::size_t line_no, const std::string& what) {
  std::cerr << file << ":" << line_no << ": " << what << "\n";
}

std::expected<std::unordered_map<std::size_t, std::vector<core::LabeledBox>>, core::EvalError>
read_rois(const std::string& roi_file) {
  std::ifstream f(roi_file);
  if (!f) {
    std::cerr << "Cannot open ROI file " << roi_file << "\n";
    return std::unexpected(core::EvalError::LoadFailed);
  }

  std::unordered_map<std::size_t, std::vector<core::LabeledBox>> out;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    std::istringstream in(line);
    std::size_t index = 0;
    std::string field;
    if (!(in >> index)) {
      if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
      report(roi_file, line_no, "expected image index");
      return std::unexpected(core::EvalError::InvalidTestSet);
    }
    if (!(in >> field) || field != kRoiField) {
      report(roi_file, line_no, "expected '|roiAndLabel'");
      return std::unexpected(core::EvalError::InvalidTestSet);
    }

    std::vector<float> values;
    float v = 0.f;
    while (in >> v) values.push_back(v);
    if (!in.eof() || values.size() % kValuesPerRoi != 0) {
      report(roi_file, line_no, "expected groups of 'x1 y1 x2 y2 label'");
      return std::unexpected(core::EvalError::InvalidTestSet);
    }

    auto& rois = out[index];
    for (std::size_t i = 0; i < values.size(); i += kValuesPerRoi) {
      core::LabeledBox roi;
      roi.box = {values[i], values[i + 1], values[i + 2], values[i + 3]};
      roi.label = static_cast<int>(std::lround(values[i + 4]));
      rois.push_back(roi);
    }
  }
  return out;
}

}  // namespace

std::expected<std::vector<TestSample>, core::EvalError> read_test_set(
    const std::string& image_list, const std::string& roi_file, std::size_t rois_per_image) {
  auto rois = read_rois(roi_file);
  if (!rois) return std::unexpected(rois.error());

  std::ifstream f(image_list);
  if (!f) {
    std::cerr << "Cannot open image list " << image_list << "\n";
    return std::unexpected(core::EvalError::LoadFailed);
  }
  const auto base = std::filesystem::path(image_list).parent_path();

  std::vector<TestSample> samples;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;

    std::istringstream in(line);
    TestSample sample;
    std::string path;
    if (!(in >> sample.index) || !std::getline(in >> std::ws, path, '\t') || path.empty()) {
      report(image_list, line_no, "expected 'index<TAB>path<TAB>0'");
      return std::unexpected(core::EvalError::InvalidTestSet);
    }
    const std::filesystem::path p(path);
    sample.image_path = p.is_relative() ? (base / p).lexically_normal().string() : path;

    if (const auto it = rois->find(sample.index); it != rois->end()) {
      sample.rois = it->second;
    }
    if (sample.rois.size() > rois_per_image) {
      std::cerr << "Warning: image " << sample.index << " has " << sample.rois.size()
                << " ground-truth boxes, keeping the first " << rois_per_image << "\n";
    }
    sample.rois.resize(rois_per_image);
    samples.push_back(std::move(sample));
  }
  return samples;
}

std::vector<core::LabeledBox> strip_padding(const std::vector<core::LabeledBox>& rois) {
  std::vector<core::LabeledBox> out;
  std::copy_if(rois.begin(), rois.end(), std::back_inserter(out),
               [](const core::LabeledBox& r) { return r.label != 0; });
  return out;
}

}  // namespace hiereval::app
