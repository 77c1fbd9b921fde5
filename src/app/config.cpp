#include <hiereval/app/config.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace hiereval::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_bool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw std::runtime_error("config: " + key + " expects true/false, got '" + value + "'");
}

/// Data and model paths in a config file are relative to the file's folder.
void resolve_relative(std::string& path, const std::filesystem::path& base) {
  if (path.empty()) return;
  const std::filesystem::path p(path);
  if (p.is_relative()) path = (base / p).lexically_normal().string();
}

}  // namespace

EvalConfig default_config() {
  return EvalConfig{};
}

EvalConfig load_config(const std::string& path) {
  EvalConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("config: cannot open " + path);
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    try {
      if (key == "model_path") c.model_path = value;
      else if (key == "backend_type") {
        if (value == "onnx") c.backend_type = DetectorBackendType::Onnx;
        else if (value == "mock") c.backend_type = DetectorBackendType::Mock;
        else throw std::runtime_error("config: unknown backend_type '" + value + "'");
      }
      else if (key == "class_map_path") c.class_map_path = value;
      else if (key == "hierarchy_path") c.hierarchy_path = value;
      else if (key == "test_image_list") c.test_image_list = value;
      else if (key == "test_roi_file") c.test_roi_file = value;
      else if (key == "num_test_images") c.num_test_images = std::stoul(value);
      else if (key == "input_size") c.input_size = static_cast<std::uint32_t>(std::stoul(value));
      else if (key == "input_rois_per_image") c.input_rois_per_image = static_cast<std::uint32_t>(std::stoul(value));
      else if (key == "pad_value") {
        const unsigned long v = std::stoul(value);
        if (v > 255) throw std::runtime_error("config: pad_value must be 0-255, got " + value);
        c.pad_value = static_cast<std::uint8_t>(v);
      }
      else if (key == "normalize_mean") c.normalize_mean = std::stof(value);
      else if (key == "normalize_scale") c.normalize_scale = std::stof(value);
      else if (key == "iou_threshold") c.iou_threshold = std::stof(value);
      else if (key == "use_07_metric") c.use_07_metric = parse_bool(key, value);
      else if (key == "apply_bbox_regression") c.apply_bbox_regression = parse_bool(key, value);
      else if (key == "visualize") c.visualize = parse_bool(key, value);
      else if (key == "output_dir") c.output_dir = value;
      else if (key == "cls_pred_name") c.cls_pred_name = value;
      else if (key == "rpn_rois_name") c.rpn_rois_name = value;
      else if (key == "bbox_regr_name") c.bbox_regr_name = value;
    } catch (const std::logic_error&) {  // std::stoul / std::stof
      throw std::runtime_error("config: cannot parse " + key + "='" + value + "'");
    }
  }

  const auto base = std::filesystem::path(path).parent_path();
  resolve_relative(c.model_path, base);
  resolve_relative(c.class_map_path, base);
  resolve_relative(c.hierarchy_path, base);
  resolve_relative(c.test_image_list, base);
  resolve_relative(c.test_roi_file, base);
  return c;
}

}  // namespace hiereval::app
