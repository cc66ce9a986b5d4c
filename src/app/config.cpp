#include <brickfinder/app/config.hpp>
#include <brickfinder/core/log.hpp>
#include <charconv>
#include <fstream>
#include <string_view>
#include <system_error>

namespace brickfinder::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
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

template <typename T>
bool parse_number(std::string_view s, T& out) {
  const char* first = s.data();
  const char* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

bool parse_bool(std::string_view s, bool& out) {
  if (s == "1" || s == "true" || s == "on" || s == "yes") {
    out = true;
    return true;
  }
  if (s == "0" || s == "false" || s == "off" || s == "no") {
    out = false;
    return true;
  }
  return false;
}

template <typename T>
bool set_number(std::string_view value, T& field) {
  T v{};
  if (!parse_number(value, v)) return false;
  field = v;
  return true;
}

bool set_ms(std::string_view value, std::chrono::milliseconds& field) {
  std::int64_t v = 0;
  if (!parse_number(value, v) || v < 0) return false;
  field = std::chrono::milliseconds(v);
  return true;
}

}  // namespace

std::string_view to_string(InferenceBackendType t) noexcept {
  switch (t) {
    case InferenceBackendType::Mock: return "mock";
    case InferenceBackendType::Onnx: return "onnx";
    case InferenceBackendType::Contour: return "contour";
  }
  return "unknown";
}

std::optional<InferenceBackendType> parse_backend_type(std::string_view s) noexcept {
  if (s == "mock") return InferenceBackendType::Mock;
  if (s == "onnx") return InferenceBackendType::Onnx;
  if (s == "contour") return InferenceBackendType::Contour;
  return std::nullopt;
}

std::vector<std::string> split_list(std::string_view s, char sep) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= s.size()) {
    const auto pos = s.find(sep, start);
    std::string item(s.substr(start, pos == std::string_view::npos ? std::string_view::npos
                                                                      : pos - start));
    trim(item);
    if (!item.empty()) out.push_back(std::move(item));
    if (pos == std::string_view::npos) break;
    start = pos + 1;
  }
  return out;
}

PipelineConfig default_config() {
  PipelineConfig c;
  c.model_path = "";
  c.backend_type = InferenceBackendType::Mock;
  c.input_width = 640;
  c.input_height = 640;
  c.quality = core::QualityConfig{};
  c.stability = core::StabilityParams{};
  c.batch_interval = std::chrono::milliseconds(100);
  c.queue_capacity = 2;
  c.frame_skip = 0;
  c.shutdown_timeout = std::chrono::milliseconds(2000);
  c.log_level = "info";
  return c;
}

bool apply_config_value(PipelineConfig& c, std::string_view key, std::string_view value) {
  auto& q = c.quality;
  auto& s = c.stability;

  if (key == "model_path") {
    c.model_path = std::string(value);
    return true;
  }
  if (key == "backend_type") {
    auto t = parse_backend_type(value);
    if (!t) return false;
    c.backend_type = *t;
    return true;
  }
  if (key == "labels") {
    c.labels = split_list(value);
    return true;
  }
  if (key == "log_level") {
    c.log_level = std::string(value);
    return true;
  }
  if (key == "input_width") return set_number(value, c.input_width);
  if (key == "input_height") return set_number(value, c.input_height);
  if (key == "confidence") return set_number(value, q.confidence);
  if (key == "nms_iou") return set_number(value, q.nms_iou);
  if (key == "min_size_px") return set_number(value, q.min_size_px);
  if (key == "max_size_px") return set_number(value, q.max_size_px);
  if (key == "aspect_min") return set_number(value, q.aspect_min);
  if (key == "aspect_max") return set_number(value, q.aspect_max);
  if (key == "color_consistency") return parse_bool(value, q.color_consistency);
  if (key == "min_color_similarity") return set_number(value, q.min_color_similarity);
  if (key == "max_candidates") return set_number(value, q.max_candidates);
  if (key == "stability_window") return set_number(value, s.window);
  if (key == "stability_min_hits") return set_number(value, s.min_hits);
  if (key == "stability_max_misses") return set_number(value, s.max_misses);
  if (key == "batch_interval_ms") return set_ms(value, c.batch_interval);
  if (key == "queue_capacity") return set_number(value, c.queue_capacity);
  if (key == "frame_skip") return set_number(value, c.frame_skip);
  if (key == "shutdown_timeout_ms") return set_ms(value, c.shutdown_timeout);
  return false;
}

PipelineConfig load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    BF_LOGW("config", "cannot open %s, using defaults", path.c_str());
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      BF_LOGW("config", "%s:%zu: expected key=value", path.c_str(), line_no);
      continue;
    }
    if (!apply_config_value(c, key, value)) {
      BF_LOGW("config", "%s:%zu: ignoring %s=%s", path.c_str(), line_no, key.c_str(),
              value.c_str());
    }
  }
  return c;
}

}  // namespace brickfinder::app
