#include <brickfinder/vision/color.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <utility>

namespace brickfinder::vision {

namespace nc = brickfinder::core;

namespace {

struct NamedColor {
  const char* name;
  Rgb rgb;
};

constexpr std::array<NamedColor, 19> kPalette{{
    {"black", {0, 0, 0}},
    {"white", {255, 255, 255}},
    {"red", {255, 0, 0}},
    {"blue", {0, 0, 255}},
    {"green", {0, 255, 0}},
    {"yellow", {255, 255, 0}},
    {"orange", {255, 165, 0}},
    {"purple", {128, 0, 128}},
    {"pink", {255, 192, 203}},
    {"brown", {165, 42, 42}},
    {"gray", {128, 128, 128}},
    {"light_gray", {211, 211, 211}},
    {"dark_gray", {64, 64, 64}},
    {"lime", {50, 205, 50}},
    {"cyan", {0, 255, 255}},
    {"magenta", {255, 0, 255}},
    {"tan", {210, 180, 140}},
    {"dark_blue", {0, 0, 139}},
    {"bright_green", {0, 255, 127}},
}};

std::string normalize_name(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (char ch : name) {
    if (ch == ' ' || ch == '-') {
      out.push_back('_');
    } else {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
  }
  if (out == "grey") out = "gray";
  return out;
}

/// HSV (OpenCV 8-bit ranges) copy of the region.
std::optional<cv::Mat> roi_to_hsv(const cv::Mat& roi, nc::PixelFormat format) {
  cv::Mat hsv;
  switch (format) {
    case nc::PixelFormat::BGR8:
      cv::cvtColor(roi, hsv, cv::COLOR_BGR2HSV);
      return hsv;
    case nc::PixelFormat::RGB8:
      cv::cvtColor(roi, hsv, cv::COLOR_RGB2HSV);
      return hsv;
    case nc::PixelFormat::BGRA8: {
      cv::Mat bgr;
      cv::cvtColor(roi, bgr, cv::COLOR_BGRA2BGR);
      cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
      return hsv;
    }
    case nc::PixelFormat::RGBA8: {
      cv::Mat bgr;
      cv::cvtColor(roi, bgr, cv::COLOR_RGBA2BGR);
      cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
      return hsv;
    }
    case nc::PixelFormat::Grayscale8: {
      cv::Mat bgr;
      cv::cvtColor(roi, bgr, cv::COLOR_GRAY2BGR);
      cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
      return hsv;
    }
    case nc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

}  // namespace

std::optional<Rgb> palette_color(std::string_view name) {
  const std::string key = normalize_name(name);
  for (const auto& c : kPalette) {
    if (key == c.name) return c.rgb;
  }
  return std::nullopt;
}

std::vector<std::string> palette_names() {
  std::vector<std::string> out;
  out.reserve(kPalette.size());
  for (const auto& c : kPalette) out.emplace_back(c.name);
  return out;
}

float color_similarity(Rgb a, Rgb b) noexcept {
  const float dr = static_cast<float>(a.r) - static_cast<float>(b.r);
  const float dg = static_cast<float>(a.g) - static_cast<float>(b.g);
  const float db = static_cast<float>(a.b) - static_cast<float>(b.b);
  const float dist = std::sqrt(dr * dr + dg * dg + db * db);
  static const float kMaxDist = 255.f * std::sqrt(3.f);
  return 1.f - dist / kMaxDist;
}

std::optional<Rgb> dominant_color(const nc::Frame& frame, const nc::BBox& box) {
  auto view = detail::frame_to_mat(frame);
  if (!view) return std::nullopt;

  const cv::Rect frame_rect(0, 0, view->cols, view->rows);
  const cv::Rect requested(static_cast<int>(std::floor(box.x)), static_cast<int>(std::floor(box.y)),
                           static_cast<int>(std::ceil(box.w)), static_cast<int>(std::ceil(box.h)));
  const cv::Rect clipped = requested & frame_rect;
  if (clipped.area() <= 0) return std::nullopt;

  auto hsv = roi_to_hsv((*view)(clipped), frame.format());
  if (!hsv) return std::nullopt;

  constexpr int kBins = 8;
  const int channels[] = {0, 1, 2};
  const int hist_size[] = {kBins, kBins, kBins};
  const float h_range[] = {0.f, 180.f};
  const float sv_range[] = {0.f, 256.f};
  const float* ranges[] = {h_range, sv_range, sv_range};

  cv::Mat hist;
  cv::calcHist(&*hsv, 1, channels, cv::Mat(), hist, 3, hist_size, ranges);

  // First fullest bin in memory order, so ties resolve the same way every time.
  int best[3] = {0, 0, 0};
  float best_count = -1.f;
  for (int h = 0; h < kBins; ++h) {
    for (int s = 0; s < kBins; ++s) {
      for (int v = 0; v < kBins; ++v) {
        const float count = hist.at<float>(h, s, v);
        if (count > best_count) {
          best_count = count;
          best[0] = h;
          best[1] = s;
          best[2] = v;
        }
      }
    }
  }

  cv::Mat hsv_px(1, 1, CV_8UC3,
                 cv::Scalar(best[0] * 180 / kBins, best[1] * 256 / kBins, best[2] * 256 / kBins));
  cv::Mat bgr_px;
  cv::cvtColor(hsv_px, bgr_px, cv::COLOR_HSV2BGR);
  const cv::Vec3b bgr = bgr_px.at<cv::Vec3b>(0, 0);
  return Rgb{bgr[2], bgr[1], bgr[0]};
}

}  // namespace brickfinder::vision
