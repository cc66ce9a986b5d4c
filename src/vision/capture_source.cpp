#include <brickfinder/vision/capture_source.hpp>
#include <brickfinder/core/log.hpp>
#include <brickfinder/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

namespace brickfinder::vision {

namespace nc = brickfinder::core;

namespace {

std::optional<int> camera_index(const std::string& s) {
  int index = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), index);
  if (s.empty() || ec != std::errc() || ptr != s.data() + s.size() || index < 0) {
    return std::nullopt;
  }
  return index;
}

bool is_image_path(const std::string& s) {
  std::string ext = std::filesystem::path(s).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  static const std::vector<std::string> kImageExts = {".png", ".jpg", ".jpeg", ".bmp", ".tif",
                                                      ".tiff"};
  return std::find(kImageExts.begin(), kImageExts.end(), ext) != kImageExts.end();
}

}  // namespace

struct OpenCvCaptureSource::Impl {
  cv::VideoCapture capture;
  cv::Mat mat;
};

OpenCvCaptureSource::OpenCvCaptureSource(std::string source)
    : source_(std::move(source)), impl_(std::make_unique<Impl>()) {}

OpenCvCaptureSource::~OpenCvCaptureSource() = default;

std::expected<void, nc::CaptureFault> OpenCvCaptureSource::reopen() {
  impl_->capture.release();
  const auto index = camera_index(source_);
  const bool ok = index ? impl_->capture.open(*index) : impl_->capture.open(source_);
  if (!ok || !impl_->capture.isOpened()) {
    return std::unexpected(nc::CaptureFault{"cannot open capture source '" + source_ + "'"});
  }
  BF_LOGI("capture", "opened %s", source_.c_str());
  return {};
}

std::expected<nc::Frame, nc::CaptureFault> OpenCvCaptureSource::read() {
  if (!impl_->capture.isOpened()) {
    return std::unexpected(nc::CaptureFault{"capture source '" + source_ + "' is not open"});
  }
  if (!impl_->capture.read(impl_->mat) || impl_->mat.empty()) {
    return std::unexpected(
        nc::CaptureFault{"no frame from '" + source_ + "' (disconnected or end of stream)"});
  }
  const nc::Timestamp now = nc::Clock::now();
  nc::PixelFormat format = nc::PixelFormat::BGR8;
  if (impl_->mat.channels() == 1) format = nc::PixelFormat::Grayscale8;
  if (impl_->mat.channels() == 4) format = nc::PixelFormat::BGRA8;
  nc::Frame frame = detail::mat_to_frame(impl_->mat, format);
  frame.set_captured_at(now);
  return frame;
}

std::expected<nc::Frame, nc::CaptureFault> StillImageSource::read() {
  if (frame_.empty()) {
    return std::unexpected(nc::CaptureFault{"still image source has no frame"});
  }
  nc::Frame copy = frame_;
  copy.set_captured_at(nc::Clock::now());
  return copy;
}

std::expected<std::unique_ptr<ICaptureSource>, nc::CaptureFault> open_capture_source(
    const std::string& source) {
  if (!camera_index(source) && is_image_path(source)) {
    auto frame = load_frame_from_image(source);
    if (!frame) {
      return std::unexpected(nc::CaptureFault{"cannot read image '" + source + "'"});
    }
    return std::make_unique<StillImageSource>(std::move(*frame));
  }
  auto cap = std::make_unique<OpenCvCaptureSource>(source);
  auto opened = cap->reopen();
  if (!opened) return std::unexpected(opened.error());
  return cap;
}

}  // namespace brickfinder::vision
