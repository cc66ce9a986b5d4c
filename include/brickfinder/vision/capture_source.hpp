#pragma once

#include <brickfinder/core/error.hpp>
#include <brickfinder/core/frame.hpp>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace brickfinder::vision {

/// Source of live frames. The pipeline never controls capture timing: the
/// caller reads at the source's native rate.
class ICaptureSource {
 public:
  virtual ~ICaptureSource() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  /// Next frame, stamped with its capture time. A CaptureFault means the
  /// source is gone (disconnected, end of file); the caller may reopen().
  [[nodiscard]] virtual std::expected<brickfinder::core::Frame, brickfinder::core::CaptureFault>
  read() = 0;

  [[nodiscard]] virtual std::expected<void, brickfinder::core::CaptureFault> reopen() = 0;
};

/// cv::VideoCapture over a camera index ("0", "1", ...) or a video file / URL.
class OpenCvCaptureSource : public ICaptureSource {
 public:
  explicit OpenCvCaptureSource(std::string source);
  ~OpenCvCaptureSource() override;

  [[nodiscard]] std::string_view name() const noexcept override { return source_; }

  [[nodiscard]] std::expected<brickfinder::core::Frame, brickfinder::core::CaptureFault> read()
      override;
  [[nodiscard]] std::expected<void, brickfinder::core::CaptureFault> reopen() override;

 private:
  struct Impl;
  std::string source_;
  std::unique_ptr<Impl> impl_;
};

/// Replays one still image forever (demo / tests without a camera).
class StillImageSource : public ICaptureSource {
 public:
  explicit StillImageSource(brickfinder::core::Frame frame) : frame_(std::move(frame)) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "still"; }

  [[nodiscard]] std::expected<brickfinder::core::Frame, brickfinder::core::CaptureFault> read()
      override;
  [[nodiscard]] std::expected<void, brickfinder::core::CaptureFault> reopen() override {
    return {};
  }

 private:
  brickfinder::core::Frame frame_;
};

/// "0".."9..." opens a camera, an image file a StillImageSource, anything
/// else a video file / stream.
[[nodiscard]] std::expected<std::unique_ptr<ICaptureSource>, brickfinder::core::CaptureFault>
open_capture_source(const std::string& source);

}  // namespace brickfinder::vision
