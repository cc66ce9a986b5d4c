#pragma once

#include <brickfinder/core/candidate.hpp>
#include <brickfinder/vision/inference_backend.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

namespace brickfinder::vision {

/// One scripted recognizer hit.
struct MockDetection {
  std::int64_t class_id{0};
  brickfinder::core::BBox bbox{};
  float confidence{0.f};
};

/// Backend that returns configurable synthetic detections (for tests/demo).
/// Either a fixed list for every frame, or a script of per-frame lists played
/// in order (the last entry repeats). Safe to reconfigure while a worker is
/// calling infer().
class MockInferenceBackend : public IInferenceBackend {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

  /// Same detections on every frame.
  void set_detections(std::vector<MockDetection> detections);
  /// Frame i gets script[min(i, size-1)]. Restarts the script.
  void set_script(std::vector<std::vector<MockDetection>> script);
  /// Sleep this long inside every infer() call (simulates a slow model).
  void set_latency(std::chrono::milliseconds latency);
  /// The next `count` infer() calls fail with InferenceFailed.
  void fail_next(std::size_t count);

  [[nodiscard]] std::uint64_t infer_calls() const noexcept { return infer_calls_.load(); }
  [[nodiscard]] std::vector<std::uint64_t> inferred_seqs() const;

  [[nodiscard]] std::expected<InferenceResult, brickfinder::core::PipelineError> infer(
      const brickfinder::core::Frame& input) override;

 private:
  mutable std::mutex mutex_;
  std::vector<std::vector<MockDetection>> script_;
  std::size_t cursor_{0};
  std::chrono::milliseconds latency_{0};
  std::size_t failures_pending_{0};
  std::vector<std::uint64_t> seqs_;
  std::atomic<std::uint64_t> infer_calls_{0};
};

}  // namespace brickfinder::vision
