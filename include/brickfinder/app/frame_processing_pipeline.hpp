#pragma once

#include <brickfinder/core/detection_set.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/core/inventory.hpp>
#include <brickfinder/core/quality_config.hpp>
#include <brickfinder/core/stability_tracker.hpp>
#include <brickfinder/vision/inference_backend.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace brickfinder::app {

struct FrameProcessingOptions {
  std::size_t queue_capacity{2};  // 1..3 keeps latency at a frame or two
  std::uint32_t frame_skip{0};    // process one of every frame_skip + 1 active frames
  core::StabilityParams stability{};
  std::chrono::milliseconds pop_timeout{20};
};

struct PipelineStats {
  std::uint64_t submitted{0};
  std::uint64_t dropped{0};             // oldest frames evicted by backpressure
  std::uint64_t skipped{0};             // frame_skip
  std::uint64_t discarded_inactive{0};  // not ACTIVE, paused, or no model yet
  std::uint64_t inferred{0};
  std::uint64_t failed{0};             // recognizer errors and exceptions
  double last_inference_ms{0.0};
};

/// Capture -> bounded queue -> one inference worker -> Candidate Filter ->
/// StabilityTracker -> snapshot sink.
///
/// submit() is non-blocking (drop-oldest queue). The worker checks the
/// active flag before starting every frame and discards instead of running
/// while inactive or paused, so deactivation stops consumption immediately
/// without touching the model. The worker owns the StabilityTracker; each
/// activation starts a new epoch and the tracker is reset before the first
/// frame of that epoch.
///
/// Everything the worker touches lives in shared state, so stop() can give up
/// after a bounded wait and detach a worker stuck inside a backend call.
class FrameProcessingPipeline {
 public:
  /// Called on the worker thread with every processed frame's stable set.
  using SnapshotSink = std::function<void(core::StableDetectionSnapshot)>;

  FrameProcessingPipeline(FrameProcessingOptions options,
                          std::shared_ptr<const core::QualityConfigStore> quality,
                          SnapshotSink sink);
  ~FrameProcessingPipeline();

  FrameProcessingPipeline(const FrameProcessingPipeline&) = delete;
  FrameProcessingPipeline& operator=(const FrameProcessingPipeline&) = delete;

  /// Starts the inference worker. No-op when already running; a stopped
  /// pipeline cannot be restarted.
  void start();
  /// Closes the queue and waits up to `timeout` for the worker.
  /// Returns false when the worker had to be detached.
  bool stop(std::chrono::milliseconds timeout);
  [[nodiscard]] bool running() const noexcept;

  /// Control thread. Builds the per-frame stage chain around the backend.
  void attach_model(const vision::ModelHandle& model);
  [[nodiscard]] bool has_model() const;

  /// Control thread. Replaces the membership / exclusion snapshot used by the
  /// filter and the tracker from the next frame on.
  void set_inventory_view(std::shared_ptr<const core::InventoryView> view);

  /// Control thread, on ACTIVE entry / exit. Deactivating drops queued frames.
  void set_active(bool active, std::uint64_t epoch);
  [[nodiscard]] bool active() const noexcept;

  /// Capture fault handling: while paused, frames are not consumed.
  void pause();
  void resume();
  [[nodiscard]] bool paused() const noexcept;

  /// Capture thread. Stamps the sequence number (and the capture time when
  /// unset) and enqueues. Never blocks. One capture thread at a time; it may
  /// differ from the control thread.
  void submit(core::Frame frame);

  [[nodiscard]] PipelineStats stats() const;
  [[nodiscard]] std::size_t queue_depth() const;
  [[nodiscard]] std::size_t queue_capacity() const noexcept;
  [[nodiscard]] std::size_t queue_high_water_mark() const;

 private:
  struct Shared;
  std::shared_ptr<Shared> shared_;
  FrameProcessingOptions options_;
  std::uint64_t next_seq_{1};
  std::atomic<std::uint64_t> active_frames_{0};
};

}  // namespace brickfinder::app
