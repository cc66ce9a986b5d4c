#pragma once

#include <brickfinder/app/batched_update_dispatcher.hpp>
#include <brickfinder/app/config.hpp>
#include <brickfinder/app/control_inbox.hpp>
#include <brickfinder/app/frame_processing_pipeline.hpp>
#include <brickfinder/app/model_loader.hpp>
#include <brickfinder/core/detection_state.hpp>
#include <brickfinder/core/error.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/core/inventory.hpp>
#include <brickfinder/core/quality_config.hpp>
#include <brickfinder/core/reorder_engine.hpp>
#include <brickfinder/vision/inference_backend.hpp>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace brickfinder::app {

/// Outbound events. All fire on the control thread, from inside a
/// DetectionController call, so they may touch widgets directly.
struct PresentationCallbacks {
  std::function<void(core::DetectionState state, const std::string& reason)> on_state_changed;
  std::function<void(const core::OrderingSnapshot& ordering)> on_ordering_changed;
  std::function<void(const core::KeySet& detected)> on_detection_set_changed;
  std::function<void(std::chrono::milliseconds elapsed)> on_load_progress;
  /// Found counters or marking changed: (found_total, required_total).
  std::function<void(std::uint64_t found, std::uint64_t required)> on_progress_changed;
};

struct ControllerOptions {
  std::string model_path;
  core::QualityConfig quality{};
  FrameProcessingOptions pipeline{};
  std::chrono::milliseconds batch_interval{100};
  std::chrono::milliseconds shutdown_timeout{2000};
  std::chrono::milliseconds progress_interval{250};
};

/// Builds controller options from a loaded PipelineConfig.
[[nodiscard]] ControllerOptions make_controller_options(const PipelineConfig& config);

/// Owns the detection core and runs it from the control thread.
///
/// The control thread calls every method; none of them blocks on model load
/// or inference. Workers talk back only through the ControlInbox (load
/// results) and the BatchedUpdateDispatcher (stable sets), both drained by
/// process_events(), which the host calls from its timer / event loop. That
/// call is also the only place detection results touch the inventory.
class DetectionController {
 public:
  DetectionController(ControllerOptions options,
                      BackendFactory factory,
                      PresentationCallbacks callbacks = {});
  ~DetectionController();

  DetectionController(const DetectionController&) = delete;
  DetectionController& operator=(const DetectionController&) = delete;

  // --- inventory boundary -------------------------------------------------
  /// Replaces the inventory; emits ordering / detection-set updates.
  std::size_t load_inventory(const std::vector<core::InventoryEntry>& entries);
  bool set_manually_marked(const std::string& key, bool marked);
  bool increment_found(const std::string& key);
  bool decrement_found(const std::string& key);

  // --- control --------------------------------------------------------------
  /// OFF -> LOADING and spawns the load. Idempotent while LOADING.
  bool start_load();
  /// ERROR -> LOADING and spawns the load again.
  bool retry_load();
  bool toggle_on();
  bool toggle_off();

  /// Validates and swaps the active snapshot; takes effect on the next frame.
  std::expected<void, core::FilterConfigError> set_quality_config(const core::QualityConfig& config);

  // --- capture boundary -----------------------------------------------------
  /// Non-blocking. Frames are dropped unless ACTIVE.
  void submit_frame(core::Frame frame);
  /// Pauses inference consumption; DetectionState is left untouched.
  void report_capture_fault(const core::CaptureFault& fault);
  void report_capture_recovered();

  /// Same as the two reports above, for capture running on another thread.
  [[nodiscard]] std::shared_ptr<ControlInbox> inbox() const noexcept { return inbox_; }

  /// Control-thread tick: applies load results, posts load progress, and
  /// flushes at most one detection batch per interval.
  void process_events(core::Timestamp now = core::Clock::now());

  /// Stops the inference worker and waits for a running load, each with the
  /// configured bounded timeout. Safe to call twice.
  void shutdown();

  // --- queries ----------------------------------------------------------------
  [[nodiscard]] core::DetectionState state() const noexcept { return state_machine_.state(); }
  [[nodiscard]] const std::string& error_reason() const noexcept {
    return state_machine_.error_reason();
  }
  [[nodiscard]] const core::Inventory& inventory() const noexcept { return inventory_; }
  [[nodiscard]] const core::OrderingSnapshot& ordering() const noexcept {
    return reorder_.current();
  }
  [[nodiscard]] core::KeySet detected() const { return inventory_.detected_keys(); }
  [[nodiscard]] std::shared_ptr<const core::QualityConfig> quality_config() const {
    return quality_->snapshot();
  }
  [[nodiscard]] bool has_model() const noexcept { return static_cast<bool>(model_); }
  [[nodiscard]] std::uint64_t models_loaded() const noexcept { return models_loaded_; }
  [[nodiscard]] PipelineStats pipeline_stats() const { return pipeline_.stats(); }
  [[nodiscard]] BatchedUpdateDispatcher::Stats dispatcher_stats() const {
    return dispatcher_->stats();
  }
  [[nodiscard]] const FrameProcessingPipeline& pipeline() const noexcept { return pipeline_; }

 private:
  void spawn_load();
  void on_load_finished(LoadResult result);
  void on_state_changed(core::DetectionState from, core::DetectionState to,
                        const std::string& reason);
  void publish_inventory();
  void apply_snapshot(const core::StableDetectionSnapshot& snapshot);
  void emit_after_detection_change();
  void emit_progress();

  ControllerOptions options_;
  PresentationCallbacks callbacks_;

  core::DetectionStateMachine state_machine_;
  core::Inventory inventory_;
  core::ReorderEngine reorder_;

  std::shared_ptr<core::QualityConfigStore> quality_;
  std::shared_ptr<BatchedUpdateDispatcher> dispatcher_;
  std::shared_ptr<ControlInbox> inbox_;
  FrameProcessingPipeline pipeline_;
  ModelLoader loader_;

  vision::ModelHandle model_;  // kept for the process lifetime once loaded
  std::uint64_t models_loaded_{0};
  std::optional<core::Timestamp> last_progress_at_;
  bool shut_down_{false};
};

}  // namespace brickfinder::app
