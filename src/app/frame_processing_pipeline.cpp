#include <brickfinder/app/frame_processing_pipeline.hpp>
#include <brickfinder/app/frame_queue.hpp>
#include <brickfinder/core/log.hpp>
#include <brickfinder/core/pipeline.hpp>
#include <brickfinder/vision/candidate_filter.hpp>
#include <brickfinder/vision/detection_stage.hpp>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>

namespace brickfinder::app {

namespace {
constexpr const char* kTag = "pipeline";
}  // namespace

struct FrameProcessingPipeline::Shared {
  Shared(const FrameProcessingOptions& options,
         std::shared_ptr<const core::QualityConfigStore> q,
         SnapshotSink s)
      : queue(options.queue_capacity),
        tracker(options.stability),
        pop_timeout(options.pop_timeout),
        quality(std::move(q)),
        sink(std::move(s)) {}

  FrameQueue queue;
  core::StabilityTracker tracker;  // worker only
  std::uint64_t tracker_epoch{0};  // worker only
  const std::chrono::milliseconds pop_timeout;
  std::shared_ptr<const core::QualityConfigStore> quality;
  SnapshotSink sink;

  std::atomic<bool> stop{false};
  std::atomic<bool> active{false};
  std::atomic<bool> paused{false};
  std::atomic<std::uint64_t> epoch{0};

  mutable std::mutex mutex;  // guards stages and view
  std::shared_ptr<core::Pipeline> stages;
  std::shared_ptr<const core::InventoryView> view;

  std::atomic<std::uint64_t> submitted{0};
  std::atomic<std::uint64_t> skipped{0};
  std::atomic<std::uint64_t> discarded_inactive{0};
  std::atomic<std::uint64_t> inferred{0};
  std::atomic<std::uint64_t> failed{0};
  std::atomic<double> last_inference_ms{0.0};

  // Control thread only.
  std::thread worker;
  std::future<void> done;

  void run();
  void process(const core::Frame& frame);
};

void FrameProcessingPipeline::Shared::run() {
  BF_LOGI(kTag, "inference worker started");
  while (!stop.load(std::memory_order_acquire)) {
    auto frame = queue.pop(pop_timeout);
    if (!frame) continue;
    if (!active.load(std::memory_order_acquire) || paused.load(std::memory_order_acquire)) {
      ++discarded_inactive;
      continue;
    }
    process(*frame);
  }
  BF_LOGI(kTag, "inference worker stopped");
}

void FrameProcessingPipeline::Shared::process(const core::Frame& frame) {
  std::shared_ptr<core::Pipeline> chain;
  std::shared_ptr<const core::InventoryView> inventory;
  {
    std::lock_guard lock(mutex);
    chain = stages;
    inventory = view;
  }
  if (!chain) {
    ++discarded_inactive;
    return;
  }

  const std::uint64_t current_epoch = epoch.load(std::memory_order_acquire);
  if (current_epoch != tracker_epoch) {
    tracker.reset();
    tracker_epoch = current_epoch;
  }

  // A throwing plug-in (or OpenCV inside the filter) costs this frame only.
  core::StableDetectionSnapshot snapshot;
  try {
    double pass_ms = 0.0;
    core::StageTimingCallback timing = [&pass_ms](std::size_t, double ms) { pass_ms += ms; };
    auto detections = chain->run(frame, &timing);
    last_inference_ms.store(pass_ms);
    if (!detections) {
      ++failed;
      return;
    }
    ++inferred;
    // stop() may have given up on us while the backend was busy.
    if (stop.load(std::memory_order_acquire)) return;

    // One config snapshot for the whole pass, even if it is replaced meanwhile.
    const std::shared_ptr<const core::QualityConfig> config = quality->snapshot();
    const vision::FilterContext ctx{inventory.get(), &frame};
    const core::CandidateList filtered =
        vision::filter_candidates(detections->candidates, *config, ctx);

    static const std::unordered_set<std::string> kNoExclusions;
    snapshot = tracker.update(filtered, detections->seq, detections->captured_at,
                              inventory ? inventory->excluded : kNoExclusions);
  } catch (const std::exception& e) {
    ++failed;
    BF_LOGW(kTag, "frame %llu dropped: %s", static_cast<unsigned long long>(frame.seq()),
            e.what());
    return;
  }
  snapshot.epoch = current_epoch;
  if (sink) sink(std::move(snapshot));
}

FrameProcessingPipeline::FrameProcessingPipeline(
    FrameProcessingOptions options,
    std::shared_ptr<const core::QualityConfigStore> quality,
    SnapshotSink sink)
    : shared_(std::make_shared<Shared>(options, std::move(quality), std::move(sink))),
      options_(options) {
  if (!shared_->quality) {
    shared_->quality = std::make_shared<core::QualityConfigStore>();
  }
}

FrameProcessingPipeline::~FrameProcessingPipeline() {
  if (running()) stop(std::chrono::milliseconds(2000));
}

void FrameProcessingPipeline::start() {
  if (shared_->worker.joinable() || shared_->queue.closed()) return;
  std::promise<void> done;
  shared_->done = done.get_future();
  shared_->worker = std::thread([state = shared_, done = std::move(done)]() mutable {
    state->run();
    done.set_value();
  });
}

bool FrameProcessingPipeline::stop(std::chrono::milliseconds timeout) {
  if (!shared_->worker.joinable()) return true;
  shared_->stop.store(true, std::memory_order_release);
  shared_->queue.close();
  if (shared_->done.wait_for(timeout) == std::future_status::ready) {
    shared_->worker.join();
    return true;
  }
  BF_LOGW(kTag, "inference worker did not stop within %lld ms; detaching",
          static_cast<long long>(timeout.count()));
  shared_->worker.detach();
  return false;
}

bool FrameProcessingPipeline::running() const noexcept { return shared_->worker.joinable(); }

void FrameProcessingPipeline::attach_model(const vision::ModelHandle& model) {
  auto chain = std::make_shared<core::Pipeline>();
  chain->add_stage(std::make_unique<vision::DetectionStage>(model));
  std::lock_guard lock(shared_->mutex);
  shared_->stages = std::move(chain);
  BF_LOGI(kTag, "model attached (%s, %zu labels)",
          model.backend ? model.backend->name().data() : "none", model.labels.size());
}

bool FrameProcessingPipeline::has_model() const {
  std::lock_guard lock(shared_->mutex);
  return shared_->stages != nullptr;
}

void FrameProcessingPipeline::set_inventory_view(std::shared_ptr<const core::InventoryView> view) {
  std::lock_guard lock(shared_->mutex);
  shared_->view = std::move(view);
}

void FrameProcessingPipeline::set_active(bool active, std::uint64_t epoch) {
  shared_->epoch.store(epoch, std::memory_order_release);
  shared_->active.store(active, std::memory_order_release);
  active_frames_.store(0);
  if (!active) {
    const std::size_t n = shared_->queue.clear();
    shared_->discarded_inactive += n;
  }
}

bool FrameProcessingPipeline::active() const noexcept { return shared_->active.load(); }

void FrameProcessingPipeline::pause() {
  if (!shared_->paused.exchange(true)) {
    shared_->discarded_inactive += shared_->queue.clear();
    BF_LOGW(kTag, "inference paused");
  }
}

void FrameProcessingPipeline::resume() {
  if (shared_->paused.exchange(false)) {
    BF_LOGI(kTag, "inference resumed");
  }
}

bool FrameProcessingPipeline::paused() const noexcept { return shared_->paused.load(); }

void FrameProcessingPipeline::submit(core::Frame frame) {
  ++shared_->submitted;
  frame.set_seq(next_seq_++);
  if (frame.captured_at() == core::Timestamp{}) {
    frame.set_captured_at(core::Clock::now());
  }
  if (!shared_->active.load(std::memory_order_acquire) || shared_->paused.load()) {
    ++shared_->discarded_inactive;
    return;
  }
  const std::uint64_t n = active_frames_.fetch_add(1);
  if (options_.frame_skip > 0 && n % (options_.frame_skip + 1u) != 0) {
    ++shared_->skipped;
    return;
  }
  if (shared_->queue.push(std::move(frame)) > 0) {
    BF_LOGD(kTag, "queue full, dropped oldest frame");
  }
}

PipelineStats FrameProcessingPipeline::stats() const {
  PipelineStats s;
  s.submitted = shared_->submitted.load();
  s.dropped = shared_->queue.dropped();
  s.skipped = shared_->skipped.load();
  s.discarded_inactive = shared_->discarded_inactive.load();
  s.inferred = shared_->inferred.load();
  s.failed = shared_->failed.load();
  s.last_inference_ms = shared_->last_inference_ms.load();
  return s;
}

std::size_t FrameProcessingPipeline::queue_depth() const { return shared_->queue.size(); }

std::size_t FrameProcessingPipeline::queue_capacity() const noexcept {
  return shared_->queue.capacity();
}

std::size_t FrameProcessingPipeline::queue_high_water_mark() const {
  return shared_->queue.high_water_mark();
}

}  // namespace brickfinder::app
