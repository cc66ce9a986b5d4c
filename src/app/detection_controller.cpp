#include <brickfinder/app/detection_controller.hpp>
#include <brickfinder/core/log.hpp>
#include <brickfinder/vision/color.hpp>
#include <type_traits>
#include <utility>
#include <variant>

namespace brickfinder::app {

namespace {

constexpr const char* kTag = "controller";

std::shared_ptr<core::QualityConfigStore> make_quality_store(const core::QualityConfig& initial) {
  auto valid = core::validate_quality_config(initial);
  if (!valid) {
    BF_LOGW(kTag, "initial quality config rejected (%s: %s); using defaults",
            valid.error().field.c_str(), valid.error().reason.c_str());
    return std::make_shared<core::QualityConfigStore>();
  }
  return std::make_shared<core::QualityConfigStore>(*valid);
}

}  // namespace

ControllerOptions make_controller_options(const PipelineConfig& config) {
  ControllerOptions o;
  o.model_path = config.model_path;
  o.quality = config.quality;
  o.pipeline.queue_capacity = config.queue_capacity;
  o.pipeline.frame_skip = config.frame_skip;
  o.pipeline.stability = config.stability;
  o.batch_interval = config.batch_interval;
  o.shutdown_timeout = config.shutdown_timeout;
  return o;
}

DetectionController::DetectionController(ControllerOptions options,
                                         BackendFactory factory,
                                         PresentationCallbacks callbacks)
    : options_(std::move(options)),
      callbacks_(std::move(callbacks)),
      quality_(make_quality_store(options_.quality)),
      dispatcher_(std::make_shared<BatchedUpdateDispatcher>(options_.batch_interval)),
      inbox_(std::make_shared<ControlInbox>()),
      pipeline_(options_.pipeline, quality_,
                [dispatcher = dispatcher_](core::StableDetectionSnapshot snapshot) {
                  dispatcher->submit(std::move(snapshot));
                }),
      loader_(std::move(factory), options_.shutdown_timeout) {
  state_machine_.set_on_change(
      [this](core::DetectionState from, core::DetectionState to, const std::string& reason) {
        on_state_changed(from, to, reason);
      });
  pipeline_.start();
}

DetectionController::~DetectionController() { shutdown(); }

// ---------------------------------------------------------------------------
// inventory

std::size_t DetectionController::load_inventory(const std::vector<core::InventoryEntry>& entries) {
  const bool had_detection = !inventory_.detected_keys().empty();
  const std::size_t n = inventory_.load(entries);
  reorder_.reset();

  // Tracker history refers to the old inventory: start a fresh session.
  const std::uint64_t epoch = dispatcher_->begin_epoch();
  pipeline_.set_active(state() == core::DetectionState::Active, epoch);
  publish_inventory();

  if (had_detection && callbacks_.on_detection_set_changed) {
    callbacks_.on_detection_set_changed(inventory_.detected_keys());
  }
  if (auto ordering = reorder_.update(inventory_.items());
      ordering && callbacks_.on_ordering_changed) {
    callbacks_.on_ordering_changed(*ordering);
  }
  emit_progress();
  return n;
}

bool DetectionController::set_manually_marked(const std::string& key, bool marked) {
  const core::KeySet before = inventory_.detected_keys();
  if (!inventory_.set_manually_marked(key, marked)) return false;
  publish_inventory();
  if (inventory_.detected_keys() != before) emit_after_detection_change();
  emit_progress();
  return true;
}

bool DetectionController::increment_found(const std::string& key) {
  const core::KeySet before = inventory_.detected_keys();
  if (!inventory_.increment_found(key)) return false;
  publish_inventory();
  if (inventory_.detected_keys() != before) emit_after_detection_change();
  emit_progress();
  return true;
}

bool DetectionController::decrement_found(const std::string& key) {
  if (!inventory_.decrement_found(key)) return false;
  publish_inventory();
  emit_progress();
  return true;
}

void DetectionController::publish_inventory() { pipeline_.set_inventory_view(inventory_.view()); }

// ---------------------------------------------------------------------------
// control

bool DetectionController::start_load() {
  if (!state_machine_.start_load()) return false;
  spawn_load();
  return true;
}

bool DetectionController::retry_load() {
  if (!state_machine_.retry_load()) return false;
  spawn_load();
  return true;
}

bool DetectionController::toggle_on() { return state_machine_.toggle_on(); }

bool DetectionController::toggle_off() { return state_machine_.toggle_off(); }

void DetectionController::spawn_load() {
  LoadRequest request;
  request.model_path = options_.model_path;
  for (const auto& item : inventory_.items()) {
    if (!item.expected_color) continue;
    if (auto rgb = vision::palette_color(*item.expected_color)) {
      request.color_targets.push_back(vision::ColorTarget{item.key, *rgb});
    } else {
      BF_LOGW(kTag, "%s: unknown colour '%s'", item.key.c_str(), item.expected_color->c_str());
    }
  }
  last_progress_at_.reset();

  const bool started = loader_.start(std::move(request), [inbox = inbox_](LoadResult result) {
    inbox->post(LoadFinished{std::move(result)});
  });
  if (!started) {
    state_machine_.load_failed("a previous model load is still running");
  }
}

void DetectionController::on_load_finished(LoadResult result) {
  if (!result) {
    const std::string reason = std::string(core::to_string(result.error().code)) + ": " +
                               result.error().reason;
    if (!state_machine_.load_failed(reason)) {
      BF_LOGW(kTag, "load failure arrived in state %s; ignored",
              core::to_string(state()).data());
    }
    return;
  }
  if (state() != core::DetectionState::Loading) {
    BF_LOGW(kTag, "load result arrived in state %s; discarded", core::to_string(state()).data());
    return;
  }
  if (!model_) {
    model_ = std::move(*result);
    ++models_loaded_;
    pipeline_.attach_model(model_);
  }
  state_machine_.load_succeeded(static_cast<bool>(model_));
}

std::expected<void, core::FilterConfigError> DetectionController::set_quality_config(
    const core::QualityConfig& config) {
  return quality_->update(config);
}

void DetectionController::on_state_changed(core::DetectionState from,
                                           core::DetectionState to,
                                           const std::string& reason) {
  if (to == core::DetectionState::Active) {
    const std::uint64_t epoch = dispatcher_->begin_epoch();
    pipeline_.set_active(true, epoch);
  } else if (from == core::DetectionState::Active) {
    const std::uint64_t epoch = dispatcher_->begin_epoch();
    pipeline_.set_active(false, epoch);
  }

  if (callbacks_.on_state_changed) callbacks_.on_state_changed(to, reason);

  // Leaving ACTIVE: nothing is "in frame" any more, items go back to their places.
  if (from == core::DetectionState::Active && inventory_.clear_detection()) {
    emit_after_detection_change();
  }
}

// ---------------------------------------------------------------------------
// capture

void DetectionController::submit_frame(core::Frame frame) { pipeline_.submit(std::move(frame)); }

void DetectionController::report_capture_fault(const core::CaptureFault& fault) {
  BF_LOGW(kTag, "capture fault: %s", fault.reason.c_str());
  pipeline_.pause();
}

void DetectionController::report_capture_recovered() { pipeline_.resume(); }

// ---------------------------------------------------------------------------
// control-thread tick

void DetectionController::process_events(core::Timestamp now) {
  for (auto& event : inbox_->drain()) {
    std::visit(
        [this](auto& e) {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, LoadFinished>) {
            on_load_finished(std::move(e.result));
          } else if constexpr (std::is_same_v<T, CaptureFaultEvent>) {
            report_capture_fault(e.fault);
          } else {
            report_capture_recovered();
          }
        },
        event);
  }

  if (state() == core::DetectionState::Loading && callbacks_.on_load_progress) {
    if (!last_progress_at_ || now - *last_progress_at_ >= options_.progress_interval) {
      if (auto elapsed = loader_.elapsed()) {
        last_progress_at_ = now;
        callbacks_.on_load_progress(*elapsed);
      }
    }
  }

  if (auto snapshot = dispatcher_->poll(now)) {
    if (state() == core::DetectionState::Active) {
      apply_snapshot(*snapshot);
    }
  }
}

void DetectionController::apply_snapshot(const core::StableDetectionSnapshot& snapshot) {
  if (inventory_.apply_detection(snapshot)) {
    emit_after_detection_change();
  }
}

void DetectionController::emit_after_detection_change() {
  if (callbacks_.on_detection_set_changed) {
    callbacks_.on_detection_set_changed(inventory_.detected_keys());
  }
  if (auto ordering = reorder_.update(inventory_.items());
      ordering && callbacks_.on_ordering_changed) {
    callbacks_.on_ordering_changed(*ordering);
  }
}

void DetectionController::emit_progress() {
  if (!callbacks_.on_progress_changed) return;
  const auto [found, required] = inventory_.progress();
  callbacks_.on_progress_changed(found, required);
}

void DetectionController::shutdown() {
  if (shut_down_) return;
  shut_down_ = true;
  BF_LOGI(kTag, "shutting down");
  const bool worker_joined = pipeline_.stop(options_.shutdown_timeout);
  const bool loader_joined = loader_.join(options_.shutdown_timeout);
  if (!worker_joined || !loader_joined) {
    BF_LOGW(kTag, "shutdown timed out (inference %s, loader %s)",
            worker_joined ? "joined" : "detached", loader_joined ? "joined" : "detached");
  }
}

}  // namespace brickfinder::app
