/**
 * brickfinder-cli: load a recognizer in the background, run live detection on a
 * camera / video / image and print state, detection and ordering updates.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/brickfinder_cli --backend contour --item 3001:2:red --item 3004:1:blue --auto-start
 */

#include <brickfinder/app/backend_factory.hpp>
#include <brickfinder/app/config.hpp>
#include <brickfinder/app/detection_controller.hpp>
#include <brickfinder/core/detection_state.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/core/inventory.hpp>
#include <brickfinder/core/log.hpp>
#include <brickfinder/vision/capture_source.hpp>
#include <brickfinder/vision/color.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace bf = brickfinder;

void print_usage() {
  std::cout << "Usage: brickfinder_cli [options]\n"
            << "  --config <path>          Pipeline config (key=value file); default: built-in\n"
            << "  --backend <type>         mock | onnx | contour (default from config)\n"
            << "  --model <path>           Model path (required for --backend onnx)\n"
            << "  --confidence <0..1>      Default confidence threshold\n"
            << "  --batch-interval <ms>    UI batch interval (default 100)\n"
            << "  --source <src>           Camera index, video file or image; default: synthetic\n"
            << "  --item KEY:COUNT[:COLOR] Inventory entry (repeatable)\n"
            << "  --frames <n>             Frames to capture (default 150)\n"
            << "  --auto-start             Toggle detection on once the model is ready\n"
            << "  --log-level <level>      debug | info | warn | error | off\n";
}

template <typename T>
bool parse_arg(const std::string& s, T& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

/// "3001:2:red" -> {3001, 2, red}. COUNT defaults to 1.
std::optional<bf::core::InventoryEntry> parse_item(const std::string& text) {
  const auto parts = bf::app::split_list(text, ':');
  if (parts.empty() || parts.size() > 3) return std::nullopt;
  bf::core::InventoryEntry e;
  e.key = parts[0];
  if (parts.size() >= 2 && !parse_arg(parts[1], e.required)) return std::nullopt;
  if (parts.size() == 3) e.expected_color = parts[2];
  return e;
}

std::string join(const std::vector<std::string>& keys) {
  std::string out = "[";
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (i) out += ", ";
    out += keys[i];
  }
  return out + "]";
}

/// Grey canvas with one filled square per coloured item, for runs without a camera.
bf::core::Frame make_synthetic_frame(const std::vector<bf::core::InventoryEntry>& items,
                                     std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buffer(static_cast<std::size_t>(w) * h * 3, std::byte{128});
  std::uint32_t x0 = 20;
  for (const auto& item : items) {
    if (!item.expected_color) continue;
    const auto rgb = bf::vision::palette_color(*item.expected_color);
    if (!rgb) continue;
    const std::uint32_t side = 60;
    if (x0 + side >= w) break;
    for (std::uint32_t y = 40; y < 40 + side && y < h; ++y) {
      for (std::uint32_t x = x0; x < x0 + side; ++x) {
        const std::size_t i = (static_cast<std::size_t>(y) * w + x) * 3;
        buffer[i + 0] = std::byte{rgb->b};
        buffer[i + 1] = std::byte{rgb->g};
        buffer[i + 2] = std::byte{rgb->r};
      }
    }
    x0 += side + 30;
  }
  return bf::core::Frame(w, h, bf::core::PixelFormat::BGR8, std::move(buffer));
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string backend_override;
  std::string model_override;
  std::string source;
  std::string log_level;
  std::optional<float> confidence_override;
  std::optional<std::int64_t> batch_override;
  std::vector<bf::core::InventoryEntry> items;
  std::uint32_t frames = 150;
  bool auto_start = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--config" && has_value) {
      config_path = argv[++i];
    } else if (arg == "--backend" && has_value) {
      backend_override = argv[++i];
    } else if (arg == "--model" && has_value) {
      model_override = argv[++i];
    } else if (arg == "--confidence" && has_value) {
      float v = 0.f;
      if (!parse_arg(std::string(argv[++i]), v)) {
        std::cerr << "Invalid --confidence " << argv[i] << "\n";
        return 1;
      }
      confidence_override = v;
    } else if (arg == "--batch-interval" && has_value) {
      std::int64_t v = 0;
      if (!parse_arg(std::string(argv[++i]), v) || v <= 0) {
        std::cerr << "Invalid --batch-interval " << argv[i] << "\n";
        return 1;
      }
      batch_override = v;
    } else if (arg == "--source" && has_value) {
      source = argv[++i];
    } else if (arg == "--item" && has_value) {
      auto item = parse_item(argv[++i]);
      if (!item) {
        std::cerr << "Invalid --item " << argv[i] << " (use KEY:COUNT[:COLOR])\n";
        return 1;
      }
      items.push_back(std::move(*item));
    } else if (arg == "--frames" && has_value) {
      if (!parse_arg(std::string(argv[++i]), frames)) {
        std::cerr << "Invalid --frames " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--auto-start") {
      auto_start = true;
    } else if (arg == "--log-level" && has_value) {
      log_level = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  bf::app::PipelineConfig cfg =
      config_path.empty() ? bf::app::default_config() : bf::app::load_config(config_path);

  if (!backend_override.empty()) {
    auto type = bf::app::parse_backend_type(backend_override);
    if (!type) {
      std::cerr << "Unknown --backend " << backend_override << " (use mock, onnx, or contour)\n";
      return 1;
    }
    cfg.backend_type = *type;
  }
  if (!model_override.empty()) cfg.model_path = model_override;
  if (confidence_override) cfg.quality.confidence = *confidence_override;
  if (batch_override) cfg.batch_interval = std::chrono::milliseconds(*batch_override);
  if (!log_level.empty()) cfg.log_level = log_level;
  bf::core::log::set_min_level(bf::core::log::parse_level(cfg.log_level));

  bf::app::PresentationCallbacks callbacks;
  callbacks.on_state_changed = [](bf::core::DetectionState s, const std::string& reason) {
    std::cout << "state: " << bf::core::to_string(s);
    if (!reason.empty()) std::cout << " (" << reason << ")";
    std::cout << "\n";
  };
  callbacks.on_ordering_changed = [](const bf::core::OrderingSnapshot& ordering) {
    std::cout << "ordering: " << join(ordering) << "\n";
  };
  callbacks.on_detection_set_changed = [](const bf::core::KeySet& keys) {
    std::cout << "detected: " << join(std::vector<std::string>(keys.begin(), keys.end())) << "\n";
  };
  callbacks.on_load_progress = [](std::chrono::milliseconds elapsed) {
    std::cout << "loading... " << elapsed.count() << " ms\n";
  };

  bf::app::DetectionController controller(bf::app::make_controller_options(cfg),
                                          bf::app::make_backend_factory(cfg),
                                          std::move(callbacks));
  controller.load_inventory(items);

  if (auto q = controller.set_quality_config(cfg.quality); !q) {
    std::cerr << "Invalid quality config: " << q.error().field << " " << q.error().reason << "\n";
    return 1;
  }

  controller.start_load();
  const auto load_deadline = bf::core::Clock::now() + std::chrono::seconds(60);
  while (controller.state() == bf::core::DetectionState::Loading &&
         bf::core::Clock::now() < load_deadline) {
    controller.process_events();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (controller.state() == bf::core::DetectionState::Error) {
    std::cerr << "Model load failed: " << controller.error_reason() << "\n";
    return 1;
  }
  if (auto_start) controller.toggle_on();

  std::unique_ptr<bf::vision::ICaptureSource> capture;
  if (!source.empty()) {
    auto opened = bf::vision::open_capture_source(source);
    if (!opened) {
      std::cerr << "Capture: " << opened.error().reason << "\n";
      return 1;
    }
    capture = std::move(*opened);
  } else {
    capture = std::make_unique<bf::vision::StillImageSource>(make_synthetic_frame(items, 640, 480));
  }

  const auto frame_period = std::chrono::milliseconds(33);
  for (std::uint32_t n = 0; n < frames; ++n) {
    auto frame = capture->read();
    if (!frame) {
      controller.report_capture_fault(frame.error());
      if (!capture->reopen()) break;
      controller.report_capture_recovered();
      continue;
    }
    controller.submit_frame(std::move(*frame));
    controller.process_events();
    std::this_thread::sleep_for(frame_period);
  }

  controller.toggle_off();
  controller.process_events();
  const auto stats = controller.pipeline_stats();
  const auto [found, required] = controller.inventory().progress();
  std::cout << "frames submitted=" << stats.submitted << " inferred=" << stats.inferred
            << " dropped=" << stats.dropped << " skipped=" << stats.skipped
            << " inactive=" << stats.discarded_inactive << " failed=" << stats.failed
            << " last_inference_ms=" << stats.last_inference_ms << "\n";
  std::cout << "progress " << found << "/" << required << "\n";
  controller.shutdown();
  return 0;
}
