#pragma once

#include <brickfinder/core/error.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/vision/color.hpp>
#include <brickfinder/vision/contour_inference_backend.hpp>
#include <brickfinder/vision/inference_backend.hpp>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace brickfinder::app {

/// What to load. Model-free backends use `color_targets` instead of a file.
struct LoadRequest {
  std::string model_path;
  std::vector<vision::ColorTarget> color_targets;
};

using LoadResult = std::expected<vision::ModelHandle, core::LoadError>;

/// Builds a recognizer. Runs on the load worker; may block and may throw.
using BackendFactory = std::function<LoadResult(const LoadRequest&)>;

/// One-shot asynchronous model load.
///
/// start() spawns the load worker and returns at once; the worker calls the
/// factory, runs one warmup inference and hands the result to `on_done`
/// (still on the worker: the callback is expected to post it to the control
/// thread). Failures never escape: exceptions thrown by the factory or the
/// warmup become a LoadError.
///
/// There is no user-facing cancel. The destructor waits a bounded time for a
/// running load, then detaches it.
class ModelLoader {
 public:
  using Completion = std::function<void(LoadResult)>;

  explicit ModelLoader(BackendFactory factory,
                       std::chrono::milliseconds join_timeout = std::chrono::milliseconds(2000));
  ~ModelLoader();

  ModelLoader(const ModelLoader&) = delete;
  ModelLoader& operator=(const ModelLoader&) = delete;

  /// Returns false (and does nothing) while a previous load is still running.
  bool start(LoadRequest request, Completion on_done);

  [[nodiscard]] bool busy() const noexcept;
  /// Time since start() of the current or last load; nullopt before any load.
  [[nodiscard]] std::optional<std::chrono::milliseconds> elapsed() const;

  /// Waits up to `timeout` for the worker. Returns false when it had to be
  /// detached.
  bool join(std::chrono::milliseconds timeout);

  /// Synchronous load on the calling thread: factory + null check + warmup,
  /// with every exception converted to a LoadError.
  [[nodiscard]] static LoadResult load(const BackendFactory& factory, const LoadRequest& request);

 private:
  struct Shared;
  BackendFactory factory_;
  std::chrono::milliseconds join_timeout_;
  std::shared_ptr<Shared> shared_;
};

}  // namespace brickfinder::app
