#include <brickfinder/app/model_loader.hpp>
#include <brickfinder/core/log.hpp>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <thread>
#include <utility>

namespace brickfinder::app {

namespace {
constexpr const char* kTag = "loader";

core::LoadError make_error(core::LoadErrorCode code, std::string reason) {
  return core::LoadError{code, std::move(reason)};
}
}  // namespace

struct ModelLoader::Shared {
  std::atomic<bool> busy{false};
  mutable std::mutex mutex;  // guards started_at
  std::optional<core::Timestamp> started_at;
  std::optional<core::Timestamp> finished_at;

  // Owning thread only.
  std::thread worker;
  std::future<void> done;
};

ModelLoader::ModelLoader(BackendFactory factory, std::chrono::milliseconds join_timeout)
    : factory_(std::move(factory)),
      join_timeout_(join_timeout),
      shared_(std::make_shared<Shared>()) {}

ModelLoader::~ModelLoader() { join(join_timeout_); }

LoadResult ModelLoader::load(const BackendFactory& factory, const LoadRequest& request) {
  if (!factory) {
    return std::unexpected(make_error(core::LoadErrorCode::InitFailed, "no backend factory"));
  }
  LoadResult result = std::unexpected(make_error(core::LoadErrorCode::InitFailed, ""));
  try {
    result = factory(request);
  } catch (const std::exception& e) {
    return std::unexpected(make_error(core::LoadErrorCode::InitFailed, e.what()));
  } catch (...) {
    return std::unexpected(
        make_error(core::LoadErrorCode::InitFailed, "unknown exception during load"));
  }
  if (!result) return result;
  if (!result->backend) {
    return std::unexpected(
        make_error(core::LoadErrorCode::InitFailed, "backend factory returned no model"));
  }
  try {
    result->backend->warmup();
  } catch (const std::exception& e) {
    return std::unexpected(
        make_error(core::LoadErrorCode::InitFailed, std::string("warmup failed: ") + e.what()));
  } catch (...) {
    return std::unexpected(
        make_error(core::LoadErrorCode::InitFailed, "warmup failed: unknown exception"));
  }
  return result;
}

bool ModelLoader::start(LoadRequest request, Completion on_done) {
  if (shared_->busy.exchange(true)) {
    BF_LOGW(kTag, "load already in progress; ignoring start");
    return false;
  }
  // The previous one-shot worker has finished (busy was false); reap it.
  if (shared_->worker.joinable()) shared_->worker.join();

  {
    std::lock_guard lock(shared_->mutex);
    shared_->started_at = core::Clock::now();
    shared_->finished_at.reset();
  }
  BF_LOGI(kTag, "loading '%s'", request.model_path.c_str());

  std::promise<void> done;
  shared_->done = done.get_future();
  shared_->worker = std::thread([state = shared_, factory = factory_, req = std::move(request),
                                 cb = std::move(on_done), done = std::move(done)]() mutable {
    LoadResult result = ModelLoader::load(factory, req);
    core::Timestamp started{};
    {
      std::lock_guard lock(state->mutex);
      state->finished_at = core::Clock::now();
      started = state->started_at.value_or(*state->finished_at);
    }
    const double secs =
        std::chrono::duration<double>(core::Clock::now() - started).count();
    if (result) {
      BF_LOGI(kTag, "loaded %s backend in %.2fs", result->backend->name().data(), secs);
    } else {
      BF_LOGE(kTag, "load failed after %.2fs (%s): %s", secs,
              core::to_string(result.error().code).data(), result.error().reason.c_str());
    }
    state->busy.store(false, std::memory_order_release);
    if (cb) cb(std::move(result));
    done.set_value();
  });
  return true;
}

bool ModelLoader::busy() const noexcept { return shared_->busy.load(std::memory_order_acquire); }

std::optional<std::chrono::milliseconds> ModelLoader::elapsed() const {
  std::lock_guard lock(shared_->mutex);
  if (!shared_->started_at) return std::nullopt;
  const core::Timestamp end = shared_->finished_at.value_or(core::Clock::now());
  return std::chrono::duration_cast<std::chrono::milliseconds>(end - *shared_->started_at);
}

bool ModelLoader::join(std::chrono::milliseconds timeout) {
  if (!shared_->worker.joinable()) return true;
  if (shared_->done.wait_for(timeout) == std::future_status::ready) {
    shared_->worker.join();
    return true;
  }
  BF_LOGW(kTag, "load worker still running after %lld ms; detaching",
          static_cast<long long>(timeout.count()));
  shared_->worker.detach();
  return false;
}

}  // namespace brickfinder::app
