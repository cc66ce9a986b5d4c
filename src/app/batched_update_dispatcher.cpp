#include <brickfinder/app/batched_update_dispatcher.hpp>
#include <brickfinder/core/log.hpp>
#include <utility>

namespace brickfinder::app {

BatchedUpdateDispatcher::BatchedUpdateDispatcher(std::chrono::milliseconds interval)
    : interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1)) {}

bool BatchedUpdateDispatcher::submit(core::StableDetectionSnapshot snapshot) {
  std::lock_guard lock(mutex_);
  ++stats_.submitted;
  if (snapshot.epoch != epoch_ || (last_seq_ && snapshot.seq <= *last_seq_)) {
    ++stats_.stale;
    return false;
  }
  if (pending_) ++stats_.coalesced;
  last_seq_ = snapshot.seq;
  pending_ = std::move(snapshot);
  return true;
}

std::optional<core::StableDetectionSnapshot> BatchedUpdateDispatcher::poll(core::Timestamp now) {
  std::lock_guard lock(mutex_);
  if (!pending_) return std::nullopt;
  if (last_flush_ && now - *last_flush_ < interval_) return std::nullopt;
  last_flush_ = now;
  ++stats_.flushed;
  std::optional<core::StableDetectionSnapshot> out = std::move(pending_);
  pending_.reset();
  return out;
}

std::uint64_t BatchedUpdateDispatcher::begin_epoch() {
  std::lock_guard lock(mutex_);
  ++epoch_;
  if (pending_) ++stats_.stale;
  pending_.reset();
  last_seq_.reset();
  BF_LOGD("dispatch", "epoch %llu", static_cast<unsigned long long>(epoch_));
  return epoch_;
}

std::uint64_t BatchedUpdateDispatcher::epoch() const {
  std::lock_guard lock(mutex_);
  return epoch_;
}

std::chrono::milliseconds BatchedUpdateDispatcher::interval() const {
  std::lock_guard lock(mutex_);
  return interval_;
}

void BatchedUpdateDispatcher::set_interval(std::chrono::milliseconds interval) {
  std::lock_guard lock(mutex_);
  interval_ = interval.count() > 0 ? interval : std::chrono::milliseconds(1);
}

bool BatchedUpdateDispatcher::has_pending() const {
  std::lock_guard lock(mutex_);
  return pending_.has_value();
}

BatchedUpdateDispatcher::Stats BatchedUpdateDispatcher::stats() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

}  // namespace brickfinder::app
