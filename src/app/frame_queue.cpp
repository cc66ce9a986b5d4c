#include <brickfinder/app/frame_queue.hpp>
#include <algorithm>
#include <utility>

namespace brickfinder::app {

FrameQueue::FrameQueue(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

std::size_t FrameQueue::push(core::Frame frame) {
  std::size_t dropped = 0;
  {
    std::lock_guard lock(mutex_);
    if (closed_) return 0;
    while (frames_.size() >= capacity_) {
      frames_.pop_front();
      ++dropped;
    }
    frames_.push_back(std::move(frame));
    dropped_ += dropped;
    high_water_ = std::max(high_water_, frames_.size());
  }
  cv_.notify_one();
  return dropped;
}

std::optional<core::Frame> FrameQueue::pop(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !frames_.empty(); });
  if (frames_.empty()) return std::nullopt;
  core::Frame f = std::move(frames_.front());
  frames_.pop_front();
  return f;
}

std::size_t FrameQueue::clear() {
  std::lock_guard lock(mutex_);
  const std::size_t n = frames_.size();
  frames_.clear();
  return n;
}

void FrameQueue::close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool FrameQueue::closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::size_t FrameQueue::size() const {
  std::lock_guard lock(mutex_);
  return frames_.size();
}

std::size_t FrameQueue::high_water_mark() const {
  std::lock_guard lock(mutex_);
  return high_water_;
}

std::uint64_t FrameQueue::dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

}  // namespace brickfinder::app
