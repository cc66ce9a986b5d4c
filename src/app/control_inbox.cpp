#include <brickfinder/app/control_inbox.hpp>
#include <iterator>
#include <utility>

namespace brickfinder::app {

void ControlInbox::post(ControlEvent event) {
  std::lock_guard lock(mutex_);
  events_.push_back(std::move(event));
}

std::vector<ControlEvent> ControlInbox::drain() {
  std::lock_guard lock(mutex_);
  std::vector<ControlEvent> out(std::make_move_iterator(events_.begin()),
                                std::make_move_iterator(events_.end()));
  events_.clear();
  return out;
}

std::size_t ControlInbox::size() const {
  std::lock_guard lock(mutex_);
  return events_.size();
}

}  // namespace brickfinder::app
