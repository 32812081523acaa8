/**
 * @file work_queue.cpp
 * @brief Bounded file queue and error collection implementation
 */

#include "replacer/work_queue.hpp"

#include <chrono>
#include <utility>

#include "replacer/cancellation.hpp"

namespace replacer {

namespace {

/// How often a blocked producer re-checks its cancellation token
constexpr auto PUSH_POLL_INTERVAL = std::chrono::milliseconds(20);

} // anonymous namespace

// **----- WorkQueue Implementation -----**

WorkQueue::WorkQueue(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

bool WorkQueue::push(WorkItem item, const CancellationToken &cancel) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!closed_ && items_.size() >= capacity_) {
      if (cancel.fired())
        return false;
      not_full_.wait_for(lock, PUSH_POLL_INTERVAL);
    }
    if (closed_)
      return false;
    items_.push(std::move(item));
  }
  not_empty_.notify_one();
  return true;
}

bool WorkQueue::pop(WorkItem &item) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return !items_.empty() || closed_; });
    if (items_.empty())
      return false;
    item = std::move(items_.front());
    items_.pop();
  }
  not_full_.notify_one();
  return true;
}

bool WorkQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
      return false;
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
  return true;
}

bool WorkQueue::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t WorkQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

// **----- ErrorCollector Implementation -----**

void ErrorCollector::add(Error error) {
  std::lock_guard<std::mutex> lock(mutex_);
  errors_.push_back(std::move(error));
}

size_t ErrorCollector::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return errors_.size();
}

std::vector<Error> ErrorCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Error> out = std::move(errors_);
  errors_.clear();
  return out;
}

} // namespace replacer
