#include "alert_queue.hpp"

namespace heartbeat::alert {

AlertQueue::AlertQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool AlertQueue::TryEnqueue(AlertTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= capacity_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<AlertTask> AlertQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  AlertTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void AlertQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t AlertQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace heartbeat::alert
