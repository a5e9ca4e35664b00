#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "alert_task.hpp"

namespace heartbeat::alert {

/*
  Bounded thread-safe queue between request threads and alert workers.

  Producers never block: a full or shut down queue rejects the task.
  After Shutdown() consumers keep receiving queued tasks until the
  queue is empty.
*/
class AlertQueue {
 public:
  explicit AlertQueue(std::size_t capacity);

  // false when full or shut down
  bool TryEnqueue(AlertTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<AlertTask> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  const std::size_t       capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<AlertTask>   queue_;
  bool                    shutdown_ = false;
};

} // namespace heartbeat::alert
