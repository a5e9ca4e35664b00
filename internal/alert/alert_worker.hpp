#pragma once

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "alert_queue.hpp"
#include "webhook_sender.hpp"

namespace heartbeat::alert {

/*
  Background delivery of queued alerts.

  Best effort: each task gets one POST; failures are logged and dropped.
  Stop() shuts the queue, lets the workers drain what is already queued,
  then joins them.
*/
class AlertWorker {
 public:
  AlertWorker(std::shared_ptr<AlertQueue> queue, std::shared_ptr<WebhookSender> sender, std::size_t thread_count);
  ~AlertWorker();

  AlertWorker(const AlertWorker&)            = delete;
  AlertWorker& operator=(const AlertWorker&) = delete;

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<AlertQueue>    queue_;
  std::shared_ptr<WebhookSender> sender_;
  std::size_t                    thread_count_;

  std::vector<std::thread> threads_;
};

} // namespace heartbeat::alert
