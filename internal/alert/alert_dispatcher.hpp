#pragma once

#include <memory>
#include <string>

namespace heartbeat::alert {

class AlertQueue;

/*
  Fire-and-forget hand-off of a webhook alert.

  Dispatch must return without waiting for delivery and must never
  throw delivery failures back to the caller.
*/
class AlertDispatcher {
 public:
  virtual ~AlertDispatcher() = default;

  virtual void Dispatch(const std::string& webhook_url, const std::string& payload_json) = 0;
};

// Production dispatcher: enqueue for AlertWorker, drop with a warning when full.
class QueuedAlertDispatcher final : public AlertDispatcher {
 public:
  explicit QueuedAlertDispatcher(std::shared_ptr<AlertQueue> queue);

  void Dispatch(const std::string& webhook_url, const std::string& payload_json) override;

 private:
  std::shared_ptr<AlertQueue> queue_;
};

} // namespace heartbeat::alert
