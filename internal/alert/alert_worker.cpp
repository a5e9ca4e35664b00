#include "alert_worker.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace heartbeat::alert {

AlertWorker::AlertWorker(std::shared_ptr<AlertQueue> queue, std::shared_ptr<WebhookSender> sender, std::size_t thread_count)
    : queue_(std::move(queue)), sender_(std::move(sender)), thread_count_(thread_count == 0 ? 1 : thread_count) {
  if (!queue_ || !sender_) {
    throw std::invalid_argument("alert worker requires queue and sender");
  }
}

AlertWorker::~AlertWorker() {
  Stop();
}

void AlertWorker::Start() {
  if (!threads_.empty()) return;
  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&AlertWorker::Run, this);
  }
}

void AlertWorker::Stop() {
  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void AlertWorker::Run() {
  for (;;) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      sender_->Post(task->webhook_url, task->payload_json);
      observability::Metrics::Instance().RecordAlertDelivery(true);
    } catch (const util::TransientDeliveryError& e) {
      observability::Metrics::Instance().RecordAlertDelivery(false);
      HEARTBEAT_LOG_WARN("alert delivery failed", {observability::StringField("webhook_url", task->webhook_url), observability::StringField("error", e.what())});
    } catch (const std::exception& e) {
      observability::Metrics::Instance().RecordAlertDelivery(false);
      HEARTBEAT_LOG_ERROR("alert delivery raised", {observability::StringField("webhook_url", task->webhook_url), observability::StringField("error", e.what())});
    }
  }
}

} // namespace heartbeat::alert
