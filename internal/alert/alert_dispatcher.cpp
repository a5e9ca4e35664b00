#include "alert_dispatcher.hpp"

#include <stdexcept>

#include "alert_queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace heartbeat::alert {

QueuedAlertDispatcher::QueuedAlertDispatcher(std::shared_ptr<AlertQueue> queue) : queue_(std::move(queue)) {
  if (!queue_) {
    throw std::invalid_argument("alert dispatcher requires queue");
  }
}

void QueuedAlertDispatcher::Dispatch(const std::string& webhook_url, const std::string& payload_json) {
  if (queue_->TryEnqueue(AlertTask{webhook_url, payload_json})) {
    return;
  }

  observability::Metrics::Instance().RecordAlertDropped("queue_full");
  HEARTBEAT_LOG_WARN("alert dropped, queue full or stopped",
                     {observability::StringField("webhook_url", webhook_url), observability::IntField("queued", static_cast<int64_t>(queue_->Size()))});
}

} // namespace heartbeat::alert
