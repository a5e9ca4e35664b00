#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/alert/alert_dispatcher.hpp"
#include "internal/alert/alert_payload.hpp"
#include "internal/alert/alert_queue.hpp"
#include "internal/alert/alert_worker.hpp"
#include "internal/alert/webhook_sender.hpp"
#include "internal/util/errors.hpp"

namespace {

using heartbeat::alert::AlertQueue;
using heartbeat::alert::AlertTask;
using heartbeat::alert::AlertWorker;
using heartbeat::alert::QueuedAlertDispatcher;

class RecordingSender final : public heartbeat::alert::WebhookSender {
 public:
  void Post(const std::string& url, const std::string& json_body) override {
    {
      std::unique_lock lock(mutex_);
      gate_cv_.wait(lock, [&] { return open_; });
      posted_.push_back(url + " " + json_body);
    }
    if (url.find("fail") != std::string::npos) {
      throw heartbeat::util::TransientDeliveryError("HTTP 500");
    }
  }

  void Open() {
    {
      std::lock_guard lock(mutex_);
      open_ = true;
    }
    gate_cv_.notify_all();
  }

  void Close() {
    std::lock_guard lock(mutex_);
    open_ = false;
  }

  std::vector<std::string> Posted() const {
    std::lock_guard lock(mutex_);
    return posted_;
  }

 private:
  mutable std::mutex       mutex_;
  std::condition_variable  gate_cv_;
  bool                     open_ = true;
  std::vector<std::string> posted_;
};

void TestQueueBoundedAndDrainsAfterShutdown() {
  AlertQueue queue(2);

  assert(queue.TryEnqueue({"u1", "a"}));
  assert(queue.TryEnqueue({"u2", "b"}));
  assert(!queue.TryEnqueue({"u3", "c"}));
  assert(queue.Size() == 2);

  queue.Shutdown();
  assert(!queue.TryEnqueue({"u4", "d"}));

  auto first = queue.Dequeue();
  assert(first && first->webhook_url == "u1");
  auto second = queue.Dequeue();
  assert(second && second->payload_json == "b");
  assert(!queue.Dequeue().has_value());
}

void TestWorkerDeliversEverythingBeforeStop() {
  auto queue  = std::make_shared<AlertQueue>(64);
  auto sender = std::make_shared<RecordingSender>();

  AlertWorker           worker(queue, sender, 3);
  QueuedAlertDispatcher dispatcher(queue);
  worker.Start();

  for (int i = 0; i < 20; ++i) {
    dispatcher.Dispatch("https://hooks.test/" + std::to_string(i), "{}");
  }
  worker.Stop();

  assert(sender->Posted().size() == 20);
}

void TestFailuresAreDroppedNotRetried() {
  auto queue  = std::make_shared<AlertQueue>(8);
  auto sender = std::make_shared<RecordingSender>();

  AlertWorker worker(queue, sender, 1);
  worker.Start();

  QueuedAlertDispatcher dispatcher(queue);
  dispatcher.Dispatch("https://hooks.test/fail", "{}");
  dispatcher.Dispatch("https://hooks.test/ok", "{}");
  worker.Stop();

  auto posted = sender->Posted();
  assert(posted.size() == 2);
  assert(posted[0].find("/fail") != std::string::npos);
  assert(posted[1].find("/ok") != std::string::npos);
}

void TestDispatchNeverBlocksOnSlowDelivery() {
  auto queue  = std::make_shared<AlertQueue>(2);
  auto sender = std::make_shared<RecordingSender>();
  sender->Close();

  AlertWorker worker(queue, sender, 1);
  worker.Start();

  QueuedAlertDispatcher dispatcher(queue);
  const auto            started = std::chrono::steady_clock::now();
  for (int i = 0; i < 10; ++i) {
    dispatcher.Dispatch("https://hooks.test/slow", "{}");
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(elapsed < std::chrono::seconds(2));

  sender->Open();
  worker.Stop();

  // one in flight plus at most two queued; the rest were dropped
  const auto delivered = sender->Posted().size();
  assert(delivered >= 2 && delivered <= 3);
}

void TestDispatchAfterStopIsDropped() {
  auto queue  = std::make_shared<AlertQueue>(4);
  auto sender = std::make_shared<RecordingSender>();

  AlertWorker worker(queue, sender, 2);
  worker.Start();
  worker.Stop();

  QueuedAlertDispatcher dispatcher(queue);
  dispatcher.Dispatch("https://hooks.test/late", "{}");
  assert(queue->Size() == 0);
  assert(sender->Posted().empty());
}

void TestPayloadShape() {
  const auto json = heartbeat::alert::BuildStateChangePayload("acme", "s1", heartbeat::model::HealthState::kOk,
                                                              heartbeat::model::HealthState::kWarn, 70'000, 1'700'000'070'000);

  google::protobuf::Struct body;
  assert(google::protobuf::util::JsonStringToMessage(json, &body).ok());

  const auto& fields = body.fields();
  assert(fields.size() == 7);
  assert(fields.at("event").string_value() == "state_change");
  assert(fields.at("tenant").string_value() == "acme");
  assert(fields.at("id").string_value() == "s1");
  assert(fields.at("from").string_value() == "OK");
  assert(fields.at("to").string_value() == "WARN");
  assert(fields.at("age_ms").number_value() == 70'000);
  assert(fields.at("at").number_value() == 1'700'000'070'000.0);
}

void TestCurlSenderReportsTransportFailure() {
  heartbeat::alert::CurlWebhookSender sender(500);

  bool threw = false;
  try {
    sender.Post("http://127.0.0.1:1/hook", "{}");
  } catch (const heartbeat::util::TransientDeliveryError&) {
    threw = true;
  }
  assert(threw);
}

void TestCurlSenderRefusesNonHttpSchemes() {
  heartbeat::alert::CurlWebhookSender sender(500);

  for (const char* url : {"file:///etc/passwd", "ftp://127.0.0.1/hook", "gopher://127.0.0.1:1/"}) {
    std::string message;
    try {
      sender.Post(url, "{}");
    } catch (const heartbeat::util::TransientDeliveryError& e) {
      message = e.what();
    }
    assert(message.find("Unsupported protocol") != std::string::npos);
  }
}

} // namespace

int main() {
  TestQueueBoundedAndDrainsAfterShutdown();
  TestWorkerDeliversEverythingBeforeStop();
  TestFailuresAreDroppedNotRetried();
  TestDispatchNeverBlocksOnSlowDelivery();
  TestDispatchAfterStopIsDropped();
  TestPayloadShape();
  TestCurlSenderReportsTransportFailure();
  TestCurlSenderRefusesNonHttpSchemes();

  std::cout << "heartbeat_unit_alert_worker: pass\n";
  return 0;
}
