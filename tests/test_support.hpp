#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "internal/alert/alert_dispatcher.hpp"
#include "internal/util/time.hpp"

namespace heartbeat::testing {

// Clock the test advances by hand.
class ManualClock final : public util::Clock {
 public:
  explicit ManualClock(int64_t start_ms) : now_ms_(start_ms) {
  }

  int64_t NowMs() const override {
    return now_ms_.load();
  }

  void Advance(int64_t delta_ms) {
    now_ms_.fetch_add(delta_ms);
  }

  void Set(int64_t now_ms) {
    now_ms_.store(now_ms);
  }

 private:
  std::atomic<int64_t> now_ms_;
};

struct RecordedAlert {
  std::string webhook_url;
  std::string payload_json;
};

// Keeps every dispatched alert instead of delivering it.
class RecordingDispatcher final : public alert::AlertDispatcher {
 public:
  void Dispatch(const std::string& webhook_url, const std::string& payload_json) override {
    std::lock_guard lock(mutex_);
    alerts_.push_back({webhook_url, payload_json});
  }

  std::vector<RecordedAlert> Alerts() const {
    std::lock_guard lock(mutex_);
    return alerts_;
  }

  void Clear() {
    std::lock_guard lock(mutex_);
    alerts_.clear();
  }

 private:
  mutable std::mutex         mutex_;
  std::vector<RecordedAlert> alerts_;
};

} // namespace heartbeat::testing
