#pragma once

#include <cstdint>
#include <string>

namespace heartbeat::alert {

/*
  Outbound HTTP POST of a JSON body.

  Post throws util::TransientDeliveryError on transport failure or a
  non-2xx response.
*/
class WebhookSender {
 public:
  virtual ~WebhookSender() = default;

  virtual void Post(const std::string& url, const std::string& json_body) = 0;
};

class CurlWebhookSender final : public WebhookSender {
 public:
  explicit CurlWebhookSender(uint32_t timeout_ms);

  void Post(const std::string& url, const std::string& json_body) override;

 private:
  uint32_t timeout_ms_;
};

} // namespace heartbeat::alert
