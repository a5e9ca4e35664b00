#pragma once

#include <string>

namespace heartbeat::alert {

/*
  One webhook delivery: POST payload_json to webhook_url.
*/
struct AlertTask {
  std::string webhook_url;
  std::string payload_json;
};

} // namespace heartbeat::alert
