#include "webhook_sender.hpp"

#include <curl/curl.h>

#include <memory>

#include "internal/util/errors.hpp"

namespace heartbeat::alert {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

// Response bodies are not inspected.
size_t DiscardBody(char*, size_t size, size_t nmemb, void*) {
  return size * nmemb;
}

} // namespace

CurlWebhookSender::CurlWebhookSender(uint32_t timeout_ms) : timeout_ms_(timeout_ms == 0 ? 5000 : timeout_ms) {
}

void CurlWebhookSender::Post(const std::string& url, const std::string& json_body) {
  std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
  if (!curl) {
    throw util::TransientDeliveryError("curl_easy_init failed");
  }

  std::unique_ptr<curl_slist, CurlSlistDeleter> headers(curl_slist_append(nullptr, "Content-Type: application/json"));
  if (!headers) {
    throw util::TransientDeliveryError("curl header allocation failed");
  }

  // stored URLs never reach file://, ftp:// or other handlers
  if (curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, "http,https") != CURLE_OK ||
      curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, "http,https") != CURLE_OK) {
    throw util::TransientDeliveryError("curl protocol restriction unavailable");
  }
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, json_body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, DiscardBody);

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    throw util::TransientDeliveryError(std::string("webhook POST failed: ") + curl_easy_strerror(rc));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    throw util::TransientDeliveryError("webhook POST returned HTTP " + std::to_string(status));
  }
}

} // namespace heartbeat::alert
