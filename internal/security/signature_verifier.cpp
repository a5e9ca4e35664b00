#include "internal/security/signature_verifier.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace heartbeat::security {

namespace {

std::string BytesToHex(const unsigned char* data, unsigned int len) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

std::string HmacSha256Hex(std::string_view key, std::string_view message) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;

  const auto* result = HMAC(EVP_sha256(),
                            key.data(),
                            static_cast<int>(key.size()),
                            reinterpret_cast<const unsigned char*>(message.data()),
                            message.size(),
                            digest,
                            &digest_len);
  if (result == nullptr) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }
  return BytesToHex(digest, digest_len);
}

// Whole string must parse; decimal and exponent forms accepted.
double ParseTimestamp(const std::string& text) {
  const std::string trimmed = util::Trim(text);
  if (trimmed.empty()) {
    throw util::InvalidTimestampError("invalid timestamp");
  }

  errno     = 0;
  char* end = nullptr;
  double value = std::strtod(trimmed.c_str(), &end);
  if (end != trimmed.c_str() + trimmed.size() || errno == ERANGE || !std::isfinite(value)) {
    throw util::InvalidTimestampError("invalid timestamp");
  }
  return value;
}

unsigned char FoldCase(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<unsigned char>(c + ('a' - 'A')) : c;
}

} // namespace

bool ConstantTimeEqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }

  unsigned char diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff |= FoldCase(static_cast<unsigned char>(a[i])) ^ FoldCase(static_cast<unsigned char>(b[i]));
  }
  return diff == 0;
}

std::string Sign(std::string_view secret, std::string_view tenant, std::string_view id, std::string_view timestamp) {
  std::string message;
  message.reserve(tenant.size() + id.size() + timestamp.size() + 2);
  message.append(tenant).append("\n").append(id).append("\n").append(timestamp);
  return HmacSha256Hex(secret, message);
}

void Verify(std::string_view                  secret,
            std::string_view                  tenant,
            std::string_view                  id,
            const std::optional<std::string>& timestamp,
            const std::optional<std::string>& signature,
            int64_t                           now_ms) {
  if (secret.empty()) {
    throw util::ConfigError("signing secret not configured");
  }
  if (!timestamp || util::IsBlank(*timestamp) || !signature || util::IsBlank(*signature)) {
    throw util::MissingFieldError("missing timestamp or signature");
  }

  const double ts = ParseTimestamp(*timestamp);
  if (std::fabs(static_cast<double>(now_ms) - ts) > static_cast<double>(kMaxClockSkewMs)) {
    throw util::SkewError("timestamp outside allowed skew");
  }

  const auto expected = Sign(secret, tenant, id, *timestamp);
  if (!ConstantTimeEqualsIgnoreCase(expected, util::Trim(*signature))) {
    throw util::BadSignatureError("bad signature");
  }
}

} // namespace heartbeat::security
