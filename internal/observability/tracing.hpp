#pragma once

#include <memory>
#include <string_view>

namespace heartbeat::runtime::config {
class RuntimeConfig;
}

namespace heartbeat::observability {

// Returns false when tracing is disabled in config or compiled out.
bool InitializeTracing(const heartbeat::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

// Active span for the enclosing scope; ends on destruction.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void RecordException(std::string_view description);

 private:
#ifdef HEARTBEAT_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef HEARTBEAT_ENABLE_OTEL
inline bool InitializeTracing(const heartbeat::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace heartbeat::observability
