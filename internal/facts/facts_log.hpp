#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "heartbeat/v1.hpp"

namespace heartbeat::tenant {
class TenantRegistry;
}
namespace heartbeat::util {
class Clock;
}

namespace heartbeat::facts {

// Per-tenant cap; older facts are dropped on append.
inline constexpr uint64_t kMaxFacts = 200;

/*
  Bounded newest-first event list per tenant.
*/
class FactsLog {
 public:
  FactsLog(std::shared_ptr<tenant::TenantRegistry> registry, std::shared_ptr<const util::Clock> clock);

  // source, type and entity are trimmed; any blank one is a MissingFieldError.
  heartbeat::v1::Fact RecordFact(const std::string&                            tenant,
                                 const std::string&                            source,
                                 const std::string&                            type,
                                 const std::string&                            entity,
                                 const std::optional<google::protobuf::Value>& meta);

  std::vector<heartbeat::v1::Fact> ListFacts(const std::string& tenant);

 private:
  std::shared_ptr<tenant::TenantRegistry> registry_;
  std::shared_ptr<const util::Clock>      clock_;
};

} // namespace heartbeat::facts
