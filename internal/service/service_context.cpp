#include "service_context.hpp"

#include "internal/util/strings.hpp"

namespace heartbeat::service {

std::string ResolveTenant(const std::string& requested, const std::string& default_tenant) {
  auto tenant = heartbeat::util::Trim(requested);
  return tenant.empty() ? default_tenant : tenant;
}

std::string ResolveTenant(const ServiceContext& ctx, const std::string& requested) {
  return ResolveTenant(requested, ctx.default_tenant);
}

} // namespace heartbeat::service
