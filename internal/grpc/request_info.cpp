#include "request_info.hpp"

#include "internal/util/strings.hpp"

namespace heartbeat::grpc {

std::optional<std::string> MetadataValue(const ::grpc::ServerContext& ctx, std::string_view key) {
  const auto& metadata = ctx.client_metadata();
  auto        it       = metadata.find(::grpc::string_ref(key.data(), key.size()));
  if (it == metadata.end()) {
    return std::nullopt;
  }
  return std::string(it->second.data(), it->second.size());
}

std::optional<std::string> PeerHost(std::string_view peer) {
  const auto scheme = peer.find(':');
  if (scheme == std::string_view::npos) {
    return std::nullopt;
  }
  auto address = peer.substr(scheme + 1);

  if (!address.empty() && address.front() == '[') {
    const auto close = address.find(']');
    if (close == std::string_view::npos) return std::nullopt;
    return std::string(address.substr(1, close - 1));
  }

  const auto port = address.rfind(':');
  if (port != std::string_view::npos) {
    address = address.substr(0, port);
  }
  if (address.empty()) return std::nullopt;
  return std::string(address);
}

heartbeat::service::RequestInfo ExtractRequestInfo(const ::grpc::ServerContext& ctx) {
  heartbeat::service::RequestInfo info;

  if (auto forwarded = MetadataValue(ctx, "x-forwarded-for")) {
    auto first_hop = heartbeat::util::Trim(std::string_view(*forwarded).substr(0, forwarded->find(',')));
    if (!first_hop.empty()) info.source_ip = std::move(first_hop);
  }
  if (!info.source_ip) {
    info.source_ip = PeerHost(ctx.peer());
  }

  if (auto agent = MetadataValue(ctx, "user-agent"); agent && !heartbeat::util::IsBlank(*agent)) {
    info.user_agent = std::move(agent);
  }
  return info;
}

std::optional<std::string> ExtractAdminToken(const ::grpc::ServerContext& ctx) {
  if (auto token = MetadataValue(ctx, "x-admin-token")) {
    return token;
  }

  auto authorization = MetadataValue(ctx, "authorization");
  if (!authorization) {
    return std::nullopt;
  }

  constexpr std::string_view kBearer = "bearer ";
  if (authorization->size() <= kBearer.size() ||
      heartbeat::util::ToLower(std::string_view(*authorization).substr(0, kBearer.size())) != kBearer) {
    return std::nullopt;
  }
  return heartbeat::util::Trim(std::string_view(*authorization).substr(kBearer.size()));
}

} // namespace heartbeat::grpc
