#pragma once

#include <grpcpp/grpcpp.h>

#include <optional>
#include <string>
#include <string_view>

#include "internal/service/heartbeat_service.hpp"

namespace heartbeat::grpc {

/*
  Caller details from gRPC metadata and the transport peer.
*/

// First value for key; metadata keys are lowercase on the wire.
std::optional<std::string> MetadataValue(const ::grpc::ServerContext& ctx, std::string_view key);

// Host part of a grpc peer string ("ipv4:1.2.3.4:5", "ipv6:[::1]:5").
std::optional<std::string> PeerHost(std::string_view peer);

// x-forwarded-for first hop, else the peer host; plus the user-agent entry.
heartbeat::service::RequestInfo ExtractRequestInfo(const ::grpc::ServerContext& ctx);

// x-admin-token, else "authorization: Bearer <token>".
std::optional<std::string> ExtractAdminToken(const ::grpc::ServerContext& ctx);

} // namespace heartbeat::grpc
