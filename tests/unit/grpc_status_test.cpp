#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <grpcpp/grpcpp.h>
#include <grpcpp/test/server_context_test_spouse.h>

#include "internal/core/heartbeat_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/facts/facts_log.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/facts_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/heartbeat_server.hpp"
#include "internal/grpc/request_info.hpp"
#include "internal/security/signature_verifier.hpp"
#include "internal/service/service_context.hpp"
#include "internal/tenant/tenant_registry.hpp"
#include "test_support.hpp"

namespace {

using heartbeat::testing::ManualClock;
using heartbeat::testing::RecordingDispatcher;

constexpr const char* kSecret     = "grpc-secret";
constexpr const char* kAdminToken = "admin-token-1";
constexpr int64_t     kNowMs      = 1'700'000'000'000;

heartbeat::service::ServiceContext BuildServiceContext(const std::string& admin_token = kAdminToken) {
  auto clock    = std::make_shared<ManualClock>(kNowMs);
  auto registry = std::make_shared<heartbeat::tenant::TenantRegistry>(std::make_shared<heartbeat::db::memory::MemoryRepository>(), 8);

  heartbeat::service::ServiceContext ctx;
  ctx.engine         = std::make_shared<heartbeat::core::HeartbeatEngine>(registry, std::make_shared<RecordingDispatcher>(), clock, kSecret);
  ctx.facts          = std::make_shared<heartbeat::facts::FactsLog>(registry, clock);
  ctx.default_tenant = "public";
  ctx.admin_token    = admin_token;
  return ctx;
}

void TestErrorMapping() {
  using heartbeat::grpc::ToStatus;

  assert(ToStatus(heartbeat::util::MissingIdError()).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(heartbeat::util::InvalidTimestampError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(heartbeat::util::BadSignatureError("x")).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(heartbeat::util::SkewError("x")).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(heartbeat::util::ConfigError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(heartbeat::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(std::runtime_error("db down")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(heartbeat::util::StorageError("put client record: busy", true)).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(heartbeat::util::StorageError("append fact: corruption", false)).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(heartbeat::util::NotFound("client not found: s1")).error_message() == "client not found: s1");
}

void TestPeerHostParsing() {
  using heartbeat::grpc::PeerHost;

  assert(PeerHost("ipv4:10.1.2.3:50211") == std::string("10.1.2.3"));
  assert(PeerHost("ipv6:[::1]:50211") == std::string("::1"));
  assert(PeerHost("unix:/tmp/sock") == std::string("/tmp/sock"));
  assert(!PeerHost("").has_value());
}

void TestPingUsesForwardedForAndUserAgent() {
  auto                             service = std::make_shared<heartbeat::service::HeartbeatService>(BuildServiceContext());
  heartbeat::grpc::HeartbeatServer server(service);

  ::grpc::ServerContext                    grpc_ctx;
  ::grpc::testing::ServerContextTestSpouse spouse(&grpc_ctx);
  spouse.AddClientMetadata("x-forwarded-for", " 203.0.113.9 , 10.0.0.1");
  spouse.AddClientMetadata("user-agent", "probe/2.0");

  heartbeat::v1::PingRequest req;
  req.set_id("s1");
  heartbeat::v1::PingResponse resp;

  const auto status = server.Ping(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.status().state() == heartbeat::v1::HEALTH_STATE_OK);
  assert(resp.status().record().source_ip() == "203.0.113.9");
  assert(resp.status().record().user_agent() == "probe/2.0");
}

void TestBlankTenantResolvesToDefault() {
  auto                             service = std::make_shared<heartbeat::service::HeartbeatService>(BuildServiceContext());
  heartbeat::grpc::HeartbeatServer server(service);

  {
    heartbeat::v1::PingRequest req;
    req.set_tenant("  ");
    req.set_id("s1");
    heartbeat::v1::PingResponse resp;
    ::grpc::ServerContext       grpc_ctx;
    assert(server.Ping(&grpc_ctx, &req, &resp).ok());
  }

  heartbeat::v1::GetStatusRequest req;
  req.set_tenant("public");
  req.set_id("s1");
  heartbeat::v1::GetStatusResponse resp;
  ::grpc::ServerContext            grpc_ctx;
  assert(server.GetStatus(&grpc_ctx, &req, &resp).ok());
}

void TestClientSignsResolvedBlankTenant() {
  using heartbeat::service::ResolveTenant;

  assert(ResolveTenant("", "public") == "public");
  assert(ResolveTenant(" \t", "public") == "public");
  assert(ResolveTenant(" acme ", "public") == "acme");

  auto ctx = BuildServiceContext();
  ctx.engine->SetConfig("public", "premium", std::nullopt);
  auto                             service = std::make_shared<heartbeat::service::HeartbeatService>(ctx);
  heartbeat::grpc::HeartbeatServer server(service);

  const std::string timestamp = std::to_string(kNowMs);
  auto              ping      = [&](const std::string& signed_tenant) {
    heartbeat::v1::PingRequest req;
    req.set_tenant("");
    req.set_id("s1");
    req.set_timestamp(timestamp);
    req.set_signature(heartbeat::security::Sign(kSecret, signed_tenant, "s1", timestamp));
    heartbeat::v1::PingResponse resp;
    ::grpc::ServerContext       grpc_ctx;
    auto                        status = server.Ping(&grpc_ctx, &req, &resp);
    return std::make_pair(status, resp);
  };

  // signing the raw blank tenant does not match what the server verifies
  assert(ping("").first.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  auto [status, resp] = ping(ResolveTenant("", "public"));
  assert(status.ok());
  assert(resp.status().record().verified());
}

void TestHeartbeatStatusCodes() {
  auto                             service = std::make_shared<heartbeat::service::HeartbeatService>(BuildServiceContext());
  heartbeat::grpc::HeartbeatServer server(service);

  {
    heartbeat::v1::GetStatusRequest req;
    req.set_id("never");
    heartbeat::v1::GetStatusResponse resp;
    ::grpc::ServerContext            grpc_ctx;
    assert(server.GetStatus(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    heartbeat::v1::PingRequest req;
    req.set_id(" ");
    heartbeat::v1::PingResponse resp;
    ::grpc::ServerContext       grpc_ctx;
    auto                        status = server.Ping(&grpc_ctx, &req, &resp);
    assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
    assert(status.error_message() == "missing id");
  }
  {
    heartbeat::v1::PingRequest req;
    req.set_id("s1");
    req.set_timestamp("not-a-number");
    req.set_signature("00");
    heartbeat::v1::PingResponse resp;
    ::grpc::ServerContext       grpc_ctx;
    assert(server.Ping(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
}

void TestSetConfigRequiresAdminToken() {
  auto ctx           = BuildServiceContext();
  auto admin         = std::make_shared<heartbeat::service::AdminService>(ctx);
  auto heartbeat_svc = std::make_shared<heartbeat::service::HeartbeatService>(ctx);
  heartbeat::grpc::AdminServer     admin_server(admin);
  heartbeat::grpc::HeartbeatServer heartbeat_server(heartbeat_svc);

  heartbeat::v1::SetConfigRequest req;
  req.set_tenant("acme");
  req.set_tier("premium");

  {
    heartbeat::v1::SetConfigResponse resp;
    ::grpc::ServerContext            grpc_ctx;
    assert(admin_server.SetConfig(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  }
  {
    heartbeat::v1::SetConfigResponse          resp;
    ::grpc::ServerContext                    grpc_ctx;
    ::grpc::testing::ServerContextTestSpouse spouse(&grpc_ctx);
    spouse.AddClientMetadata("x-admin-token", "wrong");
    assert(admin_server.SetConfig(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  }
  {
    heartbeat::v1::SetConfigResponse          resp;
    ::grpc::ServerContext                    grpc_ctx;
    ::grpc::testing::ServerContextTestSpouse spouse(&grpc_ctx);
    spouse.AddClientMetadata("authorization", std::string("Bearer ") + kAdminToken);
    assert(admin_server.SetConfig(&grpc_ctx, &req, &resp).ok());
    assert(resp.config().tier() == heartbeat::v1::TIER_PREMIUM);
  }

  // premium now demands a signature
  heartbeat::v1::PingRequest ping;
  ping.set_tenant("acme");
  ping.set_id("s1");
  {
    heartbeat::v1::PingResponse resp;
    ::grpc::ServerContext       grpc_ctx;
    assert(heartbeat_server.Ping(&grpc_ctx, &ping, &resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  }

  const std::string ts = std::to_string(kNowMs);
  ping.set_timestamp(ts);
  ping.set_signature(heartbeat::security::Sign(kSecret, "acme", "s1", ts));
  {
    heartbeat::v1::PingResponse resp;
    ::grpc::ServerContext       grpc_ctx;
    assert(heartbeat_server.Ping(&grpc_ctx, &ping, &resp).ok());
    assert(resp.status().record().verified());
  }
}

void TestSetConfigWithoutConfiguredToken() {
  auto                         admin = std::make_shared<heartbeat::service::AdminService>(BuildServiceContext(""));
  heartbeat::grpc::AdminServer server(admin);

  heartbeat::v1::SetConfigRequest req;
  req.set_tier("premium");

  heartbeat::v1::SetConfigResponse          resp;
  ::grpc::ServerContext                    grpc_ctx;
  ::grpc::testing::ServerContextTestSpouse spouse(&grpc_ctx);
  spouse.AddClientMetadata("x-admin-token", "anything");
  assert(server.SetConfig(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  // reads stay open
  heartbeat::v1::GetConfigRequest  get_req;
  heartbeat::v1::GetConfigResponse get_resp;
  ::grpc::ServerContext            get_ctx;
  assert(server.GetConfig(&get_ctx, &get_req, &get_resp).ok());
  assert(get_resp.config().tier() == heartbeat::v1::TIER_FREE);
}

void TestFactsStatusCodes() {
  auto                         facts = std::make_shared<heartbeat::service::FactsService>(BuildServiceContext());
  heartbeat::grpc::FactsServer server(facts);

  heartbeat::v1::RecordFactRequest req;
  req.set_source("scanner");
  req.set_type("");
  req.set_entity("host-1");
  heartbeat::v1::RecordFactResponse resp;
  ::grpc::ServerContext             grpc_ctx;
  assert(server.RecordFact(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_type("port_open");
  ::grpc::ServerContext ok_ctx;
  assert(server.RecordFact(&ok_ctx, &req, &resp).ok());

  heartbeat::v1::ListFactsRequest  list_req;
  heartbeat::v1::ListFactsResponse list_resp;
  ::grpc::ServerContext            list_ctx;
  assert(server.ListFacts(&list_ctx, &list_req, &list_resp).ok());
  assert(list_resp.facts_size() == 1);
  assert(list_resp.facts(0).entity() == "host-1");
}

} // namespace

int main() {
  TestErrorMapping();
  TestPeerHostParsing();
  TestPingUsesForwardedForAndUserAgent();
  TestBlankTenantResolvesToDefault();
  TestClientSignsResolvedBlankTenant();
  TestHeartbeatStatusCodes();
  TestSetConfigRequiresAdminToken();
  TestSetConfigWithoutConfiguredToken();
  TestFactsStatusCodes();

  std::cout << "heartbeat_unit_grpc_status: pass\n";
  return 0;
}
