#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "heartbeat/v1.hpp"
#include "internal/security/signature_verifier.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

using namespace heartbeat::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  heartbeatctl <addr> [--tenant T] ping <id> [--sign] [--meta JSON]\n"
            << "  heartbeatctl <addr> [--tenant T] status <id>\n"
            << "  heartbeatctl <addr> [--tenant T] list\n"
            << "  heartbeatctl <addr> [--tenant T] config-get\n"
            << "  heartbeatctl <addr> [--tenant T] config-set <free|premium> [webhook_url]\n"
            << "  heartbeatctl <addr> [--tenant T] fact <source> <type> <entity> [meta_json]\n"
            << "  heartbeatctl <addr> [--tenant T] facts\n"
            << "\n"
            << "--sign reads HEARTBEAT_SIGNING_SECRET; config-set reads HEARTBEAT_ADMIN_TOKEN.\n";
}

static std::optional<google::protobuf::Value> ParseJsonValue(const std::string& text) {
  google::protobuf::Value value;
  if (!google::protobuf::util::JsonStringToMessage(text, &value).ok()) {
    return std::nullopt;
  }
  return value;
}

static void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(message, &json, options).ok()) {
    std::cerr << "failed to render response\n";
    return;
  }
  std::cout << json;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];

  // Remaining arguments with --tenant pulled out.
  std::string              requested_tenant;
  std::vector<std::string> args;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--tenant") {
      if (i + 1 >= argc) {
        Usage();
        return 1;
      }
      requested_tenant = argv[++i];
      continue;
    }
    args.push_back(std::move(arg));
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];

  // Resolved here as well so --sign covers the tenant the server serves.
  const std::string tenant = heartbeat::service::ResolveTenant(requested_tenant, "public");

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto heartbeat_stub = HeartbeatService::NewStub(channel);
  auto admin_stub     = AdminService::NewStub(channel);
  auto facts_stub     = FactsService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "ping") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }

    PingRequest req;
    req.set_tenant(tenant);
    req.set_id(args[1]);

    for (size_t i = 2; i < args.size(); ++i) {
      if (args[i] == "--sign") {
        const char* secret = std::getenv("HEARTBEAT_SIGNING_SECRET");
        if (!secret || !*secret) {
          std::cerr << "--sign needs HEARTBEAT_SIGNING_SECRET\n";
          return 1;
        }
        const std::string timestamp = std::to_string(heartbeat::util::ToUnixMillis(heartbeat::util::Now()));
        req.set_timestamp(timestamp);
        req.set_signature(heartbeat::security::Sign(secret, tenant, args[1], timestamp));
      } else if (args[i] == "--meta" && i + 1 < args.size()) {
        auto meta = ParseJsonValue(args[++i]);
        if (!meta) {
          std::cerr << "invalid meta json\n";
          return 1;
        }
        *req.mutable_meta() = *meta;
      } else {
        std::cerr << "unknown ping option: " << args[i] << "\n";
        return 1;
      }
    }

    PingResponse resp;
    auto         status = heartbeat_stub->Ping(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }

    GetStatusRequest req;
    req.set_tenant(tenant);
    req.set_id(args[1]);

    GetStatusResponse resp;
    auto              status = heartbeat_stub->GetStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListClientsRequest req;
    req.set_tenant(tenant);

    ListClientsResponse resp;
    auto                status = heartbeat_stub->ListClients(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "config-get") {
    GetConfigRequest req;
    req.set_tenant(tenant);

    GetConfigResponse resp;
    auto              status = admin_stub->GetConfig(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "config-set") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }

    const char* token = std::getenv("HEARTBEAT_ADMIN_TOKEN");
    if (!token || !*token) {
      std::cerr << "config-set needs HEARTBEAT_ADMIN_TOKEN\n";
      return 1;
    }
    ctx.AddMetadata("x-admin-token", token);

    SetConfigRequest req;
    req.set_tenant(tenant);
    req.set_tier(args[1]);
    if (args.size() >= 3) {
      req.set_alert_webhook_url(args[2]);
    }

    SetConfigResponse resp;
    auto              status = admin_stub->SetConfig(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "fact") {
    if (args.size() < 4) {
      Usage();
      return 1;
    }

    RecordFactRequest req;
    req.set_tenant(tenant);
    req.set_source(args[1]);
    req.set_type(args[2]);
    req.set_entity(args[3]);
    if (args.size() >= 5) {
      auto meta = ParseJsonValue(args[4]);
      if (!meta) {
        std::cerr << "invalid meta json\n";
        return 1;
      }
      *req.mutable_meta() = *meta;
    }

    RecordFactResponse resp;
    auto               status = facts_stub->RecordFact(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "facts") {
    ListFactsRequest req;
    req.set_tenant(tenant);

    ListFactsResponse resp;
    auto              status = facts_stub->ListFacts(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  Usage();
  return 1;
}
