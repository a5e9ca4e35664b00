#include "pg_repository.hpp"

namespace heartbeat::db::postgres {

namespace {

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::UpsertClient(Transaction& t, const model::ClientRecord& r) {
  try {
    auto& w = TX(t).Work();
    w.exec_prepared("upsert_client", r.tenant, r.id, r.last_seen_ms, r.source_ip, r.user_agent, r.meta_json, r.verified);
    w.exec_prepared("index_client", r.tenant, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ClientRecord> PgRepository::GetClient(Transaction& t, const std::string& tenant, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_client", tenant, id);
  if (res.empty()) return std::nullopt;

  model::ClientRecord r;
  r.tenant       = res[0][0].c_str();
  r.id           = res[0][1].c_str();
  r.last_seen_ms = res[0][2].as<int64_t>();
  r.source_ip    = OptText(res[0][3]);
  r.user_agent   = OptText(res[0][4]);
  r.meta_json    = OptText(res[0][5]);
  r.verified     = res[0][6].as<bool>();
  return r;
}

std::vector<std::string> PgRepository::ListClientIds(Transaction& t, const std::string& tenant) {
  auto res = TX(t).Work().exec_prepared("list_client_ids", tenant);

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.emplace_back(row[0].c_str());
  }
  return out;
}

Result PgRepository::PutClientState(Transaction& t, const model::ClientStateRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO client_state(tenant,id,state,updated_at_ms) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(tenant,id) DO UPDATE SET state=EXCLUDED.state,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.tenant, r.id, r.state, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ClientStateRecord> PgRepository::GetClientState(Transaction& t, const std::string& tenant, const std::string& id) {
  auto res = TX(t).Work().exec_params("SELECT tenant,id,state,updated_at_ms FROM client_state WHERE tenant=$1 AND id=$2;", tenant, id);
  if (res.empty()) {
    return std::nullopt;
  }

  model::ClientStateRecord r;
  r.tenant        = res[0][0].c_str();
  r.id            = res[0][1].c_str();
  r.state         = res[0][2].c_str();
  r.updated_at_ms = res[0][3].as<int64_t>();
  return r;
}

Result PgRepository::UpsertTenantConfig(Transaction& t, const model::TenantConfigRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO tenant_config(tenant,tier,alert_webhook_url,updated_at_ms) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(tenant) DO UPDATE SET tier=EXCLUDED.tier,alert_webhook_url=EXCLUDED.alert_webhook_url,"
        "updated_at_ms=EXCLUDED.updated_at_ms;",
        r.tenant, r.tier, r.alert_webhook_url, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TenantConfigRecord> PgRepository::GetTenantConfig(Transaction& t, const std::string& tenant) {
  auto res = TX(t).Work().exec_params("SELECT tenant,tier,alert_webhook_url,updated_at_ms FROM tenant_config WHERE tenant=$1;", tenant);
  if (res.empty()) {
    return std::nullopt;
  }

  model::TenantConfigRecord r;
  r.tenant            = res[0][0].c_str();
  r.tier              = res[0][1].c_str();
  r.alert_webhook_url = OptText(res[0][2]);
  r.updated_at_ms     = res[0][3].as<int64_t>();
  return r;
}

Result PgRepository::AppendFact(Transaction& t, const model::FactRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO facts(tenant,ts_ms,source,type,entity,meta_json) VALUES($1,$2,$3,$4,$5,$6::jsonb);",
        r.tenant, r.ts_ms, r.source, r.type, r.entity, r.meta_json);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::TrimFactsToMaxCount(Transaction& t, const std::string& tenant, uint64_t max_entries) {
  try {
    TX(t).Work().exec_params(
        "DELETE FROM facts WHERE tenant=$1 AND seq NOT IN "
        "(SELECT seq FROM facts WHERE tenant=$1 ORDER BY seq DESC LIMIT $2);",
        tenant, static_cast<int64_t>(max_entries));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FactRecord> PgRepository::ListFacts(Transaction& t, const std::string& tenant) {
  auto res = TX(t).Work().exec_params(
      "SELECT tenant,seq,ts_ms,source,type,entity,meta_json::text FROM facts WHERE tenant=$1 ORDER BY seq DESC;", tenant);

  std::vector<model::FactRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::FactRecord r;
    r.tenant    = row[0].c_str();
    r.seq       = row[1].as<uint64_t>();
    r.ts_ms     = row[2].as<int64_t>();
    r.source    = row[3].c_str();
    r.type      = row[4].c_str();
    r.entity    = row[5].c_str();
    r.meta_json = OptText(row[6]);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace heartbeat::db::postgres
