#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace heartbeat::db::sqlite {

using heartbeat::db::ErrorCode;
using heartbeat::db::Result;

namespace {

Stmt Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

// Reads fail loudly; writes report through Result.
void ThrowIfStepFailed(sqlite3* db, int rc) {
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
}

model::FactRecord ReadFact(sqlite3_stmt* st) {
    model::FactRecord r;
    r.tenant    = ColText(st, 0);
    r.seq       = static_cast<uint64_t>(ColI64(st, 1));
    r.ts_ms     = ColI64(st, 2);
    r.source    = ColText(st, 3);
    r.type      = ColText(st, 4);
    r.entity    = ColText(st, 5);
    r.meta_json = ColOptText(st, 6);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Clients
// ------------------------------------------------------------------

Result SqliteRepository::UpsertClient(Transaction& t, const model::ClientRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO clients(tenant,id,last_seen_ms,source_ip,user_agent,meta_json,verified) "
        "VALUES(?,?,?,?,?,?,?) "
        "ON CONFLICT(tenant,id) DO UPDATE SET last_seen_ms=excluded.last_seen_ms, "
        "source_ip=excluded.source_ip, user_agent=excluded.user_agent, "
        "meta_json=excluded.meta_json, verified=excluded.verified;");

    BindText(st.get(), 1, r.tenant);
    BindText(st.get(), 2, r.id);
    BindI64(st.get(), 3, r.last_seen_ms);
    BindOptText(st.get(), 4, r.source_ip);
    BindOptText(st.get(), 5, r.user_agent);
    BindOptText(st.get(), 6, r.meta_json);
    sqlite3_bind_int(st.get(), 7, r.verified ? 1 : 0);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;

    // index keeps first-seen order; re-pings leave it untouched
    auto idx = Prepare(db, "INSERT OR IGNORE INTO client_index(tenant,id) VALUES(?,?);");
    BindText(idx.get(), 1, r.tenant);
    BindText(idx.get(), 2, r.id);
    return Translate(db, sqlite3_step(idx.get()));
}

std::optional<model::ClientRecord>
SqliteRepository::GetClient(Transaction& t, const std::string& tenant, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT tenant,id,last_seen_ms,source_ip,user_agent,meta_json,verified "
        "FROM clients WHERE tenant=? AND id=?;");
    BindText(st.get(), 1, tenant);
    BindText(st.get(), 2, id);

    int rc = sqlite3_step(st.get());
    ThrowIfStepFailed(db, rc);
    if (rc != SQLITE_ROW) return std::nullopt;

    model::ClientRecord r;
    r.tenant       = ColText(st.get(), 0);
    r.id           = ColText(st.get(), 1);
    r.last_seen_ms = ColI64(st.get(), 2);
    r.source_ip    = ColOptText(st.get(), 3);
    r.user_agent   = ColOptText(st.get(), 4);
    r.meta_json    = ColOptText(st.get(), 5);
    r.verified     = sqlite3_column_int(st.get(), 6) != 0;
    return r;
}

std::vector<std::string> SqliteRepository::ListClientIds(Transaction& t, const std::string& tenant) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT id FROM client_index WHERE tenant=? ORDER BY seq ASC;");
    BindText(st.get(), 1, tenant);

    std::vector<std::string> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ColText(st.get(), 0));
    }
    ThrowIfStepFailed(db, rc);
    return out;
}

// ------------------------------------------------------------------
// Last known state
// ------------------------------------------------------------------

Result SqliteRepository::PutClientState(Transaction& t, const model::ClientStateRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO client_state(tenant,id,state,updated_at_ms) VALUES(?,?,?,?) "
        "ON CONFLICT(tenant,id) DO UPDATE SET state=excluded.state, updated_at_ms=excluded.updated_at_ms;");
    BindText(st.get(), 1, r.tenant);
    BindText(st.get(), 2, r.id);
    BindText(st.get(), 3, r.state);
    BindI64(st.get(), 4, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ClientStateRecord>
SqliteRepository::GetClientState(Transaction& t, const std::string& tenant, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT tenant,id,state,updated_at_ms FROM client_state WHERE tenant=? AND id=?;");
    BindText(st.get(), 1, tenant);
    BindText(st.get(), 2, id);

    int rc = sqlite3_step(st.get());
    ThrowIfStepFailed(db, rc);
    if (rc != SQLITE_ROW) return std::nullopt;

    model::ClientStateRecord r;
    r.tenant        = ColText(st.get(), 0);
    r.id            = ColText(st.get(), 1);
    r.state         = ColText(st.get(), 2);
    r.updated_at_ms = ColI64(st.get(), 3);
    return r;
}

// ------------------------------------------------------------------
// Tenant config
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTenantConfig(Transaction& t, const model::TenantConfigRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO tenant_config(tenant,tier,alert_webhook_url,updated_at_ms) VALUES(?,?,?,?) "
        "ON CONFLICT(tenant) DO UPDATE SET tier=excluded.tier, "
        "alert_webhook_url=excluded.alert_webhook_url, updated_at_ms=excluded.updated_at_ms;");
    BindText(st.get(), 1, r.tenant);
    BindText(st.get(), 2, r.tier);
    BindOptText(st.get(), 3, r.alert_webhook_url);
    BindI64(st.get(), 4, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TenantConfigRecord>
SqliteRepository::GetTenantConfig(Transaction& t, const std::string& tenant) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT tenant,tier,alert_webhook_url,updated_at_ms FROM tenant_config WHERE tenant=?;");
    BindText(st.get(), 1, tenant);

    int rc = sqlite3_step(st.get());
    ThrowIfStepFailed(db, rc);
    if (rc != SQLITE_ROW) return std::nullopt;

    model::TenantConfigRecord r;
    r.tenant            = ColText(st.get(), 0);
    r.tier              = ColText(st.get(), 1);
    r.alert_webhook_url = ColOptText(st.get(), 2);
    r.updated_at_ms     = ColI64(st.get(), 3);
    return r;
}

// ------------------------------------------------------------------
// Facts
// ------------------------------------------------------------------

Result SqliteRepository::AppendFact(Transaction& t, const model::FactRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO facts(tenant,ts_ms,source,type,entity,meta_json) VALUES(?,?,?,?,?,?);");
    BindText(st.get(), 1, r.tenant);
    BindI64(st.get(), 2, r.ts_ms);
    BindText(st.get(), 3, r.source);
    BindText(st.get(), 4, r.type);
    BindText(st.get(), 5, r.entity);
    BindOptText(st.get(), 6, r.meta_json);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::TrimFactsToMaxCount(Transaction& t, const std::string& tenant, uint64_t max_entries) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "DELETE FROM facts WHERE tenant=? AND seq NOT IN "
        "(SELECT seq FROM facts WHERE tenant=? ORDER BY seq DESC LIMIT ?);");
    BindText(st.get(), 1, tenant);
    BindText(st.get(), 2, tenant);
    BindI64(st.get(), 3, static_cast<int64_t>(max_entries));

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::FactRecord> SqliteRepository::ListFacts(Transaction& t, const std::string& tenant) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT tenant,seq,ts_ms,source,type,entity,meta_json FROM facts "
        "WHERE tenant=? ORDER BY seq DESC;");
    BindText(st.get(), 1, tenant);

    std::vector<model::FactRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadFact(st.get()));
    }
    ThrowIfStepFailed(db, rc);
    return out;
}

} // namespace heartbeat::db::sqlite
