#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

#if HEARTBEAT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migration_executor.hpp"
#endif

namespace {

using heartbeat::db::sql::Migration;
using heartbeat::db::sql::MigrationExecutor;
using heartbeat::db::sql::RunMigrations;

class RecordingExecutor final : public MigrationExecutor {
 public:
  explicit RecordingExecutor(int start_version) : version_(start_version) {
  }

  void ExecuteSQL(const std::string& sql) override {
    executed.push_back(sql);
  }

  int CurrentVersion() override {
    return version_;
  }

  void RecordVersion(int version) override {
    version_ = version;
  }

  std::vector<std::string> executed;

 private:
  int version_;
};

void TestAppliesOnlyPendingVersions() {
  const std::vector<Migration> migrations = {{1, "one"}, {2, "two"}, {3, "three"}};

  RecordingExecutor fresh(0);
  assert(RunMigrations(fresh, migrations) == 3);
  assert(fresh.executed.size() == 3);
  assert(fresh.CurrentVersion() == 3);

  RecordingExecutor partial(2);
  assert(RunMigrations(partial, migrations) == 1);
  assert(partial.executed.size() == 1);
  assert(partial.executed[0] == "three");

  assert(RunMigrations(partial, migrations) == 0);
}

void TestRejectsUnorderedVersions() {
  RecordingExecutor executor(0);

  bool threw = false;
  try {
    (void)RunMigrations(executor, {{2, "two"}, {1, "one"}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestShippedMigrationsAreOrdered() {
  for (const auto* set : {&heartbeat::db::sql::SqliteMigrations(), &heartbeat::db::sql::PostgresMigrations()}) {
    assert(!set->empty());
    int last = 0;
    for (const auto& m : *set) {
      assert(m.version > last);
      assert(!m.sql.empty());
      last = m.version;
    }
  }
  assert(heartbeat::db::sql::SqliteMigrations().size() == heartbeat::db::sql::PostgresMigrations().size());
}

#if HEARTBEAT_DB_SQLITE
void TestSqliteSchemaIdempotent() {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto path  = (std::filesystem::temp_directory_path() / ("heartbeat_migrations_" + std::to_string(stamp) + ".db")).string();

  {
    auto                                        db = std::make_shared<heartbeat::db::sqlite::SqliteDB>(path);
    heartbeat::db::sqlite::SqliteMigrationExecutor executor(db);
    const auto&                                 migrations = heartbeat::db::sql::SqliteMigrations();

    assert(RunMigrations(executor, migrations) == static_cast<int>(migrations.size()));
    assert(executor.CurrentVersion() == migrations.back().version);

    db->Exec("SELECT tenant,id,last_seen_ms,source_ip,user_agent,meta_json,verified FROM clients LIMIT 1;");
    db->Exec("SELECT seq,tenant,id FROM client_index LIMIT 1;");
    db->Exec("SELECT tenant,id,state,updated_at_ms FROM client_state LIMIT 1;");
    db->Exec("SELECT tenant,tier,alert_webhook_url,updated_at_ms FROM tenant_config LIMIT 1;");
    db->Exec("SELECT seq,tenant,ts_ms,source,type,entity,meta_json FROM facts LIMIT 1;");
  }

  {
    auto                                        db = std::make_shared<heartbeat::db::sqlite::SqliteDB>(path);
    heartbeat::db::sqlite::SqliteMigrationExecutor executor(db);
    assert(RunMigrations(executor, heartbeat::db::sql::SqliteMigrations()) == 0);
  }

  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}
#endif

} // namespace

int main() {
  TestAppliesOnlyPendingVersions();
  TestRejectsUnorderedVersions();
  TestShippedMigrationsAreOrdered();
#if HEARTBEAT_DB_SQLITE
  TestSqliteSchemaIdempotent();
#endif

  std::cout << "heartbeat_unit_migrations: pass\n";
  return 0;
}
