#include <sqlite3.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/errors.hpp"

namespace {

using usagestat::db::model::UsageDelta;
using usagestat::db::sqlite::SchemaManager;
using usagestat::db::sqlite::SqliteDB;
using usagestat::db::sqlite::SqliteRepository;

std::string TempDbPath(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "usagestat_schema_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (test_name + ".sqlite");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
  return path.string();
}

std::vector<std::string> Columns(SqliteDB& db, const std::string& table) {
  std::vector<std::string> out;
  auto                     st = db.Prepare("PRAGMA table_info(" + table + ");");
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 1)));
  }
  return out;
}

std::vector<std::string> Indexes(SqliteDB& db) {
  std::vector<std::string> out;
  auto st = db.Prepare("SELECT name FROM sqlite_master WHERE type='index' AND name LIKE 'idx_usage_%' ORDER BY name;");
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 0)));
  }
  return out;
}

void TestFreshDatabaseGetsFullSchema() {
  const auto path = TempDbPath("fresh");

  SqliteRepository repo(path);
  repo.EnsureSchema();

  SqliteDB   db(path, 1000);
  const auto usage_columns = Columns(db, "usage_stats");
  assert(usage_columns.size() == 12);
  assert(usage_columns.front() == "name");
  assert(usage_columns.back() == "max_duration_ms");

  const auto metadata_columns = Columns(db, "usage_metadata");
  assert((metadata_columns ==
          std::vector<std::string>{"name", "tags", "short_description", "full_description", "schema_version", "updated_at"}));

  assert((Indexes(db) == std::vector<std::string>{"idx_usage_stats_call_count", "idx_usage_stats_kind"}));
  assert(SchemaManager(db).AppliedVersion() == usagestat::db::sql::kCurrentSchemaVersion);
}

void TestEnsureSchemaIsIdempotent() {
  const auto path = TempDbPath("idempotent");

  SqliteRepository repo(path);
  repo.EnsureSchema();

  {
    auto       tx = repo.Begin();
    UsageDelta delta;
    delta.name        = "get_weather";
    delta.kind        = "tool";
    delta.accessed_at = "2026-01-01T00:00:00+00:00";
    assert(repo.UpsertUsage(*tx, delta));
    tx->Commit();
  }

  for (int i = 0; i < 5; ++i) {
    repo.EnsureSchema();
  }

  SqliteDB db(path, 1000);
  assert(Columns(db, "usage_stats").size() == 12);
  assert(Indexes(db).size() == 2);

  auto tx    = repo.Begin();
  auto usage = repo.GetUsage(*tx, "get_weather");
  assert(usage.has_value());
  assert(usage->call_count == 1);
  assert(repo.ListUsage(*tx, {}).size() == 1);
  assert(repo.SchemaVersion(*tx) == usagestat::db::sql::kCurrentSchemaVersion);
}

void TestLegacyLayoutIsUpgradedInPlace() {
  const auto path = TempDbPath("legacy");

  {
    SqliteDB db(path, 1000);
    db.Exec("CREATE TABLE usage_stats (name TEXT PRIMARY KEY, last_accessed TEXT NOT NULL);");
    db.Exec("CREATE TABLE usage_metadata (name TEXT PRIMARY KEY, tags TEXT NOT NULL DEFAULT '', "
            "short_description TEXT NOT NULL DEFAULT '', updated_at TEXT NOT NULL);");
    db.Exec("INSERT INTO usage_stats(name, last_accessed) VALUES('old_tool', '2024-05-01T12:00:00+00:00');");
    db.Exec("INSERT INTO usage_metadata(name, tags, short_description, updated_at) "
            "VALUES('old_tool', 'legacy,api', 'Old tool', '2024-05-01T12:00:00+00:00');");
  }

  SqliteRepository repo(path);
  repo.EnsureSchema();

  {
    SqliteDB db(path, 1000);
    assert(Columns(db, "usage_stats").size() == 12);
    assert(Columns(db, "usage_metadata").size() == 6);
  }

  auto tx    = repo.Begin();
  auto usage = repo.GetUsage(*tx, "old_tool");
  assert(usage.has_value());
  assert(usage->kind == "tool");
  assert(usage->call_count == 0);
  assert(usage->last_accessed == "2024-05-01T12:00:00+00:00");
  assert(!usage->min_duration_ms.has_value());

  auto metadata = repo.GetMetadata(*tx, "old_tool");
  assert(metadata.has_value());
  assert(metadata->tags == "legacy,api");
  assert(metadata->full_description.empty());
  assert(metadata->schema_version == 1);

  UsageDelta delta;
  delta.name        = "old_tool";
  delta.kind        = "tool";
  delta.accessed_at = "2026-01-01T00:00:00+00:00";
  delta.duration_ms = 7;
  assert(repo.UpsertUsage(*tx, delta));

  usage = repo.GetUsage(*tx, "old_tool");
  assert(usage->call_count == 1);
  assert(usage->min_duration_ms == 7u);
  tx->Commit();
}

// Records every step so ordering and check-before-add can be asserted.
class FakeExecutor final : public usagestat::db::sql::MigrationExecutor {
 public:
  std::vector<std::string> existing;
  std::vector<std::string> executed;
  std::vector<uint32_t>    applied;

  void ExecuteSQL(const std::string& sql) override {
    executed.push_back(sql);
  }

  bool HasColumn(const std::string& table, const std::string& column) override {
    for (const auto& name : existing) {
      if (name == table + "." + column) return true;
    }
    return false;
  }

  void MarkApplied(uint32_t version) override {
    applied.push_back(version);
  }
};

void TestRunMigrationsSkipsExistingColumns() {
  using usagestat::db::sql::Migration;

  const std::vector<Migration> migrations = {
      {1, {{"t", "a", "INTEGER"}, {"t", "b", "TEXT"}}},
      {2, {{"t", "c", "INTEGER NOT NULL DEFAULT 0"}}},
  };

  FakeExecutor executor;
  executor.existing = {"t.a"};

  const auto added = usagestat::db::sql::RunMigrations(executor, migrations);
  assert(added == 2);
  assert((executor.executed ==
          std::vector<std::string>{"ALTER TABLE t ADD COLUMN b TEXT;", "ALTER TABLE t ADD COLUMN c INTEGER NOT NULL DEFAULT 0;"}));
  assert((executor.applied == std::vector<uint32_t>{1, 2}));
}

void TestRunMigrationsRejectsUnorderedVersions() {
  using usagestat::db::sql::Migration;

  const std::vector<Migration> migrations = {{2, {}}, {1, {}}};
  FakeExecutor                 executor;

  bool threw = false;
  try {
    usagestat::db::sql::RunMigrations(executor, migrations);
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void TestUnwritableLocationRaisesStorageError() {
  const auto blocker = std::filesystem::temp_directory_path() / "usagestat_schema_tests" / "blocker_file";
  std::filesystem::create_directories(blocker.parent_path());
  std::ofstream(blocker.string()) << "not a directory";

  // parent "directory" is a regular file
  SqliteRepository repo((blocker / "nested" / "db.sqlite").string());

  bool threw = false;
  try {
    repo.EnsureSchema();
  } catch (const usagestat::util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFreshDatabaseGetsFullSchema();
  TestEnsureSchemaIsIdempotent();
  TestLegacyLayoutIsUpgradedInPlace();
  TestRunMigrationsSkipsExistingColumns();
  TestRunMigrationsRejectsUnorderedVersions();
  TestUnwritableLocationRaisesStorageError();

  std::cout << "usagestat_unit_schema_manager: pass\n";
  return 0;
}
