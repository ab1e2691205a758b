#include "sqlite_schema.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace usagestat::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  bool HasColumn(const std::string& table, const std::string& column) override {
    auto st = db_.Prepare("PRAGMA table_info(" + table + ");");

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      const unsigned char* name = sqlite3_column_text(st.get(), 1);
      if (name && column == reinterpret_cast<const char*>(name)) {
        return true;
      }
    }
    if (rc != SQLITE_DONE) {
      throw std::runtime_error("table_info " + table + ": " + sqlite3_errmsg(db_.Handle()));
    }
    return false;
  }

  void MarkApplied(uint32_t version) override {
    auto st = db_.Prepare(sql::MARK_MIGRATION_APPLIED);
    sqlite3_bind_int64(st.get(), 1, version);

    const auto now = util::NowIso8601();
    sqlite3_bind_text(st.get(), 2, now.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(st.get()) != SQLITE_DONE) {
      throw std::runtime_error("record migration " + std::to_string(version) + ": " + sqlite3_errmsg(db_.Handle()));
    }
  }

 private:
  SqliteDB& db_;
};

} // namespace

const std::vector<sql::Migration>& SchemaMigrations() {
  static const std::vector<sql::Migration> kMigrations = {
      {1,
       {
           {"usage_stats", "kind", "TEXT NOT NULL DEFAULT 'tool'"},
           {"usage_stats", "call_count", "INTEGER NOT NULL DEFAULT 0"},
           {"usage_stats", "created_at", "TEXT NOT NULL DEFAULT ''"},
           {"usage_metadata", "full_description", "TEXT DEFAULT ''"},
           {"usage_metadata", "schema_version", "INTEGER NOT NULL DEFAULT 1"},
       }},
      {2,
       {
           {"usage_stats", "total_input_tokens", "INTEGER NOT NULL DEFAULT 0"},
           {"usage_stats", "total_output_tokens", "INTEGER NOT NULL DEFAULT 0"},
           {"usage_stats", "total_response_chars", "INTEGER NOT NULL DEFAULT 0"},
           {"usage_stats", "estimated_tokens", "INTEGER NOT NULL DEFAULT 0"},
           {"usage_stats", "total_duration_ms", "INTEGER NOT NULL DEFAULT 0"},
           {"usage_stats", "min_duration_ms", "INTEGER"},
           {"usage_stats", "max_duration_ms", "INTEGER"},
       }},
  };
  return kMigrations;
}

SchemaManager::SchemaManager(SqliteDB& db) : db_(db) {
}

void SchemaManager::Apply() {
  db_.Exec("BEGIN IMMEDIATE;");
  try {
    db_.Exec(sql::CREATE_USAGE_TABLE);
    db_.Exec(sql::CREATE_METADATA_TABLE);
    db_.Exec(sql::CREATE_MIGRATIONS_TABLE);

    // Columns must exist before indexes reference them on legacy files.
    SqliteMigrationExecutor executor(db_);
    const auto              added = sql::RunMigrations(executor, SchemaMigrations());

    db_.Exec(sql::CREATE_KIND_INDEX);
    db_.Exec(sql::CREATE_CALL_COUNT_INDEX);

    db_.Exec("COMMIT;");

    if (added > 0) {
      USAGESTAT_LOG_INFO("schema migrated", {observability::StringField("path", db_.Path()),
                                             observability::IntField("columns_added", static_cast<int64_t>(added)),
                                             observability::IntField("version", sql::kCurrentSchemaVersion)});
    }
  } catch (...) {
    sqlite3_exec(db_.Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

uint32_t SchemaManager::AppliedVersion() {
  auto st = db_.Prepare(sql::SELECT_SCHEMA_VERSION);
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("schema version: ") + sqlite3_errmsg(db_.Handle()));
  }
  return static_cast<uint32_t>(sqlite3_column_int64(st.get(), 0));
}

} // namespace usagestat::db::sqlite
