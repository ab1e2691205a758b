#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace usagestat::db::sql {

// Highest migration version known to this build.
constexpr uint32_t kCurrentSchemaVersion = 2;

/*
  Additive, column-level migrations.

  A migration never drops, renames or reorders anything. Every step is
  check-before-add, so the full list can run on every startup.
*/

struct ColumnAddition {
  std::string table;
  std::string column;
  // type + constraints, e.g. "INTEGER NOT NULL DEFAULT 0"
  std::string definition;
};

struct Migration {
  uint32_t                    version = 0;
  std::vector<ColumnAddition> columns;
};

/*
  Backend-specific hooks used by RunMigrations().
*/
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual bool HasColumn(const std::string& table, const std::string& column) = 0;

  // Records that version has been applied. Must tolerate repeats.
  virtual void MarkApplied(uint32_t version) = 0;
};

// Runs migrations in ascending version order. Returns the number of
// columns actually added.
std::size_t RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

// ALTER TABLE <table> ADD COLUMN <column> <definition>;
std::string AddColumnSql(const ColumnAddition& addition);

} // namespace usagestat::db::sql
