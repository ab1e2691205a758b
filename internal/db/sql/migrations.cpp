#include "migrations.hpp"

#include <stdexcept>

namespace usagestat::db::sql {

std::string AddColumnSql(const ColumnAddition& addition) {
  return "ALTER TABLE " + addition.table + " ADD COLUMN " + addition.column + " " + addition.definition + ";";
}

std::size_t RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  std::size_t added        = 0;
  uint32_t    last_version = 0;

  for (const auto& migration : ordered) {
    if (migration.version <= last_version) {
      throw std::logic_error("migrations must be strictly ascending at version " + std::to_string(migration.version));
    }
    last_version = migration.version;

    for (const auto& column : migration.columns) {
      if (executor.HasColumn(column.table, column.column)) {
        continue;
      }
      executor.ExecuteSQL(AddColumnSql(column));
      ++added;
    }

    executor.MarkApplied(migration.version);
  }

  return added;
}

} // namespace usagestat::db::sql
