#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/sql/migrations.hpp"
#include "sqlite_db.hpp"

namespace usagestat::db::sqlite {

/*
  Ordered column-additive migrations.

  v1: counter-only usage layout + metadata
  v2: token, response-size and latency counters
*/
const std::vector<sql::Migration>& SchemaMigrations();

/*
  Creates tables and indexes, then applies SchemaMigrations().

  Idempotent: running it any number of times leaves the same schema and
  data as running it once.
*/
class SchemaManager {
 public:
  explicit SchemaManager(SqliteDB& db);

  void Apply();

  uint32_t AppliedVersion();

 private:
  SqliteDB& db_;
};

} // namespace usagestat::db::sqlite
