#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace usagestat::db::sqlite {

/*
  File-backed repository.

  Holds no connection: Begin() opens one per operation and the returned
  transaction owns it.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::string path, int busy_timeout_ms = 30000);

  const std::string& Path() const { return path_; }

  void EnsureSchema() override;
  uint32_t SchemaVersion(Transaction&) override;

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertUsage(Transaction&, const model::UsageDelta&) override;
  Result AddTokens(Transaction&, const std::string& name, uint64_t input_tokens, uint64_t output_tokens) override;
  std::optional<model::UsageRecord> GetUsage(Transaction&, const std::string& name) override;
  std::vector<model::UsageWithMetadata> ListUsage(Transaction&, const UsageFilter&) override;
  Result DeleteToolUsage(Transaction&, const std::string& name) override;

  Result UpsertMetadata(Transaction&, const model::MetadataRecord&) override;
  std::optional<model::MetadataRecord> GetMetadata(Transaction&, const std::string& name) override;
  std::vector<model::MetadataRecord> ListMetadata(Transaction&) override;
  std::vector<model::MetadataWithUsage> ListCatalog(Transaction&) override;
  Result DeleteMetadata(Transaction&, const std::string& name) override;

private:
  std::string path_;
  int busy_timeout_ms_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
