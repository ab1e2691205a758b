#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/joined_records.hpp"
#include "internal/db/model/metadata_record.hpp"
#include "internal/db/model/usage_record.hpp"

namespace usagestat::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - UpsertUsage is a single atomic statement: a concurrent writer can never
    observe (or lose) half of a call's contribution

  The DB is the source of truth for:
    usage counters
    catalog metadata
    applied schema migrations
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Schema
  // ---------------------------------------------------------------------

  // Idempotent. Throws util::StorageError.
  virtual void EnsureSchema() = 0;

  virtual uint32_t SchemaVersion(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Usage counters
  // ---------------------------------------------------------------------

  virtual Result UpsertUsage(Transaction&, const model::UsageDelta&) = 0;

  // NotFound when no row exists for name.
  virtual Result AddTokens(Transaction&, const std::string& name, uint64_t input_tokens, uint64_t output_tokens) = 0;

  virtual std::optional<model::UsageRecord> GetUsage(Transaction&, const std::string& name) = 0;

  // Ordered by call_count DESC, last_accessed DESC.
  virtual std::vector<model::UsageWithMetadata> ListUsage(Transaction&, const UsageFilter&) = 0;

  // Deletes the usage row only when its kind is 'tool'.
  virtual Result DeleteToolUsage(Transaction&, const std::string& name) = 0;

  // ---------------------------------------------------------------------
  // Metadata
  // ---------------------------------------------------------------------

  virtual Result UpsertMetadata(Transaction&, const model::MetadataRecord&) = 0;

  virtual std::optional<model::MetadataRecord> GetMetadata(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::MetadataRecord> ListMetadata(Transaction&) = 0;

  // Unordered; callers sort.
  virtual std::vector<model::MetadataWithUsage> ListCatalog(Transaction&) = 0;

  virtual Result DeleteMetadata(Transaction&, const std::string& name) = 0;
};

} // namespace usagestat::db
