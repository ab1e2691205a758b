#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/metadata/entity_metadata.hpp"
#include "internal/metadata/preset_registry.hpp"
#include "internal/service/metadata_sync.hpp"
#include "internal/service/query_service.hpp"
#include "internal/service/recorder.hpp"
#include "usagestat/v1.hpp"

namespace usagestat::db {
class Repository;
}
namespace usagestat::observability {
class AuditLog;
}

namespace usagestat::core {

struct StoreOptions {
  // Audit trail file; std::nullopt disables it.
  std::optional<std::string> audit_path;

  // Passed to SyncMetadata() by SyncTools().
  bool cleanup_orphans = true;
};

/*
  UsageStore

  One instance per server. Owns the repository, the storage gate, the audit
  log and the preset registry, and wires the recorder, synchronizer and
  query service over them.

  The schema is created in the constructor (throws util::StorageError), so
  no operation can observe a missing table.

  After Close():
    - Record() / ReportTokens() are silent no-ops
    - queries throw util::QueryError
    - metadata writes throw util::StorageError
*/
class UsageStore {
 public:
  UsageStore(std::shared_ptr<usagestat::db::Repository> repository, StoreOptions options = {});
  ~UsageStore();

  UsageStore(const UsageStore&)            = delete;
  UsageStore& operator=(const UsageStore&) = delete;

  // Recording (never throws)
  bool Record(const service::Invocation& invocation) noexcept;
  bool ReportTokens(const std::string& name, uint64_t input_tokens, uint64_t output_tokens) noexcept;

  // Queries
  usagestat::v1::StatsResponse   GetStats(const usagestat::v1::StatsRequest& req = {});
  usagestat::v1::ByTypeResponse  GetByType();
  usagestat::v1::CatalogResponse GetCatalog(const usagestat::v1::CatalogRequest& req = {});

  // Metadata
  service::SyncReport SyncMetadata(const std::vector<metadata::EntityDescriptor>& entries, bool cleanup_orphans);
  void                UpdateMetadata(const std::string& name, const std::vector<std::string>& tags, const std::string& short_description,
                                     const std::optional<std::string>& full_description = std::nullopt);

  // Registration
  service::SyncReport SyncTools(const std::vector<metadata::RegisteredEntity>& tools);
  void                SyncPrompts(const std::vector<metadata::RegisteredEntity>& prompts);
  void                SyncResources(const std::vector<metadata::RegisteredEntity>& resources);
  void                RegisterMetadata(const std::string& name, const std::vector<std::string>& tags, const std::string& short_description,
                                       const std::optional<std::string>& full_description = std::nullopt);
  void                AddPreset(const std::string& name, metadata::MetadataPreset preset);

  uint32_t SchemaVersion();

  // Releases the audit file. Idempotent.
  void Close();
  bool Closed() const {
    return closed_.load();
  }

 private:
  void SyncPerEntity(const std::vector<metadata::RegisteredEntity>& entities, model::Kind kind);
  void RequireOpenForWrite(const char* op) const;

  std::shared_ptr<usagestat::db::Repository>          repository_;
  std::shared_ptr<std::mutex>                         gate_;
  std::shared_ptr<usagestat::observability::AuditLog> audit_;
  bool                                                cleanup_orphans_;

  metadata::PresetRegistry presets_;

  service::Recorder             recorder_;
  service::MetadataSynchronizer synchronizer_;
  service::QueryService         queries_;

  std::atomic<bool> closed_{false};
};

} // namespace usagestat::core
