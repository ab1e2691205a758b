#include "usage_store.hpp"

#include <stdexcept>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/observability/audit_log.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace usagestat::core {

using usagestat::observability::StringField;

namespace {

service::ServiceContext MakeContext(const std::shared_ptr<db::Repository>& repository, const std::shared_ptr<std::mutex>& gate,
                                    const std::shared_ptr<observability::AuditLog>& audit) {
  if (!repository) {
    throw std::invalid_argument("UsageStore: repository is null");
  }
  service::ServiceContext ctx;
  ctx.repository = repository;
  ctx.gate       = gate;
  ctx.audit      = audit;
  return ctx;
}

} // namespace

UsageStore::UsageStore(std::shared_ptr<db::Repository> repository, StoreOptions options)
    : repository_(std::move(repository)),
      gate_(std::make_shared<std::mutex>()),
      audit_(std::make_shared<observability::AuditLog>(std::move(options.audit_path))),
      cleanup_orphans_(options.cleanup_orphans),
      recorder_(MakeContext(repository_, gate_, audit_)),
      synchronizer_(MakeContext(repository_, gate_, audit_)),
      queries_(MakeContext(repository_, gate_, audit_)) {
  std::lock_guard lock(*gate_);
  repository_->EnsureSchema();
}

UsageStore::~UsageStore() {
  Close();
}

bool UsageStore::Record(const service::Invocation& invocation) noexcept {
  if (closed_.load()) {
    return false;
  }
  return recorder_.Record(invocation);
}

bool UsageStore::ReportTokens(const std::string& name, uint64_t input_tokens, uint64_t output_tokens) noexcept {
  if (closed_.load()) {
    return false;
  }
  return recorder_.ReportTokens(name, input_tokens, output_tokens);
}

usagestat::v1::StatsResponse UsageStore::GetStats(const usagestat::v1::StatsRequest& req) {
  if (closed_.load()) {
    throw util::QueryError("store is closed");
  }
  return queries_.GetStats(req);
}

usagestat::v1::ByTypeResponse UsageStore::GetByType() {
  if (closed_.load()) {
    throw util::QueryError("store is closed");
  }
  return queries_.GetByType();
}

usagestat::v1::CatalogResponse UsageStore::GetCatalog(const usagestat::v1::CatalogRequest& req) {
  if (closed_.load()) {
    throw util::QueryError("store is closed");
  }
  return queries_.GetCatalog(req);
}

service::SyncReport UsageStore::SyncMetadata(const std::vector<metadata::EntityDescriptor>& entries, bool cleanup_orphans) {
  RequireOpenForWrite("SyncMetadata");
  return synchronizer_.SyncMetadata(entries, cleanup_orphans);
}

void UsageStore::UpdateMetadata(const std::string& name, const std::vector<std::string>& tags, const std::string& short_description,
                                const std::optional<std::string>& full_description) {
  RequireOpenForWrite("UpdateMetadata");
  synchronizer_.UpdateMetadata(name, tags, short_description, full_description);
}

service::SyncReport UsageStore::SyncTools(const std::vector<metadata::RegisteredEntity>& tools) {
  std::vector<metadata::EntityDescriptor> entries;
  entries.reserve(tools.size());
  for (const auto& tool : tools) {
    entries.push_back(metadata::BuildDescriptor(tool, model::Kind::kTool, presets_.Get(tool.name)));
  }
  return SyncMetadata(entries, cleanup_orphans_);
}

void UsageStore::SyncPrompts(const std::vector<metadata::RegisteredEntity>& prompts) {
  SyncPerEntity(prompts, model::Kind::kPrompt);
}

void UsageStore::SyncResources(const std::vector<metadata::RegisteredEntity>& resources) {
  SyncPerEntity(resources, model::Kind::kResource);
}

void UsageStore::SyncPerEntity(const std::vector<metadata::RegisteredEntity>& entities, model::Kind kind) {
  for (const auto& entity : entities) {
    const auto entry = metadata::BuildDescriptor(entity, kind, presets_.Get(entity.name));
    UpdateMetadata(entry.name, entry.tags, entry.short_description, entry.description);
  }
}

void UsageStore::RegisterMetadata(const std::string& name, const std::vector<std::string>& tags, const std::string& short_description,
                                  const std::optional<std::string>& full_description) {
  UpdateMetadata(name, tags, short_description, full_description);
}

void UsageStore::AddPreset(const std::string& name, metadata::MetadataPreset preset) {
  presets_.Put(name, std::move(preset));
}

uint32_t UsageStore::SchemaVersion() {
  if (closed_.load()) {
    throw util::QueryError("store is closed");
  }
  try {
    std::lock_guard lock(*gate_);
    auto            tx      = repository_->Begin();
    const auto      version = repository_->SchemaVersion(*tx);
    tx->Commit();
    return version;
  } catch (const std::exception& ex) {
    throw util::QueryError(std::string("schema version: ") + ex.what());
  }
}

void UsageStore::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  // waits for an in-flight operation
  std::lock_guard lock(*gate_);
  audit_->Close();
  USAGESTAT_LOG_DEBUG("usage store closed", {StringField("audit", audit_->Path().value_or(""))});
}

void UsageStore::RequireOpenForWrite(const char* op) const {
  if (closed_.load()) {
    throw util::StorageError(std::string(op) + ": store is closed");
  }
}

} // namespace usagestat::core
