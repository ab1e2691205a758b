#include "metadata_sync.hpp"

#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"

namespace usagestat::service {

using usagestat::observability::IntField;
using usagestat::observability::StringField;

namespace {

void ThrowIfDbError(const usagestat::db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  throw usagestat::util::StorageError(prefix + ": " + result.message);
}

std::string StoredTags(const metadata::EntityDescriptor& entry) {
  auto tags = util::NormalizeTags(entry.tags);
  if (tags.empty()) {
    tags.push_back(util::ToLower(entry.name));
  }
  return util::TagsToString(tags);
}

bool SameContent(const db::model::MetadataRecord& a, const db::model::MetadataRecord& b) {
  return a.tags == b.tags && a.short_description == b.short_description && a.full_description == b.full_description &&
         a.schema_version == b.schema_version;
}

} // namespace

MetadataSynchronizer::MetadataSynchronizer(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SyncReport MetadataSynchronizer::SyncMetadata(const std::vector<metadata::EntityDescriptor>& entries, bool cleanup_orphans) {
  SyncReport report;
  const auto now = util::NowIso8601();

  std::lock_guard lock(*ctx_.gate);

  try {
    auto tx = ctx_.repository->Begin();

    std::unordered_map<std::string, db::model::MetadataRecord> existing;
    for (auto& record : ctx_.repository->ListMetadata(*tx)) {
      auto name = record.name;
      existing.emplace(std::move(name), std::move(record));
    }

    std::unordered_set<std::string> known;
    for (const auto& entry : entries) {
      known.insert(entry.name);

      db::model::MetadataRecord desired;
      desired.name              = entry.name;
      desired.tags              = StoredTags(entry);
      desired.short_description = entry.short_description;
      desired.full_description  = entry.description;
      desired.schema_version    = db::sql::kCurrentSchemaVersion;
      desired.updated_at        = now;

      auto it = existing.find(entry.name);
      if (it != existing.end() && SameContent(it->second, desired)) {
        ++report.unchanged;
        continue;
      }

      ThrowIfDbError(ctx_.repository->UpsertMetadata(*tx, desired), "sync metadata " + entry.name);
      if (it == existing.end()) {
        ++report.inserted;
        // a repeated name in entries compares against what was just written
        existing.emplace(entry.name, desired);
      } else {
        ++report.updated;
        it->second = desired;
      }
    }

    if (cleanup_orphans) {
      for (const auto& [name, record] : existing) {
        if (known.count(name)) {
          continue;
        }
        ThrowIfDbError(ctx_.repository->DeleteMetadata(*tx, name), "delete orphan metadata " + name);
        ThrowIfDbError(ctx_.repository->DeleteToolUsage(*tx, name), "delete orphan usage " + name);
        ++report.orphans_removed;
      }
    }

    tx->Commit();
  } catch (const util::StorageError&) {
    throw;
  } catch (const std::exception& ex) {
    throw util::StorageError(std::string("sync metadata: ") + ex.what());
  }

  USAGESTAT_LOG_DEBUG("metadata synced", {IntField("inserted", static_cast<int64_t>(report.inserted)),
                                          IntField("updated", static_cast<int64_t>(report.updated)),
                                          IntField("orphans_removed", static_cast<int64_t>(report.orphans_removed))});
  return report;
}

void MetadataSynchronizer::UpdateMetadata(const std::string& name, const std::vector<std::string>& tags,
                                          const std::string& short_description,
                                          const std::optional<std::string>& full_description) {
  db::model::MetadataRecord record;
  record.name              = name;
  record.tags              = util::TagsToString(util::NormalizeTags(tags));
  record.short_description = short_description;
  record.full_description  = full_description.value_or("");
  record.schema_version    = db::sql::kCurrentSchemaVersion;
  record.updated_at        = util::NowIso8601();

  std::lock_guard lock(*ctx_.gate);

  try {
    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->UpsertMetadata(*tx, record), "update metadata " + name);
    tx->Commit();
  } catch (const util::StorageError&) {
    throw;
  } catch (const std::exception& ex) {
    throw util::StorageError("update metadata " + name + ": " + ex.what());
  }
}

} // namespace usagestat::service
