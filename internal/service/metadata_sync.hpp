#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/metadata/entity_metadata.hpp"
#include "service_context.hpp"

namespace usagestat::service {

// Counts of what one SyncMetadata() call changed.
struct SyncReport {
  std::size_t inserted  = 0;
  std::size_t updated   = 0;
  std::size_t unchanged = 0;
  std::size_t orphans_removed = 0;
};

/*
  Reconciles stored catalog metadata with the caller's known entities.

  Writes propagate failures as util::StorageError.
*/
class MetadataSynchronizer {
public:
  explicit MetadataSynchronizer(ServiceContext ctx);

  /*
    Inserts missing names, rewrites existing ones only when tags,
    descriptions or schema version differ. With cleanup_orphans, removes
    metadata for every name not in entries plus the usage rows of those
    names whose kind is 'tool'. One transaction.
  */
  SyncReport SyncMetadata(const std::vector<metadata::EntityDescriptor>& entries, bool cleanup_orphans);

  // Unconditional single-entity upsert.
  void UpdateMetadata(const std::string& name, const std::vector<std::string>& tags, const std::string& short_description,
                      const std::optional<std::string>& full_description = std::nullopt);

private:
  ServiceContext ctx_;
};

}
