#pragma once

#include <optional>

#include "internal/db/model/metadata_record.hpp"
#include "internal/db/model/usage_record.hpp"

namespace usagestat::db::model {

// usage LEFT JOIN metadata
struct UsageWithMetadata {
  UsageRecord                   usage;
  std::optional<MetadataRecord> metadata;
};

// metadata LEFT JOIN usage
struct MetadataWithUsage {
  MetadataRecord             metadata;
  std::optional<UsageRecord> usage;
};

} // namespace usagestat::db::model
