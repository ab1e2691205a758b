#pragma once

#include <cstdint>
#include <string>

namespace usagestat::db::model {

/*
  Catalog metadata for an entity.

  Lifecycle is independent from UsageRecord: a name may have metadata
  without usage and usage without metadata.
*/

struct MetadataRecord {
  std::string name;

  // comma-joined normalized tags
  std::string tags;

  std::string short_description;
  std::string full_description;

  // schema version current when the content last changed
  uint32_t schema_version = 0;

  std::string updated_at;
};

} // namespace usagestat::db::model
