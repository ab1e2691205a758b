#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace usagestat::db::model {

/*
  Persistent usage row (one per entity name).

  IMPORTANT:
  - Cumulative counters only ever grow.
  - min/max duration stay empty until a call reports a duration.
  - Timestamps are ISO-8601 UTC strings, second precision.
*/

struct UsageRecord {
  std::string name;
  std::string kind = "tool";

  uint64_t call_count = 0;

  std::string last_accessed;
  std::string created_at;

  uint64_t total_input_tokens   = 0;
  uint64_t total_output_tokens  = 0;
  uint64_t total_response_chars = 0;
  uint64_t estimated_tokens     = 0;
  uint64_t total_duration_ms    = 0;

  std::optional<uint64_t> min_duration_ms;
  std::optional<uint64_t> max_duration_ms;
};

/*
  Per-call contribution applied by the upsert.
  Absent counters contribute 0; an absent duration leaves extrema untouched.
*/
struct UsageDelta {
  std::string name;
  std::string kind;
  std::string accessed_at;

  uint64_t input_tokens     = 0;
  uint64_t output_tokens    = 0;
  uint64_t response_chars   = 0;
  uint64_t estimated_tokens = 0;

  std::optional<uint64_t> duration_ms;
};

} // namespace usagestat::db::model
