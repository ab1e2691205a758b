#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/kind.hpp"
#include "service_context.hpp"

namespace usagestat::service {

// One handler invocation as reported by the caller.
struct Invocation {
  std::string name;
  model::Kind kind    = model::Kind::kTool;
  bool        success = true;
  std::string error_msg;

  std::optional<uint64_t> response_chars;
  std::optional<uint64_t> input_tokens;
  std::optional<uint64_t> output_tokens;
  std::optional<uint64_t> duration_ms;
};

// max(1, floor(chars / 3.5)) for chars > 0, else 0
uint64_t EstimateTokens(uint64_t response_chars);

/*
  Hot-path writer.

  Record() and ReportTokens() never throw: storage failures are logged at
  error level and dropped so instrumentation can never fail a handler.

  Deltas above INT64_MAX are rejected (returns false, nothing stored).
  Stored sums saturate at INT64_MAX.
*/
class Recorder {
public:
  explicit Recorder(ServiceContext ctx);

  // Returns true when the counters were stored.
  bool Record(const Invocation& invocation) noexcept;

  // Adds tokens without counting a call. Unknown names are a no-op
  // (returns false).
  bool ReportTokens(const std::string& name, uint64_t input_tokens, uint64_t output_tokens) noexcept;

private:
  ServiceContext ctx_;
};

}
