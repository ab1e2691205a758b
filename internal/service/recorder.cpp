#include "recorder.hpp"

#include <algorithm>
#include <exception>
#include <limits>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "internal/observability/audit_log.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace usagestat::service {

using usagestat::observability::IntField;
using usagestat::observability::StringField;

uint64_t EstimateTokens(uint64_t response_chars) {
  if (response_chars == 0) {
    return 0;
  }
  // floor(chars / 3.5) == floor(2 * chars / 7)
  return std::max<uint64_t>(1, (response_chars * 2) / 7);
}

namespace {

constexpr uint64_t kMaxDelta = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

// SQLite integers are signed 64-bit.
bool FitsColumn(const std::optional<uint64_t>& value) {
  return !value || *value <= kMaxDelta;
}

} // namespace

Recorder::Recorder(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

bool Recorder::Record(const Invocation& invocation) noexcept {
  const auto kind = model::ToString(invocation.kind);

  try {
    if (ctx_.audit) {
      ctx_.audit->Write(invocation.name, kind, invocation.success, invocation.error_msg);
    }
  } catch (const std::exception& ex) {
    USAGESTAT_LOG_WARN("audit write failed", {StringField("name", invocation.name), StringField("error", ex.what())});
  }

  if (!FitsColumn(invocation.response_chars) || !FitsColumn(invocation.input_tokens) || !FitsColumn(invocation.output_tokens) ||
      !FitsColumn(invocation.duration_ms)) {
    USAGESTAT_LOG_WARN("usage delta out of range, call not stored", {StringField("name", invocation.name), StringField("kind", kind)});
    return false;
  }

  try {
    db::model::UsageDelta delta;
    delta.name             = invocation.name;
    delta.kind             = std::string(kind);
    delta.accessed_at      = util::NowIso8601();
    delta.input_tokens     = invocation.input_tokens.value_or(0);
    delta.output_tokens    = invocation.output_tokens.value_or(0);
    delta.response_chars   = invocation.response_chars.value_or(0);
    delta.estimated_tokens = EstimateTokens(delta.response_chars);
    delta.duration_ms      = invocation.duration_ms;

    std::lock_guard lock(*ctx_.gate);

    auto tx     = ctx_.repository->Begin();
    auto result = ctx_.repository->UpsertUsage(*tx, delta);
    if (!result) {
      USAGESTAT_LOG_ERROR("usage tracking failed", {StringField("name", invocation.name), StringField("kind", kind),
                                                    IntField("code", static_cast<int64_t>(result.code)),
                                                    StringField("error", result.message)});
      return false;
    }
    tx->Commit();
    return true;
  } catch (const std::exception& ex) {
    USAGESTAT_LOG_ERROR("usage tracking failed", {StringField("name", invocation.name), StringField("kind", kind),
                                                  StringField("error", ex.what())});
  }
  return false;
}

bool Recorder::ReportTokens(const std::string& name, uint64_t input_tokens, uint64_t output_tokens) noexcept {
  if (input_tokens > kMaxDelta || output_tokens > kMaxDelta) {
    USAGESTAT_LOG_WARN("token report out of range, ignored", {StringField("name", name)});
    return false;
  }

  try {
    std::lock_guard lock(*ctx_.gate);

    auto tx     = ctx_.repository->Begin();
    auto result = ctx_.repository->AddTokens(*tx, name, input_tokens, output_tokens);
    if (result.code == db::ErrorCode::NotFound) {
      USAGESTAT_LOG_DEBUG("token report for untracked name ignored", {StringField("name", name)});
      return false;
    }
    if (!result) {
      USAGESTAT_LOG_ERROR("token reporting failed", {StringField("name", name), StringField("error", result.message)});
      return false;
    }
    tx->Commit();
    return true;
  } catch (const std::exception& ex) {
    USAGESTAT_LOG_ERROR("token reporting failed", {StringField("name", name), StringField("error", ex.what())});
  }
  return false;
}

} // namespace usagestat::service
