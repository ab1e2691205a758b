#include "invocation_scope.hpp"

#include "internal/core/usage_store.hpp"

namespace usagestat::instrument {

InvocationScope::InvocationScope(usagestat::core::UsageStore& store, std::string name, model::Kind kind)
    : store_(store), name_(std::move(name)), kind_(kind), started_at_(std::chrono::steady_clock::now()) {
}

InvocationScope::~InvocationScope() {
  const auto elapsed = std::chrono::steady_clock::now() - started_at_;

  service::Invocation invocation;
  invocation.name           = name_;
  invocation.kind           = kind_;
  invocation.success        = success_;
  invocation.error_msg      = error_msg_;
  invocation.response_chars = response_chars_;
  invocation.input_tokens   = input_tokens_;
  invocation.output_tokens  = output_tokens_;
  invocation.duration_ms    = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

  store_.Record(invocation);
}

void InvocationScope::MarkFailed(std::string_view error_msg) {
  success_   = false;
  error_msg_ = std::string(error_msg);
}

void InvocationScope::SetResponseChars(uint64_t chars) {
  response_chars_ = chars;
}

void InvocationScope::SetTokens(uint64_t input_tokens, uint64_t output_tokens) {
  input_tokens_  = input_tokens;
  output_tokens_ = output_tokens;
}

} // namespace usagestat::instrument
