#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/model/kind.hpp"

namespace usagestat::core {
class UsageStore;
}

namespace usagestat::instrument {

/*
  Records one invocation when it goes out of scope: success unless
  MarkFailed() was called, duration measured on steady_clock since
  construction.

  Recording never throws, so the destructor is safe during unwinding.
*/
class InvocationScope {
 public:
  InvocationScope(usagestat::core::UsageStore& store, std::string name, model::Kind kind = model::Kind::kTool);
  ~InvocationScope();

  InvocationScope(const InvocationScope&)            = delete;
  InvocationScope& operator=(const InvocationScope&) = delete;

  void MarkFailed(std::string_view error_msg);
  void SetResponseChars(uint64_t chars);
  void SetTokens(uint64_t input_tokens, uint64_t output_tokens);

 private:
  usagestat::core::UsageStore&          store_;
  std::string                           name_;
  model::Kind                           kind_;
  std::chrono::steady_clock::time_point started_at_;

  bool                    success_ = true;
  std::string             error_msg_;
  std::optional<uint64_t> response_chars_;
  std::optional<uint64_t> input_tokens_;
  std::optional<uint64_t> output_tokens_;
};

/*
  Runs fn and records it. The callable's exception is recorded as a failure
  and rethrown; its return value is passed through.

    auto weather = MeasuredInvocation(store, "get_weather", Kind::kTool,
                                      [&] { return FetchWeather(city); });
*/
template <typename Fn>
auto MeasuredInvocation(usagestat::core::UsageStore& store, std::string name, model::Kind kind, Fn&& fn) -> std::invoke_result_t<Fn&> {
  InvocationScope scope(store, std::move(name), kind);
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
      fn();
    } else {
      return fn();
    }
  } catch (const std::exception& ex) {
    scope.MarkFailed(ex.what());
    throw;
  } catch (...) {
    scope.MarkFailed("unknown exception");
    throw;
  }
}

} // namespace usagestat::instrument
