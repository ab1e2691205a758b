#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace usagestat::model {

// Primitive type of a tracked entity.
enum class Kind : std::uint8_t {
  kTool     = 0,
  kPrompt   = 1,
  kResource = 2,
};

constexpr std::string_view ToString(Kind kind) {
  switch (kind) {
    case Kind::kPrompt:
      return "prompt";
    case Kind::kResource:
      return "resource";
    case Kind::kTool:
    default:
      return "tool";
  }
}

constexpr std::optional<Kind> ParseKind(std::string_view value) {
  if (value == "tool") {
    return Kind::kTool;
  }
  if (value == "prompt") {
    return Kind::kPrompt;
  }
  if (value == "resource") {
    return Kind::kResource;
  }
  return std::nullopt;
}

} // namespace usagestat::model
