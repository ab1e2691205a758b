#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace usagestat::db {

struct UsageFilter {
  std::optional<std::string> kind;
  bool                       include_zero = true;
  // 0 = unlimited
  std::size_t limit = 0;
};

} // namespace usagestat::db
