#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace usagestat::observability {

/*
  Optional file audit trail, one line per recorded invocation:

    2026-01-01T10:30:45|tool:get_weather|OK
    2026-01-01T10:31:00|tool:unknown_tool|FAIL|Unknown tool

  Disabled when constructed without a path; Write() is then a no-op.
  Thread-safe.
*/
class AuditLog {
 public:
  static constexpr std::size_t kMaxErrorLength = 100;

  explicit AuditLog(std::optional<std::string> path = std::nullopt);
  ~AuditLog();

  AuditLog(const AuditLog&)            = delete;
  AuditLog& operator=(const AuditLog&) = delete;

  bool Enabled() const;

  const std::optional<std::string>& Path() const {
    return path_;
  }

  void Write(std::string_view name, std::string_view kind, bool success, std::string_view error_msg = {});

  // Flushes and releases the file. Idempotent.
  void Close();

  // "<kind>:<name>|OK" / "<kind>:<name>|FAIL|<error>"
  static std::string FormatEntry(std::string_view name, std::string_view kind, bool success, std::string_view error_msg);

 private:
  std::optional<std::string>      path_;
  mutable std::mutex              mutex_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace usagestat::observability
