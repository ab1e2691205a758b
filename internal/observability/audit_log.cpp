#include "internal/observability/audit_log.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include "internal/observability/logging.hpp"

namespace usagestat::observability {

AuditLog::AuditLog(std::optional<std::string> path) : path_(std::move(path)) {
  if (!path_) {
    return;
  }

  const std::filesystem::path file(*path_);
  if (file.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
  }

  try {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*path_);
    // not registered: several stores may audit to different files
    logger_ = std::make_shared<spdlog::logger>("usagestat.audit", std::move(sink));
    logger_->set_pattern("%Y-%m-%dT%H:%M:%S|%v", spdlog::pattern_time_type::utc);
    logger_->set_level(spdlog::level::info);
    logger_->flush_on(spdlog::level::info);
  } catch (const spdlog::spdlog_ex& ex) {
    USAGESTAT_LOG_WARN("audit log disabled", {StringField("path", *path_), StringField("error", ex.what())});
    logger_.reset();
  }
}

AuditLog::~AuditLog() {
  Close();
}

bool AuditLog::Enabled() const {
  std::lock_guard lock(mutex_);
  return logger_ != nullptr;
}

std::string AuditLog::FormatEntry(std::string_view name, std::string_view kind, bool success, std::string_view error_msg) {
  std::string entry;
  entry.reserve(kind.size() + name.size() + 8 + std::min(error_msg.size(), kMaxErrorLength));
  entry.append(kind).append(":").append(name).append(success ? "|OK" : "|FAIL");

  if (!error_msg.empty()) {
    entry.append("|").append(error_msg.substr(0, kMaxErrorLength));
  }
  return entry;
}

void AuditLog::Write(std::string_view name, std::string_view kind, bool success, std::string_view error_msg) {
  std::lock_guard lock(mutex_);
  if (!logger_) {
    return;
  }
  logger_->info(FormatEntry(name, kind, success, error_msg));
}

void AuditLog::Close() {
  std::lock_guard lock(mutex_);
  if (logger_) {
    logger_->flush();
    logger_.reset();
  }
}

} // namespace usagestat::observability
