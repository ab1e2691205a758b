#include "factory.hpp"

#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"

namespace usagestat::factory {

using usagestat::observability::BoolField;
using usagestat::observability::IntField;
using usagestat::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const usagestat::runtime::config::RuntimeConfig& config) {
  const auto& storage = config.storage();
  const auto  path    = storage.path().empty() ? std::string(config::kDefaultDbPath) : storage.path();
  const auto  timeout = storage.busy_timeout_ms() == 0 ? config::kDefaultBusyTimeoutMs : storage.busy_timeout_ms();

  return std::make_shared<db::sqlite::SqliteRepository>(path, static_cast<int>(timeout));
}

std::unique_ptr<core::UsageStore> BuildStore(const usagestat::runtime::config::RuntimeConfig& config) {
  core::StoreOptions options;
  if (config.audit().enabled()) {
    options.audit_path = config.audit().path().empty() ? std::string(config::kDefaultAuditLogPath) : config.audit().path();
  }
  options.cleanup_orphans = !config.sync().has_cleanup_orphans() || config.sync().cleanup_orphans();

  auto store = std::make_unique<core::UsageStore>(BuildRepository(config), options);

  for (const auto& preset : config.presets()) {
    if (preset.name().empty()) {
      USAGESTAT_LOG_WARN("ignoring preset without name");
      continue;
    }
    store->AddPreset(preset.name(), metadata::MetadataPreset{{preset.tags().begin(), preset.tags().end()}, preset.short_description()});
  }

  USAGESTAT_LOG_INFO("usage store ready",
                     {StringField("server", config.server_name()), StringField("db", config.storage().path()),
                      BoolField("audit", options.audit_path.has_value()), IntField("presets", config.presets_size())});
  return store;
}

} // namespace usagestat::factory
