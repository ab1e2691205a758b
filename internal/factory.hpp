#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/usage_store.hpp"
#include "internal/db/api/repository.hpp"

namespace usagestat::factory {

/*
  BuildRepository / BuildStore

  Composition root. The only place allowed to know concrete DB types.

  BuildStore expects a config that already went through
  ConfigLoader::ApplyDefaults(); it registers the configured presets and
  creates the schema (throws util::StorageError).
*/
std::shared_ptr<db::Repository> BuildRepository(const usagestat::runtime::config::RuntimeConfig& config);

std::unique_ptr<core::UsageStore> BuildStore(const usagestat::runtime::config::RuntimeConfig& config);

} // namespace usagestat::factory
