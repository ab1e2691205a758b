#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/usage_store.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using usagestat::model::Kind;
using usagestat::service::Invocation;

std::filesystem::path TempDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "usagestat_integration_tests" / test_name;
  std::filesystem::remove_all(dir);
  return dir;
}

usagestat::runtime::config::RuntimeConfig MakeConfig(const std::filesystem::path& dir) {
  usagestat::runtime::config::RuntimeConfig config;
  config.set_server_name("persistence-test");
  config.mutable_storage()->set_path((dir / "data" / "usage.sqlite").string());
  config.mutable_audit()->set_enabled(true);
  config.mutable_audit()->set_path((dir / "logs" / "usage.log").string());

  auto* preset = config.add_presets();
  preset->set_name("get_weather");
  preset->add_tags("api");
  preset->add_tags("weather");
  preset->set_short_description("Weather lookup");

  usagestat::config::ConfigLoader::ApplyDefaults(config);
  return config;
}

void TestCountersAndMetadataSurviveRestart() {
  const auto dir    = TempDir("restart");
  const auto config = MakeConfig(dir);

  {
    auto store = usagestat::factory::BuildStore(config);
    store->SyncTools({{"get_weather", "Get the weather. Fast."}, {"get_news", "Headlines."}});
    store->SyncPrompts({{"summarize", "Summarize text."}});

    for (int i = 0; i < 3; ++i) {
      Invocation call;
      call.name        = "get_weather";
      call.duration_ms = 10 + i;
      assert(store->Record(call));
    }

    Invocation prompt;
    prompt.name = "summarize";
    prompt.kind = Kind::kPrompt;
    assert(store->Record(prompt));

    store->Close();
  }

  {
    auto store = usagestat::factory::BuildStore(config);
    assert(store->SchemaVersion() == usagestat::db::sql::kCurrentSchemaVersion);

    Invocation call;
    call.name        = "get_weather";
    call.duration_ms = 4;
    assert(store->Record(call));
    assert(store->ReportTokens("get_weather", 50, 25));

    const auto stats = store->GetStats();
    assert(stats.tracked_count() == 2);
    assert(stats.total_calls() == 5);
    assert(stats.stats(0).name() == "get_weather");
    assert(stats.stats(0).call_count() == 4);
    assert(stats.stats(0).min_duration_ms() == 4);
    assert(stats.stats(0).max_duration_ms() == 12);
    assert(stats.stats(0).avg_tokens_per_call() == 18);
    assert(stats.stats(0).tags(0) == "api");

    usagestat::v1::CatalogRequest req;
    req.add_tags("weather");
    const auto catalog = store->GetCatalog(req);
    assert(catalog.matched() == 1);
    assert(catalog.results(0).short_description() == "Weather lookup");
    assert(catalog.total_tracked() == 3);

    store->Close();
  }

  assert(std::filesystem::exists(dir / "logs" / "usage.log"));
}

void TestOrphanCleanupAcrossRestart() {
  const auto dir    = TempDir("orphans");
  const auto config = MakeConfig(dir);

  {
    auto store = usagestat::factory::BuildStore(config);
    store->SyncTools({{"get_weather", ""}, {"retired_tool", ""}});

    Invocation call;
    call.name = "retired_tool";
    assert(store->Record(call));
  }

  auto store  = usagestat::factory::BuildStore(config);
  auto report = store->SyncTools({{"get_weather", ""}});
  assert(report.orphans_removed == 1);
  assert(report.unchanged == 1);

  const auto stats = store->GetStats();
  assert(stats.tracked_count() == 0);
  assert(store->GetCatalog().total_tracked() == 1);
}

void TestClosedStoreRejectsWork() {
  const auto dir   = TempDir("closed");
  auto       store = usagestat::factory::BuildStore(MakeConfig(dir));

  Invocation call;
  call.name = "get_weather";
  assert(store->Record(call));

  store->Close();
  store->Close();
  assert(store->Closed());

  assert(!store->Record(call));
  assert(!store->ReportTokens("get_weather", 1, 1));

  bool query_threw = false;
  try {
    store->GetStats();
  } catch (const usagestat::util::QueryError&) {
    query_threw = true;
  }
  assert(query_threw);

  bool write_threw = false;
  try {
    store->RegisterMetadata("get_weather", {"api"}, "Weather lookup");
  } catch (const usagestat::util::StorageError&) {
    write_threw = true;
  }
  assert(write_threw);

  auto reopened = usagestat::factory::BuildStore(MakeConfig(dir));
  assert(reopened->GetStats().total_calls() == 1);
}

} // namespace

int main() {
  TestCountersAndMetadataSurviveRestart();
  TestOrphanCleanupAcrossRestart();
  TestClosedStoreRejectsWork();

  std::cout << "usagestat_integration_store_persistence: pass\n";
  return 0;
}
