#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/usage_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using usagestat::core::UsageStore;
using usagestat::db::sqlite::SqliteDB;
using usagestat::db::sqlite::SqliteRepository;
using usagestat::model::Kind;
using usagestat::service::Invocation;
using usagestat::v1::CatalogRequest;
using usagestat::v1::StatsRequest;

std::string TempDbPath(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "usagestat_query_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (test_name + ".sqlite");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
  return path.string();
}

struct Fixture {
  explicit Fixture(const std::string& test_name)
      : path(TempDbPath(test_name)), store(std::make_shared<SqliteRepository>(path)) {
  }

  std::string path;
  UsageStore  store;

  void Exec(const std::string& sql) {
    SqliteDB db(path, 1000);
    db.Exec(sql);
  }
};

Invocation Call(const std::string& name, Kind kind = Kind::kTool) {
  Invocation invocation;
  invocation.name = name;
  invocation.kind = kind;
  return invocation;
}

// a: 3 tool calls with tokens, b: 1 tool call with size and duration,
// c: 2 prompt calls, z: tracked with zero calls
void Seed(Fixture& fx) {
  for (int i = 0; i < 3; ++i) {
    auto call          = Call("a");
    call.input_tokens  = 10;
    call.output_tokens = 5;
    assert(fx.store.Record(call));
  }

  auto b           = Call("b");
  b.response_chars = 1000;
  b.duration_ms    = 9;
  assert(fx.store.Record(b));

  assert(fx.store.Record(Call("c", Kind::kPrompt)));
  assert(fx.store.Record(Call("c", Kind::kPrompt)));

  fx.Exec("INSERT INTO usage_stats(name, kind, call_count, last_accessed, created_at) VALUES('z', 'tool', 0, '', '');");
}

void TestStatsAggregates() {
  Fixture fx("stats_aggregates");
  Seed(fx);

  const auto resp = fx.store.GetStats();
  assert(resp.tracked_count() == 4);
  assert(resp.total_calls() == 6);
  assert(resp.zero_count() == 1);
  assert(resp.has_latest_access());
  assert(!resp.latest_access().empty());

  assert(resp.tokens().total_input_tokens() == 30);
  assert(resp.tokens().total_output_tokens() == 15);
  assert(resp.tokens().total_estimated_tokens() == 285);
  assert(resp.tokens().total_response_chars() == 1000);

  assert(resp.latency().total_duration_ms() == 9);
  assert(resp.latency().calls_with_duration() == 1);
  assert(resp.latency().avg_latency_ms() == 9);

  assert(resp.stats_size() == 4);
  assert(resp.stats(0).name() == "a");
  assert(resp.stats(1).name() == "c");
  assert(resp.stats(3).name() == "z");
}

void TestStatsPerRowAverages() {
  Fixture fx("stats_averages");
  Seed(fx);

  const auto resp = fx.store.GetStats();
  for (const auto& stat : resp.stats()) {
    if (stat.name() == "a") {
      assert(stat.avg_tokens_per_call() == 15);
      assert(!stat.has_avg_latency_ms());
      assert(!stat.has_min_duration_ms());
    } else if (stat.name() == "b") {
      assert(stat.avg_tokens_per_call() == 285);
      assert(stat.avg_latency_ms() == 9);
      assert(stat.min_duration_ms() == 9);
      assert(stat.max_duration_ms() == 9);
    } else if (stat.name() == "c") {
      assert(stat.kind() == "prompt");
      assert(stat.has_avg_tokens_per_call());
      assert(stat.avg_tokens_per_call() == 0);
    } else {
      assert(stat.name() == "z");
      assert(stat.call_count() == 0);
      assert(!stat.has_avg_tokens_per_call());
      assert(!stat.has_avg_latency_ms());
    }
  }
}

void TestStatsExcludeZeroAndLimit() {
  Fixture fx("stats_filters");
  Seed(fx);

  StatsRequest no_zero;
  no_zero.set_include_zero(false);
  const auto filtered = fx.store.GetStats(no_zero);
  assert(filtered.stats_size() == 3);
  assert(filtered.zero_count() == 0);
  for (const auto& stat : filtered.stats()) {
    assert(stat.call_count() > 0);
  }

  StatsRequest limited;
  limited.set_limit(2);
  const auto top = fx.store.GetStats(limited);
  assert(top.stats_size() == 2);
  assert(top.stats(0).call_count() == 3);
  assert(top.stats(1).call_count() == 2);

  StatsRequest prompts;
  prompts.set_kind_filter("prompt");
  const auto only_prompts = fx.store.GetStats(prompts);
  assert(only_prompts.stats_size() == 1);
  assert(only_prompts.stats(0).name() == "c");
}

void TestStatsCarryMetadata() {
  Fixture fx("stats_metadata");
  Seed(fx);
  fx.store.UpdateMetadata("a", {"api", "fast"}, "Tool a", std::string("Tool a does a."));

  const auto resp = fx.store.GetStats();
  assert(resp.stats(0).name() == "a");
  assert(resp.stats(0).has_metadata());
  assert(resp.stats(0).tags_size() == 2);
  assert(resp.stats(0).tags(1) == "fast");
  assert(resp.stats(0).short_description() == "Tool a");
  assert(!resp.stats(1).has_metadata());
}

void TestEmptyStoreStats() {
  Fixture fx("stats_empty");

  const auto resp = fx.store.GetStats();
  assert(resp.tracked_count() == 0);
  assert(resp.total_calls() == 0);
  assert(!resp.has_latest_access());
  assert(!resp.latency().has_avg_latency_ms());
}

void TestByTypeBuckets() {
  Fixture fx("by_type");
  Seed(fx);

  const auto resp = fx.store.GetByType();
  assert(resp.has_tool());
  assert(resp.has_prompt());
  assert(resp.has_resource());

  assert(resp.tool().count() == 3);
  assert(resp.tool().total_calls() == 4);
  assert(resp.tool().entries(0).name() == "a");
  assert(resp.tool().entries(2).name() == "z");

  assert(resp.prompt().count() == 1);
  assert(resp.prompt().total_calls() == 2);

  assert(resp.resource().count() == 0);
  assert(resp.resource().entries_size() == 0);

  assert(resp.total_calls() == 6);
  assert(resp.total_items() == 4);
}

void SeedCatalog(Fixture& fx) {
  fx.store.UpdateMetadata("get_weather", {"api", "weather"}, "Weather lookup", std::string("Fetches the forecast."));
  fx.store.UpdateMetadata("get_news", {"api", "news"}, "Headlines", std::string("Latest NEWS stories."));
  fx.store.UpdateMetadata("convert", {"math"}, "Unit conversion");
  fx.store.UpdateMetadata("alpha", {"math"}, "First");

  fx.Exec("INSERT INTO usage_stats(name, kind, call_count, last_accessed, created_at) VALUES"
          "('get_weather', 'tool', 5, '2026-01-02T00:00:00+00:00', '2026-01-01T00:00:00+00:00'),"
          "('get_news', 'tool', 5, '2026-01-03T00:00:00+00:00', '2026-01-01T00:00:00+00:00'),"
          "('untracked_usage', 'tool', 9, '2026-01-04T00:00:00+00:00', '2026-01-01T00:00:00+00:00');");
}

std::vector<std::string> ResultNames(const usagestat::v1::CatalogResponse& resp) {
  std::vector<std::string> names;
  for (const auto& entry : resp.results()) {
    names.push_back(entry.name());
  }
  return names;
}

void TestCatalogTagFilterUsesAndSemantics() {
  Fixture fx("catalog_tags");
  SeedCatalog(fx);

  CatalogRequest weather;
  weather.add_tags("weather");
  assert((ResultNames(fx.store.GetCatalog(weather)) == std::vector<std::string>{"get_weather"}));

  CatalogRequest api;
  api.add_tags(" API ");
  assert(fx.store.GetCatalog(api).matched() == 2);

  CatalogRequest api_news;
  api_news.add_tags("api");
  api_news.add_tags("news");
  assert((ResultNames(fx.store.GetCatalog(api_news)) == std::vector<std::string>{"get_news"}));
}

void TestCatalogTextQuery() {
  Fixture fx("catalog_query");
  SeedCatalog(fx);

  CatalogRequest req;
  req.set_query("  news   stories ");
  const auto resp = fx.store.GetCatalog(req);
  assert((ResultNames(resp) == std::vector<std::string>{"get_news"}));
  assert(resp.filters().query() == "news stories");

  CatalogRequest by_description;
  by_description.set_query("FORECAST");
  assert((ResultNames(fx.store.GetCatalog(by_description)) == std::vector<std::string>{"get_weather"}));
}

void TestCatalogMatchesNonAsciiCaseInsensitively() {
  Fixture fx("catalog_unicode");
  fx.store.UpdateMetadata("Café", {"Météo"}, "Température");

  CatalogRequest by_query;
  by_query.set_query("TEMPÉRATURE");
  assert((ResultNames(fx.store.GetCatalog(by_query)) == std::vector<std::string>{"Café"}));

  CatalogRequest by_tag;
  by_tag.add_tags("MÉTÉO");
  const auto resp = fx.store.GetCatalog(by_tag);
  assert(resp.matched() == 1);
  assert(resp.filters().tags(0) == "météo");
  assert(resp.results(0).tags(0) == "météo");
}

void TestCatalogOrderingAndAggregates() {
  Fixture fx("catalog_order");
  SeedCatalog(fx);

  const auto resp = fx.store.GetCatalog(CatalogRequest{});
  assert(resp.total_tracked() == 4);
  assert(resp.matched() == 4);
  assert((ResultNames(resp) == std::vector<std::string>{"get_news", "get_weather", "alpha", "convert"}));

  assert(resp.all_tags_size() == 4);
  assert(resp.all_tags(0) == "api");
  assert(resp.all_tags(1) == "math");
  assert(resp.all_tags(2) == "news");
  assert(resp.all_tags(3) == "weather");

  assert(resp.include_usage());
  assert(resp.total_calls() == 10);
  assert(resp.results(0).call_count() == 5);
  assert(resp.results(0).last_accessed() == "2026-01-03T00:00:00+00:00");
  assert(resp.results(2).call_count() == 0);
  assert(!resp.results(2).has_last_accessed());
}

void TestCatalogWithoutUsageAndLimit() {
  Fixture fx("catalog_no_usage");
  SeedCatalog(fx);

  CatalogRequest req;
  req.set_include_usage(false);
  req.set_limit(3);
  const auto resp = fx.store.GetCatalog(req);

  assert((ResultNames(resp) == std::vector<std::string>{"alpha", "convert", "get_news"}));
  assert(resp.matched() == 3);
  assert(!resp.include_usage());
  assert(!resp.has_total_calls());
  for (const auto& entry : resp.results()) {
    assert(!entry.has_call_count());
    assert(!entry.has_last_accessed());
  }
}

void TestQueriesFailAfterClose() {
  Fixture fx("closed");
  fx.store.Close();
  fx.store.Close();

  assert(!fx.store.Record(Call("a")));

  bool threw = false;
  try {
    fx.store.GetStats();
  } catch (const usagestat::util::QueryError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestStatsAggregates();
  TestStatsPerRowAverages();
  TestStatsExcludeZeroAndLimit();
  TestStatsCarryMetadata();
  TestEmptyStoreStats();
  TestByTypeBuckets();
  TestCatalogTagFilterUsesAndSemantics();
  TestCatalogTextQuery();
  TestCatalogMatchesNonAsciiCaseInsensitively();
  TestCatalogOrderingAndAggregates();
  TestCatalogWithoutUsageAndLimit();
  TestQueriesFailAfterClose();

  std::cout << "usagestat_unit_query_service: pass\n";
  return 0;
}
