#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/core/usage_store.hpp"
#include "internal/instrument/invocation_scope.hpp"
#include "internal/service/report.hpp"

using usagestat::instrument::InvocationScope;
using usagestat::instrument::MeasuredInvocation;
using usagestat::model::Kind;

static std::string GetWeather(const std::string& city) {
  if (city.empty()) {
    throw std::invalid_argument("city is required");
  }
  return "{\"city\":\"" + city + "\",\"temp_c\":21}";
}

int main(int argc, char** argv) {
  const std::string db_path = argc > 1 ? argv[1] : "./example_usage.sqlite";

  usagestat::core::UsageStore store(std::make_shared<usagestat::db::sqlite::SqliteRepository>(db_path));

  // Registration: presets win over tags derived from the name.
  store.AddPreset("get_weather", {{"api", "weather"}, "Weather lookup"});
  store.SyncTools({{"get_weather", "Get current weather for a city. Returns JSON."},
                   {"convert_to_celsius", "Convert a Fahrenheit reading to Celsius."}});
  store.SyncPrompts({{"summarize", "Summarize a document."}});

  // Wrapped handler: duration and outcome are recorded, the result passes through.
  auto body = MeasuredInvocation(store, "get_weather", Kind::kTool, [] { return GetWeather("Oslo"); });

  try {
    MeasuredInvocation(store, "get_weather", Kind::kTool, [] { return GetWeather(""); });
  } catch (const std::invalid_argument& e) {
    std::cout << "handler failed as expected: " << e.what() << '\n';
  }

  // Scoped form when the response size is only known at the end.
  {
    InvocationScope scope(store, "summarize", Kind::kPrompt);
    scope.SetResponseChars(1000);
  }

  store.ReportTokens("get_weather", 120, 45);

  usagestat::v1::StatsRequest request;
  request.set_include_zero(false);
  const auto stats = store.GetStats(request);

  std::cout << "tracked=" << stats.tracked_count() << " calls=" << stats.total_calls() << '\n';
  for (const auto& stat : stats.stats()) {
    std::cout << "  " << stat.kind() << ":" << stat.name() << " calls=" << stat.call_count();
    if (stat.has_avg_tokens_per_call()) {
      std::cout << " avg_tokens=" << stat.avg_tokens_per_call();
    }
    std::cout << '\n';
  }

  std::cout << "last response: " << body << "\n\n";
  std::cout << usagestat::service::FormatStatsReport(store.GetByType()) << '\n';
  return 0;
}
