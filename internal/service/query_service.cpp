#include "query_service.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>
#include <string_view>
#include <type_traits>

#include "internal/db/api/repository.hpp"
#include "internal/model/kind.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace usagestat::service {

using namespace usagestat::v1;

namespace {

template <typename Fn>
auto ObserveQuery(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    USAGESTAT_LOG_DEBUG("query served",
                        {usagestat::observability::StringField("route", route),
                         usagestat::observability::IntField(
                             "elapsed_us", std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started_at).count())});
    return result;
  } catch (const util::QueryError&) {
    throw;
  } catch (const std::exception& ex) {
    USAGESTAT_LOG_ERROR("query failed", {usagestat::observability::StringField("route", route),
                                         usagestat::observability::StringField("error", ex.what())});
    throw util::QueryError(std::string(route) + ": " + ex.what());
  }
}

bool HasDurationData(const db::model::UsageRecord& usage) {
  return usage.min_duration_ms.has_value() || usage.total_duration_ms > 0;
}

UsageStat ToUsageStat(const db::model::UsageRecord& usage, const std::optional<db::model::MetadataRecord>& metadata) {
  UsageStat stat;
  stat.set_name(usage.name);
  stat.set_kind(usage.kind);
  stat.set_call_count(usage.call_count);
  stat.set_last_accessed(usage.last_accessed);
  stat.set_created_at(usage.created_at);

  stat.set_total_input_tokens(usage.total_input_tokens);
  stat.set_total_output_tokens(usage.total_output_tokens);
  stat.set_total_response_chars(usage.total_response_chars);
  stat.set_estimated_tokens(usage.estimated_tokens);
  stat.set_total_duration_ms(usage.total_duration_ms);
  if (usage.min_duration_ms) stat.set_min_duration_ms(*usage.min_duration_ms);
  if (usage.max_duration_ms) stat.set_max_duration_ms(*usage.max_duration_ms);

  if (usage.call_count > 0) {
    const auto actual_tokens = usage.total_input_tokens + usage.total_output_tokens;
    // falls back to the estimate, which is 0 when no response sizes were seen
    const auto tokens = actual_tokens > 0 ? actual_tokens : usage.estimated_tokens;
    stat.set_avg_tokens_per_call(tokens / usage.call_count);

    if (HasDurationData(usage)) {
      stat.set_avg_latency_ms(usage.total_duration_ms / usage.call_count);
    }
  }

  if (metadata) {
    stat.set_has_metadata(true);
    for (auto& tag : util::ParseTagsString(metadata->tags)) {
      stat.add_tags(std::move(tag));
    }
    stat.set_short_description(metadata->short_description);
    stat.set_full_description(metadata->full_description);
  }

  return stat;
}

KindGroup* GroupFor(ByTypeResponse& resp, std::string_view kind) {
  switch (model::ParseKind(kind).value_or(model::Kind::kTool)) {
    case model::Kind::kPrompt:
      return resp.mutable_prompt();
    case model::Kind::kResource:
      return resp.mutable_resource();
    case model::Kind::kTool:
    default:
      return resp.mutable_tool();
  }
}

struct CatalogRow {
  CatalogEntry entry;
  uint64_t     call_count = 0;
  std::string  last_accessed;
};

} // namespace

QueryService::QueryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse QueryService::GetStats(const StatsRequest& req) {
  return ObserveQuery("QueryService.GetStats", [&] {
    db::UsageFilter filter;
    filter.include_zero = !req.has_include_zero() || req.include_zero();
    filter.limit        = req.limit();
    if (!req.kind_filter().empty()) {
      filter.kind = req.kind_filter();
    }

    std::vector<db::model::UsageWithMetadata> rows;
    {
      std::lock_guard lock(*ctx_.gate);
      auto            tx = ctx_.repository->Begin();
      rows               = ctx_.repository->ListUsage(*tx, filter);
      tx->Commit();
    }

    StatsResponse resp;
    uint64_t      total_calls         = 0;
    uint64_t      zero_count          = 0;
    uint64_t      calls_with_duration = 0;
    std::string   latest;

    auto* tokens  = resp.mutable_tokens();
    auto* latency = resp.mutable_latency();

    for (const auto& row : rows) {
      const auto& usage = row.usage;

      total_calls += usage.call_count;
      if (usage.call_count == 0) {
        ++zero_count;
      }

      tokens->set_total_input_tokens(tokens->total_input_tokens() + usage.total_input_tokens);
      tokens->set_total_output_tokens(tokens->total_output_tokens() + usage.total_output_tokens);
      tokens->set_total_estimated_tokens(tokens->total_estimated_tokens() + usage.estimated_tokens);
      tokens->set_total_response_chars(tokens->total_response_chars() + usage.total_response_chars);

      latency->set_total_duration_ms(latency->total_duration_ms() + usage.total_duration_ms);
      if (HasDurationData(usage)) {
        calls_with_duration += usage.call_count;
      }

      if (!usage.last_accessed.empty() && usage.last_accessed > latest) {
        latest = usage.last_accessed;
      }

      *resp.add_stats() = ToUsageStat(usage, row.metadata);
    }

    resp.set_tracked_count(rows.size());
    resp.set_total_calls(total_calls);
    resp.set_zero_count(zero_count);
    if (!latest.empty()) {
      resp.set_latest_access(latest);
    }

    latency->set_calls_with_duration(calls_with_duration);
    if (calls_with_duration > 0) {
      latency->set_avg_latency_ms(latency->total_duration_ms() / calls_with_duration);
    }

    return resp;
  });
}

ByTypeResponse QueryService::GetByType(const ByTypeRequest&) {
  return ObserveQuery("QueryService.GetByType", [&] {
    std::vector<db::model::UsageWithMetadata> rows;
    {
      std::lock_guard lock(*ctx_.gate);
      auto            tx = ctx_.repository->Begin();
      rows               = ctx_.repository->ListUsage(*tx, db::UsageFilter{});
      tx->Commit();
    }

    ByTypeResponse resp;
    // present even when empty
    resp.mutable_tool();
    resp.mutable_resource();
    resp.mutable_prompt();

    uint64_t total_calls = 0;
    for (const auto& row : rows) {
      auto* group = GroupFor(resp, row.usage.kind);
      group->set_count(group->count() + 1);
      group->set_total_calls(group->total_calls() + row.usage.call_count);
      *group->add_entries() = ToUsageStat(row.usage, row.metadata);

      total_calls += row.usage.call_count;
    }

    resp.set_total_calls(total_calls);
    resp.set_total_items(rows.size());
    return resp;
  });
}

CatalogResponse QueryService::GetCatalog(const CatalogRequest& req) {
  return ObserveQuery("QueryService.GetCatalog", [&] {
    std::vector<db::model::MetadataWithUsage> rows;
    {
      std::lock_guard lock(*ctx_.gate);
      auto            tx = ctx_.repository->Begin();
      rows               = ctx_.repository->ListCatalog(*tx);
      tx->Commit();
    }

    const bool include_usage = !req.has_include_usage() || req.include_usage();
    const auto tag_filters   = util::NormalizeTags({req.tags().begin(), req.tags().end()});
    const auto query_text    = util::ToLower(util::CollapseWhitespace(req.query()));

    std::set<std::string>   all_tags;
    std::vector<CatalogRow> results;
    uint64_t                total_calls = 0;

    for (const auto& row : rows) {
      const auto& meta      = row.metadata;
      const auto  tags_list = util::ParseTagsString(meta.tags);
      all_tags.insert(tags_list.begin(), tags_list.end());

      const uint64_t count = row.usage ? row.usage->call_count : 0;
      total_calls += count;

      const bool has_all_tags = std::all_of(tag_filters.begin(), tag_filters.end(), [&](const std::string& wanted) {
        return std::find(tags_list.begin(), tags_list.end(), wanted) != tags_list.end();
      });
      if (!has_all_tags) {
        continue;
      }

      if (!query_text.empty()) {
        std::string haystack = meta.name;
        for (const auto& tag : tags_list) {
          haystack += ' ';
          haystack += tag;
        }
        haystack += ' ';
        haystack += meta.short_description;
        haystack += ' ';
        haystack += meta.full_description;

        if (util::ToLower(haystack).find(query_text) == std::string::npos) {
          continue;
        }
      }

      CatalogRow out;
      out.entry.set_name(meta.name);
      out.entry.set_short_description(meta.short_description);
      out.entry.set_full_description(meta.full_description);
      for (const auto& tag : tags_list) {
        out.entry.add_tags(tag);
      }
      out.entry.set_schema_version(meta.schema_version);
      out.entry.set_updated_at(meta.updated_at);

      if (include_usage) {
        out.call_count    = count;
        out.last_accessed = row.usage ? row.usage->last_accessed : "";
        out.entry.set_call_count(out.call_count);
        if (row.usage) {
          out.entry.set_last_accessed(out.last_accessed);
        }
      }

      results.push_back(std::move(out));
    }

    // Three stable passes: the last pass is the primary key.
    std::stable_sort(results.begin(), results.end(),
                     [](const CatalogRow& a, const CatalogRow& b) { return a.entry.name() < b.entry.name(); });
    // empty timestamps sort last
    std::stable_sort(results.begin(), results.end(),
                     [](const CatalogRow& a, const CatalogRow& b) { return a.last_accessed > b.last_accessed; });
    std::stable_sort(results.begin(), results.end(),
                     [](const CatalogRow& a, const CatalogRow& b) { return a.call_count > b.call_count; });

    if (req.limit() > 0 && results.size() > req.limit()) {
      results.resize(req.limit());
    }

    CatalogResponse resp;
    resp.set_total_tracked(rows.size());
    resp.set_matched(results.size());
    for (const auto& tag : all_tags) {
      resp.add_all_tags(tag);
    }

    auto* filters = resp.mutable_filters();
    for (const auto& tag : tag_filters) {
      filters->add_tags(tag);
    }
    if (!query_text.empty()) {
      filters->set_query(query_text);
    }

    resp.set_include_usage(include_usage);
    resp.set_limit(req.limit());
    if (include_usage) {
      resp.set_total_calls(total_calls);
    }

    for (auto& row : results) {
      *resp.add_results() = std::move(row.entry);
    }
    return resp;
  });
}

} // namespace usagestat::service
