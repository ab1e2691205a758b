#pragma once

#include <optional>
#include <string>

#include "internal/model/kind.hpp"
#include "usagestat/v1.hpp"

namespace usagestat::service {

struct ReportOptions {
  // Free text shown in the footer, e.g. "past week".
  std::string period = "all time";

  // std::nullopt renders every kind.
  std::optional<model::Kind> kind_filter;

  bool include_recommendations = true;
};

/*
  Markdown usage report built from GetByType() output.

  One section per kind (tools, resources, prompts) with the five most used
  entries and the never-called ones. Entries are expected in call_count
  DESC order, as GetByType() returns them.
*/
std::string FormatStatsReport(const usagestat::v1::ByTypeResponse& by_type, const ReportOptions& options = {});

}
