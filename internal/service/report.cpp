#include "report.hpp"

#include <sstream>
#include <string_view>
#include <vector>

namespace usagestat::service {

using usagestat::v1::ByTypeResponse;
using usagestat::v1::KindGroup;

namespace {

constexpr int kTopEntries = 5;

struct Section {
  model::Kind      kind;
  std::string_view heading;
  std::string_view plural;
  const KindGroup& (ByTypeResponse::*group)() const;
};

// report order differs from the enum order
const std::vector<Section>& Sections() {
  static const std::vector<Section> kSections = {
      {model::Kind::kTool, "\xF0\x9F\x94\xA7 Tools", "tools", &ByTypeResponse::tool},
      {model::Kind::kResource, "\xF0\x9F\x93\x9A Resources", "resources", &ByTypeResponse::resource},
      {model::Kind::kPrompt, "\xF0\x9F\x92\xAC Prompts", "prompts", &ByTypeResponse::prompt},
  };
  return kSections;
}

void WriteTop(std::ostringstream& out, const KindGroup& group) {
  int rank = 0;
  for (const auto& entry : group.entries()) {
    if (entry.call_count() == 0) {
      continue;
    }
    if (rank == kTopEntries) {
      break;
    }
    if (rank > 0) {
      out << '\n';
    }
    out << ++rank << ". `" << entry.name() << "` - **" << entry.call_count() << " calls**";
  }
  if (rank == 0) {
    out << "(None used yet)";
  }
}

void WriteUnused(std::ostringstream& out, const KindGroup& group) {
  bool any = false;
  for (const auto& entry : group.entries()) {
    if (entry.call_count() != 0) {
      continue;
    }
    if (any) {
      out << '\n';
    }
    out << "- `" << entry.name() << '`';
    any = true;
  }
  if (!any) {
    out << "(All have been used)";
  }
}

} // namespace

std::string FormatStatsReport(const ByTypeResponse& by_type, const ReportOptions& options) {
  std::ostringstream out;

  out << "## MCP Usage Statistics";
  if (options.kind_filter) {
    out << " (filtered: " << model::ToString(*options.kind_filter) << ')';
  }
  out << "\n\n";

  // kinds with no tracked entries are left out of the summary
  out << "**Summary:** ";
  bool any_kind = false;
  for (const auto& section : Sections()) {
    const auto& group = (by_type.*section.group)();
    if (group.count() == 0) {
      continue;
    }
    if (any_kind) {
      out << ", ";
    }
    out << group.count() << ' ' << section.plural << " (" << group.total_calls() << " calls)";
    any_kind = true;
  }
  if (!any_kind) {
    out << "No data";
  }
  out << '\n';
  out << "**Total:** " << by_type.total_calls() << " calls across all primitives\n\n";

  bool first_section = true;
  for (const auto& section : Sections()) {
    if (options.kind_filter && *options.kind_filter != section.kind) {
      continue;
    }
    const auto& group = (by_type.*section.group)();

    if (!first_section) {
      out << '\n';
    }
    first_section = false;

    out << "### " << section.heading << " (" << group.count() << " tracked, " << group.total_calls() << " calls)\n\n";
    out << "**Top 5:**\n";
    WriteTop(out, group);
    out << "\n\n**Unused:**\n";
    WriteUnused(out, group);
  }
  out << '\n';

  if (options.include_recommendations) {
    out << "\n\n---\n"
        << "**Recommendations:**\n"
        << "1. High-usage tools represent key workflows - ensure robust error handling\n"
        << "2. Unused items may need better documentation or deprecation\n"
        << "3. Consider promoting underused tools that provide value";
  }

  out << "\n\n---\n_Period: " << options.period << '_';
  return out.str();
}

}
