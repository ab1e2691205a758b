#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/kind.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/report.hpp"
#include "internal/util/text.hpp"
#include "usagestat/v1.hpp"

using namespace usagestat::v1;
using usagestat::core::UsageStore;
using usagestat::util::ParseUnsigned;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  usagestatctl [--config <file.yaml>] stats [--no-zero] [--limit N] [--kind tool|prompt|resource]\n"
            << "  usagestatctl [--config <file.yaml>] by-type\n"
            << "  usagestatctl [--config <file.yaml>] report [--kind tool|prompt|resource] [--period P] [--no-recommendations]\n"
            << "  usagestatctl [--config <file.yaml>] catalog [--tag T]... [--query Q] [--no-usage] [--limit N]\n"
            << "  usagestatctl [--config <file.yaml>] record <name> [tool|prompt|resource] [--duration-ms N] [--chars N]\n"
            << "                                      [--in N] [--out N] [--fail MSG]\n"
            << "  usagestatctl [--config <file.yaml>] report-tokens <name> <in> <out>\n"
            << "  usagestatctl [--config <file.yaml>] tag <name> <short description> <tag>...\n";
}

static bool PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render result: " << status.message() << "\n";
    return false;
  }
  std::cout << json;
  return true;
}

// Flag parsing helpers: each returns false on a malformed argument.
static bool TakeValue(const std::vector<std::string>& args, size_t& i, std::string& out) {
  if (i + 1 >= args.size()) {
    std::cerr << "missing value for " << args[i] << "\n";
    return false;
  }
  out = args[++i];
  return true;
}

static bool TakeCount(const std::vector<std::string>& args, size_t& i, uint64_t& out,
                      uint64_t max = std::numeric_limits<uint64_t>::max()) {
  std::string raw;
  if (!TakeValue(args, i, raw)) {
    return false;
  }
  auto parsed = ParseUnsigned(raw, max);
  if (!parsed) {
    std::cerr << "invalid number for " << args[i - 1] << ": " << raw << "\n";
    return false;
  }
  out = *parsed;
  return true;
}

static int RunStats(UsageStore& store, const std::vector<std::string>& args) {
  StatsRequest req;
  for (size_t i = 0; i < args.size(); ++i) {
    uint64_t    n = 0;
    std::string kind;
    if (args[i] == "--no-zero") {
      req.set_include_zero(false);
    } else if (args[i] == "--limit") {
      if (!TakeCount(args, i, n, std::numeric_limits<uint32_t>::max())) return 1;
      req.set_limit(static_cast<uint32_t>(n));
    } else if (args[i] == "--kind") {
      if (!TakeValue(args, i, kind)) return 1;
      if (!usagestat::model::ParseKind(kind)) {
        std::cerr << "unsupported kind: " << kind << "\n";
        return 1;
      }
      req.set_kind_filter(kind);
    } else {
      std::cerr << "unknown option: " << args[i] << "\n";
      return 1;
    }
  }
  return PrintJson(store.GetStats(req)) ? 0 : 2;
}

static int RunCatalog(UsageStore& store, const std::vector<std::string>& args) {
  CatalogRequest req;
  for (size_t i = 0; i < args.size(); ++i) {
    uint64_t    n = 0;
    std::string value;
    if (args[i] == "--tag") {
      if (!TakeValue(args, i, value)) return 1;
      req.add_tags(value);
    } else if (args[i] == "--query") {
      if (!TakeValue(args, i, value)) return 1;
      req.set_query(value);
    } else if (args[i] == "--no-usage") {
      req.set_include_usage(false);
    } else if (args[i] == "--limit") {
      if (!TakeCount(args, i, n, std::numeric_limits<uint32_t>::max())) return 1;
      req.set_limit(static_cast<uint32_t>(n));
    } else {
      std::cerr << "unknown option: " << args[i] << "\n";
      return 1;
    }
  }
  return PrintJson(store.GetCatalog(req)) ? 0 : 2;
}

static int RunReport(UsageStore& store, const std::vector<std::string>& args) {
  usagestat::service::ReportOptions options;
  for (size_t i = 0; i < args.size(); ++i) {
    std::string value;
    if (args[i] == "--kind") {
      if (!TakeValue(args, i, value)) return 1;
      options.kind_filter = usagestat::model::ParseKind(value);
      if (!options.kind_filter) {
        std::cerr << "unsupported kind: " << value << "\n";
        return 1;
      }
    } else if (args[i] == "--period") {
      if (!TakeValue(args, i, options.period)) return 1;
    } else if (args[i] == "--no-recommendations") {
      options.include_recommendations = false;
    } else {
      std::cerr << "unknown option: " << args[i] << "\n";
      return 1;
    }
  }
  std::cout << usagestat::service::FormatStatsReport(store.GetByType(), options) << "\n";
  return 0;
}

static int RunRecord(UsageStore& store, const std::vector<std::string>& args) {
  if (args.empty()) {
    Usage();
    return 1;
  }

  usagestat::service::Invocation invocation;
  invocation.name = args[0];

  size_t i = 1;
  if (i < args.size() && args[i].rfind("--", 0) != 0) {
    auto kind = usagestat::model::ParseKind(args[i]);
    if (!kind) {
      std::cerr << "unsupported kind: " << args[i] << "\n";
      return 1;
    }
    invocation.kind = *kind;
    ++i;
  }

  for (; i < args.size(); ++i) {
    uint64_t n = 0;
    if (args[i] == "--duration-ms") {
      if (!TakeCount(args, i, n)) return 1;
      invocation.duration_ms = n;
    } else if (args[i] == "--chars") {
      if (!TakeCount(args, i, n)) return 1;
      invocation.response_chars = n;
    } else if (args[i] == "--in") {
      if (!TakeCount(args, i, n)) return 1;
      invocation.input_tokens = n;
    } else if (args[i] == "--out") {
      if (!TakeCount(args, i, n)) return 1;
      invocation.output_tokens = n;
    } else if (args[i] == "--fail") {
      if (!TakeValue(args, i, invocation.error_msg)) return 1;
      invocation.success = false;
    } else {
      std::cerr << "unknown option: " << args[i] << "\n";
      return 1;
    }
  }

  if (!store.Record(invocation)) {
    std::cerr << "failed to record " << invocation.name << "\n";
    return 2;
  }
  return 0;
}

static int RunReportTokens(UsageStore& store, const std::vector<std::string>& args) {
  if (args.size() != 3) {
    Usage();
    return 1;
  }
  auto in  = ParseUnsigned(args[1]);
  auto out = ParseUnsigned(args[2]);
  if (!in || !out) {
    std::cerr << "token counts must be non-negative integers\n";
    return 1;
  }
  if (!store.ReportTokens(args[0], *in, *out)) {
    std::cerr << "no usage tracked for " << args[0] << "; tokens ignored\n";
  }
  return 0;
}

static int RunTag(UsageStore& store, const std::vector<std::string>& args) {
  if (args.size() < 3) {
    Usage();
    return 1;
  }
  std::vector<std::string> tags(args.begin() + 2, args.end());
  store.RegisterMetadata(args[0], tags, args[1]);
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string              cmd = args[0];
  const std::vector<std::string> rest(args.begin() + 1, args.end());

  if (cmd != "stats" && cmd != "by-type" && cmd != "report" && cmd != "catalog" && cmd != "record" && cmd != "report-tokens" && cmd != "tag") {
    std::cerr << "unknown command: " << cmd << "\n";
    Usage();
    return 1;
  }

  try {
    auto config = usagestat::config::ConfigLoader::Load(config_path);
    usagestat::observability::InitializeLogging(config);

    auto store = usagestat::factory::BuildStore(config);

    int rc = 0;
    if (cmd == "stats") {
      rc = RunStats(*store, rest);
    } else if (cmd == "by-type") {
      rc = PrintJson(store->GetByType()) ? 0 : 2;
    } else if (cmd == "report") {
      rc = RunReport(*store, rest);
    } else if (cmd == "catalog") {
      rc = RunCatalog(*store, rest);
    } else if (cmd == "record") {
      rc = RunRecord(*store, rest);
    } else if (cmd == "report-tokens") {
      rc = RunReportTokens(*store, rest);
    } else {
      rc = RunTag(*store, rest);
    }

    store->Close();
    usagestat::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    USAGESTAT_LOG_ERROR("usagestatctl failed", {usagestat::observability::StringField("command", cmd),
                                                usagestat::observability::StringField("error", e.what())});
    usagestat::observability::ShutdownLogging();
    return 2;
  }
}
