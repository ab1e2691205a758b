#pragma once

#include "service_context.hpp"
#include "usagestat/v1.hpp"

namespace usagestat::service {

/*
  Read-side analytics. Each call is a stateless read of the current store
  contents; failures surface as util::QueryError.
*/
class QueryService {
public:
  explicit QueryService(ServiceContext ctx);

  // usage LEFT JOIN metadata, call_count DESC then last_accessed DESC
  usagestat::v1::StatsResponse GetStats(const usagestat::v1::StatsRequest& req);

  // tool/resource/prompt buckets, always present
  usagestat::v1::ByTypeResponse GetByType(const usagestat::v1::ByTypeRequest& req = {});

  // metadata LEFT JOIN usage with AND tag filter and text search
  usagestat::v1::CatalogResponse GetCatalog(const usagestat::v1::CatalogRequest& req);

private:
  ServiceContext ctx_;
};

}
