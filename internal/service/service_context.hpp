#pragma once

#include <memory>
#include <mutex>

namespace usagestat::db { class Repository; }
namespace usagestat::observability { class AuditLog; }

namespace usagestat::service {

/*
  Dependency container shared by all services.

  gate serializes every storage access of one store instance: writes never
  interleave and each runs in its own transaction.
*/
struct ServiceContext {
  std::shared_ptr<usagestat::db::Repository> repository;
  std::shared_ptr<std::mutex> gate;
  std::shared_ptr<usagestat::observability::AuditLog> audit;
};

}
