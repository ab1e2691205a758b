#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace usagestat::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& ex) {
      USAGESTAT_LOG_WARN("sqlite rollback failed", {usagestat::observability::StringField("path", db_->Path()),
                                                    usagestat::observability::StringField("error", ex.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace usagestat::db::sqlite
