#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace usagestat::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.

  One instance per operation: the repository opens a fresh connection for
  every transaction and closes it when the transaction goes away.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, int busy_timeout_ms);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement; throws on failure
  Statement Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout)
  void Configure(int busy_timeout_ms);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace usagestat::db::sqlite
