#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace relaynorm::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One handle is shared by every worker; transactions take TxMutex()
  for their whole lifetime so BEGIN/COMMIT pairs never interleave.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace relaynorm::db::sqlite
