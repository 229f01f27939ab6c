#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace flowsched::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One SqliteDB is one connection. Concurrent schedulers use one SqliteDB
  each; BEGIN IMMEDIATE plus the busy timeout serializes their writes.
  Threads sharing one SqliteDB are serialized by TxMutex(), which a
  SqliteTransaction holds from BEGIN until it finishes.
*/
class SqliteDB : public sql::MigrationExecutor {
 public:
  static constexpr int kDefaultBusyTimeoutMs = 5000;

  explicit SqliteDB(std::string path, int busy_timeout_ms = kDefaultBusyTimeoutMs);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Create tables and indexes if missing.
  void Bootstrap();

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace flowsched::db::sqlite
