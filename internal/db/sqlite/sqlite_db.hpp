#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace availability::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opened in WAL mode with a busy timeout. One connection per process:
  every transaction, reads included, runs under TxMutex, so in-process
  reads queue behind an open write transaction.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas, DDL and transaction control)
  void Exec(const std::string& sql);

  // Idempotent bootstrap of the availability tables.
  void ApplySchema();

  const std::string& Path() const {
    return path_;
  }

  // One connection carries one transaction at a time.
  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

/*
  Prepared statement bound to one connection; finalized on destruction.
  Bind indexes are 1-based, column indexes 0-based, as in sqlite3.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Valid() const {
    return stmt_ != nullptr;
  }
  // sqlite3 result code of the prepare step.
  int PrepareCode() const {
    return prepare_rc_;
  }

  void BindText(int idx, const std::string& value);
  void BindBlob(int idx, const std::string& value);
  void BindU64(int idx, uint64_t value);

  // SQLITE_ROW, SQLITE_DONE or an error code.
  int Step();

  std::string ColText(int col) const;
  std::string ColBlob(int col) const;
  uint64_t    ColU64(int col) const;

 private:
  sqlite3_stmt* stmt_       = nullptr;
  int           prepare_rc_ = SQLITE_OK;
};

} // namespace availability::db::sqlite
