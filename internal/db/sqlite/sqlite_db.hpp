#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace graphdoc::db::sqlite {

struct SqliteOptions {
  bool     wal_mode        = true;
  uint32_t busy_timeout_ms = 5000;
  bool     read_only       = false;
};

/*
  Thin RAII wrapper around sqlite3*.

  One SqliteDB is one connection. Write transactions on a connection are
  serialized through WriterMutex(); readers open their own read-only
  connection (see SqliteRepository::Begin) unless the database is
  in-memory and cannot be shared.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  const SqliteOptions& Options() const {
    return options_;
  }

  // ":memory:" and "" databases are private to their connection
  bool IsPrivate() const {
    return path_.empty() || path_ == ":memory:";
  }

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  // Execute a SQL string (used for pragmas/bootstrap)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure PRAGMAs (WAL, foreign keys, busy timeout, extended codes)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    writer_mutex_;
};

} // namespace graphdoc::db::sqlite
