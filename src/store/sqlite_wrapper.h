#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>

namespace transitperf {

// RAII wrapper for sqlite3 database handle.
class SqliteDb {
 public:
  explicit SqliteDb(const std::string& path);
  ~SqliteDb();

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;

  void exec(const char* sql);
  sqlite3* handle();

 private:
  sqlite3* db_ = nullptr;
};

// RAII wrapper for sqlite3 prepared statements. Parameter and column indexes
// follow sqlite: parameters start at 1, columns at 0.
class SqliteStmt {
 public:
  SqliteStmt(SqliteDb& db, const char* sql);
  ~SqliteStmt();

  SqliteStmt(const SqliteStmt&) = delete;
  SqliteStmt& operator=(const SqliteStmt&) = delete;

  void bind_text(int col, const std::string& val);
  void bind_double(int col, double val);
  void bind_int(int col, int val);
  void bind_int64(int col, int64_t val);
  void bind_null(int col);
  void bind_optional_double(int col, const std::optional<double>& val);
  void bind_optional_int(int col, const std::optional<int>& val);

  // Advances to the next row. Returns false once the statement is done.
  bool step();
  // Runs a statement that returns no rows, then resets it for reuse.
  void step_and_reset();
  void reset();

  std::string column_text(int col);
  double column_double(int col);
  int column_int(int col);
  int64_t column_int64(int col);
  bool column_is_null(int col);
  std::optional<std::string> column_optional_text(int col);
  std::optional<double> column_optional_double(int col);
  std::optional<int> column_optional_int(int col);

 private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

// Begins an immediate transaction on construction and rolls it back on
// destruction unless commit() was called.
class SqliteTransaction {
 public:
  explicit SqliteTransaction(SqliteDb& db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&) = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void commit();

 private:
  SqliteDb& db_;
  bool done_ = false;
};

}  // namespace transitperf
