#include "store/sqlite_wrapper.h"

#include <stdexcept>

namespace transitperf {

SqliteDb::SqliteDb(const std::string& path) {
  int rc = sqlite3_open(path.c_str(), &db_);
  if (rc != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to open SQLite database: " + err);
  }
  sqlite3_busy_timeout(db_, 5000);
}

SqliteDb::~SqliteDb() {
  if (db_) sqlite3_close(db_);
}

void SqliteDb::exec(const char* sql) {
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string err = err_msg ? err_msg : sqlite3_errstr(rc);
    sqlite3_free(err_msg);
    throw std::runtime_error("SQLite exec error: " + err);
  }
}

sqlite3* SqliteDb::handle() { return db_; }

SqliteStmt::SqliteStmt(SqliteDb& db, const char* sql) : db_(db.handle()) {
  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    throw std::runtime_error(
        std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_)
    );
  }
}

SqliteStmt::~SqliteStmt() {
  if (stmt_) sqlite3_finalize(stmt_);
}

namespace {

void CheckBind(sqlite3* db, int rc) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(
        std::string("Failed to bind parameter: ") + sqlite3_errmsg(db)
    );
  }
}

}  // namespace

void SqliteStmt::bind_text(int col, const std::string& val) {
  CheckBind(db_, sqlite3_bind_text(stmt_, col, val.c_str(), -1, SQLITE_TRANSIENT));
}

void SqliteStmt::bind_double(int col, double val) {
  CheckBind(db_, sqlite3_bind_double(stmt_, col, val));
}

void SqliteStmt::bind_int(int col, int val) {
  CheckBind(db_, sqlite3_bind_int(stmt_, col, val));
}

void SqliteStmt::bind_int64(int col, int64_t val) {
  CheckBind(db_, sqlite3_bind_int64(stmt_, col, val));
}

void SqliteStmt::bind_null(int col) {
  CheckBind(db_, sqlite3_bind_null(stmt_, col));
}

void SqliteStmt::bind_optional_double(
    int col, const std::optional<double>& val
) {
  if (val) {
    bind_double(col, *val);
  } else {
    bind_null(col);
  }
}

void SqliteStmt::bind_optional_int(int col, const std::optional<int>& val) {
  if (val) {
    bind_int(col, *val);
  } else {
    bind_null(col);
  }
}

bool SqliteStmt::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw std::runtime_error(
      std::string("SQLite step error: ") + sqlite3_errmsg(db_)
  );
}

void SqliteStmt::step_and_reset() {
  int rc = sqlite3_step(stmt_);
  sqlite3_reset(stmt_);
  if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
    throw std::runtime_error(
        std::string("SQLite step error: ") + sqlite3_errstr(rc)
    );
  }
}

void SqliteStmt::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

std::string SqliteStmt::column_text(int col) {
  const unsigned char* text = sqlite3_column_text(stmt_, col);
  return text ? reinterpret_cast<const char*>(text) : "";
}

double SqliteStmt::column_double(int col) {
  return sqlite3_column_double(stmt_, col);
}

int SqliteStmt::column_int(int col) { return sqlite3_column_int(stmt_, col); }

int64_t SqliteStmt::column_int64(int col) {
  return sqlite3_column_int64(stmt_, col);
}

bool SqliteStmt::column_is_null(int col) {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::optional<std::string> SqliteStmt::column_optional_text(int col) {
  if (column_is_null(col)) return std::nullopt;
  return column_text(col);
}

std::optional<double> SqliteStmt::column_optional_double(int col) {
  if (column_is_null(col)) return std::nullopt;
  return column_double(col);
}

std::optional<int> SqliteStmt::column_optional_int(int col) {
  if (column_is_null(col)) return std::nullopt;
  return column_int(col);
}

SqliteTransaction::SqliteTransaction(SqliteDb& db) : db_(db) {
  db_.exec("BEGIN IMMEDIATE");
}

SqliteTransaction::~SqliteTransaction() {
  if (!done_) {
    // Rollback failures leave sqlite to roll back when the connection closes.
    sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, nullptr);
  }
}

void SqliteTransaction::commit() {
  db_.exec("COMMIT");
  done_ = true;
}

}  // namespace transitperf
