#include "frostcoord/store/sqlite_database.hpp"

#include <sqlite3.h>

#include "frostcoord/common/logging.hpp"

namespace frostcoord {
namespace {

[[noreturn]] void ThrowSqlite(sqlite3* connection, int code, const std::string& context) {
  const std::string message =
      "sqlite: " + context + ": " + (connection != nullptr ? sqlite3_errmsg(connection) : sqlite3_errstr(code));
  if ((code & 0xff) == SQLITE_CONSTRAINT) {
    throw SqliteConstraintError(message);
  }
  throw CoordinatorError(ErrorKind::kStorage, message);
}

}  // namespace

SqliteConstraintError::SqliteConstraintError(const std::string& message)
    : CoordinatorError(ErrorKind::kStorage, message) {}

SqliteStatement::SqliteStatement(sqlite3* connection, const std::string& sql) : connection_(connection) {
  const int rc = sqlite3_prepare_v2(connection_, sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    ThrowSqlite(connection_, rc, "prepare " + sql);
  }
}

SqliteStatement::~SqliteStatement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : connection_(other.connection_), stmt_(other.stmt_) {
  other.stmt_ = nullptr;
}

SqliteStatement& SqliteStatement::Bind(int index, int64_t value) {
  if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
    ThrowLastError("bind");
  }
  return *this;
}

SqliteStatement& SqliteStatement::Bind(int index, const std::string& value) {
  if (sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) !=
      SQLITE_OK) {
    ThrowLastError("bind");
  }
  return *this;
}

SqliteStatement& SqliteStatement::Bind(int index, const std::optional<int64_t>& value) {
  return value.has_value() ? Bind(index, *value) : BindNull(index);
}

SqliteStatement& SqliteStatement::Bind(int index, const std::optional<std::string>& value) {
  return value.has_value() ? Bind(index, *value) : BindNull(index);
}

SqliteStatement& SqliteStatement::BindNull(int index) {
  if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
    ThrowLastError("bind");
  }
  return *this;
}

bool SqliteStatement::Step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  ThrowSqlite(connection_, rc, std::string("step ") + sqlite3_sql(stmt_));
}

void SqliteStatement::Run() {
  while (Step()) {
  }
}

bool SqliteStatement::ColumnIsNull(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int64_t SqliteStatement::ColumnInt64(int column) const {
  return sqlite3_column_int64(stmt_, column);
}

std::string SqliteStatement::ColumnText(int column) const {
  const unsigned char* text = sqlite3_column_text(stmt_, column);
  if (text == nullptr) {
    return std::string();
  }
  const int size = sqlite3_column_bytes(stmt_, column);
  return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

std::optional<int64_t> SqliteStatement::ColumnOptionalInt64(int column) const {
  if (ColumnIsNull(column)) {
    return std::nullopt;
  }
  return ColumnInt64(column);
}

std::optional<std::string> SqliteStatement::ColumnOptionalText(int column) const {
  if (ColumnIsNull(column)) {
    return std::nullopt;
  }
  return ColumnText(column);
}

void SqliteStatement::ThrowLastError(const char* operation) const {
  ThrowSqlite(connection_, sqlite3_errcode(connection_), operation);
}

SqliteDatabase::SqliteDatabase(const std::string& path, std::chrono::milliseconds busy_timeout) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc = sqlite3_open_v2(path.c_str(), &connection_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string message = connection_ != nullptr ? sqlite3_errmsg(connection_) : "not enough memory";
    if (connection_ != nullptr) {
      sqlite3_close_v2(connection_);
      connection_ = nullptr;
    }
    throw CoordinatorError(ErrorKind::kStorage, "sqlite: open " + path + ": " + message);
  }
  sqlite3_extended_result_codes(connection_, 1);
  sqlite3_busy_timeout(connection_, static_cast<int>(busy_timeout.count()));
  try {
    Execute("PRAGMA foreign_keys = ON;");
  } catch (const CoordinatorError&) {
    sqlite3_close_v2(connection_);
    connection_ = nullptr;
    throw;
  }
}

SqliteDatabase::~SqliteDatabase() {
  if (connection_ != nullptr) {
    sqlite3_close_v2(connection_);
  }
}

void SqliteDatabase::Execute(const std::string& sql) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  char* error = nullptr;
  const int rc = sqlite3_exec(connection_, sql.c_str(), nullptr, nullptr, &error);
  if (rc != SQLITE_OK) {
    std::string message = error != nullptr ? error : sqlite3_errstr(rc);
    sqlite3_free(error);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
      throw SqliteConstraintError("sqlite: " + message);
    }
    throw CoordinatorError(ErrorKind::kStorage, "sqlite: " + message);
  }
}

SqliteStatement SqliteDatabase::Prepare(const std::string& sql) {
  return SqliteStatement(connection_, sql);
}

int64_t SqliteDatabase::Changes() const {
  return sqlite3_changes64(connection_);
}

void SqliteDatabase::RunInTransaction(const std::function<void()>& body) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (transaction_depth_ > 0) {
    ++transaction_depth_;
    try {
      body();
    } catch (...) {
      --transaction_depth_;
      throw;
    }
    --transaction_depth_;
    return;
  }

  Execute("BEGIN IMMEDIATE;");
  transaction_depth_ = 1;
  try {
    body();
    Execute("COMMIT;");
  } catch (...) {
    transaction_depth_ = 0;
    try {
      Execute("ROLLBACK;");
    } catch (const CoordinatorError& rollback_error) {
      Log()->error("sqlite rollback failed: {}", rollback_error.what());
    }
    throw;
  }
  transaction_depth_ = 0;
}

}  // namespace frostcoord
