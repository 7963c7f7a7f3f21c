#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "frostcoord/common/errors.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace frostcoord {

// Raised for SQLITE_CONSTRAINT failures so stores can map a violated
// constraint onto the matching coordinator error.
class SqliteConstraintError : public CoordinatorError {
 public:
  explicit SqliteConstraintError(const std::string& message);
};

class SqliteStatement {
 public:
  SqliteStatement(sqlite3* connection, const std::string& sql);
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement&) = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;
  SqliteStatement(SqliteStatement&& other) noexcept;
  SqliteStatement& operator=(SqliteStatement&&) = delete;

  // Parameters are 1-based, as in sqlite3_bind_*.
  SqliteStatement& Bind(int index, int64_t value);
  SqliteStatement& Bind(int index, const std::string& value);
  SqliteStatement& Bind(int index, const std::optional<int64_t>& value);
  SqliteStatement& Bind(int index, const std::optional<std::string>& value);
  SqliteStatement& BindNull(int index);

  // Returns true while a result row is available.
  bool Step();
  // Runs a statement that returns no rows.
  void Run();

  bool ColumnIsNull(int column) const;
  int64_t ColumnInt64(int column) const;
  std::string ColumnText(int column) const;
  std::optional<int64_t> ColumnOptionalInt64(int column) const;
  std::optional<std::string> ColumnOptionalText(int column) const;

 private:
  [[noreturn]] void ThrowLastError(const char* operation) const;

  sqlite3* connection_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

// One serialized connection. Transactions started through RunInTransaction
// hold the connection mutex until they commit or roll back, so they are
// exclusive across threads of this process; BEGIN IMMEDIATE plus the busy
// timeout handles other processes sharing the file.
class SqliteDatabase {
 public:
  SqliteDatabase(const std::string& path, std::chrono::milliseconds busy_timeout);
  ~SqliteDatabase();

  SqliteDatabase(const SqliteDatabase&) = delete;
  SqliteDatabase& operator=(const SqliteDatabase&) = delete;

  void Execute(const std::string& sql);
  SqliteStatement Prepare(const std::string& sql);
  // Rows touched by the last INSERT/UPDATE/DELETE.
  int64_t Changes() const;

  void RunInTransaction(const std::function<void()>& body);

  std::recursive_mutex& mutex() { return mutex_; }

 private:
  sqlite3* connection_ = nullptr;
  std::recursive_mutex mutex_;
  uint32_t transaction_depth_ = 0;
};

}  // namespace frostcoord
