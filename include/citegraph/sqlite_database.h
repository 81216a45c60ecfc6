#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace citegraph {

// Thin RAII layer over the SQLite C API. Every failure surfaces as
// std::runtime_error carrying SQLite's message.
class SqliteStatement {
public:
  SqliteStatement(sqlite3 *db, const std::string &sql);
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement &) = delete;
  SqliteStatement &operator=(const SqliteStatement &) = delete;
  SqliteStatement(SqliteStatement &&other) noexcept;
  SqliteStatement &operator=(SqliteStatement &&other) noexcept;

  SqliteStatement &Bind(int index, const std::string &value);
  SqliteStatement &Bind(int index, std::int64_t value);

  // True while rows remain, false once the statement is done.
  bool Step();
  // Steps to completion, then resets for the next set of bindings.
  void Run();
  void Reset();

  std::string ColumnText(int column) const;
  std::int64_t ColumnInt64(int column) const;

private:
  sqlite3 *db_ = nullptr;
  sqlite3_stmt *stmt_ = nullptr;
  std::string sql_;
};

class SqliteDatabase {
public:
  enum class Mode { kReadOnly, kReadWrite };

  SqliteDatabase(const std::filesystem::path &path, Mode mode);
  ~SqliteDatabase();

  SqliteDatabase(const SqliteDatabase &) = delete;
  SqliteDatabase &operator=(const SqliteDatabase &) = delete;

  void Execute(const std::string &sql);
  SqliteStatement Prepare(const std::string &sql);
  bool TableExists(const std::string &table);
  void Close();

  const std::filesystem::path &Path() const { return path_; }

private:
  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
};

// BEGIN IMMEDIATE on construction; rolls back unless Commit() ran.
class SqliteTransaction {
public:
  explicit SqliteTransaction(SqliteDatabase &database);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction &) = delete;
  SqliteTransaction &operator=(const SqliteTransaction &) = delete;

  void Commit();

private:
  SqliteDatabase *database_;
  bool committed_ = false;
};

} // namespace citegraph
