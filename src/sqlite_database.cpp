#include <citegraph/sqlite_database.h>

#include <stdexcept>
#include <utility>

#include <sqlite3.h>

namespace citegraph {
namespace {

std::runtime_error SqliteError(sqlite3 *db, const std::string &context) {
  const char *message = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
  return std::runtime_error(context + ": " + message);
}

} // namespace

SqliteStatement::SqliteStatement(sqlite3 *db, const std::string &sql)
    : db_(db), sql_(sql) {
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) !=
      SQLITE_OK) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw SqliteError(db_, "Failed to prepare '" + sql + "'");
  }
}

SqliteStatement::~SqliteStatement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

SqliteStatement::SqliteStatement(SqliteStatement &&other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)),
      sql_(std::move(other.sql_)) {}

SqliteStatement &SqliteStatement::operator=(SqliteStatement &&other) noexcept {
  if (this != &other) {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
    db_ = other.db_;
    stmt_ = std::exchange(other.stmt_, nullptr);
    sql_ = std::move(other.sql_);
  }
  return *this;
}

SqliteStatement &SqliteStatement::Bind(int index, const std::string &value) {
  if (sqlite3_bind_text(stmt_, index, value.data(),
                        static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    throw SqliteError(db_, "Failed to bind parameter " +
                               std::to_string(index) + " of '" + sql_ + "'");
  }
  return *this;
}

SqliteStatement &SqliteStatement::Bind(int index, std::int64_t value) {
  if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
    throw SqliteError(db_, "Failed to bind parameter " +
                               std::to_string(index) + " of '" + sql_ + "'");
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
  throw SqliteError(db_, "Failed to execute '" + sql_ + "'");
}

void SqliteStatement::Run() {
  while (Step()) {
  }
  Reset();
}

void SqliteStatement::Reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

std::string SqliteStatement::ColumnText(int column) const {
  const unsigned char *text = sqlite3_column_text(stmt_, column);
  if (text == nullptr) {
    return {};
  }
  const auto size = sqlite3_column_bytes(stmt_, column);
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<std::size_t>(size));
}

std::int64_t SqliteStatement::ColumnInt64(int column) const {
  return sqlite3_column_int64(stmt_, column);
}

SqliteDatabase::SqliteDatabase(const std::filesystem::path &path, Mode mode)
    : path_(path) {
  const int flags = mode == Mode::kReadOnly
                        ? SQLITE_OPEN_READONLY
                        : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  const int rc = sqlite3_open_v2(path_.string().c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string message = db_ != nullptr ? sqlite3_errmsg(db_)
                                               : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to open SQLite database at " +
                             path_.string() + ": " + message);
  }
  sqlite3_busy_timeout(db_, 5000);
}

SqliteDatabase::~SqliteDatabase() { Close(); }

void SqliteDatabase::Close() {
  if (db_ != nullptr) {
    sqlite3_close_v2(db_);
    db_ = nullptr;
  }
}

void SqliteDatabase::Execute(const std::string &sql) {
  if (db_ == nullptr) {
    throw std::runtime_error("Database " + path_.string() + " is closed");
  }
  char *errmsg = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
  if (rc != SQLITE_OK) {
    const std::string message =
        errmsg != nullptr ? errmsg : sqlite3_errstr(rc);
    sqlite3_free(errmsg);
    throw std::runtime_error("Failed to execute '" + sql + "' on " +
                             path_.string() + ": " + message);
  }
}

SqliteStatement SqliteDatabase::Prepare(const std::string &sql) {
  if (db_ == nullptr) {
    throw std::runtime_error("Database " + path_.string() + " is closed");
  }
  return SqliteStatement(db_, sql);
}

bool SqliteDatabase::TableExists(const std::string &table) {
  auto statement = Prepare(
      "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
  statement.Bind(1, table);
  return statement.Step();
}

SqliteTransaction::SqliteTransaction(SqliteDatabase &database)
    : database_(&database) {
  database_->Execute("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_) {
    return;
  }
  try {
    database_->Execute("ROLLBACK;");
  } catch (const std::runtime_error &) {
    // SQLite already rolled back after the failure that got us here.
  }
}

void SqliteTransaction::Commit() {
  database_->Execute("COMMIT;");
  committed_ = true;
}

} // namespace citegraph
