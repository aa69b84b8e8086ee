#include "sqlite.h"
#include <sqlite3.h>
#include <unistd.h>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include <string_view>
#include <utility>
#include "error.h"
#include "log.h"

using std::string;

namespace sqlite {

constexpr int BUSY_TIMEOUT_MS = 60 * 1000;
constexpr int64_t LONG_TRANSACTION_SECS = 60;
constexpr char GLOBALS_TABLE[] = "rhbase_globals";

// Converts an extended result code to the most specific exception.
[[noreturn]] static void throwSqliteError(int code, const string& message) {
  char suffix[16];
  snprintf(suffix, sizeof(suffix), " (code 0x%X)", code);
  string fullMessage = message + suffix;
  switch (code) {
    case SQLITE_CONSTRAINT_UNIQUE:
    case SQLITE_CONSTRAINT_PRIMARYKEY:
      throw UniqueConstraintError(fullMessage);
  }
  switch (code & 0xFF) {
    case SQLITE_CONSTRAINT:
      throw ConstraintError(fullMessage);
    case SQLITE_BUSY:
      throw BusyError(fullMessage);
    case SQLITE_READONLY:
      throw ReadOnlyError(fullMessage);
  }
  throw SqliteError(fullMessage);
}

Statement::Statement(Database* database, const string& text) : m_database(database), m_text(text) {
  RH_ASSERT(database != nullptr && database->m_db != nullptr);
  m_isSelect = std::string_view(text).substr(0, 7) == "SELECT ";
  int result = sqlite3_prepare_v2(database->m_db, text.c_str(), -1, &m_stmt, nullptr);
  if (result != SQLITE_OK) {
    throwSqliteError(result, "Cannot prepare statement '" + text + "': " + database->lastErrorMessage());
  }
  m_numParameters = sqlite3_bind_parameter_count(m_stmt);
}

Statement::Statement(Statement&& statement)
    : m_stmt(std::exchange(statement.m_stmt, nullptr)), m_database(statement.m_database),
      m_text(std::move(statement.m_text)), m_numParameters(statement.m_numParameters),
      m_isSelect(statement.m_isSelect) {}

Statement& Statement::operator=(Statement&& statement) {
  if (&statement != this) {
    sqlite3_finalize(m_stmt);
    m_stmt = std::exchange(statement.m_stmt, nullptr);
    m_database = statement.m_database;
    m_text = std::move(statement.m_text);
    m_numParameters = statement.m_numParameters;
    m_isSelect = statement.m_isSelect;
  }
  return *this;
}

Statement::~Statement() {
  sqlite3_finalize(m_stmt);
}

void Statement::checkBindResult(int result, const char* function) {
  if (result != SQLITE_OK) {
    throwSqliteError(result, string(function) + " failed for statement '" + m_text +
                                 "': " + m_database->lastErrorMessage());
  }
}

void Statement::bind(int parameter, int value) {
  RH_ASSERT(m_stmt != nullptr);
  checkBindResult(sqlite3_bind_int(m_stmt, parameter, value), "sqlite3_bind_int");
}

void Statement::bind(int parameter, int64_t value) {
  RH_ASSERT(m_stmt != nullptr);
  checkBindResult(sqlite3_bind_int64(m_stmt, parameter, value), "sqlite3_bind_int64");
}

void Statement::bind(int parameter, const char* value) {
  RH_ASSERT(m_stmt != nullptr);
  checkBindResult(sqlite3_bind_text(m_stmt, parameter, value, -1, SQLITE_TRANSIENT), "sqlite3_bind_text");
}

void Statement::bindNull(int parameter) {
  RH_ASSERT(m_stmt != nullptr);
  checkBindResult(sqlite3_bind_null(m_stmt, parameter), "sqlite3_bind_null");
}

void Statement::bindFrom(int parameter) {
  // Extra arguments make sqlite3_bind_* fail, so only missing ones need to be checked here.
  if (parameter <= m_numParameters) {
    throw SqliteError("Missing parameters for statement '" + m_text + "'");
  }
}

bool Statement::step() {
  RH_ASSERT(m_stmt != nullptr);
  const Transaction* transaction = m_database->m_transaction;
  if (transaction == nullptr) {
    throw NotInTransactionError("Statement '" + m_text + "' executed outside of a transaction");
  } else if (!m_isSelect && !transaction->isWrite()) {
    throw NotInTransactionError("Statement '" + m_text + "' executed in read transaction '" + transaction->name() +
                                "'");
  }
  int result = sqlite3_step(m_stmt);
  if (result == SQLITE_ROW) {
    return true;
  } else if (result != SQLITE_DONE) {
    throwSqliteError(result, "Cannot execute statement '" + m_text + "': " + m_database->lastErrorMessage());
  }
  return false;
}

const char* Statement::columnTextNotNull(int column) {
  const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, column));
  return text != nullptr ? text : "";
}

Transaction::Transaction(Database& database, bool isWrite, const char* name)
    : m_database(database), m_isWrite(isWrite), m_name(name) {
  database.beginTransaction(this);
}

Transaction::~Transaction() {
  if (m_database.m_transaction == this) {
    try {
      m_database.endTransaction(/* commit = */ false);
    } catch (const SqliteError& error) {
      RH_ERROR << "Cannot roll back transaction '" << m_name << "': " << error.what();
    }
  }
}

void WriteTransaction::commit() {
  if (m_database.m_transaction != this) {
    throw NotInTransactionError(string("Transaction '") + m_name + "' committed after its end");
  }
  m_database.endTransaction(/* commit = */ true);
}

Database Database::open(const string& path, OpenMode openMode, const InitCallback& initCallback) {
  // openInternal is not called from a constructor so that ~Database() runs if it throws.
  Database database;
  database.openInternal(path, openMode, initCallback);
  return database;
}

Database::Database(Database&& database) : m_db(std::exchange(database.m_db, nullptr)) {
  if (database.m_transaction != nullptr) {
    throw rhbase::InvalidStateError("Cannot move a database during a transaction");
  }
}

Database::~Database() {
  try {
    close();
  } catch (const SqliteError& error) {
    RH_ERROR << error.what();
  }
}

Database& Database::operator=(Database&& database) {
  if (m_transaction != nullptr || database.m_transaction != nullptr) {
    throw rhbase::InvalidStateError("Cannot move a database during a transaction");
  }
  if (&database != this) {
    close();
    m_db = std::exchange(database.m_db, nullptr);
  }
  return *this;
}

void Database::openInternal(const string& path, OpenMode openMode, const InitCallback& initCallback) {
  RH_ASSERT(m_db == nullptr);
  int flags = openMode == OPEN_READONLY ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  int result = sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr);
  if (result != SQLITE_OK) {
    if (openMode == OPEN_READONLY && access(path.c_str(), F_OK) != 0) {
      throw rhbase::FileNotFoundError("Cannot open '" + path + "': file not found");
    }
    throwSqliteError(result, "Cannot open '" + path + "': " + lastErrorMessage());
  }
  sqlite3_extended_result_codes(m_db, 1);
  sqlite3_busy_timeout(m_db, BUSY_TIMEOUT_MS);
  if (openMode == OPEN_OR_CREATE) {
    WriteTransaction transaction(*this, RH_HERE);
    bool isNew = !prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' LIMIT 1;").step();
    if (isNew) {
      execMany(string("CREATE TABLE ") + GLOBALS_TABLE + "(key TEXT PRIMARY KEY, value INTEGER);");
      if (initCallback) {
        initCallback(*this);
      }
    }
    transaction.commit();
  }
}

void Database::close() {
  if (m_db != nullptr) {
    int result = sqlite3_close(m_db);
    if (result != SQLITE_OK) {
      throwSqliteError(result, "Cannot close database: " + lastErrorMessage());
    }
    m_db = nullptr;
  }
}

void Database::execMany(const string& text) {
  if (m_transaction == nullptr || !m_transaction->isWrite()) {
    throw NotInTransactionError("Statements '" + text + "' executed outside of a write transaction");
  }
  string errorMessage;
  int result = execRaw(text, errorMessage);
  if (result != SQLITE_OK) {
    throwSqliteError(result, "Cannot execute statements '" + text + "': " + errorMessage);
  }
}

int Database::execRaw(const string& text, string& errorMessage) {
  RH_ASSERT(m_db != nullptr);
  char* rawErrorMessage = nullptr;
  int result = sqlite3_exec(m_db, text.c_str(), nullptr, nullptr, &rawErrorMessage);
  errorMessage = rawErrorMessage != nullptr ? rawErrorMessage : "";
  sqlite3_free(rawErrorMessage);
  return result;
}

string Database::lastErrorMessage() const {
  if (m_db == nullptr) {
    return "cannot allocate database";
  }
  const char* message = sqlite3_errmsg(m_db);
  return message != nullptr ? message : "unknown error";
}

void Database::beginTransaction(Transaction* transaction) {
  if (m_transaction != nullptr) {
    throw NestedTransactionsError(string("Transaction '") + transaction->name() + "' started inside transaction '" +
                                  m_transaction->name() + "'");
  }
  string errorMessage;
  int result = execRaw(transaction->isWrite() ? "BEGIN IMMEDIATE;" : "BEGIN;", errorMessage);
  if (result != SQLITE_OK) {
    throwSqliteError(result, string("Cannot start transaction '") + transaction->name() + "': " + errorMessage);
  }
  m_transaction = transaction;
  m_transactionStartTime = static_cast<int64_t>(time(nullptr));
}

void Database::endTransaction(bool commit) {
  RH_ASSERT(m_transaction != nullptr);
  const char* name = m_transaction->name();
  int64_t duration = static_cast<int64_t>(time(nullptr)) - m_transactionStartTime;
  if (duration >= LONG_TRANSACTION_SECS) {
    RH_WARNING << "Transaction '" << name << "' lasted " << duration << " seconds";
  }
  m_transaction = nullptr;
  string errorMessage;
  int result = execRaw(commit ? "COMMIT;" : "ROLLBACK;", errorMessage);
  if (result != SQLITE_OK) {
    throwSqliteError(result, string("Cannot end transaction '") + name + "': " + errorMessage);
  }
}

int64_t Database::loadGlobalInt64(const char* name, int64_t defaultValue) {
  Statement statement = prepareAndBind(string("SELECT value FROM ") + GLOBALS_TABLE + " WHERE key = ?1;", name);
  return statement.step() ? statement.columnInt64(0) : defaultValue;
}

void Database::saveGlobalInt64(const char* name, int64_t value) {
  exec(string("INSERT OR REPLACE INTO ") + GLOBALS_TABLE + "(key, value) VALUES (?1, ?2);", name, value);
}

}  // namespace sqlite
