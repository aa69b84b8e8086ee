// Thin C++ wrapper around the sqlite3 C API.
// Statements run inside a transaction: a ReadTransaction accepts only SELECT statements, a WriteTransaction accepts
// everything. A WriteTransaction that is not committed is rolled back when it goes out of scope, in particular when an
// exception is thrown.
// Databases created by Database::open have a key/value table for global values, accessed with loadGlobalInt64 and
// saveGlobalInt64 (e.g. to store a schema version).
//
// Example:
//   Database db = Database::open("history.sqlite", OPEN_OR_CREATE, [](Database& db) {
//     db.execMany("CREATE TABLE documents(id INTEGER PRIMARY KEY, slug TEXT);");
//   });
//   {
//     WriteTransaction transaction(db, RH_HERE);
//     db.exec("INSERT INTO documents(slug) VALUES (?1);", "Web/HTML");
//     transaction.commit();
//   }
//   ReadTransaction transaction(db, RH_HERE);
//   Statement statement = db.prepareAndBind("SELECT id FROM documents WHERE slug = ?1;", "Web/HTML");
//   while (statement.step()) {
//     std::cout << statement.columnInt64(0) << "\n";
//   }
#ifndef RHBASE_SQLITE_H
#define RHBASE_SQLITE_H

#include <sqlite3.h>
#include <cstdint>
#include <functional>
#include <string>
#include "error.h"

namespace sqlite {

class SqliteError : public rhbase::Error {
public:
  using Error::Error;
};

class ConstraintError : public SqliteError {
public:
  using SqliteError::SqliteError;
};

// Also thrown for primary key violations.
class UniqueConstraintError : public ConstraintError {
public:
  using ConstraintError::ConstraintError;
};

// Statement executed outside of a transaction, or write statement executed in a ReadTransaction.
class NotInTransactionError : public SqliteError {
public:
  using SqliteError::SqliteError;
};

class NestedTransactionsError : public SqliteError {
public:
  using SqliteError::SqliteError;
};

class BusyError : public SqliteError {
public:
  using SqliteError::SqliteError;
};

// Write attempt on a database opened with OPEN_READONLY.
class ReadOnlyError : public SqliteError {
public:
  using SqliteError::SqliteError;
};

class Database;

// Prepared statement. Created by Database::prepare or Database::prepareAndBind.
class Statement {
public:
  Statement() = default;
  Statement(const Statement&) = delete;
  Statement(Statement&& statement);
  ~Statement();
  Statement& operator=(const Statement&) = delete;
  Statement& operator=(Statement&& statement);

  // Sets the value of ?parameter (1-based).
  void bind(int parameter, int value);
  void bind(int parameter, int64_t value);
  void bind(int parameter, const std::string& value) { bind(parameter, value.c_str()); }
  void bind(int parameter, const char* value);
  void bindNull(int parameter);
  // Sets ?1, ?2, etc. The number of values must match the number of parameters of the statement.
  template <typename... Args>
  void bindAll(const Args&... args) {
    bindFrom(1, args...);
  }

  // Executes the statement until the next row. Returns false when there are no more rows.
  bool step();

  // Columns are 0-based.
  bool isColumnNull(int column) { return sqlite3_column_type(m_stmt, column) == SQLITE_NULL; }
  int columnInt(int column) { return sqlite3_column_int(m_stmt, column); }
  int64_t columnInt64(int column) { return sqlite3_column_int64(m_stmt, column); }
  // Returns "" for NULL.
  const char* columnTextNotNull(int column);

private:
  Statement(Database* database, const std::string& text);

  void bindFrom(int parameter);
  template <typename T, typename... Args>
  void bindFrom(int parameter, const T& value, const Args&... args) {
    bind(parameter, value);
    bindFrom(parameter + 1, args...);
  }
  void checkBindResult(int result, const char* function);

  sqlite3_stmt* m_stmt = nullptr;
  Database* m_database = nullptr;
  std::string m_text;
  int m_numParameters = 0;
  bool m_isSelect = false;

  friend class Database;
};

class Transaction {
public:
  Transaction(const Transaction&) = delete;
  ~Transaction();
  Transaction& operator=(const Transaction&) = delete;

  bool isWrite() const { return m_isWrite; }
  // Name used in error messages, typically RH_HERE.
  const char* name() const { return m_name; }

protected:
  Transaction(Database& database, bool isWrite, const char* name);

  Database& m_database;
  bool m_isWrite;
  const char* m_name;
};

class ReadTransaction : public Transaction {
public:
  ReadTransaction(Database& database, const char* name) : Transaction(database, false, name) {}
};

class WriteTransaction : public Transaction {
public:
  WriteTransaction(Database& database, const char* name) : Transaction(database, true, name) {}

  // Must be called once all statements have been executed. Otherwise, the destructor rolls back the transaction.
  void commit();
};

enum OpenMode {
  OPEN_READONLY,
  OPEN_OR_CREATE,
};

class Database {
public:
  using InitCallback = std::function<void(Database&)>;

  // With OPEN_OR_CREATE, initCallback is called in a write transaction if the database is new.
  // Throws: rhbase::FileNotFoundError (only with OPEN_READONLY), SqliteError.
  [[nodiscard]] static Database open(const std::string& path, OpenMode openMode,
                                     const InitCallback& initCallback = {});

  Database() = default;
  Database(const Database&) = delete;
  Database(Database&& database);
  ~Database();
  Database& operator=(const Database&) = delete;
  Database& operator=(Database&& database);

  Statement prepare(const std::string& text) { return Statement(this, text); }
  template <typename... Args>
  Statement prepareAndBind(const std::string& text, const Args&... args) {
    Statement statement = prepare(text);
    statement.bindAll(args...);
    return statement;
  }
  // Executes a statement that does not return rows.
  template <typename... Args>
  void exec(const std::string& text, const Args&... args) {
    prepareAndBind(text, args...).step();
  }
  // Executes several statements separated by ';', without parameters. Requires a write transaction.
  void execMany(const std::string& text);
  int64_t lastInsertRowid() const { return sqlite3_last_insert_rowid(m_db); }

  int64_t loadGlobalInt64(const char* name, int64_t defaultValue);
  void saveGlobalInt64(const char* name, int64_t value);

private:
  void openInternal(const std::string& path, OpenMode openMode, const InitCallback& initCallback);
  void close();
  // Runs text without checking the current transaction. Returns the sqlite result code.
  int execRaw(const std::string& text, std::string& errorMessage);
  std::string lastErrorMessage() const;
  void beginTransaction(Transaction* transaction);
  void endTransaction(bool commit);

  sqlite3* m_db = nullptr;
  Transaction* m_transaction = nullptr;
  int64_t m_transactionStartTime = 0;

  friend class Statement;
  friend class Transaction;
  friend class WriteTransaction;
};

}  // namespace sqlite

#endif
