#include "sqlite.h"
#include <string>
#include "log.h"
#include "tempfile.h"
#include "unittest.h"

using std::string;

namespace sqlite {

class SqliteTest : public rhbase::Test {
private:
  void setUp() override {
    m_database = Database::open(m_tempFile.path(), OPEN_OR_CREATE, [](Database& database) {
      database.execMany("CREATE TABLE pages(id INTEGER PRIMARY KEY, title TEXT NOT NULL, parent_id INTEGER);");
    });
  }

  void tearDown() override { m_database = Database(); }

  RH_TEST_CASE(bindNull) {
    WriteTransaction transaction(m_database, RH_HERE);
    Statement insertion = m_database.prepare("INSERT INTO pages(title, parent_id) VALUES (?1, ?2);");
    insertion.bind(1, "Main page");
    insertion.bindNull(2);
    insertion.step();
    int64_t id = m_database.lastInsertRowid();

    Statement statement = m_database.prepareAndBind("SELECT title, parent_id FROM pages WHERE id = ?1;", id);
    RH_ASSERT(statement.step());
    RH_ASSERT_EQ(string(statement.columnTextNotNull(0)), "Main page");
    RH_ASSERT(statement.isColumnNull(1));
  }

  RH_TEST_CASE(missingParameters) {
    WriteTransaction transaction(m_database, RH_HERE);
    bool exceptionThrown = false;
    try {
      m_database.exec("INSERT INTO pages(title, parent_id) VALUES (?1, ?2);", "Main page");
    } catch (const SqliteError&) {
      exceptionThrown = true;
    }
    RH_ASSERT(exceptionThrown);
  }

  RH_TEST_CASE(writeInReadTransaction) {
    ReadTransaction transaction(m_database, RH_HERE);
    bool exceptionThrown = false;
    try {
      m_database.exec("INSERT INTO pages(title) VALUES (?1);", "Main page");
    } catch (const NotInTransactionError&) {
      exceptionThrown = true;
    }
    RH_ASSERT(exceptionThrown);
  }

  RH_TEST_CASE(globals) {
    WriteTransaction transaction(m_database, RH_HERE);
    RH_ASSERT_EQ(m_database.loadGlobalInt64("version", -1), -1);
    m_database.saveGlobalInt64("version", 3);
    RH_ASSERT_EQ(m_database.loadGlobalInt64("version", -1), 3);
  }

  rhbase::TempFile m_tempFile;
  Database m_database;
};

}  // namespace sqlite

int main() {
  sqlite::SqliteTest().run();
  return 0;
}
