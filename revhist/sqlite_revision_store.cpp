#include "sqlite_revision_store.h"
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "rhbase/date.h"
#include "rhbase/log.h"
#include "rhbase/sqlite.h"
#include "history_defs.h"

using rhbase::Date;
using sqlite::Database;
using sqlite::ReadTransaction;
using sqlite::Statement;
using sqlite::WriteTransaction;
using std::string;
using std::vector;

namespace revhist {

constexpr char SCHEMA_VERSION_KEY[] = "revhist_schema_version";
constexpr int64_t SCHEMA_VERSION = 1;

static void createTables(Database& database) {
  database.execMany(
      "CREATE TABLE documents("
      "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
      "  locale TEXT NOT NULL,"
      "  slug TEXT NOT NULL,"
      "  parent_id INTEGER,"
      "  current_revision_id INTEGER);"
      "CREATE UNIQUE INDEX documents_locale_slug ON documents(locale, slug);"
      "CREATE TABLE revisions("
      "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
      "  document_id INTEGER NOT NULL,"
      "  created INTEGER NOT NULL,"
      "  is_approved INTEGER NOT NULL,"
      "  creator TEXT,"
      "  comment TEXT,"
      "  based_on_id INTEGER);"
      "CREATE INDEX revisions_document_created ON revisions(document_id, created, id);");
  database.saveGlobalInt64(SCHEMA_VERSION_KEY, SCHEMA_VERSION);
}

static int64_t nullableId(Statement& statement, int column) {
  return statement.isColumnNull(column) ? 0 : statement.columnInt64(column);
}

// Binds NULL for INVALID_DOCID and INVALID_REVID.
static void bindOptionalId(Statement& statement, int parameter, int64_t id) {
  if (id == 0) {
    statement.bindNull(parameter);
  } else {
    statement.bind(parameter, id);
  }
}

// Reads the columns id, document_id, created, is_approved, creator, comment starting at firstColumn.
static Revision readRevisionColumns(Statement& statement, int firstColumn) {
  Revision revision;
  revision.id = statement.columnInt64(firstColumn);
  revision.documentId = statement.columnInt64(firstColumn + 1);
  revision.createdAt = Date::fromTimeT(statement.columnInt64(firstColumn + 2));
  revision.isApproved = statement.columnInt(firstColumn + 3) != 0;
  revision.creator = statement.columnTextNotNull(firstColumn + 4);
  revision.comment = statement.columnTextNotNull(firstColumn + 5);
  return revision;
}

SqliteRevisionStore::SqliteRevisionStore(const string& databasePath, sqlite::OpenMode openMode) {
  m_database = Database::open(databasePath, openMode, createTables);
  ReadTransaction transaction(m_database, RH_HERE);
  int64_t schemaVersion = m_database.loadGlobalInt64(SCHEMA_VERSION_KEY, 0);
  if (schemaVersion != SCHEMA_VERSION) {
    throw sqlite::SqliteError("Unsupported schema version " + std::to_string(schemaVersion) + " in '" +
                              databasePath + "'");
  }
}

Document SqliteRevisionStore::readDocument(const string& locale, const string& slug) {
  Statement statement = m_database.prepareAndBind(
      "SELECT d.id, d.locale, d.slug, d.current_revision_id, p.id, p.locale, p.slug, p.current_revision_id "
      "FROM documents d LEFT JOIN documents p ON p.id = d.parent_id WHERE d.locale = ?1 AND d.slug = ?2;",
      locale, slug);
  if (!statement.step()) {
    throw DocumentNotFoundError("No document '" + slug + "' in locale '" + locale + "'");
  }
  Document document;
  document.id = statement.columnInt64(0);
  document.locale = statement.columnTextNotNull(1);
  document.slug = statement.columnTextNotNull(2);
  document.currentRevisionId = nullableId(statement, 3);
  if (!statement.isColumnNull(4)) {
    auto parent = std::make_shared<Document>();
    parent->id = statement.columnInt64(4);
    parent->locale = statement.columnTextNotNull(5);
    parent->slug = statement.columnTextNotNull(6);
    parent->currentRevisionId = nullableId(statement, 7);
    document.parent = std::move(parent);
  }
  return document;
}

vector<Revision> SqliteRevisionStore::readRevisions(docid_t documentId) {
  Statement statement = m_database.prepareAndBind(
      "SELECT r.id, r.document_id, r.created, r.is_approved, r.creator, r.comment, "
      "b.id, b.document_id, b.created, b.is_approved, b.creator, b.comment "
      "FROM revisions r LEFT JOIN revisions b ON b.id = r.based_on_id WHERE r.document_id = ?1 "
      "ORDER BY r.created, r.id;",
      documentId);
  vector<Revision> revisions;
  while (statement.step()) {
    Revision revision = readRevisionColumns(statement, 0);
    if (!statement.isColumnNull(6)) {
      revision.basedOn = std::make_shared<Revision>(readRevisionColumns(statement, 6));
    }
    revisions.push_back(std::move(revision));
  }
  return revisions;
}

Document SqliteRevisionStore::getDocument(const string& locale, const string& slug) {
  ReadTransaction transaction(m_database, RH_HERE);
  return readDocument(locale, slug);
}

vector<Revision> SqliteRevisionStore::getRevisions(const Document& document) {
  ReadTransaction transaction(m_database, RH_HERE);
  return readRevisions(document.id);
}

HistorySnapshot SqliteRevisionStore::getSnapshot(const string& locale, const string& slug) {
  ReadTransaction transaction(m_database, RH_HERE);
  HistorySnapshot snapshot;
  snapshot.document = readDocument(locale, slug);
  snapshot.revisions = readRevisions(snapshot.document.id);
  return snapshot;
}

docid_t SqliteRevisionStore::addDocument(const string& locale, const string& slug, docid_t parentId) {
  WriteTransaction transaction(m_database, RH_HERE);
  Statement statement = m_database.prepare("INSERT INTO documents(locale, slug, parent_id) VALUES (?1, ?2, ?3);");
  statement.bind(1, locale);
  statement.bind(2, slug);
  bindOptionalId(statement, 3, parentId);
  statement.step();
  docid_t documentId = m_database.lastInsertRowid();
  transaction.commit();
  return documentId;
}

void SqliteRevisionStore::updateCurrentRevision(docid_t documentId) {
  m_database.exec(
      "UPDATE documents SET current_revision_id = (SELECT id FROM revisions WHERE document_id = ?1 AND is_approved "
      "ORDER BY created DESC, id DESC LIMIT 1) WHERE id = ?1;",
      documentId);
}

revid_t SqliteRevisionStore::addRevision(const NewRevision& newRevision) {
  WriteTransaction transaction(m_database, RH_HERE);
  if (!m_database.prepareAndBind("SELECT id FROM documents WHERE id = ?1;", newRevision.documentId).step()) {
    throw DocumentNotFoundError("Cannot add a revision to missing document " +
                                std::to_string(newRevision.documentId));
  }
  Date createdAt = newRevision.createdAt.isNull() ? Date::now() : newRevision.createdAt;
  Statement statement = m_database.prepare(
      "INSERT INTO revisions(document_id, created, is_approved, creator, comment, based_on_id) "
      "VALUES (?1, ?2, ?3, ?4, ?5, ?6);");
  statement.bind(1, newRevision.documentId);
  statement.bind(2, static_cast<int64_t>(createdAt.toTimeT()));
  statement.bind(3, newRevision.isApproved ? 1 : 0);
  statement.bind(4, newRevision.creator);
  statement.bind(5, newRevision.comment);
  bindOptionalId(statement, 6, newRevision.basedOnId);
  statement.step();
  revid_t revid = m_database.lastInsertRowid();
  updateCurrentRevision(newRevision.documentId);
  transaction.commit();
  return revid;
}

void SqliteRevisionStore::deleteRevision(revid_t revid) {
  WriteTransaction transaction(m_database, RH_HERE);
  docid_t documentId = INVALID_DOCID;
  {
    Statement statement = m_database.prepareAndBind("SELECT document_id FROM revisions WHERE id = ?1;", revid);
    if (!statement.step()) {
      RH_WARNING << "Cannot delete revision " << revid << " because it does not exist";
      return;
    }
    documentId = statement.columnInt64(0);
  }
  m_database.exec("DELETE FROM revisions WHERE id = ?1;", revid);
  updateCurrentRevision(documentId);
  transaction.commit();
}

}  // namespace revhist
