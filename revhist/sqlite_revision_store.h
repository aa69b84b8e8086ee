#ifndef REVHIST_SQLITE_REVISION_STORE_H
#define REVHIST_SQLITE_REVISION_STORE_H

#include <string>
#include <vector>
#include "rhbase/sqlite.h"
#include "history_defs.h"
#include "revision_store.h"

namespace revhist {

// RevisionStore backed by a sqlite database with two tables:
//   documents(id, locale, slug, parent_id, current_revision_id)
//   revisions(id, document_id, created, is_approved, creator, comment, based_on_id)
// `created` is stored as a Unix timestamp.
class SqliteRevisionStore : public RevisionStore {
public:
  // With sqlite::OPEN_OR_CREATE, the tables are created if the database is new.
  // Throws: rhbase::FileNotFoundError, sqlite::SqliteError (also if the database has an unknown schema version).
  explicit SqliteRevisionStore(const std::string& databasePath, sqlite::OpenMode openMode = sqlite::OPEN_READONLY);

  Document getDocument(const std::string& locale, const std::string& slug) override;
  std::vector<Revision> getRevisions(const Document& document) override;
  // Reads the document and its revisions in a single transaction.
  HistorySnapshot getSnapshot(const std::string& locale, const std::string& slug) override;

  // Throws: sqlite::UniqueConstraintError if a document with the same locale and slug exists.
  docid_t addDocument(const std::string& locale, const std::string& slug, docid_t parentId = INVALID_DOCID);
  // The current revision of the document becomes its most recent approved revision.
  // Throws: DocumentNotFoundError.
  revid_t addRevision(const NewRevision& newRevision);
  // Revisions based on the deleted revision become orphans. The current revision of the document is updated.
  // Does nothing if the revision does not exist.
  void deleteRevision(revid_t revid);

private:
  // The functions below must be called within a transaction.
  Document readDocument(const std::string& locale, const std::string& slug);
  std::vector<Revision> readRevisions(docid_t documentId);
  void updateCurrentRevision(docid_t documentId);

  sqlite::Database m_database;
};

}  // namespace revhist

#endif
