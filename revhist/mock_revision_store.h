#ifndef REVHIST_MOCK_REVISION_STORE_H
#define REVHIST_MOCK_REVISION_STORE_H

#include <map>
#include <string>
#include <vector>
#include "history_defs.h"
#include "revision_store.h"

namespace revhist {

// In-memory RevisionStore for tests.
// The current revision of each document is its most recent approved revision, as in SqliteRevisionStore.
class MockRevisionStore : public RevisionStore {
public:
  Document getDocument(const std::string& locale, const std::string& slug) override;
  std::vector<Revision> getRevisions(const Document& document) override;

  docid_t addDocument(const std::string& locale, const std::string& slug, docid_t parentId = INVALID_DOCID);
  // Throws: DocumentNotFoundError.
  revid_t addRevision(const NewRevision& newRevision);
  void deleteRevision(revid_t revid);

  // Number of calls to getRevisions().
  int getNumRevisionsReads() const { return m_numRevisionsReads; }

private:
  struct DocumentData {
    std::string locale;
    std::string slug;
    docid_t parentId = INVALID_DOCID;
  };
  struct RevisionData {
    Revision revision;
    revid_t basedOnId = INVALID_REVID;
  };

  Document makeDocument(docid_t documentId, bool withParent) const;
  revid_t computeCurrentRevision(docid_t documentId) const;

  std::map<docid_t, DocumentData> m_documents;
  std::map<revid_t, RevisionData> m_revisions;
  docid_t m_lastDocumentId = INVALID_DOCID;
  revid_t m_lastRevisionId = INVALID_REVID;
  int m_numRevisionsReads = 0;
};

}  // namespace revhist

#endif
